#include <syncdl/types/error_type.h>
#include <syncdl/util/errors.h>

#include <fmt/format.h>

namespace syncdl {

    LocatedError::LocatedError(std::string message, ResponsePath path, std::exception_ptr original_error)
        : std::runtime_error{path.empty() ? message : fmt::format("{} (at {})", message, path)},
          _message{std::move(message)}, _path{std::move(path)}, _original_error{std::move(original_error)} {
    }

    std::string LocatedError::to_string() const { return what(); }

    Value LocatedError::to_value() const {
        List path;
        for (const auto &element : _path.as_list()) {
            if (const auto *index = std::get_if<std::size_t>(&element)) {
                path.emplace_back(static_cast<std::int64_t>(*index));
            } else {
                path.emplace_back(std::get<std::string>(element));
            }
        }
        return Object{{"message", _message}, {"path", std::move(path)}};
    }

    std::ostream &operator<<(std::ostream &os, const LocatedError &error) {
        os << error.to_string();
        return os;
    }

    LocatedError LocatedError::locate(const std::exception_ptr &raw_error, const ResponsePath &path) {
        try {
            std::rethrow_exception(raw_error);
        } catch (const LocatedError &e) {
            return e;
        } catch (const std::exception &e) {
            return LocatedError{e.what(), path, raw_error};
        } catch (...) {
            return LocatedError{describe_exception(raw_error), path, raw_error};
        }
    }

    Value ExecutionResult::to_value() const {
        Object result{{"data", data}};
        if (!errors.empty()) {
            List error_values;
            error_values.reserve(errors.size());
            for (const auto &error : errors) { error_values.push_back(error.to_value()); }
            result.insert_or_assign("errors", std::move(error_values));
        }
        return result;
    }

} // namespace syncdl
