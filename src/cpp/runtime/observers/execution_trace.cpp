#include <syncdl/runtime/observers/execution_trace.h>
#include <syncdl/runtime/execution_context.h>
#include <syncdl/types/error_type.h>
#include <syncdl/types/schema.h>

#include <fmt/format.h>

#include <iostream>

namespace syncdl {

    // Static member initialization
    bool ExecutionTrace::_print_all_values = false;
    bool ExecutionTrace::_use_logger = true;

    ExecutionTrace::ExecutionTrace(const std::optional<std::string> &filter, bool execution, bool field,
                                   bool drain, bool batch, std::ostream *out)
        : _filter(filter), _execution(execution), _field(field), _drain(drain), _batch(batch), _out(out) {
    }

    void ExecutionTrace::set_print_all_values(bool value) {
        _print_all_values = value;
    }

    void ExecutionTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void ExecutionTrace::_print(std::string_view msg) const {
        std::ostream &out = _out != nullptr ? *_out : (_use_logger ? std::cerr : std::cout);
        out << fmt::format("[syncdl] {}", msg) << std::endl;
    }

    bool ExecutionTrace::_should_log_path(const ResponsePath &path) const {
        if (!_filter.has_value()) {
            return true;
        }
        return path.to_string().find(_filter.value()) != std::string::npos;
    }

    void ExecutionTrace::on_before_execution(const ExecutionContext &context) {
        if (_execution) {
            _print(fmt::format(">> {} Starting {} {}", std::string(15, '.'),
                               to_string(context.options().operation_type), std::string(15, '.')));
        }
    }

    void ExecutionTrace::on_after_execution(const ExecutionContext &context, const ExecutionResult &result) {
        if (!_execution) {
            return;
        }
        _print(fmt::format("<< {} Finished {} with {} error(s) {}", std::string(15, '.'),
                           to_string(context.options().operation_type), result.errors.size(),
                           std::string(15, '.')));
        if (_print_all_values) {
            _print(fmt::format("   data: {}", result.data));
        }
    }

    void ExecutionTrace::on_before_field_resolve(const ResolveInfo &info) {
        if (_field && _should_log_path(info.path)) {
            std::string args = _print_all_values && !info.arguments.empty()
                                   ? fmt::format("({})", Value(info.arguments))
                                   : "";
            _print(fmt::format("{} {}.{}{} [IN]", info.path, info.parent_type.name(), info.field_name, args));
        }
    }

    void ExecutionTrace::on_after_field_resolve(const ResolveInfo &info) {
        if (_field && _should_log_path(info.path)) {
            _print(fmt::format("{} -> {} [OUT]", info.path, info.return_type.name()));
        }
    }

    void ExecutionTrace::on_field_deferred(const ResponsePath &path) {
        if (_field && _should_log_path(path)) {
            _print(fmt::format("{} [DEFERRED]", path));
        }
    }

    void ExecutionTrace::on_field_error(const LocatedError &error) {
        if (_field && _should_log_path(error.path())) {
            _print(fmt::format("{} [ERROR] {}", error.path(), error.message()));
        }
    }

    void ExecutionTrace::on_before_drain(std::size_t queued) {
        if (_drain) {
            _print(fmt::format("{} Drain Start ({} queued) {}", std::string(20, '>'), queued, std::string(20, '>')));
        }
    }

    void ExecutionTrace::on_after_drain(std::size_t callbacks_run) {
        if (_drain) {
            _print(fmt::format("{} Drain Done ({} run) {}", std::string(20, '<'), callbacks_run, std::string(20, '<')));
        }
    }

    void ExecutionTrace::on_batch_dispatch(std::string_view loader_name, std::size_t key_count) {
        if (_batch) {
            _print(fmt::format("[{}] dispatching {} key(s)", loader_name, key_count));
        }
    }

} // namespace syncdl
