#ifndef SYNCDL_TYPES_ERROR_TYPE_H
#define SYNCDL_TYPES_ERROR_TYPE_H

#include <syncdl/syncdl_export.h>
#include <syncdl/types/response_path.h>
#include <syncdl/types/value.h>

#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace syncdl {

    /**
     * A field level error tagged with the response path of the field (or list item) it was raised for.
     */
    struct SYNCDL_EXPORT LocatedError : std::runtime_error {
        LocatedError(std::string message, ResponsePath path, std::exception_ptr original_error = {});

        [[nodiscard]] const std::string &message() const noexcept { return _message; }

        [[nodiscard]] const ResponsePath &path() const noexcept { return _path; }

        [[nodiscard]] std::exception_ptr original_error() const noexcept { return _original_error; }

        [[nodiscard]] std::string to_string() const;

        // {"message": ..., "path": [...]}
        [[nodiscard]] Value to_value() const;

        friend std::ostream &operator<<(std::ostream &os, const LocatedError &error);

        /**
         * Wraps a raw error with the path it was raised at. An error that is already located keeps its
         * original path, so an error propagating through non-null parents is reported where it happened.
         */
        static LocatedError locate(const std::exception_ptr &raw_error, const ResponsePath &path);

    private:
        std::string _message;
        ResponsePath _path;
        std::exception_ptr _original_error;
    };

    /**
     * The data tree of an execution paired with the errors recorded while producing it, in the order they were
     * recorded. Data and errors coexist: a field error nulls the field, it does not abort the execution.
     */
    struct SYNCDL_EXPORT ExecutionResult {
        Value data{};
        std::vector<LocatedError> errors{};

        [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }

        // {"data": ..., "errors": [...]}, errors omitted when there are none
        [[nodiscard]] Value to_value() const;
    };

} // namespace syncdl

#endif // SYNCDL_TYPES_ERROR_TYPE_H
