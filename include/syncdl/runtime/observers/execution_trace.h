#pragma once

#include <syncdl/runtime/execution_observer.h>
#include <syncdl/syncdl_export.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace syncdl {

    /**
     * @brief Logs out the different steps as an execution walks the field tree and drains its batch scope.
     *
     * This is voluminous but can be helpful tracing down why loads were (or were not) batched together.
     */
    class SYNCDL_EXPORT ExecutionTrace : public ExecutionLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Execution Trace object
         *
         * @param filter Used to restrict which field events to report (substring match on the response path)
         * @param execution Log execution start / end events
         * @param field Log field resolve and error events
         * @param drain Log scope drain events
         * @param batch Log loader dispatch events
         * @param out Stream to write to, when null stderr (or stdout, see set_use_logger) is used
         */
        explicit ExecutionTrace(const std::optional<std::string> &filter = std::nullopt, bool execution = true,
                                bool field = true, bool drain = true, bool batch = true, std::ostream *out = nullptr);

        void on_before_execution(const ExecutionContext &context) override;
        void on_after_execution(const ExecutionContext &context, const ExecutionResult &result) override;
        void on_before_field_resolve(const ResolveInfo &info) override;
        void on_after_field_resolve(const ResolveInfo &info) override;
        void on_field_deferred(const ResponsePath &path) override;
        void on_field_error(const LocatedError &error) override;
        void on_before_drain(std::size_t queued) override;
        void on_after_drain(std::size_t callbacks_run) override;
        void on_batch_dispatch(std::string_view loader_name, std::size_t key_count) override;

        // Static configuration
        static void set_print_all_values(bool value);
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _execution;
        bool _field;
        bool _drain;
        bool _batch;
        std::ostream *_out;

        static bool _print_all_values;
        static bool _use_logger;

        void _print(std::string_view msg) const;
        bool _should_log_path(const ResponsePath &path) const;
    };

} // namespace syncdl
