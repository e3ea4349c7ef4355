#ifndef SYNCDL_RUNTIME_EXECUTION_OBSERVER_H
#define SYNCDL_RUNTIME_EXECUTION_OBSERVER_H

#include <syncdl/syncdl_forward_declarations.h>

#include <cstddef>
#include <string_view>

namespace syncdl {

    /**
     * Receives notifications as an execution walks the field tree and as its batch scope drains.
     * Observers are owned externally and must outlive the scope / execution they are registered with.
     * All hooks default to no-ops.
     */
    struct ExecutionLifeCycleObserver {
        virtual ~ExecutionLifeCycleObserver() = default;

        virtual void on_before_execution(const ExecutionContext &) {
        };

        virtual void on_after_execution(const ExecutionContext &, const ExecutionResult &) {
        };

        virtual void on_before_field_resolve(const ResolveInfo &) {
        };

        virtual void on_after_field_resolve(const ResolveInfo &) {
        };

        // The field resolved to a Deferred that is not done yet, its slot is now a placeholder.
        virtual void on_field_deferred(const ResponsePath &) {
        };

        virtual void on_field_error(const LocatedError &) {
        };

        virtual void on_before_drain(std::size_t /*queued*/) {
        };

        virtual void on_after_drain(std::size_t /*callbacks_run*/) {
        };

        virtual void on_batch_dispatch(std::string_view /*loader_name*/, std::size_t /*key_count*/) {
        };
    };

} // namespace syncdl

#endif // SYNCDL_RUNTIME_EXECUTION_OBSERVER_H
