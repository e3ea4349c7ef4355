#ifndef SYNCDL_RUNTIME_BATCH_SCOPE_H
#define SYNCDL_RUNTIME_BATCH_SCOPE_H

#include <syncdl/syncdl_export.h>
#include <syncdl/syncdl_forward_declarations.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <string_view>
#include <vector>

namespace syncdl {

    /**
     * Registry of callbacks to run once the current synchronous pass has finished. This is the synchronous
     * equivalent of an event loop's call_soon, and is what lets independent loads made during one pass be
     * coalesced into a single batch.
     *
     * A scope is injected into the loaders that use it (and exposed to resolvers through ResolveInfo), there is no
     * process wide current scope. Callbacks can only be added while the scope is active, and a scope can only be
     * activated once at a time.
     */
    class SYNCDL_EXPORT BatchScope {
    public:
        using callback_type = std::function<void()>;

        /**
         * Activates the scope for its life-time.
         * close() drains the queue and deactivates, propagating any error raised by a callback.
         * If close() was not called the destructor deactivates: when an exception is unwinding the queued callbacks
         * are discarded, otherwise they are drained first (errors are reported to stderr since destructors must
         * not throw).
         */
        class SYNCDL_EXPORT Activation {
        public:
            explicit Activation(BatchScope &scope);

            ~Activation() noexcept;

            Activation(const Activation &) = delete;

            Activation &operator=(const Activation &) = delete;

            Activation(Activation &&) = delete;

            Activation &operator=(Activation &&) = delete;

            void close();

            // Deactivates without draining, queued callbacks are discarded
            void abandon() noexcept;

            [[nodiscard]] bool is_open() const noexcept { return _scope != nullptr; }

        private:
            BatchScope *_scope;
            int _uncaught_on_entry;
        };

        BatchScope() = default;

        BatchScope(const BatchScope &) = delete;

        BatchScope &operator=(const BatchScope &) = delete;

        [[nodiscard]] bool is_active() const noexcept { return _active; }

        [[nodiscard]] bool is_draining() const noexcept { return _draining; }

        [[nodiscard]] std::size_t pending() const noexcept { return _callbacks.size(); }

        /**
         * Queues a callback for the next drain. on_discard, when given, is run instead of the callback if the
         * activation ends without draining it (an error left the scope, or it was abandoned), so the owner of the
         * callback can release whatever it was waiting to process.
         */
        void add_callback(callback_type callback, callback_type on_discard = {});

        /**
         * Run queued callbacks, oldest first, until the queue is empty. Callbacks added while draining are run as
         * part of the same drain. Calling drain from inside a callback is a no-op, the outer drain picks up the
         * work. Returns the number of callbacks run.
         */
        std::size_t drain();

        void add_observer(execution_observer_ptr observer);

        void remove_observer(execution_observer_ptr observer);

        [[nodiscard]] const std::vector<execution_observer_ptr> &observers() const noexcept { return _observers; }

        void notify_batch_dispatch(std::string_view loader_name, std::size_t key_count) const;

    private:
        void activate();

        void deactivate() noexcept;

        // Drops the queued callbacks, running their discard handlers. Handler errors are reported to stderr.
        void discard() noexcept;

        struct QueuedCallback {
            callback_type run;
            callback_type on_discard;
        };

        std::deque<QueuedCallback> _callbacks{};
        std::vector<execution_observer_ptr> _observers{};
        bool _active{false};
        bool _draining{false};
    };

} // namespace syncdl

#endif // SYNCDL_RUNTIME_BATCH_SCOPE_H
