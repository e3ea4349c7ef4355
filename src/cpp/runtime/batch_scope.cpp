#include <syncdl/runtime/batch_scope.h>
#include <syncdl/runtime/execution_observer.h>
#include <syncdl/util/errors.h>
#include <syncdl/util/scope.h>

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace syncdl {

    BatchScope::Activation::Activation(BatchScope &scope)
        : _scope{&scope}, _uncaught_on_entry{std::uncaught_exceptions()} {
        _scope->activate();
    }

    void BatchScope::Activation::close() {
        if (_scope == nullptr) { return; }
        auto *scope = _scope;
        _scope = nullptr;
        // On success the queue is already empty, on failure whatever is left is dropped with the activation.
        auto deactivate = make_scope_exit([scope] {
            scope->deactivate();
            scope->discard();
        });
        scope->drain();
    }

    void BatchScope::Activation::abandon() noexcept {
        if (_scope == nullptr) { return; }
        auto *scope = _scope;
        _scope = nullptr;
        scope->deactivate();
        scope->discard();
    }

    BatchScope::Activation::~Activation() noexcept {
        if (_scope == nullptr) { return; }
        auto *scope = _scope;
        _scope = nullptr;
        if (std::uncaught_exceptions() > _uncaught_on_entry) {
            // Leaving because of an error, the queued work belongs to an execution that has already failed.
            scope->deactivate();
            scope->discard();
            return;
        }
        try {
            scope->drain();
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception while draining batch scope on exit: {}\n", e.what());
        }
        scope->deactivate();
        scope->discard();
    }

    void BatchScope::activate() {
        if (_active) { throw ConfigurationError("Batch scope is already active, nested activation is not supported."); }
        _active = true;
    }

    void BatchScope::deactivate() noexcept {
        _active = false;
        _draining = false;
    }

    void BatchScope::discard() noexcept {
        // The scope is inactive by now, so a discard handler cannot queue more work.
        auto callbacks = std::exchange(_callbacks, {});
        for (auto &queued : callbacks) {
            if (!queued.on_discard) { continue; }
            try {
                queued.on_discard();
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception while discarding batch scope callback: {}\n", e.what());
            }
        }
    }

    void BatchScope::add_callback(callback_type callback, callback_type on_discard) {
        if (!_active) { throw ConfigurationError("No active batch scope, was the execution started correctly?"); }
        _callbacks.push_back({std::move(callback), std::move(on_discard)});
    }

    std::size_t BatchScope::drain() {
        if (_draining) { return 0; }
        _draining = true;
        auto reset = make_scope_exit([this] { _draining = false; });

        for (auto *observer : _observers) { observer->on_before_drain(_callbacks.size()); }
        std::size_t run{0};
        while (!_callbacks.empty()) {
            auto callback = std::move(_callbacks.front().run);
            _callbacks.pop_front();
            callback();
            ++run;
        }
        for (auto *observer : _observers) { observer->on_after_drain(run); }
        return run;
    }

    void BatchScope::add_observer(execution_observer_ptr observer) {
        if (observer == nullptr) { return; }
        if (std::find(_observers.begin(), _observers.end(), observer) == _observers.end()) {
            _observers.push_back(observer);
        }
    }

    void BatchScope::remove_observer(execution_observer_ptr observer) {
        std::erase(_observers, observer);
    }

    void BatchScope::notify_batch_dispatch(std::string_view loader_name, std::size_t key_count) const {
        for (auto *observer : _observers) { observer->on_batch_dispatch(loader_name, key_count); }
    }

} // namespace syncdl
