#ifndef SYNCDL_RUNTIME_DEFERRED_H
#define SYNCDL_RUNTIME_DEFERRED_H

#include <syncdl/util/errors.h>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace syncdl {

    template<typename T>
    class Deferred;

    template<typename T>
    struct is_deferred : std::false_type {};

    template<typename T>
    struct is_deferred<Deferred<T>> : std::true_type {};

    template<typename T>
    inline constexpr bool is_deferred_v = is_deferred<std::remove_cvref_t<T>>::value;

    // The value type a Deferred settles to once R has been flattened, i.e. Deferred<X> -> X, otherwise R.
    template<typename R>
    struct deferred_value {
        using type = std::remove_cvref_t<R>;
    };

    template<typename X>
    struct deferred_value<Deferred<X>> {
        using type = X;
    };

    template<typename R>
    using deferred_value_t = typename deferred_value<std::remove_cvref_t<R>>::type;

    /**
     * A synchronous, settle-once container for a value that is not available yet.
     *
     * Deferred is a handle: copies share the same state, and the state lives for as long as any handle or any
     * registered callback refers to it. The settle operations are therefore const, in the same way a
     * std::shared_ptr does not need to be mutable to modify the object it points to.
     *
     * There is no scheduler involved. Callbacks are invoked synchronously, in registration order, from inside the
     * set_result / set_error call that settles the value, and may themselves settle further Deferreds before that
     * call returns.
     *
     * Settling with another Deferred (set_result(Deferred)) makes this Deferred follow the other one: it settles
     * with the same value or error once the other settles. Following can be chained, but a Deferred can never end
     * up following itself.
     */
    template<typename T>
    class Deferred {
    public:
        using value_type = T;
        using callback_type = std::function<void(const Deferred &)>;
        using dispatch_hint_type = std::function<void()>;

        Deferred() : _state{std::make_shared<State>()} {}

        [[nodiscard]] static Deferred resolved(T value) {
            Deferred d;
            d.set_result(std::move(value));
            return d;
        }

        [[nodiscard]] static Deferred failed(std::exception_ptr error) {
            Deferred d;
            d.set_error(std::move(error));
            return d;
        }

        [[nodiscard]] bool is_done() const noexcept { return _state->status != Status::PENDING; }

        [[nodiscard]] bool is_failed() const noexcept { return _state->status == Status::FAILED; }

        /**
         * True while this Deferred is waiting on another Deferred it was settled with.
         */
        [[nodiscard]] bool is_following() const noexcept { return !_state->following.expired(); }

        /**
         * The settled value, rethrows the stored error if this failed.
         */
        [[nodiscard]] const T &get_result() const {
            assert_done();
            if (_state->status == Status::FAILED) { std::rethrow_exception(_state->error); }
            return *_state->value;
        }

        /**
         * The stored error, or an empty exception_ptr if this settled with a value.
         */
        [[nodiscard]] std::exception_ptr error() const {
            assert_done();
            return _state->error;
        }

        void on_done(callback_type callback) const {
            assert_pending("on_done");
            _state->callbacks.push_back(std::move(callback));
        }

        void set_result(T value) const {
            assert_settable();
            _state->value.emplace(std::move(value));
            finish(Status::SETTLED);
        }

        void set_result(const Deferred &other) const {
            if (other._state == _state) { throw InvalidStateError("Cannot resolve a deferred with itself."); }
            assert_settable();
            // Walk the chain other is already waiting on, settling with any member of it would never complete.
            for (auto link = other._state->following.lock(); link; link = link->following.lock()) {
                if (link == _state) { throw InvalidStateError("Cannot resolve a deferred with itself (cycle)."); }
            }
            if (other.is_done()) {
                adopt(other);
                return;
            }
            _state->following = other._state;
            other.on_done([self = *this](const Deferred &settled) {
                self._state->following.reset();
                self.adopt(settled);
            });
        }

        void set_error(std::exception_ptr error) const {
            assert_settable();
            if (!error) { error = std::make_exception_ptr(std::runtime_error("Deferred failed without an error")); }
            _state->error = std::move(error);
            finish(Status::FAILED);
        }

        template<typename E>
            requires std::derived_from<std::remove_cvref_t<E>, std::exception>
        void set_error(E &&error) const {
            set_error(std::make_exception_ptr(std::forward<E>(error)));
        }

        /**
         * A new Deferred settled with transform(value) once this settles. If transform returns a Deferred the
         * result follows it. If this fails, or transform throws, the new Deferred fails with that error.
         * When this is already done the transform runs immediately.
         */
        template<typename F>
        [[nodiscard]] auto then(F &&transform) const {
            using R = std::invoke_result_t<std::decay_t<F> &, const T &>;
            static_assert(!std::is_void_v<R>, "The transform passed to then must return a value");
            using U = deferred_value_t<R>;

            Deferred<U> next;
            auto continuation = [next, transform = std::forward<F>(transform)](const Deferred &settled) mutable {
                if (settled.is_failed()) {
                    next.set_error(settled.error());
                    return;
                }
                std::optional<std::remove_cvref_t<R>> produced;
                try {
                    produced.emplace(transform(settled.get_result()));
                } catch (...) {
                    next.set_error(std::current_exception());
                    return;
                }
                next.set_result(std::move(*produced));
            };
            if (is_done()) {
                continuation(*this);
            } else {
                on_done(std::move(continuation));
            }
            return next;
        }

        /**
         * Optional callable a producer may attach so a consumer can request the work behind this Deferred before
         * it settles (for example to register a dispatch on a scope eagerly).
         */
        void set_dispatch_hint(dispatch_hint_type hint) const { _state->dispatch_hint = std::move(hint); }

        [[nodiscard]] const dispatch_hint_type &dispatch_hint() const noexcept { return _state->dispatch_hint; }

        [[nodiscard]] const void *id() const noexcept { return _state.get(); }

        [[nodiscard]] std::size_t pending_callbacks() const noexcept { return _state->callbacks.size(); }

        friend bool operator==(const Deferred &lhs, const Deferred &rhs) noexcept { return lhs._state == rhs._state; }

    private:
        enum class Status { PENDING, SETTLED, FAILED };

        struct State {
            Status status{Status::PENDING};
            std::optional<T> value{};
            std::exception_ptr error{};
            std::vector<callback_type> callbacks{};
            std::weak_ptr<State> following{};
            dispatch_hint_type dispatch_hint{};
        };

        void assert_done() const {
            if (!is_done()) { throw InvalidStateError("Deferred is not done."); }
        }

        void assert_pending(const char *operation) const {
            if (is_done()) { throw_error<InvalidStateError>("Deferred is already done, cannot call {}.", operation); }
        }

        void assert_settable() const {
            assert_pending("set_result/set_error");
            if (is_following()) { throw InvalidStateError("Deferred is already following another deferred."); }
        }

        void adopt(const Deferred &settled) const {
            if (settled.is_failed()) {
                set_error(settled.error());
            } else {
                set_result(settled.get_result());
            }
        }

        void finish(Status status) const {
            _state->status = status;
            _state->dispatch_hint = nullptr;
            auto callbacks = std::move(_state->callbacks);
            _state->callbacks.clear();
            for (auto &callback : callbacks) { callback(*this); }
        }

        std::shared_ptr<State> _state;
    };

    /**
     * Settles with every value of deferreds in order once they have all settled, or fails with the first failure.
     */
    template<typename T>
    [[nodiscard]] Deferred<std::vector<T>> gather(const std::vector<Deferred<T>> &deferreds) {
        struct Frame {
            std::vector<std::optional<T>> values;
            std::size_t pending;
            bool failed{false};
        };
        Deferred<std::vector<T>> result;
        auto frame = std::make_shared<Frame>(Frame{std::vector<std::optional<T>>(deferreds.size()), deferreds.size()});

        auto complete_one = [result, frame](std::size_t index, const Deferred<T> &settled) {
            if (frame->failed) { return; }
            if (settled.is_failed()) {
                frame->failed = true;
                result.set_error(settled.error());
                return;
            }
            frame->values[index].emplace(settled.get_result());
            if (--frame->pending == 0) {
                std::vector<T> values;
                values.reserve(frame->values.size());
                for (auto &value : frame->values) { values.push_back(std::move(*value)); }
                result.set_result(std::move(values));
            }
        };

        if (deferreds.empty()) {
            result.set_result(std::vector<T>{});
            return result;
        }
        for (std::size_t i = 0; i < deferreds.size(); ++i) {
            const auto &d = deferreds[i];
            if (d.is_done()) {
                complete_one(i, d);
            } else {
                d.on_done([complete_one, i](const Deferred<T> &settled) { complete_one(i, settled); });
            }
        }
        return result;
    }

} // namespace syncdl

#endif // SYNCDL_RUNTIME_DEFERRED_H
