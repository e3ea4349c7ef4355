#ifndef SYNCDL_UTIL_SCOPE_H
#define SYNCDL_UTIL_SCOPE_H

#include <utility>

namespace syncdl {
    // Runs f when leaving the enclosing block, on every path
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)) {
        }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        ~scope_exit() { fn_(); }

    private:
        F fn_;
    };

    // Returned as a prvalue, so the guard is never moved
    template<class F>
    scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }
} // namespace syncdl
#endif  // SYNCDL_UTIL_SCOPE_H
