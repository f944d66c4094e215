// Scope guards until std::experimental::scope_exit is available on every supported toolchain.
#ifndef DYNSCOPE_UTIL_SCOPE_H
#define DYNSCOPE_UTIL_SCOPE_H

#include <type_traits>
#include <utility>

namespace dynscope {
    /**
     * Runs the stored callable when the guard leaves scope, whether by return, exception or
     * cancellation. The callable must not throw.
     */
    template<class F>
    class scope_exit {
    public:
        static_assert(std::is_nothrow_invocable_v<F &>, "scope_exit callables must be noexcept");

        template<class G>
        explicit scope_exit(G &&g) noexcept(std::is_nothrow_constructible_v<F, G>) : fn_(std::forward<G>(g)), active_(true) {
        }

        scope_exit(scope_exit &&other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) { other.release(); }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (active_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

        [[nodiscard]] bool is_active() const noexcept { return active_; }

    private:
        F fn_;
        bool active_;
    };

    template<class F>
    [[nodiscard]] scope_exit<std::decay_t<F>> make_scope_exit(F &&f) {
        return scope_exit<std::decay_t<F>>(std::forward<F>(f));
    }
} // namespace dynscope
#endif  // DYNSCOPE_UTIL_SCOPE_H
