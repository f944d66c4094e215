#ifndef DYNSCOPE_RUNTIME_INHERIT_H
#define DYNSCOPE_RUNTIME_INHERIT_H

#include <dynscope/scope/scope_runner.h>

#include <thread>

namespace dynscope {

    /**
     * Capture the calling unit's inheritable bindings now and return a callable that runs ``fn`` under them,
     * wherever and whenever it is eventually invoked.
     */
    template<typename F>
    [[nodiscard]] auto inherit_scope(F &&fn) {
        return [snapshot = capture(), fn = std::forward<F>(fn)](auto &&...args) mutable -> decltype(auto) {
            return call_with_snapshot(snapshot, [&]() -> decltype(auto) {
                return std::invoke(fn, std::forward<decltype(args)>(args)...);
            });
        };
    }

    /**
     * Start a thread whose entry point runs under the spawning unit's inheritable bindings.
     */
    template<typename F, typename... Args>
    [[nodiscard]] std::thread spawn_thread(F &&fn, Args &&...args) {
        return std::thread(inherit_scope(std::forward<F>(fn)), std::forward<Args>(args)...);
    }

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_INHERIT_H
