#ifndef DYNSCOPE_SCOPE_SCOPE_RUNNER_H
#define DYNSCOPE_SCOPE_SCOPE_RUNNER_H

#include <dynscope/scope/carrier.h>
#include <dynscope/scope/continuation.h>
#include <dynscope/scope/snapshot.h>
#include <dynscope/scope/unit_state.h>
#include <dynscope/util/scope.h>

#include <functional>
#include <type_traits>

namespace dynscope {

    namespace detail {
        /**
         * Make ``frame`` current on the calling unit, invoke ``body`` and restore the previous frame on every exit path
         * before the result, or the exception, leaves this function.
         */
        template<typename F>
        decltype(auto) invoke_in_frame(BindingFrame::ptr frame, FrameTransition transition, F &&body) {
            auto &unit = ExecutionUnitState::current();
            BindingFrame::ptr previous = FrameSwap::enter(unit, std::move(frame), transition);
            auto restore = make_scope_exit([&unit, &previous, transition]() noexcept {
                FrameSwap::leave(unit, std::move(previous), transition);
            });
            return std::invoke(std::forward<F>(body));
        }
    } // namespace detail

    /**
     * Bind the carrier's pending bindings for the dynamic extent of ``body`` and return its result.
     *
     * A new frame whose parent is the current frame is pushed, ``body`` runs, and the previous frame is current again
     * once call returns or rethrows. Exceptions from ``body`` propagate unchanged.
     */
    template<typename F>
    decltype(auto) call(const Carrier &carrier, F &&body) {
        auto frame = BindingFrame::push(ExecutionUnitState::current().frame(), carrier.bindings());
        return detail::invoke_in_frame(std::move(frame), FrameTransition::PUSH, std::forward<F>(body));
    }

    template<typename F>
    void run(const Carrier &carrier, F &&body) {
        call(carrier, [&body]() { std::invoke(std::forward<F>(body)); });
    }

    template<typename T, typename U, typename F>
        requires std::is_convertible_v<U &&, T>
    decltype(auto) call_where(const ScopedKey<T> &key, U &&value, F &&body) {
        return call(where(key, std::forward<U>(value)), std::forward<F>(body));
    }

    template<typename T, typename U, typename F>
        requires std::is_convertible_v<U &&, T>
    void run_where(const ScopedKey<T> &key, U &&value, F &&body) {
        run(where(key, std::forward<U>(value)), std::forward<F>(body));
    }

    /**
     * Run ``body`` with ``snapshot`` as the calling unit's current frame, restoring the unit's prior frame on exit.
     * This is how a newly spawned unit takes on the bindings inherited from the unit that spawned it.
     */
    template<typename F>
    decltype(auto) call_with_snapshot(const Snapshot &snapshot, F &&body) {
        return detail::invoke_in_frame(snapshot.frame(), FrameTransition::SNAPSHOT, std::forward<F>(body));
    }

    template<typename F>
    void run_with_snapshot(const Snapshot &snapshot, F &&body) {
        call_with_snapshot(snapshot, [&body]() { std::invoke(std::forward<F>(body)); });
    }

    /**
     * Resume a logical task with the frame it saved when it suspended.
     */
    template<typename F>
    decltype(auto) call_with_continuation(const ContinuationState &state, F &&body) {
        return detail::invoke_in_frame(state.frame(), FrameTransition::CONTINUATION, std::forward<F>(body));
    }

    template<typename F>
    void run_with_continuation(const ContinuationState &state, F &&body) {
        call_with_continuation(state, [&body]() { std::invoke(std::forward<F>(body)); });
    }

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_SCOPE_RUNNER_H
