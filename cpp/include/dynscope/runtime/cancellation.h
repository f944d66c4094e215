#ifndef DYNSCOPE_RUNTIME_CANCELLATION_H
#define DYNSCOPE_RUNTIME_CANCELLATION_H

#include <dynscope/scope/scoped_key.h>

#include <atomic>

namespace dynscope {

    /**
     * CancellationToken - Shared, thread-safe cancellation flag. Copies refer to the same flag.
     *
     * Cancellation is cooperative: code polls the token at cancellation points, and throw_if_cancelled raises
     * CancelledError, which leaves every enclosing run/call through the normal restore path.
     */
    class DYNSCOPE_EXPORT CancellationToken {
    public:
        CancellationToken();

        void request_cancel() noexcept;

        [[nodiscard]] bool is_cancellation_requested() const noexcept;

        void throw_if_cancelled() const;

        bool operator==(const CancellationToken &other) const noexcept { return _state == other._state; }

    private:
        std::shared_ptr<std::atomic<bool>> _state;
    };

    /**
     * The inheritable key under which runtime collaborators (e.g. TaskPool) bind the token governing the work they
     * run, so that any code in the task's extent can reach it.
     */
    [[nodiscard]] DYNSCOPE_EXPORT const ScopedKey<CancellationToken> &cancellation_key();

    /**
     * Cancellation point: throws CancelledError if a token is bound in the current scope and has been cancelled.
     */
    DYNSCOPE_EXPORT void check_cancelled();

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_CANCELLATION_H
