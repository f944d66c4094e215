#include <dynscope/runtime/cancellation.h>
#include <dynscope/scope/resolution.h>
#include <dynscope/util/errors.h>

namespace dynscope {

    CancellationToken::CancellationToken() : _state{std::make_shared<std::atomic<bool>>(false)} {}

    void CancellationToken::request_cancel() noexcept { _state->store(true, std::memory_order_release); }

    bool CancellationToken::is_cancellation_requested() const noexcept { return _state->load(std::memory_order_acquire); }

    void CancellationToken::throw_if_cancelled() const {
        if (is_cancellation_requested()) { throw_error<CancelledError>("Operation cancelled"); }
    }

    const ScopedKey<CancellationToken> &cancellation_key() {
        static const ScopedKey<CancellationToken> key{"cancellation", Inheritance::INHERITABLE};
        return key;
    }

    void check_cancelled() {
        if (const Value *token = resolve(cancellation_key()); token != nullptr) {
            token->as<CancellationToken>().throw_if_cancelled();
        }
    }

} // namespace dynscope
