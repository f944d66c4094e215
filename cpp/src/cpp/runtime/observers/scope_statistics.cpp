#include <dynscope/runtime/observers/scope_statistics.h>

namespace dynscope {

    void ScopeStatistics::on_enter_frame(FrameTransition transition, const BindingFrame *frame,
                                         const BindingFrame * /*previous*/) {
        switch (transition) {
            case FrameTransition::PUSH: _pushes.fetch_add(1, std::memory_order_relaxed); break;
            case FrameTransition::SNAPSHOT: _snapshot_installs.fetch_add(1, std::memory_order_relaxed); break;
            case FrameTransition::CONTINUATION: _continuation_resumes.fetch_add(1, std::memory_order_relaxed); break;
        }
        size_t depth = frame == nullptr ? 0 : frame->depth();
        size_t seen = _max_depth.load(std::memory_order_relaxed);
        while (depth > seen && !_max_depth.compare_exchange_weak(seen, depth, std::memory_order_relaxed)) {}
    }

    void ScopeStatistics::on_exit_frame(FrameTransition, const BindingFrame *, const BindingFrame *) {
        _pops.fetch_add(1, std::memory_order_relaxed);
    }

    void ScopeStatistics::on_capture(const BindingFrame *, const BindingFrame *) {
        _captures.fetch_add(1, std::memory_order_relaxed);
    }

    void ScopeStatistics::reset() noexcept {
        _pushes.store(0, std::memory_order_relaxed);
        _pops.store(0, std::memory_order_relaxed);
        _snapshot_installs.store(0, std::memory_order_relaxed);
        _continuation_resumes.store(0, std::memory_order_relaxed);
        _captures.store(0, std::memory_order_relaxed);
        _max_depth.store(0, std::memory_order_relaxed);
    }

} // namespace dynscope
