#ifndef DYNSCOPE_RUNTIME_OBSERVERS_SCOPE_STATISTICS_H
#define DYNSCOPE_RUNTIME_OBSERVERS_SCOPE_STATISTICS_H

#include <dynscope/runtime/scope_observer.h>

#include <atomic>

namespace dynscope {

    /**
     * @brief Counts frame transitions across all execution units, useful to see how much scoping a workload does.
     */
    class DYNSCOPE_EXPORT ScopeStatistics : public ScopeObserver {
    public:
        void on_enter_frame(FrameTransition transition, const BindingFrame *frame,
                            const BindingFrame *previous) override;
        void on_exit_frame(FrameTransition transition, const BindingFrame *exited,
                           const BindingFrame *restored) override;
        void on_capture(const BindingFrame *source, const BindingFrame *captured) override;

        [[nodiscard]] uint64_t pushes() const noexcept { return _pushes.load(std::memory_order_relaxed); }
        [[nodiscard]] uint64_t pops() const noexcept { return _pops.load(std::memory_order_relaxed); }
        [[nodiscard]] uint64_t snapshot_installs() const noexcept { return _snapshot_installs.load(std::memory_order_relaxed); }
        [[nodiscard]] uint64_t continuation_resumes() const noexcept {
            return _continuation_resumes.load(std::memory_order_relaxed);
        }
        [[nodiscard]] uint64_t captures() const noexcept { return _captures.load(std::memory_order_relaxed); }

        // Deepest frame made current since the last reset
        [[nodiscard]] size_t max_depth() const noexcept { return _max_depth.load(std::memory_order_relaxed); }

        void reset() noexcept;

    private:
        std::atomic<uint64_t> _pushes{0};
        std::atomic<uint64_t> _pops{0};
        std::atomic<uint64_t> _snapshot_installs{0};
        std::atomic<uint64_t> _continuation_resumes{0};
        std::atomic<uint64_t> _captures{0};
        std::atomic<size_t> _max_depth{0};
    };

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_OBSERVERS_SCOPE_STATISTICS_H
