#ifndef DYNSCOPE_RUNTIME_OBSERVERS_SCOPE_TRACE_H
#define DYNSCOPE_RUNTIME_OBSERVERS_SCOPE_TRACE_H

#include <dynscope/runtime/scope_observer.h>

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace dynscope {

    /**
     * @brief Logs every frame transition and capture as it happens.
     *
     * This is voluminous but can be helpful tracing down a binding that is not visible where it is expected.
     * Each line carries the unit (thread) it happened on, the transition and the frame involved.
     */
    class DYNSCOPE_EXPORT ScopeTrace : public ScopeObserver {
    public:
        /**
         * @param filter Only report frames binding a key whose name contains this (substring match)
         * @param out Destination of the trace lines
         * @param enter Log frames becoming current
         * @param exit Log frames being restored away
         * @param capture Log snapshot captures
         */
        explicit ScopeTrace(const std::optional<std::string> &filter = std::nullopt, std::ostream &out = std::cerr,
                            bool enter = true, bool exit = true, bool capture = true);

        void on_enter_frame(FrameTransition transition, const BindingFrame *frame,
                            const BindingFrame *previous) override;
        void on_exit_frame(FrameTransition transition, const BindingFrame *exited,
                           const BindingFrame *restored) override;
        void on_capture(const BindingFrame *source, const BindingFrame *captured) override;

        [[nodiscard]] const std::optional<std::string> &filter() const noexcept { return _filter; }

    private:
        std::optional<std::string> _filter;
        std::ostream &_out;
        bool _enter;
        bool _exit;
        bool _capture;
        std::mutex _mutex;

        void _print(const std::string &msg);
        [[nodiscard]] bool _should_log(const BindingFrame *frame) const;
        [[nodiscard]] static std::string _frame_name(const BindingFrame *frame);
    };

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_OBSERVERS_SCOPE_TRACE_H
