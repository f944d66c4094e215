#include <dynscope/runtime/observers/scope_trace.h>

#include <fmt/format.h>

#include <functional>
#include <thread>

namespace dynscope {

    ScopeTrace::ScopeTrace(const std::optional<std::string> &filter, std::ostream &out, bool enter, bool exit,
                           bool capture)
        : _filter(filter), _out(out), _enter(enter), _exit(exit), _capture(capture) {}

    void ScopeTrace::on_enter_frame(FrameTransition transition, const BindingFrame *frame,
                                    const BindingFrame *previous) {
        if (!_enter || !_should_log(frame)) { return; }
        _print(fmt::format("{} enter {} (from {})", to_string(transition), _frame_name(frame), _frame_name(previous)));
    }

    void ScopeTrace::on_exit_frame(FrameTransition transition, const BindingFrame *exited,
                                   const BindingFrame *restored) {
        if (!_exit || !_should_log(exited)) { return; }
        _print(fmt::format("{} exit {} (back to {})", to_string(transition), _frame_name(exited),
                           _frame_name(restored)));
    }

    void ScopeTrace::on_capture(const BindingFrame *source, const BindingFrame *captured) {
        if (!_capture || !_should_log(source)) { return; }
        _print(fmt::format("CAPTURE {} as {}", _frame_name(source), _frame_name(captured)));
    }

    void ScopeTrace::_print(const std::string &msg) {
        auto unit = std::hash<std::thread::id>{}(std::this_thread::get_id());
        std::lock_guard<std::mutex> lock(_mutex);
        _out << fmt::format("[dynscope][{:x}] {}", unit, msg) << std::endl;
    }

    bool ScopeTrace::_should_log(const BindingFrame *frame) const {
        if (!_filter.has_value()) { return true; }
        for (; frame != nullptr; frame = frame->parent().get()) {
            for (const auto &binding : frame->bindings()) {
                if (binding.key.name().find(_filter.value()) != std::string::npos) { return true; }
            }
        }
        return false;
    }

    std::string ScopeTrace::_frame_name(const BindingFrame *frame) {
        return frame == nullptr ? std::string{"<root>"} : frame->to_string();
    }

} // namespace dynscope
