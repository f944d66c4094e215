#ifndef DYNSCOPE_SCOPE_CONTINUATION_H
#define DYNSCOPE_SCOPE_CONTINUATION_H

#include <dynscope/scope/binding_frame.h>

namespace dynscope {

    /**
     * ContinuationState - The complete current frame of a logical task, carried with the task when it suspends on
     * one worker and resumes on another.
     *
     * Unlike a Snapshot this keeps LOCAL bindings: a resumed task is the same execution unit, not a new one.
     */
    class DYNSCOPE_EXPORT ContinuationState {
    public:
        ContinuationState() = default;

        [[nodiscard]] static ContinuationState save();

        [[nodiscard]] const BindingFrame::ptr &frame() const noexcept { return _frame; }
        [[nodiscard]] bool empty() const noexcept { return _frame == nullptr; }

    private:
        explicit ContinuationState(BindingFrame::ptr frame) : _frame(std::move(frame)) {}

        BindingFrame::ptr _frame;
    };

    [[nodiscard]] inline ContinuationState save_continuation() { return ContinuationState::save(); }

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_CONTINUATION_H
