#include <dynscope/scope/continuation.h>
#include <dynscope/scope/unit_state.h>

namespace dynscope {

    ContinuationState ContinuationState::save() { return ContinuationState{ExecutionUnitState::current().frame()}; }

} // namespace dynscope
