#include <dynscope/scope/snapshot.h>
#include <dynscope/scope/unit_state.h>
#include <dynscope/runtime/scope_observer.h>
#include <dynscope/util/errors.h>

namespace dynscope {

    Snapshot Snapshot::capture() {
        const BindingFrame::ptr &source = ExecutionUnitState::current().frame();
        Snapshot snapshot{BindingFrame::inheritable_projection(source)};
        if (ScopeObservers::has_observers()) { ScopeObservers::notify_capture(source.get(), snapshot._frame.get()); }
        return snapshot;
    }

    const Value *Snapshot::resolve(const ScopedKeyBase &key) const noexcept {
        return BindingFrame::resolve(_frame.get(), key);
    }

    const Value &Snapshot::bound_value(const ScopedKeyBase &key) const {
        const Value *value = resolve(key);
        if (value == nullptr) { throw_error<UnboundKeyError>("Key '{}' is not bound in this snapshot", key.to_string()); }
        return *value;
    }

} // namespace dynscope
