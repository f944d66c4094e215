#ifndef DYNSCOPE_FORWARD_DECLARATIONS_H
#define DYNSCOPE_FORWARD_DECLARATIONS_H

#include <memory>

namespace dynscope {
    // TypeMeta - static or registry owned, always held by raw const pointer
    struct TypeMeta;

    class Value;

    // Keys are handles onto a shared descriptor
    struct KeyDescriptor;
    class ScopedKeyBase;
    template<typename T>
    class ScopedKey;

    // BindingFrame - immutable, shared across execution units
    class BindingFrame;
    using binding_frame_ptr = std::shared_ptr<const BindingFrame>;

    struct Binding;
    class Carrier;
    class Snapshot;
    class ContinuationState;
    class ExecutionUnitState;

    // ScopeObserver - externally managed, shared_ptr
    struct ScopeObserver;
    using scope_observer_s_ptr = std::shared_ptr<ScopeObserver>;

    struct ComponentLifeCycle;
    class TaskPool;
    class CancellationToken;
} // namespace dynscope

#endif // DYNSCOPE_FORWARD_DECLARATIONS_H
