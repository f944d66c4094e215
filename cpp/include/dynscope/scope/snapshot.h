#ifndef DYNSCOPE_SCOPE_SNAPSHOT_H
#define DYNSCOPE_SCOPE_SNAPSHOT_H

#include <dynscope/scope/binding_frame.h>

namespace dynscope {

    /**
     * Snapshot - The inheritable bindings visible to a unit at the moment of capture.
     *
     * A snapshot owns a reference to an immutable frame chain, so it remains valid and resolvable after the capturing
     * scope, or the capturing thread, has ended. Bindings of LOCAL keys are not part of the chain and cannot be
     * recovered from it. Copying a snapshot copies one pointer.
     */
    class DYNSCOPE_EXPORT Snapshot {
    public:
        // The empty snapshot, installing it runs a body at the root
        Snapshot() = default;

        /**
         * Capture the calling unit's current inheritable bindings. O(1), the projection is precomputed by each frame.
         */
        [[nodiscard]] static Snapshot capture();

        [[nodiscard]] const BindingFrame::ptr &frame() const noexcept { return _frame; }
        [[nodiscard]] bool empty() const noexcept { return _frame == nullptr; }
        [[nodiscard]] size_t depth() const noexcept { return _frame ? _frame->depth() : 0; }

        /**
         * Resolve against this snapshot without installing it.
         */
        [[nodiscard]] const Value *resolve(const ScopedKeyBase &key) const noexcept;

        [[nodiscard]] bool is_bound(const ScopedKeyBase &key) const noexcept { return resolve(key) != nullptr; }

        template<typename T>
        [[nodiscard]] const T &get(const ScopedKey<T> &key) const {
            return bound_value(key).template as<T>();
        }

    private:
        explicit Snapshot(BindingFrame::ptr frame) : _frame(std::move(frame)) {}

        [[nodiscard]] const Value &bound_value(const ScopedKeyBase &key) const;

        BindingFrame::ptr _frame;
    };

    [[nodiscard]] inline Snapshot capture() { return Snapshot::capture(); }

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_SNAPSHOT_H
