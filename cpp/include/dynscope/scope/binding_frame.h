#ifndef DYNSCOPE_SCOPE_BINDING_FRAME_H
#define DYNSCOPE_SCOPE_BINDING_FRAME_H

#include <dynscope/scope/scoped_key.h>
#include <dynscope/types/value.h>

namespace dynscope {

    struct DYNSCOPE_EXPORT Binding {
        ScopedKeyBase key;
        Value value;
    };

    /**
     * BindingFrame - One set of bindings established by a single binding operation, linked to its parent.
     *
     * Frames form a persistent singly-linked chain. A null frame pointer is the root (empty) frame. Once
     * constructed nothing in a frame changes, so a chain can be shared by reference between any number of
     * execution units without locking; a frame lives as long as any current-frame pointer, snapshot or child
     * frame refers to it.
     *
     * Each frame also carries:
     * - key_mask: the union of the mask bits of every key bound in this frame or its ancestors. A key whose bit is
     *   absent cannot be bound anywhere in the chain.
     * - the inheritable projection: the same chain restricted to inheritable bindings. It is computed once here,
     *   so capturing a snapshot never has to walk the chain.
     */
    class DYNSCOPE_EXPORT BindingFrame {
    public:
        using ptr = binding_frame_ptr;

        /**
         * Create the frame that binds ``bindings`` on top of ``parent``. The bindings must not repeat a key.
         */
        [[nodiscard]] static ptr push(ptr parent, std::vector<Binding> bindings);

        [[nodiscard]] const ptr& parent() const noexcept { return _parent; }
        [[nodiscard]] const std::vector<Binding>& bindings() const noexcept { return _bindings; }
        [[nodiscard]] size_t depth() const noexcept { return _depth; }
        [[nodiscard]] uint64_t key_mask() const noexcept { return _key_mask; }
        [[nodiscard]] uint64_t serial() const noexcept { return _serial; }

        /**
         * True when every binding in this frame and its ancestors is inheritable, i.e. the frame is its own
         * inheritable projection.
         */
        [[nodiscard]] bool is_fully_inheritable() const noexcept { return _self_projection; }

        /**
         * The binding for ``key`` in this frame only.
         */
        [[nodiscard]] const Value* find_local(const ScopedKeyBase& key) const noexcept;

        /**
         * Walk from ``frame`` towards the root and return the nearest binding for ``key``, nullptr if unbound.
         */
        [[nodiscard]] static const Value* resolve(const BindingFrame* frame, const ScopedKeyBase& key) noexcept;

        /**
         * The chain reachable from ``frame`` restricted to inheritable bindings. Nearest-binding-wins resolution
         * over the result matches the original chain for every inheritable key.
         */
        [[nodiscard]] static ptr inheritable_projection(const ptr& frame) noexcept;

        [[nodiscard]] std::string to_string() const;

        BindingFrame(const BindingFrame&) = delete;
        BindingFrame& operator=(const BindingFrame&) = delete;

    private:
        struct private_tag {};

    public:
        // Only constructible through push, public for std::make_shared
        BindingFrame(private_tag, ptr parent, std::vector<Binding> bindings, ptr projection, bool self_projection);

    private:
        ptr _parent;
        std::vector<Binding> _bindings;
        size_t _depth;
        uint64_t _own_mask{0};
        uint64_t _key_mask{0};
        uint64_t _serial;
        // Null when the frame is its own projection, or when the projection is the root
        ptr _projection;
        bool _self_projection;
    };

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_BINDING_FRAME_H
