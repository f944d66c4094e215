#ifndef DYNSCOPE_SCOPE_SCOPED_KEY_H
#define DYNSCOPE_SCOPE_SCOPED_KEY_H

#include <dynscope/dynscope_base.h>
#include <dynscope/types/scalar_type.h>

namespace dynscope {

    /**
     * Whether bindings of a key are captured into snapshots and so become visible to execution units spawned
     * inside the binding's extent.
     */
    enum class Inheritance : uint8_t {
        INHERITABLE = 0,
        LOCAL = 1,
    };

    /**
     * The immutable identity behind a key. Every declaration allocates a new descriptor, so two keys are equal
     * only when they are handles onto the same declaration.
     */
    struct DYNSCOPE_EXPORT KeyDescriptor {
        KeyDescriptor(uint64_t id, std::string name, const TypeMeta* schema, Inheritance inheritance);

        const uint64_t id;
        const std::string name;
        const TypeMeta* const schema;
        const Inheritance inheritance;
        // One bit per key id (modulo 64), used by frames to skip chains that cannot contain the key
        const uint64_t mask_bit;
    };

    /**
     * ScopedKeyBase - Type-erased handle onto a dynamically scoped variable.
     *
     * Handles are cheap to copy and thread-safe to share, the descriptor they refer to is never mutated. Which
     * code can read or bind a key is governed only by who can see the handle.
     */
    class DYNSCOPE_EXPORT ScopedKeyBase {
    public:
        ScopedKeyBase(const TypeMeta* schema, std::string name, Inheritance inheritance = Inheritance::INHERITABLE);

        [[nodiscard]] uint64_t id() const noexcept { return _descriptor->id; }
        [[nodiscard]] const std::string& name() const noexcept { return _descriptor->name; }
        [[nodiscard]] const TypeMeta* schema() const noexcept { return _descriptor->schema; }
        [[nodiscard]] Inheritance inheritance() const noexcept { return _descriptor->inheritance; }
        [[nodiscard]] bool is_inheritable() const noexcept { return _descriptor->inheritance == Inheritance::INHERITABLE; }
        [[nodiscard]] uint64_t mask_bit() const noexcept { return _descriptor->mask_bit; }
        [[nodiscard]] const KeyDescriptor* descriptor() const noexcept { return _descriptor.get(); }

        /**
         * Diagnostic rendering, e.g. ``request_id#7:int64``.
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const ScopedKeyBase& other) const noexcept { return _descriptor == other._descriptor; }

    private:
        std::shared_ptr<const KeyDescriptor> _descriptor;
    };

    /**
     * ScopedKey - Typed facade over ScopedKeyBase, the declared type is T.
     */
    template<typename T>
    class ScopedKey : public ScopedKeyBase {
    public:
        using value_type = T;

        explicit ScopedKey(std::string name = {}, Inheritance inheritance = Inheritance::INHERITABLE)
            : ScopedKeyBase(scalar_type_meta<T>(), std::move(name), inheritance) {}
    };

    /**
     * Declare a new key with declared type T. Each call returns a distinct key.
     */
    template<typename T>
    [[nodiscard]] ScopedKey<T> declare_key(std::string name = {}, Inheritance inheritance = Inheritance::INHERITABLE) {
        return ScopedKey<T>{std::move(name), inheritance};
    }

    /**
     * Declare a new key whose declared type is only known at runtime, e.g. any_type_meta() or a host-language type.
     */
    [[nodiscard]] DYNSCOPE_EXPORT ScopedKeyBase declare_key(const TypeMeta* schema, std::string name = {},
                                                          Inheritance inheritance = Inheritance::INHERITABLE);

} // namespace dynscope

template<>
struct std::hash<dynscope::ScopedKeyBase> {
    size_t operator()(const dynscope::ScopedKeyBase& key) const noexcept { return std::hash<uint64_t>{}(key.id()); }
};

#endif // DYNSCOPE_SCOPE_SCOPED_KEY_H
