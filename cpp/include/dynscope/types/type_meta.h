#ifndef DYNSCOPE_TYPES_TYPE_META_H
#define DYNSCOPE_TYPES_TYPE_META_H

#include <dynscope/dynscope_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <typeinfo>

namespace dynscope {

    struct TypeMeta;

    /**
     * TypeOps - Function pointers for type-erased operations on a bound value.
     *
     * All operations take raw pointers and the TypeMeta for context. Bound values are immutable, so only
     * construction by copy, destruction, comparison and rendering are required.
     */
    struct TypeOps {
        // Lifecycle
        void (*copy_construct)(void* dest, const void* src, const TypeMeta* meta);
        void (*destruct)(void* dest, const TypeMeta* meta);

        // Comparison
        bool (*equals)(const void* a, const void* b, const TypeMeta* meta);

        // Hashing
        size_t (*hash)(const void* v, const TypeMeta* meta);

        // String representation (for tracing and error messages)
        std::string (*to_string)(const void* v, const TypeMeta* meta);

        // Type name used in diagnostics, e.g. "int64", "string"
        std::string (*type_name)(const TypeMeta* meta);

        // Declared-type acceptance (optional - nullptr means only values of exactly this type are accepted).
        // Used by open types such as "any" and by host-language types that check subtyping at runtime.
        bool (*accepts)(const TypeMeta* declared, const TypeMeta* actual, const void* v);
    };

    /**
     * TypeFlags - Properties of a type
     */
    enum class TypeFlags : uint32_t {
        None = 0,
        TriviallyDestructible = 1 << 0,
        TriviallyCopyable = 1 << 1,
        Hashable = 1 << 2,
        Equatable = 1 << 3,
    };

    inline TypeFlags operator|(TypeFlags a, TypeFlags b) {
        return static_cast<TypeFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline TypeFlags operator&(TypeFlags a, TypeFlags b) {
        return static_cast<TypeFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    inline bool has_flag(TypeFlags flags, TypeFlags test) {
        return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(test)) != 0;
    }

    /**
     * TypeKind - Classification of types
     */
    enum class TypeKind : uint8_t {
        Scalar,  // A concrete C++ type
        Any,     // Declared type only, accepts a value of any type
        Foreign, // A host-language type (e.g. a Python class), values are checked by TypeOps::accepts
    };

    /**
     * TypeMeta - Complete metadata for a type
     *
     * Keys declare their value type as a TypeMeta and every Value carries the TypeMeta it was created with.
     * TypeMeta instances are never destroyed while a key or value can refer to them.
     */
    struct DYNSCOPE_EXPORT TypeMeta {
        size_t size;            // sizeof(T), zero for declared-only types
        size_t alignment;       // alignof(T)
        TypeFlags flags;
        TypeKind kind;
        const TypeOps* ops;
        const std::type_info* type_info;  // nullptr for declared-only types
        const char* name;       // Human-readable name (optional)

        [[nodiscard]] bool is_hashable() const {
            return has_flag(flags, TypeFlags::Hashable);
        }

        [[nodiscard]] bool is_equatable() const {
            return has_flag(flags, TypeFlags::Equatable);
        }

        [[nodiscard]] bool is_trivially_destructible() const {
            return has_flag(flags, TypeFlags::TriviallyDestructible);
        }

        [[nodiscard]] bool is_storable() const {
            return size > 0 && ops->copy_construct != nullptr;
        }

        // Operation wrappers
        void copy_construct_at(void* dest, const void* src) const {
            if (ops->copy_construct) ops->copy_construct(dest, src, this);
        }

        void destruct_at(void* dest) const {
            if (ops->destruct) ops->destruct(dest, this);
        }

        [[nodiscard]] bool equals_at(const void* a, const void* b) const {
            return ops->equals ? ops->equals(a, b, this) : false;
        }

        [[nodiscard]] size_t hash_at(const void* v) const {
            return ops->hash ? ops->hash(v, this) : 0;
        }

        [[nodiscard]] std::string to_string_at(const void* v) const;

        [[nodiscard]] std::string type_name() const;

        /**
         * True when a value of type ``actual`` (located at ``v``) may be bound to a key declared with this type.
         */
        [[nodiscard]] bool is_assignable_from(const TypeMeta* actual, const void* v) const;
    };

    /**
     * The declared type that accepts a value of any type. Keys declared with it never raise TypeMismatchError
     * for a non-empty value.
     */
    DYNSCOPE_EXPORT const TypeMeta* any_type_meta();

} // namespace dynscope

#endif // DYNSCOPE_TYPES_TYPE_META_H
