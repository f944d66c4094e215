#ifndef DYNSCOPE_TYPES_SCALAR_TYPE_H
#define DYNSCOPE_TYPES_SCALAR_TYPE_H

#include <dynscope/types/type_meta.h>

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>

namespace dynscope {

    /**
     * ScalarTypeOps - Generate TypeOps for a C++ type T
     */
    template<typename T>
    struct ScalarTypeOps {
        static void copy_construct(void* dest, const void* src, const TypeMeta*) {
            if constexpr (std::is_copy_constructible_v<T>) {
                new (dest) T(*static_cast<const T*>(src));
            }
        }

        static void destruct(void* dest, const TypeMeta*) {
            static_cast<T*>(dest)->~T();
        }

        static bool equals(const void* a, const void* b, const TypeMeta*) {
            if constexpr (requires(const T& x, const T& y) { { x == y } -> std::convertible_to<bool>; }) {
                return *static_cast<const T*>(a) == *static_cast<const T*>(b);
            } else {
                return a == b;
            }
        }

        static size_t hash(const void* v, const TypeMeta*) {
            if constexpr (requires(const T& x) { std::hash<T>{}(x); }) {
                return std::hash<T>{}(*static_cast<const T*>(v));
            } else {
                return 0;
            }
        }

        static std::string to_string(const void* v, const TypeMeta* meta) {
            const T& value = *static_cast<const T*>(v);
            if constexpr (std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_integral_v<T>) {
                return std::to_string(value);
            } else if constexpr (std::is_floating_point_v<T>) {
                std::ostringstream oss;
                oss << std::setprecision(6) << value;
                return oss.str();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + value + "\"";
            } else if constexpr (fmt::is_formattable<T>::value) {
                return fmt::format("{}", value);
            } else if constexpr (requires { std::declval<std::ostream&>() << value; }) {
                std::ostringstream oss;
                oss << value;
                return oss.str();
            } else {
                return fmt::format("<{}>", meta->type_name());
            }
        }

        static std::string type_name(const TypeMeta* meta) {
            if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return "int64";
            } else if constexpr (std::is_same_v<T, int32_t>) {
                return "int32";
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                return "uint64";
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                return "uint32";
            } else if constexpr (std::is_same_v<T, double>) {
                return "double";
            } else if constexpr (std::is_same_v<T, float>) {
                return "float";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "string";
            } else {
                if (meta->name) return meta->name;
                return meta->type_info->name();
            }
        }

        static constexpr TypeOps ops = {
            .copy_construct = std::is_copy_constructible_v<T> ? &copy_construct : nullptr,
            .destruct = &destruct,
            .equals = &equals,
            .hash = &hash,
            .to_string = &to_string,
            .type_name = &type_name,
            .accepts = nullptr,
        };
    };

    template<typename T>
    constexpr TypeFlags compute_flags() {
        TypeFlags flags = TypeFlags::None;
        if constexpr (std::is_trivially_destructible_v<T>) flags = flags | TypeFlags::TriviallyDestructible;
        if constexpr (std::is_trivially_copyable_v<T>) flags = flags | TypeFlags::TriviallyCopyable;
        if constexpr (requires(const T& x) { std::hash<T>{}(x); }) flags = flags | TypeFlags::Hashable;
        if constexpr (requires(const T& x, const T& y) { { x == y } -> std::convertible_to<bool>; })
            flags = flags | TypeFlags::Equatable;
        return flags;
    }

    template<typename T>
    struct ScalarTypeMeta {
        static const TypeMeta instance;

        static const TypeMeta* get() { return &instance; }
    };

    template<typename T>
    const TypeMeta ScalarTypeMeta<T>::instance = {
        .size = sizeof(T),
        .alignment = alignof(T),
        .flags = compute_flags<T>(),
        .kind = TypeKind::Scalar,
        .ops = &ScalarTypeOps<T>::ops,
        .type_info = &typeid(T),
        .name = nullptr,
    };

    /**
     * Helper to get TypeMeta for any C++ value type, cv-qualifiers and references are stripped.
     */
    template<typename T>
    const TypeMeta* scalar_type_meta() {
        return ScalarTypeMeta<std::remove_cvref_t<T>>::get();
    }

} // namespace dynscope

#endif // DYNSCOPE_TYPES_SCALAR_TYPE_H
