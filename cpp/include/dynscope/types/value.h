#ifndef DYNSCOPE_TYPES_VALUE_H
#define DYNSCOPE_TYPES_VALUE_H

#include <dynscope/types/scalar_type.h>
#include <dynscope/util/errors.h>

#include <memory>
#include <string>
#include <utility>

namespace dynscope {

    /**
     * Value - An immutable, type-erased value together with the TypeMeta it was created as.
     *
     * Storage is shared: copying a Value copies a reference, never the underlying object. This is what allows a
     * binding to be shared by every frame, snapshot and execution unit that can see it.
     */
    class DYNSCOPE_EXPORT Value {
    public:
        Value() = default;

        /**
         * Construct a value of type T in place.
         */
        template<typename T, typename... Args>
        static Value make(Args&&... args) {
            using value_type = std::remove_cvref_t<T>;
            return Value{std::make_shared<const value_type>(std::forward<Args>(args)...), scalar_type_meta<value_type>()};
        }

        template<typename T>
        static Value of(T&& value) {
            return make<std::remove_cvref_t<T>>(std::forward<T>(value));
        }

        /**
         * Copy the object at ``src`` using the operations of ``schema``. Used where only the TypeMeta is known,
         * for example by host-language bindings.
         */
        static Value copy_of(const TypeMeta* schema, const void* src);

        [[nodiscard]] bool has_value() const noexcept { return _storage != nullptr; }
        explicit operator bool() const noexcept { return has_value(); }

        [[nodiscard]] const TypeMeta* schema() const noexcept { return _schema; }
        [[nodiscard]] const void* data() const noexcept { return _storage.get(); }

        /**
         * Access as T, throws TypeMismatchError when this value does not hold a T.
         */
        template<typename T>
        [[nodiscard]] const T& as() const {
            if (const T* v = try_as<T>(); v != nullptr) { return *v; }
            throw_type_mismatch(scalar_type_meta<T>());
        }

        template<typename T>
        [[nodiscard]] const T* try_as() const noexcept {
            if (!has_value()) { return nullptr; }
            const TypeMeta* requested = scalar_type_meta<T>();
            if (requested == _schema || (_schema->type_info != nullptr && *_schema->type_info == *requested->type_info)) {
                return static_cast<const T*>(_storage.get());
            }
            return nullptr;
        }

        [[nodiscard]] bool equals(const Value& other) const;
        [[nodiscard]] size_t hash() const;
        [[nodiscard]] std::string to_string() const;
        [[nodiscard]] std::string type_name() const;

        bool operator==(const Value& other) const { return equals(other); }

    private:
        Value(std::shared_ptr<const void> storage, const TypeMeta* schema)
            : _storage(std::move(storage)), _schema(schema) {}

        [[noreturn]] void throw_type_mismatch(const TypeMeta* requested) const;

        std::shared_ptr<const void> _storage;
        const TypeMeta* _schema{nullptr};
    };

} // namespace dynscope

#endif // DYNSCOPE_TYPES_VALUE_H
