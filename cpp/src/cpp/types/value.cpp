#include <dynscope/types/value.h>

#include <new>

namespace dynscope {

    namespace {
        std::string any_type_name(const TypeMeta*) { return "any"; }

        bool any_accepts(const TypeMeta*, const TypeMeta* actual, const void*) { return actual != nullptr; }

        constexpr TypeOps any_type_ops = {
            .copy_construct = nullptr,
            .destruct = nullptr,
            .equals = nullptr,
            .hash = nullptr,
            .to_string = nullptr,
            .type_name = &any_type_name,
            .accepts = &any_accepts,
        };

        const TypeMeta any_meta = {
            .size = 0,
            .alignment = 1,
            .flags = TypeFlags::None,
            .kind = TypeKind::Any,
            .ops = &any_type_ops,
            .type_info = nullptr,
            .name = "any",
        };
    } // namespace

    const TypeMeta* any_type_meta() { return &any_meta; }

    std::string TypeMeta::to_string_at(const void* v) const {
        if (ops->to_string) { return ops->to_string(v, this); }
        return fmt::format("<{}>", type_name());
    }

    std::string TypeMeta::type_name() const {
        if (ops->type_name) { return ops->type_name(this); }
        if (name) { return name; }
        return type_info != nullptr ? type_info->name() : "<unknown>";
    }

    bool TypeMeta::is_assignable_from(const TypeMeta* actual, const void* v) const {
        if (actual == nullptr) { return false; }
        if (actual == this) { return true; }
        if (ops->accepts != nullptr) { return ops->accepts(this, actual, v); }
        // The same template instantiated in two shared objects can produce two metas for one type
        return type_info != nullptr && actual->type_info != nullptr && *type_info == *actual->type_info;
    }

    Value Value::copy_of(const TypeMeta* schema, const void* src) {
        if (schema == nullptr || !schema->is_storable()) {
            throw_error<TypeMismatchError>("Cannot create a value of declared-only type '{}'",
                                           schema == nullptr ? std::string{"<null>"} : schema->type_name());
        }
        void* storage = ::operator new(schema->size, std::align_val_t{schema->alignment});
        try {
            schema->copy_construct_at(storage, src);
        } catch (...) {
            ::operator delete(storage, std::align_val_t{schema->alignment});
            throw;
        }
        std::shared_ptr<const void> owned(storage, [schema](const void* p) {
            void* mutable_p = const_cast<void*>(p);
            schema->destruct_at(mutable_p);
            ::operator delete(mutable_p, std::align_val_t{schema->alignment});
        });
        return Value{std::move(owned), schema};
    }

    bool Value::equals(const Value& other) const {
        if (_storage == other._storage) { return true; }
        if (!has_value() || !other.has_value()) { return false; }
        if (_schema != other._schema) { return false; }
        return _schema->equals_at(_storage.get(), other._storage.get());
    }

    size_t Value::hash() const { return has_value() ? _schema->hash_at(_storage.get()) : 0; }

    std::string Value::to_string() const {
        return has_value() ? _schema->to_string_at(_storage.get()) : std::string{"<empty>"};
    }

    std::string Value::type_name() const { return has_value() ? _schema->type_name() : std::string{"<empty>"}; }

    void Value::throw_type_mismatch(const TypeMeta* requested) const {
        throw_error<TypeMismatchError>("Expected a value of type '{}', got '{}'", requested->type_name(), type_name());
    }

} // namespace dynscope
