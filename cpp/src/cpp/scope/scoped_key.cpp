#include <dynscope/scope/scoped_key.h>
#include <dynscope/util/errors.h>

#include <atomic>

namespace dynscope {

    namespace {
        std::atomic<uint64_t> next_key_id{1};
    }

    KeyDescriptor::KeyDescriptor(uint64_t id, std::string name, const TypeMeta* schema, Inheritance inheritance)
        : id{id}, name{std::move(name)}, schema{schema}, inheritance{inheritance}, mask_bit{uint64_t{1} << (id % 64)} {}

    ScopedKeyBase::ScopedKeyBase(const TypeMeta* schema, std::string name, Inheritance inheritance) {
        if (schema == nullptr) { throw_error<TypeMismatchError>("A scoped key requires a declared type"); }
        _descriptor = std::make_shared<const KeyDescriptor>(next_key_id.fetch_add(1, std::memory_order_relaxed),
                                                            std::move(name), schema, inheritance);
    }

    std::string ScopedKeyBase::to_string() const {
        return fmt::format("{}#{}:{}", name().empty() ? "<anonymous>" : name(), id(), schema()->type_name());
    }

    ScopedKeyBase declare_key(const TypeMeta* schema, std::string name, Inheritance inheritance) {
        return ScopedKeyBase{schema, std::move(name), inheritance};
    }

} // namespace dynscope
