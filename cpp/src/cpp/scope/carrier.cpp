#include <dynscope/scope/carrier.h>
#include <dynscope/util/errors.h>

#include <algorithm>

namespace dynscope {

    namespace {
        const std::vector<Binding> no_bindings{};
    }

    Carrier Carrier::with_value(const ScopedKeyBase &key, Value value) const {
        if (!key.schema()->is_assignable_from(value.schema(), value.data())) {
            throw_error<TypeMismatchError>("Cannot bind a value of type '{}' to key '{}'", value.type_name(), key.to_string());
        }
        return with_checked(key, std::move(value));
    }

    Carrier Carrier::with_checked(const ScopedKeyBase &key, Value value) const {
        auto bindings = _bindings ? std::make_shared<std::vector<Binding>>(*_bindings) : std::make_shared<std::vector<Binding>>();
        auto it = std::find_if(bindings->begin(), bindings->end(), [&key](const Binding &b) { return b.key == key; });
        if (it != bindings->end()) {
            it->value = std::move(value);
        } else {
            bindings->push_back(Binding{key, std::move(value)});
        }
        return Carrier{std::move(bindings)};
    }

    const Value *Carrier::find(const ScopedKeyBase &key) const noexcept {
        if (!_bindings) { return nullptr; }
        for (const auto &binding : *_bindings) {
            if (binding.key == key) { return &binding.value; }
        }
        return nullptr;
    }

    const Value &Carrier::pending_value(const ScopedKeyBase &key) const {
        const Value *value = find(key);
        if (value == nullptr) { throw_error<UnboundKeyError>("Key '{}' is not bound by this carrier", key.to_string()); }
        return *value;
    }

    const std::vector<Binding> &Carrier::bindings() const noexcept { return _bindings ? *_bindings : no_bindings; }

    std::string Carrier::to_string() const {
        std::vector<std::string> items;
        for (const auto &binding : bindings()) {
            items.push_back(fmt::format("{}={}", binding.key.to_string(), binding.value.to_string()));
        }
        return fmt::format("Carrier{{{}}}", fmt::join(items, ", "));
    }

} // namespace dynscope
