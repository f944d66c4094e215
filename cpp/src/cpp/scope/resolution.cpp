#include <dynscope/scope/resolution.h>
#include <dynscope/runtime/scope_config.h>
#include <dynscope/util/errors.h>

namespace dynscope {

    const Value *resolve(const ScopedKeyBase &key) {
        auto &unit = ExecutionUnitState::current();
        const BindingFrame *frame = unit.frame().get();
        if (frame == nullptr || (frame->key_mask() & key.mask_bit()) == 0) { return nullptr; }

        if (!resolution_cache_enabled()) { return BindingFrame::resolve(frame, key); }

        const Value *value = nullptr;
        if (unit.cache().lookup(unit.epoch(), key.id(), value)) { return value; }
        value = BindingFrame::resolve(frame, key);
        unit.cache().store(unit.epoch(), key.id(), value);
        return value;
    }

    const Value &get_value(const ScopedKeyBase &key) {
        const Value *value = resolve(key);
        if (value == nullptr) { throw_error<UnboundKeyError>("Key '{}' is not bound in the current scope", key.to_string()); }
        return *value;
    }

    bool is_bound(const ScopedKeyBase &key) { return resolve(key) != nullptr; }

} // namespace dynscope
