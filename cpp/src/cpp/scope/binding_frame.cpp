#include <dynscope/scope/binding_frame.h>

#include <atomic>

namespace dynscope {

    namespace {
        std::atomic<uint64_t> next_frame_serial{1};
    }

    BindingFrame::BindingFrame(private_tag, ptr parent, std::vector<Binding> bindings, ptr projection, bool self_projection)
        : _parent{std::move(parent)}, _bindings{std::move(bindings)}, _depth{_parent ? _parent->_depth + 1 : 1},
          _serial{next_frame_serial.fetch_add(1, std::memory_order_relaxed)}, _projection{std::move(projection)},
          _self_projection{self_projection} {
        for (const auto &binding : _bindings) { _own_mask |= binding.key.mask_bit(); }
        _key_mask = _own_mask | (_parent ? _parent->_key_mask : 0);
    }

    BindingFrame::ptr BindingFrame::push(ptr parent, std::vector<Binding> bindings) {
        ptr parent_projection = inheritable_projection(parent);
        const bool parent_is_projection = parent_projection == parent;

        size_t inheritable_count = 0;
        for (const auto &binding : bindings) {
            if (binding.key.is_inheritable()) { ++inheritable_count; }
        }

        if (parent_is_projection && inheritable_count == bindings.size()) {
            return std::make_shared<const BindingFrame>(private_tag{}, std::move(parent), std::move(bindings), nullptr, true);
        }

        ptr projection;
        if (inheritable_count == 0) {
            projection = std::move(parent_projection);
        } else {
            std::vector<Binding> inheritable;
            inheritable.reserve(inheritable_count);
            for (const auto &binding : bindings) {
                if (binding.key.is_inheritable()) { inheritable.push_back(binding); }
            }
            // parent_projection is fully inheritable, so this resolves to a self-projecting frame
            projection = push(std::move(parent_projection), std::move(inheritable));
        }
        return std::make_shared<const BindingFrame>(private_tag{}, std::move(parent), std::move(bindings), std::move(projection),
                                                    false);
    }

    const Value *BindingFrame::find_local(const ScopedKeyBase &key) const noexcept {
        if ((_own_mask & key.mask_bit()) == 0) { return nullptr; }
        for (const auto &binding : _bindings) {
            if (binding.key == key) { return &binding.value; }
        }
        return nullptr;
    }

    const Value *BindingFrame::resolve(const BindingFrame *frame, const ScopedKeyBase &key) noexcept {
        const uint64_t bit = key.mask_bit();
        for (; frame != nullptr && (frame->_key_mask & bit) != 0; frame = frame->_parent.get()) {
            if (const Value *value = frame->find_local(key); value != nullptr) { return value; }
        }
        return nullptr;
    }

    BindingFrame::ptr BindingFrame::inheritable_projection(const ptr &frame) noexcept {
        if (!frame || frame->_self_projection) { return frame; }
        return frame->_projection;
    }

    std::string BindingFrame::to_string() const {
        std::vector<std::string> items;
        items.reserve(_bindings.size());
        for (const auto &binding : _bindings) {
            items.push_back(fmt::format("{}={}", binding.key.to_string(), binding.value.to_string()));
        }
        return fmt::format("frame#{}(depth={}){{{}}}", _serial, _depth, fmt::join(items, ", "));
    }

} // namespace dynscope
