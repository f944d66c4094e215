#ifndef DYNSCOPE_SCOPE_CARRIER_H
#define DYNSCOPE_SCOPE_CARRIER_H

#include <dynscope/scope/binding_frame.h>

#include <type_traits>

namespace dynscope {

    /**
     * Carrier - An immutable set of pending bindings, consumed by the scope runner.
     *
     * Adding a binding returns a new Carrier and leaves the receiver untouched, so a carrier can be kept and reused
     * as a template. A key that is already pending is replaced by the later value.
     *
     *   auto carrier = where(request_id, int64_t{42}).with(user, std::string{"alice"});
     *   run(carrier, [] { handle_request(); });
     */
    class DYNSCOPE_EXPORT Carrier {
    public:
        Carrier() = default;

        [[nodiscard]] static Carrier empty() { return Carrier{}; }

        /**
         * Typed binding. Only values implicitly convertible to T are accepted, a value that needs an explicit
         * constructor does not bind.
         */
        template<typename T, typename U>
            requires std::is_convertible_v<U &&, T>
        [[nodiscard]] Carrier with(const ScopedKey<T>& key, U&& value) const {
            return with_checked(key, Value::make<T>(std::forward<U>(value)));
        }

        /**
         * Type-erased binding. Throws TypeMismatchError when ``value`` is not assignable to the key's declared type;
         * the check happens here and never at resolution.
         */
        [[nodiscard]] Carrier with_value(const ScopedKeyBase& key, Value value) const;

        [[nodiscard]] size_t size() const noexcept { return _bindings ? _bindings->size() : 0; }
        [[nodiscard]] bool is_empty() const noexcept { return size() == 0; }
        [[nodiscard]] bool contains(const ScopedKeyBase& key) const noexcept { return find(key) != nullptr; }

        /**
         * The pending value for ``key``, nullptr if this carrier does not bind it.
         */
        [[nodiscard]] const Value* find(const ScopedKeyBase& key) const noexcept;

        /**
         * The pending value for ``key``, throws UnboundKeyError if this carrier does not bind it.
         */
        template<typename T>
        [[nodiscard]] const T& get(const ScopedKey<T>& key) const {
            return pending_value(key).template as<T>();
        }

        /**
         * The pending bindings in the order they were first added.
         */
        [[nodiscard]] const std::vector<Binding>& bindings() const noexcept;

        [[nodiscard]] std::string to_string() const;

    private:
        explicit Carrier(std::shared_ptr<const std::vector<Binding>> bindings) : _bindings(std::move(bindings)) {}

        [[nodiscard]] Carrier with_checked(const ScopedKeyBase& key, Value value) const;
        [[nodiscard]] const Value& pending_value(const ScopedKeyBase& key) const;

        std::shared_ptr<const std::vector<Binding>> _bindings;
    };

    /**
     * Shorthand for Carrier::empty().with(key, value).
     */
    template<typename T, typename U>
        requires std::is_convertible_v<U &&, T>
    [[nodiscard]] Carrier where(const ScopedKey<T>& key, U&& value) {
        return Carrier::empty().with(key, std::forward<U>(value));
    }

    [[nodiscard]] inline Carrier where_value(const ScopedKeyBase& key, Value value) {
        return Carrier::empty().with_value(key, std::move(value));
    }

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_CARRIER_H
