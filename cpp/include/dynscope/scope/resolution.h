#ifndef DYNSCOPE_SCOPE_RESOLUTION_H
#define DYNSCOPE_SCOPE_RESOLUTION_H

#include <dynscope/scope/unit_state.h>

#include <optional>

namespace dynscope {

    /**
     * The nearest binding of ``key`` visible from the calling unit's current frame, nullptr if none.
     *
     * For a fixed current frame the result never changes; it is memoised in the unit's resolution cache until the
     * next frame change.
     */
    [[nodiscard]] DYNSCOPE_EXPORT const Value *resolve(const ScopedKeyBase &key);

    /**
     * As resolve, but throws UnboundKeyError when no frame binds ``key``.
     */
    [[nodiscard]] DYNSCOPE_EXPORT const Value &get_value(const ScopedKeyBase &key);

    [[nodiscard]] DYNSCOPE_EXPORT bool is_bound(const ScopedKeyBase &key);

    /**
     * The value bound to ``key``. Throws UnboundKeyError when nothing binds it.
     * The reference stays valid for as long as the binding frame is reachable, which covers the remainder of the
     * binding's dynamic extent; copy the value if it must outlive that.
     */
    template<typename T>
    [[nodiscard]] const T &get(const ScopedKey<T> &key) {
        return get_value(key).template as<T>();
    }

    template<typename T, typename U>
    [[nodiscard]] T get_or(const ScopedKey<T> &key, U &&default_value) {
        if (const Value *value = resolve(key); value != nullptr) { return value->template as<T>(); }
        return T(std::forward<U>(default_value));
    }

    template<typename T>
    [[nodiscard]] std::optional<T> find(const ScopedKey<T> &key) {
        if (const Value *value = resolve(key); value != nullptr) { return value->template as<T>(); }
        return std::nullopt;
    }

    /**
     * The value bound to ``key``, otherwise throws the exception returned by ``make_error()``.
     */
    template<typename T, typename F>
    [[nodiscard]] const T &get_or_throw(const ScopedKey<T> &key, F &&make_error) {
        if (const Value *value = resolve(key); value != nullptr) { return value->template as<T>(); }
        throw std::forward<F>(make_error)();
    }

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_RESOLUTION_H
