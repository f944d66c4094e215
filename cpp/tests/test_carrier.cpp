#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dynscope/scope/carrier.h>
#include <dynscope/util/errors.h>

#include <string>
#include <utility>
#include <vector>

using namespace dynscope;

namespace {
    template<typename T, typename U>
    concept bindable_with_where = requires(const ScopedKey<T> &key, U &&value) { where(key, std::forward<U>(value)); };

    template<typename T, typename U>
    concept bindable_with_with = requires(const Carrier &carrier, const ScopedKey<T> &key, U &&value) {
        carrier.with(key, std::forward<U>(value));
    };

    struct ExplicitOnly {
        explicit ExplicitOnly(int v) : value{v} {}
        int value;
    };
} // namespace

TEST_CASE("Carrier - empty", "[scope][carrier]") {
    auto carrier = Carrier::empty();
    REQUIRE(carrier.is_empty());
    REQUIRE(carrier.size() == 0);
    REQUIRE(carrier.bindings().empty());
    REQUIRE(carrier.to_string() == "Carrier{}");
}

TEST_CASE("Carrier - with returns a new carrier", "[scope][carrier]") {
    ScopedKey<int64_t> id{"id"};
    ScopedKey<std::string> user{"user"};

    auto base = where(id, 1);
    auto extended = base.with(user, "alice");

    REQUIRE(base.size() == 1);
    REQUIRE_FALSE(base.contains(user));
    REQUIRE(extended.size() == 2);
    REQUIRE(extended.get(id) == 1);
    REQUIRE(extended.get(user) == "alice");
}

TEST_CASE("Carrier - later binding of the same key wins", "[scope][carrier]") {
    ScopedKey<int64_t> id{"id"};
    ScopedKey<std::string> user{"user"};

    auto carrier = where(id, 1).with(user, "alice").with(id, 2);

    REQUIRE(carrier.size() == 2);
    REQUIRE(carrier.get(id) == 2);
    // Insertion order of the first binding is kept
    REQUIRE(carrier.bindings()[0].key == id);
    REQUIRE(carrier.bindings()[1].key == user);
}

TEST_CASE("Carrier - get of a key it does not bind", "[scope][carrier]") {
    ScopedKey<int64_t> id{"id"};
    ScopedKey<int64_t> other{"other"};

    auto carrier = where(id, 1);
    REQUIRE(carrier.find(other) == nullptr);
    REQUIRE_THROWS_AS(carrier.get(other), UnboundKeyError);
}

TEST_CASE("Carrier - with_value checks the declared type", "[scope][carrier][type]") {
    ScopedKey<int64_t> count{"count"};

    SECTION("matching type") {
        auto carrier = where_value(count, Value::make<int64_t>(5));
        REQUIRE(carrier.get(count) == 5);
    }

    SECTION("mismatched type") {
        REQUIRE_THROWS_AS(where_value(count, Value::of(std::string{"five"})), TypeMismatchError);
        REQUIRE_THROWS_WITH(where_value(count, Value::make<double>(5.0)),
                            Catch::Matchers::ContainsSubstring("Cannot bind a value of type 'double'"));
    }

    SECTION("empty value") {
        REQUIRE_THROWS_AS(where_value(count, Value{}), TypeMismatchError);
    }

    SECTION("failed binding leaves the receiver unchanged") {
        auto carrier = where(count, 1);
        REQUIRE_THROWS_AS(carrier.with_value(count, Value::make<double>(2.0)), TypeMismatchError);
        REQUIRE(carrier.get(count) == 1);
    }
}

TEST_CASE("Carrier - typed binding accepts only implicitly convertible values", "[scope][carrier][type]") {
    STATIC_REQUIRE(bindable_with_where<int64_t, int>);
    STATIC_REQUIRE(bindable_with_where<std::string, const char *>);
    STATIC_REQUIRE(bindable_with_with<std::string, const char (&)[6]>);
    STATIC_REQUIRE(bindable_with_where<std::vector<int>, std::vector<int>>);

    // A size is not a vector, nor is an int an ExplicitOnly, even though both can be direct-initialised from it
    STATIC_REQUIRE_FALSE(bindable_with_where<std::vector<int>, int>);
    STATIC_REQUIRE_FALSE(bindable_with_with<std::vector<int>, int>);
    STATIC_REQUIRE_FALSE(bindable_with_where<ExplicitOnly, int>);
    STATIC_REQUIRE_FALSE(bindable_with_where<int64_t, std::string>);

    ScopedKey<std::vector<int>> items{"items"};
    auto carrier = where(items, std::vector<int>{5});
    REQUIRE(carrier.get(items) == std::vector<int>{5});
}

TEST_CASE("Carrier - keys declared as any accept every value", "[scope][carrier][type]") {
    auto anything = declare_key(any_type_meta(), "anything");

    auto carrier = where_value(anything, Value::of(std::string{"text"})).with_value(anything, Value::make<int64_t>(3));
    REQUIRE(carrier.size() == 1);
    REQUIRE(carrier.find(anything)->as<int64_t>() == 3);
}

TEST_CASE("Carrier - to_string lists pending bindings", "[scope][carrier]") {
    ScopedKey<int64_t> id{"id"};
    auto carrier = where(id, 7);
    REQUIRE(carrier.to_string() == fmt::format("Carrier{{id#{}:int64=7}}", id.id()));
}
