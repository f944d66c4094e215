/**
 * Scope observers (trace and statistics) and process-wide configuration.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dynscope/runtime/observers/scope_statistics.h>
#include <dynscope/runtime/observers/scope_trace.h>
#include <dynscope/runtime/scope_config.h>
#include <dynscope/scope/resolution.h>
#include <dynscope/scope/scope_runner.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dynscope;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Test Fixtures / Helpers
// ============================================================================

namespace {
    // Registers an observer for the lifetime of the guard
    template<typename T>
    struct ObserverGuard {
        std::shared_ptr<T> observer;

        template<typename... Args>
        explicit ObserverGuard(Args &&...args) : observer{std::make_shared<T>(std::forward<Args>(args)...)} {
            ScopeObservers::add_observer(observer);
        }

        ~ObserverGuard() { ScopeObservers::remove_observer(observer); }
    };

    struct Recorder : ScopeObserver {
        std::vector<std::string> events;

        void on_enter_frame(FrameTransition transition, const BindingFrame *frame, const BindingFrame *) override {
            events.push_back(fmt::format("enter {} {}", to_string(transition), frame ? frame->depth() : 0));
        }

        void on_exit_frame(FrameTransition transition, const BindingFrame *exited, const BindingFrame *) override {
            events.push_back(fmt::format("exit {} {}", to_string(transition), exited ? exited->depth() : 0));
        }

        void on_capture(const BindingFrame *, const BindingFrame *) override { events.emplace_back("capture"); }
    };

    struct ThrowingObserver : ScopeObserver {
        bool throw_on_enter{false};
        bool throw_non_standard{false};

        void on_enter_frame(FrameTransition, const BindingFrame *, const BindingFrame *) override {
            if (throw_on_enter) { throw std::runtime_error("enter rejected"); }
        }

        void on_exit_frame(FrameTransition, const BindingFrame *, const BindingFrame *) override {
            if (throw_non_standard) { throw 42; }
            throw std::runtime_error("exit failed");
        }
    };

    struct ConfigGuard {
        ConfigGuard() : _saved{current_config()} {}
        ~ConfigGuard() { configure(_saved); }

    private:
        ScopeConfig _saved;
    };
} // namespace

// ============================================================================
// Observer registry
// ============================================================================

TEST_CASE("ScopeObservers - registry add and remove", "[runtime][observer]") {
    const size_t before = ScopeObservers::observer_count();
    {
        ObserverGuard<Recorder> guard;
        REQUIRE(ScopeObservers::has_observers());
        REQUIRE(ScopeObservers::observer_count() == before + 1);
    }
    REQUIRE(ScopeObservers::observer_count() == before);
}

TEST_CASE("ScopeObservers - matched enter and exit events", "[runtime][observer]") {
    ScopedKey<int64_t> key{"key"};
    ObserverGuard<Recorder> guard;

    run(where(key, 1), [&] {
        run(where(key, 2), [] {});
        Snapshot snapshot = capture();
        run_with_snapshot(snapshot, [] {});
        ContinuationState state = save_continuation();
        run_with_continuation(state, [] {});
    });

    REQUIRE(guard.observer->events == std::vector<std::string>{
        "enter PUSH 1", "enter PUSH 2", "exit PUSH 2", "capture", "enter SNAPSHOT 1", "exit SNAPSHOT 1",
        "enter CONTINUATION 1", "exit CONTINUATION 1", "exit PUSH 1"});
}

TEST_CASE("ScopeObservers - a throwing enter leaves the unit untouched", "[runtime][observer]") {
    ScopedKey<int64_t> key{"key"};
    ObserverGuard<ThrowingObserver> guard;
    guard.observer->throw_on_enter = true;
    bool invoked = false;
    const auto *before = current_frame().get();

    REQUIRE_THROWS_WITH(run(where(key, 1), [&] { invoked = true; }), "enter rejected");
    REQUIRE_FALSE(invoked);
    REQUIRE(current_frame().get() == before);
}

TEST_CASE("ScopeObservers - a throwing exit never prevents the restore", "[runtime][observer]") {
    ScopedKey<int64_t> key{"key"};
    ObserverGuard<ThrowingObserver> guard;

    run(where(key, 1), [&] {
        run(where(key, 2), [] {});
        REQUIRE(get(key) == 1);
    });
    REQUIRE_FALSE(is_bound(key));
}

TEST_CASE("ScopeObservers - an exit throwing a non-standard type never prevents the restore", "[runtime][observer]") {
    ScopedKey<int64_t> key{"key"};
    ObserverGuard<ThrowingObserver> guard;
    guard.observer->throw_non_standard = true;
    const auto *before = current_frame().get();

    run(where(key, 1), [&] {
        run(where(key, 2), [] {});
        REQUIRE(get(key) == 1);
    });
    REQUIRE_FALSE(is_bound(key));
    REQUIRE(current_frame().get() == before);
}

// ============================================================================
// ScopeStatistics
// ============================================================================

TEST_CASE("ScopeStatistics - counts transitions", "[runtime][observer][statistics]") {
    ScopedKey<int64_t> key{"key"};
    ObserverGuard<ScopeStatistics> guard;
    auto &stats = *guard.observer;

    run(where(key, 1), [&] {
        run(where(key, 2), [&] { run(where(key, 3), [] {}); });
        Snapshot snapshot = capture();
        run_with_snapshot(snapshot, [] {});
        run_with_continuation(save_continuation(), [] {});
    });

    REQUIRE(stats.pushes() == 3);
    REQUIRE(stats.snapshot_installs() == 1);
    REQUIRE(stats.continuation_resumes() == 1);
    REQUIRE(stats.pops() == 5);
    REQUIRE(stats.captures() == 1);
    REQUIRE(stats.max_depth() == 3);

    stats.reset();
    REQUIRE(stats.pushes() == 0);
    REQUIRE(stats.max_depth() == 0);
}

// ============================================================================
// ScopeTrace
// ============================================================================

TEST_CASE("ScopeTrace - writes each event", "[runtime][observer][trace]") {
    ScopedKey<std::string> user{"user"};
    std::ostringstream out;
    {
        ObserverGuard<ScopeTrace> guard{std::nullopt, out};
        run(where(user, "alice"), [] { (void)capture(); });
    }

    const std::string text = out.str();
    REQUIRE_THAT(text, ContainsSubstring("[dynscope]["));
    REQUIRE_THAT(text, ContainsSubstring("PUSH enter frame#"));
    REQUIRE_THAT(text, ContainsSubstring(fmt::format("user#{}:string=\"alice\"", user.id())));
    REQUIRE_THAT(text, ContainsSubstring("(from <root>)"));
    REQUIRE_THAT(text, ContainsSubstring("CAPTURE frame#"));
    REQUIRE_THAT(text, ContainsSubstring("PUSH exit frame#"));
    REQUIRE_THAT(text, ContainsSubstring("(back to <root>)"));
}

TEST_CASE("ScopeTrace - filter restricts output to matching key names", "[runtime][observer][trace]") {
    ScopedKey<int64_t> traced{"traced_key"};
    ScopedKey<int64_t> quiet{"quiet_key"};
    std::ostringstream out;
    {
        ObserverGuard<ScopeTrace> guard{std::optional<std::string>{"traced"}, out};
        run(where(quiet, 1), [] {});
        REQUIRE(out.str().empty());
        run(where(traced, 2), [] {});
    }
    REQUIRE_THAT(out.str(), ContainsSubstring("traced_key#"));
    REQUIRE_THAT(out.str(), !ContainsSubstring("quiet_key#"));
}

TEST_CASE("ScopeTrace - per-event toggles", "[runtime][observer][trace]") {
    ScopedKey<int64_t> key{"key"};
    std::ostringstream out;
    {
        ObserverGuard<ScopeTrace> guard{std::nullopt, out, false, true, false};
        run(where(key, 1), [] { (void)capture(); });
    }
    REQUIRE_THAT(out.str(), !ContainsSubstring(" enter "));
    REQUIRE_THAT(out.str(), !ContainsSubstring("CAPTURE"));
    REQUIRE_THAT(out.str(), ContainsSubstring("PUSH exit"));
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("ScopeConfig - defaults", "[runtime][config]") {
    ScopeConfig config;
    REQUIRE(config.resolution_cache);
    REQUIRE_FALSE(config.trace);
    REQUIRE_FALSE(config.trace_filter.has_value());
}

TEST_CASE("ScopeConfig - from_environment", "[runtime][config]") {
    ::unsetenv("DYNSCOPE_TRACE");
    ::unsetenv("DYNSCOPE_TRACE_FILTER");
    ::unsetenv("DYNSCOPE_DISABLE_CACHE");

    SECTION("nothing set") {
        auto config = ScopeConfig::from_environment();
        REQUIRE(config.resolution_cache);
        REQUIRE_FALSE(config.trace);
        REQUIRE_FALSE(config.trace_filter.has_value());
    }

    SECTION("presence enables, the value is not inspected") {
        ::setenv("DYNSCOPE_TRACE", "0", 1);
        ::setenv("DYNSCOPE_DISABLE_CACHE", "", 1);
        ::setenv("DYNSCOPE_TRACE_FILTER", "request", 1);
        auto config = ScopeConfig::from_environment();
        REQUIRE(config.trace);
        REQUIRE_FALSE(config.resolution_cache);
        REQUIRE(config.trace_filter == std::optional<std::string>{"request"});
    }

    ::unsetenv("DYNSCOPE_TRACE");
    ::unsetenv("DYNSCOPE_TRACE_FILTER");
    ::unsetenv("DYNSCOPE_DISABLE_CACHE");
}

TEST_CASE("configure - installs and removes the trace observer", "[runtime][config]") {
    ConfigGuard guard;
    configure(ScopeConfig{});
    const size_t base = ScopeObservers::observer_count();

    configure(ScopeConfig{.trace = true, .trace_filter = std::string{"nothing_matches_this"}});
    REQUIRE(current_config().trace);
    REQUIRE(ScopeObservers::observer_count() == base + 1);

    // Changing the filter replaces the observer rather than adding another
    configure(ScopeConfig{.trace = true, .trace_filter = std::string{"still_nothing"}});
    REQUIRE(ScopeObservers::observer_count() == base + 1);
    REQUIRE(current_config().trace_filter == std::optional<std::string>{"still_nothing"});

    configure(ScopeConfig{.trace = false});
    REQUIRE(ScopeObservers::observer_count() == base);
}

TEST_CASE("configure - resolution cache switch", "[runtime][config]") {
    ConfigGuard guard;
    configure(ScopeConfig{.resolution_cache = false});
    REQUIRE_FALSE(resolution_cache_enabled());
    REQUIRE_FALSE(current_config().resolution_cache);

    configure(ScopeConfig{});
    REQUIRE(resolution_cache_enabled());
}
