/**
 * Snapshots: capture of inheritable bindings, independence from the capturing unit and propagation to other
 * threads.
 */

#include <catch2/catch_test_macros.hpp>

#include <dynscope/runtime/inherit.h>
#include <dynscope/scope/resolution.h>
#include <dynscope/scope/scope_runner.h>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace dynscope;

// ============================================================================
// Capture
// ============================================================================

TEST_CASE("Snapshot - capture at the root is empty", "[scope][snapshot]") {
    Snapshot snapshot = capture();
    REQUIRE(snapshot.empty());
    REQUIRE(snapshot.depth() == 0);
}

TEST_CASE("Snapshot - resolves without being installed", "[scope][snapshot]") {
    ScopedKey<int64_t> key{"key"};
    ScopedKey<int64_t> unbound{"unbound"};

    Snapshot snapshot = call(where(key, 4), [] { return capture(); });
    REQUIRE(snapshot.is_bound(key));
    REQUIRE(snapshot.get(key) == 4);
    REQUIRE_FALSE(snapshot.is_bound(unbound));
    REQUIRE_THROWS_AS(snapshot.get(unbound), UnboundKeyError);
}

TEST_CASE("Snapshot - non-inheritable bindings are excluded", "[scope][snapshot][inheritance]") {
    ScopedKey<std::string> request{"request"};
    ScopedKey<std::string> secret{"secret", Inheritance::LOCAL};

    Snapshot snapshot = call(where(request, "r-1").with(secret, "s-1"), [&] {
        REQUIRE(get(secret) == "s-1");
        return capture();
    });

    REQUIRE(snapshot.get(request) == "r-1");
    REQUIRE_FALSE(snapshot.is_bound(secret));
    run_with_snapshot(snapshot, [&] {
        REQUIRE(get(request) == "r-1");
        REQUIRE_FALSE(is_bound(secret));
    });
}

TEST_CASE("Snapshot - shadowed local binding does not expose the inheritable one beneath",
          "[scope][snapshot][inheritance]") {
    ScopedKey<int64_t> shared{"shared"};
    ScopedKey<int64_t> local{"local", Inheritance::LOCAL};

    Snapshot snapshot = call(where(shared, 1), [&] {
        return call(where(local, 2).with(shared, 3), [] { return capture(); });
    });
    REQUIRE(snapshot.get(shared) == 3);
    REQUIRE_FALSE(snapshot.is_bound(local));
}

TEST_CASE("Snapshot - capture is O(1), repeated captures share the projection", "[scope][snapshot]") {
    ScopedKey<int64_t> key{"key"};
    ScopedKey<int64_t> local{"local", Inheritance::LOCAL};

    run(where(key, 1).with(local, 2), [] {
        Snapshot a = capture();
        Snapshot b = capture();
        REQUIRE(a.frame() == b.frame());
    });
}

// ============================================================================
// Independence
// ============================================================================

TEST_CASE("Snapshot - unaffected by later rebinding in the capturing unit", "[scope][snapshot][independence]") {
    ScopedKey<int64_t> key{"key"};

    run(where(key, 1), [&] {
        Snapshot snapshot = capture();
        run(where(key, 3), [&] {
            REQUIRE(get(key) == 3);
            REQUIRE(snapshot.get(key) == 1);
        });
    });
}

TEST_CASE("Snapshot - outlives the scope that captured it", "[scope][snapshot][independence]") {
    ScopedKey<std::string> key{"key"};
    Snapshot snapshot = call(where(key, "kept"), [] { return capture(); });

    REQUIRE_FALSE(is_bound(key));
    REQUIRE(call_with_snapshot(snapshot, [&] { return get(key); }) == "kept");
}

TEST_CASE("Snapshot - install replaces the current frame and restores it", "[scope][snapshot]") {
    ScopedKey<int64_t> key{"key"};
    ScopedKey<int64_t> other{"other"};

    Snapshot snapshot = call(where(key, 1), [] { return capture(); });
    run(where(other, 2), [&] {
        const auto *before = current_frame().get();
        run_with_snapshot(snapshot, [&] {
            REQUIRE(get(key) == 1);
            REQUIRE_FALSE(is_bound(other));
        });
        REQUIRE(current_frame().get() == before);
        REQUIRE(get(other) == 2);
    });
}

TEST_CASE("Snapshot - an empty snapshot runs the body at the root", "[scope][snapshot]") {
    ScopedKey<int64_t> key{"key"};
    run(where(key, 1), [&] {
        run_with_snapshot(Snapshot{}, [&] {
            REQUIRE(current_frame() == nullptr);
            REQUIRE_FALSE(is_bound(key));
        });
        REQUIRE(get(key) == 1);
    });
}

TEST_CASE("Snapshot - exception in an installed snapshot restores the prior frame", "[scope][snapshot][restore]") {
    ScopedKey<int64_t> key{"key"};
    Snapshot snapshot = call(where(key, 9), [] { return capture(); });

    run(where(key, 1), [&] {
        REQUIRE_THROWS_AS(run_with_snapshot(snapshot, [] { throw std::runtime_error("inside"); }), std::runtime_error);
        REQUIRE(get(key) == 1);
    });
}

// ============================================================================
// Cross-unit propagation
// ============================================================================

TEST_CASE("Snapshot - a new thread starts at the root", "[scope][snapshot][threads]") {
    ScopedKey<int64_t> key{"key"};
    bool bound_in_thread = true;

    run(where(key, 1), [&] {
        std::thread worker([&] { bound_in_thread = is_bound(key); });
        worker.join();
    });
    REQUIRE_FALSE(bound_in_thread);
}

TEST_CASE("Snapshot - spawn_thread and inherit_scope propagate inheritable bindings", "[scope][snapshot][threads]") {
    ScopedKey<std::string> request{"request"};
    ScopedKey<std::string> secret{"secret", Inheritance::LOCAL};
    std::optional<std::string> seen_request;
    bool secret_visible = true;

    run(where(request, "r-7").with(secret, "s"), [&] {
        std::thread worker = spawn_thread([&] {
            seen_request = get(request);
            secret_visible = is_bound(secret);
        });
        worker.join();
    });

    REQUIRE(seen_request == "r-7");
    REQUIRE_FALSE(secret_visible);

    auto deferred = call(where(request, "r-8"), [&] { return inherit_scope([&](int suffix) {
        return fmt::format("{}/{}", get(request), suffix);
    }); });
    REQUIRE(deferred(3) == "r-8/3");
    REQUIRE_FALSE(is_bound(request));
}

TEST_CASE("Snapshot - end to end: rebinding after capture does not leak to the spawned unit",
          "[scope][snapshot][threads]") {
    ScopedKey<int64_t> k{"K"};

    std::mutex mutex;
    std::condition_variable cv;
    bool captured = false;
    bool rebound = false;
    std::optional<int64_t> first_read;
    std::optional<int64_t> second_read;
    std::vector<int64_t> parent_reads;
    std::thread other;

    run(where(k, 1), [&] {
        run(where(k, 2), [&] { parent_reads.push_back(get(k)); });
        parent_reads.push_back(get(k));

        Snapshot snapshot = capture();
        other = std::thread([&, snapshot] {
            run_with_snapshot(snapshot, [&] {
                first_read = get(k);
                {
                    std::unique_lock<std::mutex> lock(mutex);
                    captured = true;
                    cv.notify_all();
                    cv.wait(lock, [&] { return rebound; });
                }
                second_read = get(k);
            });
        });

        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return captured; });
        lock.unlock();

        run(where(k, 3), [&] {
            parent_reads.push_back(get(k));
            std::lock_guard<std::mutex> relock(mutex);
            rebound = true;
            cv.notify_all();
        });
    });
    other.join();

    REQUIRE(parent_reads == std::vector<int64_t>{2, 1, 3});
    REQUIRE(first_read == 1);
    REQUIRE(second_read == 1);
}

TEST_CASE("Snapshot - shared by many threads concurrently", "[scope][snapshot][threads]") {
    ScopedKey<int64_t> key{"key"};
    Snapshot snapshot = call(where(key, 21), [] { return capture(); });

    std::vector<std::thread> workers;
    std::vector<int64_t> results(8, 0);
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&, i] {
            results[i] = call_with_snapshot(snapshot, [&] {
                return call(where(key, get(key) * 2), [&] { return get(key); });
            });
        });
    }
    for (auto &worker : workers) { worker.join(); }

    REQUIRE(results == std::vector<int64_t>(8, 42));
    REQUIRE(snapshot.get(key) == 21);
}
