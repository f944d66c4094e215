#include <dynscope/python/py_value.h>

#include <dynscope/runtime/cancellation.h>
#include <dynscope/runtime/observers/scope_statistics.h>
#include <dynscope/runtime/scope_config.h>
#include <dynscope/scope/resolution.h>
#include <dynscope/scope/scope_runner.h>

#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>

namespace {
    using namespace dynscope;

    // Python bodies take no arguments, their result is returned from call
    nb::object invoke_body(const nb::callable &fn) { return fn(); }

    nb::object carrier_get(const Carrier &carrier, const ScopedKeyBase &key) {
        const Value *value = carrier.find(key);
        if (value == nullptr) { throw_error<UnboundKeyError>("Key '{}' is not bound by this carrier", key.to_string()); }
        return from_value(*value);
    }

    nb::object snapshot_get(const Snapshot &snapshot, const ScopedKeyBase &key) {
        const Value *value = snapshot.resolve(key);
        if (value == nullptr) { throw_error<UnboundKeyError>("Key '{}' is not bound in this snapshot", key.to_string()); }
        return from_value(*value);
    }
} // namespace

void export_scope(nb::module_ &m) {
    using namespace dynscope;

    nb::class_<Carrier>(m, "Carrier")
        .def(nb::init<>())
        .def("where", [](const Carrier &self, const ScopedKeyBase &key, nb::handle value) {
            return self.with_value(key, to_value(value));
        }, "key"_a, "value"_a)
        .def("get", &carrier_get, "key"_a)
        .def("call", [](const Carrier &self, nb::callable fn) { return call(self, [&]() { return invoke_body(fn); }); })
        .def("run", [](const Carrier &self, nb::callable fn) { run(self, [&]() { invoke_body(fn); }); })
        .def("__len__", &Carrier::size)
        .def("__contains__", &Carrier::contains)
        .def("__repr__", &Carrier::to_string);

    m.def("where", [](const ScopedKeyBase &key, nb::handle value) { return where_value(key, to_value(value)); },
          "key"_a, "value"_a, "A carrier binding key to value");
    m.def("call", [](const Carrier &carrier, nb::callable fn) { return call(carrier, [&]() { return invoke_body(fn); }); },
          "carrier"_a, "fn"_a);
    m.def("run", [](const Carrier &carrier, nb::callable fn) { run(carrier, [&]() { invoke_body(fn); }); },
          "carrier"_a, "fn"_a);

    m.def("get", [](const ScopedKeyBase &key) { return from_value(get_value(key)); }, "key"_a,
          "The value bound to key in the current scope, raises UnboundKeyError if none");
    m.def("get_or", [](const ScopedKeyBase &key, nb::object default_value) {
        const Value *value = resolve(key);
        return value == nullptr ? default_value : from_value(*value);
    }, "key"_a, "default"_a);
    m.def("is_bound", [](const ScopedKeyBase &key) { return is_bound(key); }, "key"_a);

    nb::class_<Snapshot>(m, "Snapshot")
        .def(nb::init<>())
        .def_prop_ro("depth", &Snapshot::depth)
        .def_prop_ro("empty", &Snapshot::empty)
        .def("is_bound", &Snapshot::is_bound, "key"_a)
        .def("get", &snapshot_get, "key"_a)
        .def("call", [](const Snapshot &self, nb::callable fn) {
            return call_with_snapshot(self, [&]() { return invoke_body(fn); });
        })
        .def("run", [](const Snapshot &self, nb::callable fn) { run_with_snapshot(self, [&]() { invoke_body(fn); }); });

    m.def("capture", &Snapshot::capture, "The inheritable bindings of the current scope");

    nb::class_<ContinuationState>(m, "ContinuationState")
        .def_prop_ro("empty", &ContinuationState::empty)
        .def("call", [](const ContinuationState &self, nb::callable fn) {
            return call_with_continuation(self, [&]() { return invoke_body(fn); });
        })
        .def("run", [](const ContinuationState &self, nb::callable fn) {
            run_with_continuation(self, [&]() { invoke_body(fn); });
        });

    m.def("save_continuation", &ContinuationState::save, "Every binding of the current scope, local ones included");
}

void export_runtime(nb::module_ &m) {
    using namespace dynscope;

    nb::class_<CancellationToken>(m, "CancellationToken")
        .def(nb::init<>())
        .def("request_cancel", &CancellationToken::request_cancel)
        .def_prop_ro("is_cancellation_requested", &CancellationToken::is_cancellation_requested)
        .def("throw_if_cancelled", &CancellationToken::throw_if_cancelled);

    m.def("call_with_cancellation", [](const CancellationToken &token, nb::callable fn) {
        return call(where(cancellation_key(), token), [&]() { return invoke_body(fn); });
    }, "token"_a, "fn"_a, "Call fn with token bound as the current cancellation token");
    m.def("check_cancelled", &check_cancelled);

    nb::class_<ScopeStatistics>(m, "ScopeStatistics")
        .def(nb::init<>())
        .def_prop_ro("pushes", &ScopeStatistics::pushes)
        .def_prop_ro("pops", &ScopeStatistics::pops)
        .def_prop_ro("snapshot_installs", &ScopeStatistics::snapshot_installs)
        .def_prop_ro("continuation_resumes", &ScopeStatistics::continuation_resumes)
        .def_prop_ro("captures", &ScopeStatistics::captures)
        .def_prop_ro("max_depth", &ScopeStatistics::max_depth)
        .def("reset", &ScopeStatistics::reset);

    m.def("add_observer", [](std::shared_ptr<ScopeStatistics> observer) { ScopeObservers::add_observer(observer); });
    m.def("remove_observer", [](std::shared_ptr<ScopeStatistics> observer) {
        ScopeObservers::remove_observer(observer);
    });

    m.def("configure", [](bool resolution_cache, bool trace, std::optional<std::string> trace_filter) {
        configure(ScopeConfig{.resolution_cache = resolution_cache, .trace = trace, .trace_filter = std::move(trace_filter)});
    }, "resolution_cache"_a = true, "trace"_a = false, "trace_filter"_a = nb::none());
    m.def("configure_from_environment", []() { configure(ScopeConfig::from_environment()); });
}
