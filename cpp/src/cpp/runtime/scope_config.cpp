#include <dynscope/runtime/scope_config.h>
#include <dynscope/runtime/observers/scope_trace.h>

#include <atomic>
#include <cstdlib>
#include <mutex>

namespace dynscope {

    namespace {
        struct ConfigState {
            std::mutex mutex;
            ScopeConfig config{};
            std::shared_ptr<ScopeTrace> trace;
        };

        ConfigState &config_state() {
            static ConfigState state;
            return state;
        }

        std::atomic<bool> g_resolution_cache{true};
    } // namespace

    ScopeConfig ScopeConfig::from_environment() {
        ScopeConfig config;
        if (std::getenv("DYNSCOPE_DISABLE_CACHE") != nullptr) { config.resolution_cache = false; }
        if (std::getenv("DYNSCOPE_TRACE") != nullptr) { config.trace = true; }
        if (const char *filter = std::getenv("DYNSCOPE_TRACE_FILTER"); filter != nullptr && *filter != '\0') {
            config.trace_filter = std::string{filter};
        }
        return config;
    }

    void configure(const ScopeConfig &config) {
        auto &state = config_state();
        std::lock_guard<std::mutex> lock(state.mutex);

        if (state.trace && (!config.trace || state.trace->filter() != config.trace_filter)) {
            ScopeObservers::remove_observer(state.trace);
            state.trace.reset();
        }
        if (config.trace && !state.trace) {
            state.trace = std::make_shared<ScopeTrace>(config.trace_filter);
            ScopeObservers::add_observer(state.trace);
        }

        g_resolution_cache.store(config.resolution_cache, std::memory_order_relaxed);
        state.config = config;
    }

    ScopeConfig current_config() {
        auto &state = config_state();
        std::lock_guard<std::mutex> lock(state.mutex);
        return state.config;
    }

    bool resolution_cache_enabled() noexcept { return g_resolution_cache.load(std::memory_order_relaxed); }

} // namespace dynscope
