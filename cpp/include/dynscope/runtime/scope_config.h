#ifndef DYNSCOPE_RUNTIME_SCOPE_CONFIG_H
#define DYNSCOPE_RUNTIME_SCOPE_CONFIG_H

#include <dynscope/dynscope_export.h>

#include <optional>
#include <string>

namespace dynscope {

    /**
     * Process-wide settings of the scoping mechanism.
     */
    struct DYNSCOPE_EXPORT ScopeConfig {
        // Memoise lookups against the current frame in the unit's resolution cache
        bool resolution_cache{true};
        // Register a ScopeTrace writing to std::cerr
        bool trace{false};
        std::optional<std::string> trace_filter{};

        /**
         * The defaults, overridden by DYNSCOPE_DISABLE_CACHE and DYNSCOPE_TRACE (set means on, the value is not
         * inspected) and DYNSCOPE_TRACE_FILTER (the key name substring to trace).
         */
        [[nodiscard]] static ScopeConfig from_environment();
    };

    /**
     * Apply ``config`` process-wide, installing, replacing or removing the trace observer as required.
     */
    DYNSCOPE_EXPORT void configure(const ScopeConfig &config);

    [[nodiscard]] DYNSCOPE_EXPORT ScopeConfig current_config();

    [[nodiscard]] DYNSCOPE_EXPORT bool resolution_cache_enabled() noexcept;

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_SCOPE_CONFIG_H
