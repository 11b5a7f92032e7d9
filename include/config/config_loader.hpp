#pragma once

#include "resilience/resilience_config.hpp"
#include "resilience/resilience_manager.hpp"
#include "resilience/resilience_registry.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace callguard {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Per-service resilience config
// ============================================================================

struct ServiceConfig {
    std::string name;
    std::string profile;            // Empty = based on [resilience.defaults]
    ResilienceConfig resilience;    // Fully resolved
};

// ============================================================================
// CallguardConfig - Complete parsed configuration
// ============================================================================

struct CallguardConfig {
    LoggingConfig logging;
    ResilienceConfig defaults;
    std::vector<ServiceConfig> services;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Recognized layout:
 *
 *   [logging]
 *   level = "info"
 *
 *   [resilience.defaults]
 *   failure_threshold = 5
 *   timeout_ms = 3000
 *
 *   [[resilience.services]]
 *   name = "llm"
 *   profile = "llm"          # optional base: llm, vector, database, http, webhook
 *   tier = "critical"        # resets capacities to the tier defaults
 *   max_concurrent = 8       # explicit keys override profile and tier
 *
 * ${VAR} inside string values is replaced from the environment (unset = empty).
 */
class ConfigLoader {
public:
    /// Upper bound for every *_ms key (24h)
    static constexpr int64_t kMaxDurationMs = 24LL * 60 * 60 * 1000;

    struct LoadResult {
        bool success;
        std::string error_message;
        CallguardConfig config;

        static LoadResult ok(CallguardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to callguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config struct, collecting all errors
     * @return Empty vector if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CallguardConfig& config);

private:
    static LoadResult extract_and_validate(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ResilienceConfig extract_resilience(const toml::table& tbl, ResilienceConfig base,
                                               const std::string& path,
                                               std::vector<std::string>& errors);
    static std::vector<ServiceConfig> extract_services(const toml::table& root,
                                                       const ResilienceConfig& defaults,
                                                       std::vector<std::string>& errors);
};

/**
 * @brief Apply [logging] to the process-wide logger
 */
void apply_logging_config(const LoggingConfig& config);

/**
 * @brief Registry whose default and per-name overrides come from config
 */
[[nodiscard]] std::unique_ptr<ResilienceRegistry> build_registry(
    const CallguardConfig& config, ResilienceManager::Listener listener = {});

} // namespace callguard
