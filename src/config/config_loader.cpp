#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "resilience/service_profiles.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <utility>

using namespace std::string_literals;

namespace callguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/// Read a non-negative integer key; absent leaves out untouched
bool read_uint(const toml::table& tbl, std::string_view key, int64_t max, int64_t& out,
               const std::string& path, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return false;

    if (!node.is_integer()) {
        errors.push_back(std::format("{}.{} must be an integer", path, key));
        return false;
    }
    const int64_t v = node.value<int64_t>().value_or(0);
    if (v < 0 || v > max) {
        errors.push_back(std::format("{}.{} must be 0-{}, got {}", path, key, max, v));
        return false;
    }
    out = v;
    return true;
}

void read_u32(const toml::table& tbl, std::string_view key, uint32_t& out,
              const std::string& path, std::vector<std::string>& errors) {
    int64_t v = 0;
    if (read_uint(tbl, key, std::numeric_limits<uint32_t>::max(), v, path, errors)) {
        out = static_cast<uint32_t>(v);
    }
}

void read_ms(const toml::table& tbl, std::string_view key, std::chrono::milliseconds& out,
             const std::string& path, std::vector<std::string>& errors) {
    int64_t v = 0;
    if (read_uint(tbl, key, ConfigLoader::kMaxDurationMs, v, path, errors)) {
        out = std::chrono::milliseconds(v);
    }
}

void read_bool(const toml::table& tbl, std::string_view key, bool& out,
               const std::string& path, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return;
    if (!node.is_boolean()) {
        errors.push_back(std::format("{}.{} must be true or false", path, key));
        return;
    }
    out = node.value_or(out);
}

std::optional<std::string> read_string(const toml::table& tbl, std::string_view key,
                                       const std::string& path, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (const auto* s = node.as_string()) {
        return s->get();
    }
    errors.push_back(std::format("{}.{} must be a string", path, key));
    return std::nullopt;
}

void validate_resilience(const ResilienceConfig& cfg, const std::string& path,
                         std::vector<std::string>& errors) {
    if (cfg.circuit_breaker_enabled) {
        if (cfg.failure_threshold == 0) {
            errors.push_back(std::format("{}.failure_threshold must be > 0", path));
        }
        if (cfg.half_open_max_calls == 0) {
            errors.push_back(std::format("{}.half_open_max_calls must be > 0", path));
        }
        if (cfg.window <= std::chrono::milliseconds::zero()) {
            errors.push_back(std::format("{}.window_ms must be > 0", path));
        }
        if (cfg.reset_timeout <= std::chrono::milliseconds::zero()) {
            errors.push_back(std::format("{}.reset_timeout_ms must be > 0", path));
        }
    }
    if (cfg.bulkhead_enabled && cfg.max_concurrent == 0) {
        errors.push_back(std::format("{}.max_concurrent must be > 0", path));
    }
    if (cfg.timeout < std::chrono::milliseconds::zero()) {
        errors.push_back(std::format("{}.timeout_ms must be >= 0", path));
    }

    const std::chrono::milliseconds max_duration(ConfigLoader::kMaxDurationMs);
    const std::pair<std::string_view, std::chrono::milliseconds> durations[] = {
        {"window_ms", cfg.window},
        {"reset_timeout_ms", cfg.reset_timeout},
        {"timeout_ms", cfg.timeout},
    };
    for (const auto& [key, value] : durations) {
        if (value > max_duration) {
            errors.push_back(std::format("{}.{} must be <= {}, got {}",
                path, key, ConfigLoader::kMaxDurationMs, value.count()));
        }
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ResilienceConfig ConfigLoader::extract_resilience(const toml::table& tbl, ResilienceConfig base,
                                                  const std::string& path,
                                                  std::vector<std::string>& errors) {
    // Precedence: profile < tier defaults < explicit keys
    if (const auto profile = read_string(tbl, "profile", path, errors)) {
        if (const auto type = parse_service_type(*profile)) {
            base = profile_config(*type);
        } else {
            errors.push_back(std::format("{}.profile: unknown profile '{}'", path, *profile));
        }
    }

    if (const auto tier = read_string(tbl, "tier", path, errors)) {
        if (const auto parsed = parse_tier(*tier)) {
            apply_tier(base, *parsed);
        } else {
            errors.push_back(std::format("{}.tier: unknown tier '{}'", path, *tier));
        }
    }

    read_bool(tbl, "circuit_breaker_enabled", base.circuit_breaker_enabled, path, errors);
    read_bool(tbl, "bulkhead_enabled", base.bulkhead_enabled, path, errors);

    read_u32(tbl, "failure_threshold", base.failure_threshold, path, errors);
    read_ms(tbl, "window_ms", base.window, path, errors);
    read_ms(tbl, "reset_timeout_ms", base.reset_timeout, path, errors);
    read_ms(tbl, "timeout_ms", base.timeout, path, errors);
    read_u32(tbl, "half_open_max_calls", base.half_open_max_calls, path, errors);

    read_u32(tbl, "max_concurrent", base.max_concurrent, path, errors);
    read_u32(tbl, "max_queue_size", base.max_queue_size, path, errors);
    return base;
}

std::vector<ServiceConfig> ConfigLoader::extract_services(const toml::table& root,
                                                          const ResilienceConfig& defaults,
                                                          std::vector<std::string>& errors) {
    std::vector<ServiceConfig> result;
    const auto* arr = root["resilience"]["services"].as_array();
    if (!arr) return result;

    for (size_t i = 0; i < arr->size(); ++i) {
        const std::string path = std::format("resilience.services[{}]", i);
        const auto* svc = arr->get(i)->as_table();
        if (!svc) {
            errors.push_back(std::format("{} must be a table", path));
            continue;
        }

        ServiceConfig entry;
        entry.name = read_string(*svc, "name", path, errors).value_or("");
        entry.profile = utils::to_lower((*svc)["profile"].value_or(""s));
        entry.resilience = extract_resilience(*svc, defaults, path, errors);
        result.push_back(std::move(entry));
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;
    CallguardConfig config;

    config.logging = extract_logging(root);

    if (const auto* defaults = root["resilience"]["defaults"].as_table()) {
        config.defaults = extract_resilience(*defaults, default_resilience_config(),
                                             "resilience.defaults", errors);
    } else {
        config.defaults = default_resilience_config();
    }
    config.services = extract_services(root, config.defaults, errors);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const CallguardConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    validate_resilience(config.defaults, "resilience.defaults", errors);

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.services.size(); ++i) {
        const auto& svc = config.services[i];
        const std::string path = std::format("resilience.services[{}]", i);
        if (svc.name.empty()) {
            errors.push_back(std::format("{}.name must not be empty", path));
        } else if (!seen.insert(svc.name).second) {
            errors.push_back(std::format("{}.name '{}' is defined more than once", path, svc.name));
        }
        validate_resilience(svc.resilience, path, errors);
    }

    return errors;
}

// ============================================================================
// Wiring helpers
// ============================================================================

void apply_logging_config(const LoggingConfig& config) {
    if (const auto level = utils::log::parse_level(config.level)) {
        utils::log::set_level(*level);
    }
}

std::unique_ptr<ResilienceRegistry> build_registry(const CallguardConfig& config,
                                                   ResilienceManager::Listener listener) {
    auto registry = std::make_unique<ResilienceRegistry>(config.defaults, std::move(listener));
    for (const auto& svc : config.services) {
        registry->set_service_config(svc.name, svc.resilience);
    }
    return registry;
}

} // namespace callguard
