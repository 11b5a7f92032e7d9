#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdio>
#include <fstream>

using namespace callguard;
using namespace std::chrono_literals;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.defaults.failure_threshold == 5);
    CHECK(result.config.defaults.timeout == 3000ms);
    CHECK(result.config.services.empty());
}

TEST_CASE("ConfigLoader: defaults section and services", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[resilience.defaults]
failure_threshold = 4
window_ms = 20000
timeout_ms = 1500

[[resilience.services]]
name = "search"
max_concurrent = 3
max_queue_size = 0

[[resilience.services]]
name = "payments"
circuit_breaker_enabled = false
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.defaults.failure_threshold == 4);
    CHECK(cfg.defaults.window == 20000ms);

    REQUIRE(cfg.services.size() == 2);
    CHECK(cfg.services[0].name == "search");
    // Inherits from [resilience.defaults]
    CHECK(cfg.services[0].resilience.failure_threshold == 4);
    CHECK(cfg.services[0].resilience.timeout == 1500ms);
    CHECK(cfg.services[0].resilience.max_concurrent == 3);
    CHECK(cfg.services[0].resilience.max_queue_size == 0);
    CHECK_FALSE(cfg.services[1].resilience.circuit_breaker_enabled);
}

TEST_CASE("ConfigLoader: profile, then tier, then explicit keys", "[config][profiles]") {
    const std::string toml = R"(
[[resilience.services]]
name = "llm"
profile = "llm"

[[resilience.services]]
name = "cheap-llm"
profile = "llm"
tier = "optional"

[[resilience.services]]
name = "tuned-llm"
profile = "LLM"
tier = "optional"
max_concurrent = 2
timeout_ms = 100
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& svcs = result.config.services;
    REQUIRE(svcs.size() == 3);

    CHECK(svcs[0].profile == "llm");
    CHECK(svcs[0].resilience.timeout == 30000ms);
    CHECK(svcs[0].resilience.tier == BulkheadTier::CRITICAL);
    CHECK(svcs[0].resilience.max_concurrent == 20);

    CHECK(svcs[1].resilience.timeout == 30000ms);
    CHECK(svcs[1].resilience.tier == BulkheadTier::OPTIONAL);
    CHECK(svcs[1].resilience.max_concurrent == 5);

    CHECK(svcs[2].resilience.tier == BulkheadTier::OPTIONAL);
    CHECK(svcs[2].resilience.max_concurrent == 2);
    CHECK(svcs[2].resilience.max_queue_size == 5);
    CHECK(svcs[2].resilience.timeout == 100ms);
}

TEST_CASE("ConfigLoader: validation collects every error", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "verbose"

[resilience.defaults]
failure_threshold = 0

[[resilience.services]]
name = "a"
profile = "mainframe"

[[resilience.services]]
name = "a"
tier = "urgent"

[[resilience.services]]
max_concurrent = 0
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("resilience.defaults.failure_threshold") != std::string::npos);
    CHECK(msg.find("unknown profile 'mainframe'") != std::string::npos);
    CHECK(msg.find("unknown tier 'urgent'") != std::string::npos);
    CHECK(msg.find("defined more than once") != std::string::npos);
    CHECK(msg.find("resilience.services[2].name must not be empty") != std::string::npos);
    CHECK(msg.find("resilience.services[2].max_concurrent") != std::string::npos);
}

TEST_CASE("ConfigLoader: negative and mistyped numbers are rejected", "[config][validation]") {
    const std::string toml = R"(
[[resilience.services]]
name = "bad"
timeout_ms = -5
failure_threshold = "three"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("timeout_ms") != std::string::npos);
    CHECK(result.error_message.find("failure_threshold must be an integer") != std::string::npos);
}

TEST_CASE("ConfigLoader: durations above 24h are rejected", "[config][validation]") {
    const std::string toml = R"(
[[resilience.services]]
name = "huge"
timeout_ms = 9223372036854775807
reset_timeout_ms = 86400001
window_ms = 86400000
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("resilience.services[0].timeout_ms must be 0-86400000") != std::string::npos);
    CHECK(result.error_message.find("resilience.services[0].reset_timeout_ms must be 0-86400000") != std::string::npos);
    CHECK(result.error_message.find("window_ms") == std::string::npos);
}

TEST_CASE("ConfigLoader: validate_config rejects oversized durations", "[config][validation]") {
    CallguardConfig cfg;
    cfg.defaults.timeout = std::chrono::milliseconds::max();
    auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("resilience.defaults.timeout_ms must be <= 86400000") != std::string::npos);
}

TEST_CASE("ConfigLoader: disabled layer skips its checks", "[config][validation]") {
    const std::string toml = R"(
[[resilience.services]]
name = "bulkhead-off"
bulkhead_enabled = false
max_concurrent = 0

[[resilience.services]]
name = "breaker-off"
circuit_breaker_enabled = false
failure_threshold = 0
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK(result.success);
}

TEST_CASE("ConfigLoader: malformed TOML is a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[resilience\nname = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file is reported", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/callguard.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load_from_file round trip", "[config]") {
    const std::string path = "test_callguard_config.toml";
    {
        std::ofstream out(path);
        out << "[[resilience.services]]\nname = \"from-file\"\nprofile = \"database\"\n";
    }

    auto result = ConfigLoader::load_from_file(path);
    std::remove(path.c_str());

    REQUIRE(result.success);
    REQUIRE(result.config.services.size() == 1);
    CHECK(result.config.services[0].resilience.reset_timeout == 15000ms);
}

TEST_CASE("ConfigLoader: build_registry wires defaults and overrides", "[config][registry]") {
    const std::string toml = R"(
[resilience.defaults]
failure_threshold = 8

[[resilience.services]]
name = "webhook"
profile = "webhook"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    auto registry = build_registry(result.config);
    CHECK(registry->get_or_create("anything")->config().failure_threshold == 8);
    CHECK(registry->get_or_create("webhook")->config().tier == BulkheadTier::OPTIONAL);
}

TEST_CASE("ConfigLoader: validate_config on a hand-built struct", "[config][validation]") {
    CallguardConfig cfg;
    CHECK(ConfigLoader::validate_config(cfg).empty());

    cfg.defaults.reset_timeout = 0ms;
    cfg.services.push_back(ServiceConfig{"", "", ResilienceConfig{}});
    auto errors = ConfigLoader::validate_config(cfg);
    CHECK(errors.size() == 2);
}
