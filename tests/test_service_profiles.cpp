#include <catch2/catch_test_macros.hpp>
#include "resilience/service_profiles.hpp"

using namespace callguard;
using namespace std::chrono_literals;

TEST_CASE("ServiceProfiles: llm profile", "[profiles]") {
    auto cfg = profile_config(ServiceType::LLM);
    CHECK(cfg.timeout == 30000ms);
    CHECK(cfg.reset_timeout == 30000ms);
    CHECK(cfg.failure_threshold == 5);
    CHECK(cfg.window == 10000ms);
    CHECK(cfg.tier == BulkheadTier::CRITICAL);
    CHECK(cfg.max_concurrent == 20);
    CHECK(cfg.max_queue_size == 50);
}

TEST_CASE("ServiceProfiles: webhook profile is optional tier", "[profiles]") {
    auto cfg = profile_config(ServiceType::WEBHOOK);
    CHECK(cfg.timeout == 5000ms);
    CHECK(cfg.reset_timeout == 60000ms);
    CHECK(cfg.failure_threshold == 3);
    CHECK(cfg.tier == BulkheadTier::OPTIONAL);
    CHECK(cfg.max_concurrent == 5);
    CHECK(cfg.max_queue_size == 5);
}

TEST_CASE("ServiceProfiles: remaining profiles", "[profiles]") {
    auto vector = profile_config(ServiceType::VECTOR);
    CHECK(vector.timeout == 10000ms);
    CHECK(vector.reset_timeout == 20000ms);
    CHECK(vector.failure_threshold == 3);
    CHECK(vector.tier == BulkheadTier::STANDARD);

    auto database = profile_config(ServiceType::DATABASE);
    CHECK(database.reset_timeout == 15000ms);
    CHECK(database.tier == BulkheadTier::CRITICAL);

    auto http = profile_config(ServiceType::HTTP);
    CHECK(http.reset_timeout == 30000ms);
    CHECK(http.failure_threshold == 5);
    CHECK(http.tier == BulkheadTier::STANDARD);
}

TEST_CASE("ServiceProfiles: global defaults", "[profiles]") {
    auto cfg = default_resilience_config();
    CHECK(cfg.failure_threshold == 5);
    CHECK(cfg.window == 60000ms);
    CHECK(cfg.reset_timeout == 30000ms);
    CHECK(cfg.timeout == 3000ms);
    CHECK(cfg.tier == BulkheadTier::STANDARD);
    CHECK(cfg.half_open_max_calls == 1);
    CHECK(cfg.circuit_breaker_enabled);
    CHECK(cfg.bulkhead_enabled);
}

TEST_CASE("ServiceProfiles: tier capacities", "[profiles][tier]") {
    CHECK(tier_capacity(BulkheadTier::CRITICAL).max_concurrent == 20);
    CHECK(tier_capacity(BulkheadTier::CRITICAL).max_queue_size == 50);
    CHECK(tier_capacity(BulkheadTier::STANDARD).max_concurrent == 10);
    CHECK(tier_capacity(BulkheadTier::STANDARD).max_queue_size == 20);
    CHECK(tier_capacity(BulkheadTier::OPTIONAL).max_concurrent == 5);
    CHECK(tier_capacity(BulkheadTier::OPTIONAL).max_queue_size == 5);

    ResilienceConfig cfg;
    apply_tier(cfg, BulkheadTier::OPTIONAL);
    CHECK(cfg.tier == BulkheadTier::OPTIONAL);
    CHECK(cfg.max_concurrent == 5);
}

TEST_CASE("ServiceProfiles: name parsing is case-insensitive", "[profiles]") {
    CHECK(parse_service_type("LLM") == ServiceType::LLM);
    CHECK(parse_service_type("Vector") == ServiceType::VECTOR);
    CHECK_FALSE(parse_service_type("graphql").has_value());

    CHECK(parse_tier("Critical") == BulkheadTier::CRITICAL);
    CHECK(parse_tier("optional") == BulkheadTier::OPTIONAL);
    CHECK_FALSE(parse_tier("urgent").has_value());
}

TEST_CASE("ServiceProfiles: operation timeouts", "[profiles]") {
    CHECK(default_timeout(OperationTimeout::LLM_INVOKE) == 30000ms);
    CHECK(default_timeout(OperationTimeout::LLM_STREAM) == 60000ms);
    CHECK(default_timeout(OperationTimeout::VECTOR_SEARCH) == 10000ms);
    CHECK(default_timeout(OperationTimeout::VECTOR_EMBED) == 15000ms);
    CHECK(default_timeout(OperationTimeout::DATABASE_QUERY) == 10000ms);
    CHECK(default_timeout(OperationTimeout::DATABASE_TRANSACTION) == 30000ms);
    CHECK(default_timeout(OperationTimeout::HTTP_REQUEST) == 10000ms);
    CHECK(default_timeout(OperationTimeout::WEBHOOK) == 5000ms);
}
