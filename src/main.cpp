#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "resilience/fallback.hpp"
#include "resilience/resilience_registry.hpp"
#include "resilience/service_profiles.hpp"
#include "resilience/stats_json.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace callguard;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Simulated downstream that fails until told to recover
 */
class FlakyService {
public:
    Result<std::string> call(const std::string& prompt) {
        ++calls_;
        if (!healthy_.load()) {
            return Result<std::string>::error(Error::operation_failed(
                "upstream returned 503", "flaky-llm"));
        }
        return Result<std::string>::ok(std::format("completion for '{}'", prompt));
    }

    void set_healthy(bool healthy) { healthy_.store(healthy); }
    [[nodiscard]] uint64_t calls() const { return calls_.load(); }

private:
    std::atomic<bool> healthy_{false};
    std::atomic<uint64_t> calls_{0};
};

/// Built-in llm profile with a short cooldown so the demo finishes quickly
ResilienceConfig demo_llm_config() {
    ResilienceConfig cfg = profile_config(ServiceType::LLM);
    cfg.failure_threshold = 3;
    cfg.reset_timeout = 2000ms;
    cfg.timeout = 500ms;
    return cfg;
}

void drive_circuit(ResilienceManager& llm, FlakyService& service) {
    utils::log::info(std::format("[2/4] Driving '{}' with a failing downstream", llm.name()));

    for (int i = 1; i <= 10 && !llm.is_open(); ++i) {
        const auto result = llm.execute([&service, i] {
            return service.call(std::format("request {}", i));
        });
        utils::log::info(std::format("  call {}: {}", i,
            result.is_ok() ? result.value() : result.error_message()));
    }

    // Fast-fail while OPEN: the downstream is not touched
    const uint64_t before = service.calls();
    const utils::Timer timer;
    const auto rejected = llm.execute([&service] { return service.call("while open"); });
    utils::log::info(std::format("  open call: {} ({}us, downstream calls +{})",
        error_code_to_string(rejected.error_code()), timer.elapsed().count(),
        service.calls() - before));

    const auto degraded = with_fallback(llm,
        [&service] { return service.call("with fallback"); },
        std::string("cached completion"));
    utils::log::info(std::format("  with fallback: {}", degraded.value()));
}

void await_recovery(ResilienceManager& llm, FlakyService& service) {
    const auto cooldown = llm.config().reset_timeout + 100ms;
    utils::log::info(std::format("[3/4] Downstream recovered, waiting {}ms for half-open",
        cooldown.count()));

    service.set_healthy(true);
    std::this_thread::sleep_for(cooldown);

    const auto trial = llm.execute([&service] { return service.call("trial"); });
    utils::log::info(std::format("  trial call: {} -> circuit {}",
        trial.is_ok() ? trial.value() : trial.error_message(),
        circuit_state_to_string(llm.circuit_breaker()
            ? llm.circuit_breaker()->get_state() : CircuitState::CLOSED)));
}

void saturate_bulkhead(ResilienceRegistry& registry) {
    ResilienceConfig cfg = profile_config(ServiceType::WEBHOOK);
    cfg.max_concurrent = 2;
    cfg.max_queue_size = 1;
    auto webhook = registry.get_or_create("webhook-demo", cfg);

    std::vector<std::jthread> callers;
    std::atomic<int> rejected{0};
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&webhook, &rejected] {
            const auto result = webhook->execute([] {
                std::this_thread::sleep_for(200ms);
                return Result<int>::ok(200);
            });
            if (result.error_code() == ErrorCode::BULKHEAD_REJECTED) {
                ++rejected;
            }
        });
        std::this_thread::sleep_for(20ms);
    }
    callers.clear();
    utils::log::info(std::format("  bulkhead '{}': {} of 4 concurrent calls rejected",
        webhook->name(), rejected.load()));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("callguard demo starting...");

        CallguardConfig config;
        if (argc > 1) {
            const std::string config_file = argv[1];
            utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
            auto config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return 1;
            }
            config = std::move(config_result.config);
            apply_logging_config(config.logging);
            utils::log::info(std::format("Config loaded: {} services", config.services.size()));
        } else {
            utils::log::info("[1/4] No config file given, using built-in defaults");
            config.defaults = default_resilience_config();
            config.services.push_back(ServiceConfig{"llm", "llm", demo_llm_config()});
        }

        auto registry = build_registry(config, [](const ResilienceEvent& event) {
            if (event.type == EventType::STATE_CHANGE) {
                std::cout << std::format("event: {} {} {} -> {}\n",
                    event.source, event_type_to_string(event.type),
                    circuit_state_to_string(event.from), circuit_state_to_string(event.to));
            }
        });

        FlakyService service;
        auto llm = registry->get_or_create("llm");
        drive_circuit(*llm, service);
        await_recovery(*llm, service);
        saturate_bulkhead(*registry);

        utils::log::info("[4/4] Registry state");
        std::cout << registry_to_json(*registry) << "\n";

        if (!registry->shutdown(5000ms)) {
            utils::log::warn("Some calls were still active at shutdown");
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
