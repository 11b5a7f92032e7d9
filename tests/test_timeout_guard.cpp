#include <catch2/catch_test_macros.hpp>
#include "resilience/timeout_guard.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace callguard;
using namespace std::chrono_literals;

TEST_CASE("TimeoutGuard: fast call returns its value", "[timeout]") {
    auto result = TimeoutGuard::run([] { return Result<int>::ok(42); }, 100ms, "fast");
    REQUIRE(result.is_ok());
    CHECK(result.value() == 42);
}

TEST_CASE("TimeoutGuard: error from fn passes through unchanged", "[timeout]") {
    auto result = TimeoutGuard::run([] {
        return Result<int>::error(ErrorCode::OPERATION_FAILED, "boom");
    }, 100ms, "failing");

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::OPERATION_FAILED);
    CHECK(result.error_message() == "boom");
}

TEST_CASE("TimeoutGuard: slow call times out at the deadline", "[timeout]") {
    auto start = std::chrono::steady_clock::now();
    auto result = TimeoutGuard::run([] {
        std::this_thread::sleep_for(300ms);
        return Result<int>::ok(1);
    }, 50ms, "slow-op");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::TIMEOUT);
    CHECK(result.error_info().source == "slow-op");
    CHECK(result.error_info().timeout == 50ms);
    CHECK(elapsed >= 50ms);
    CHECK(elapsed < 250ms);
}

TEST_CASE("TimeoutGuard: cooperative fn sees stop requested after timeout", "[timeout]") {
    auto observed_stop = std::make_shared<std::atomic<bool>>(false);

    auto result = TimeoutGuard::run([observed_stop](std::stop_token st) {
        for (int i = 0; i < 100 && !st.stop_requested(); ++i) {
            std::this_thread::sleep_for(5ms);
        }
        observed_stop->store(st.stop_requested());
        return Result<int>::ok(0);
    }, 20ms, "cooperative");

    CHECK(result.error_code() == ErrorCode::TIMEOUT);

    std::this_thread::sleep_for(100ms);
    CHECK(observed_stop->load());
}

TEST_CASE("TimeoutGuard: caller cancellation returns CANCELLED", "[timeout][cancel]") {
    std::stop_source caller;
    std::jthread canceller([&caller] {
        std::this_thread::sleep_for(30ms);
        caller.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = TimeoutGuard::run([] {
        std::this_thread::sleep_for(300ms);
        return Result<int>::ok(1);
    }, 1000ms, "cancellable", caller.get_token());
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(result.error_code() == ErrorCode::CANCELLED);
    CHECK(elapsed < 250ms);
}

TEST_CASE("TimeoutGuard: already-cancelled caller never runs fn", "[timeout][cancel]") {
    std::stop_source caller;
    caller.request_stop();

    bool called = false;
    auto result = TimeoutGuard::run([&called] {
        called = true;
        return Result<int>::ok(1);
    }, 100ms, "never", caller.get_token());

    CHECK(result.error_code() == ErrorCode::CANCELLED);
    CHECK_FALSE(called);
}

TEST_CASE("TimeoutGuard: zero timeout runs inline", "[timeout]") {
    const auto caller_thread = std::this_thread::get_id();
    std::thread::id ran_on;

    auto result = TimeoutGuard::run([&ran_on] {
        ran_on = std::this_thread::get_id();
        return Result<int>::ok(7);
    }, 0ms, "inline");

    REQUIRE(result.is_ok());
    CHECK(ran_on == caller_thread);
}

TEST_CASE("TimeoutGuard: thrown exception becomes OPERATION_FAILED", "[timeout]") {
    auto result = TimeoutGuard::run([]() -> Result<int> {
        throw std::runtime_error("connection reset");
    }, 100ms, "throwing");

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::OPERATION_FAILED);
    CHECK(result.error_message().find("connection reset") != std::string::npos);
}

TEST_CASE("TimeoutGuard: maximal timeout does not wrap the deadline", "[timeout]") {
    auto result = TimeoutGuard::run([] {
        std::this_thread::sleep_for(10ms);
        return Result<int>::ok(7);
    }, std::chrono::milliseconds::max(), "unbounded");

    REQUIRE(result.is_ok());
    CHECK(result.value() == 7);
}
