// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace tangle::util;

// Note: LogManager uses std::call_once, so Initialize() only runs once per process.

TEST_CASE("LogManager: GetLogger returns component loggers", "[logging]") {
    LogManager::Initialize("debug", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Client components") {
        for (const char* name : {"network", "pool", "pow", "wallet", "client"}) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == name);
        }
    }

    SECTION("Unknown component falls back to default") {
        REQUIRE(LogManager::GetLogger("chain")->name() == "default");
    }

    SECTION("Same logger returned for same component") {
        REQUIRE(LogManager::GetLogger("pool").get() == LogManager::GetLogger("pool").get());
    }
}

TEST_CASE("LogManager: SetLogLevel and SetComponentLevel", "[logging]") {
    LogManager::Initialize("info", false, "");

    LogManager::SetLogLevel("trace");
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("wallet")->level() == spdlog::level::trace);

    LogManager::SetLogLevel("info");
    LogManager::SetComponentLevel("pool", "debug");
    REQUIRE(LogManager::GetLogger("pool")->level() == spdlog::level::debug);
    REQUIRE(LogManager::GetLogger("network")->level() == spdlog::level::info);

    SECTION("Unknown component is ignored") {
        LogManager::SetComponentLevel("nonexistent", "trace");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::info);
    }

    SECTION("Invalid level maps to off") {
        LogManager::SetLogLevel("invalid_level");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::off);
    }

    LogManager::SetLogLevel("off");
}

TEST_CASE("LogManager: Macros format arguments", "[logging]") {
    LogManager::Initialize("trace", false, "");
    LogManager::SetLogLevel("off");

    LOG_INFO("Integer: {}", 42);
    LOG_NET_DEBUG("GET {} -> {}", "/health", 200);
    LOG_POOL_INFO("{} of {} nodes healthy", 2, 3);
    LOG_POW_DEBUG("score {:.2f}", 4000.0);
    LOG_WALLET_TRACE("index {} holds {}", 7, uint64_t{1000000});
    LOG_CLIENT_WARN("retrying {}", "abc");

    for (int i = 0; i < 300; ++i) {
        LOG_POOL_DEBUG_RL("node {} unreachable", i);
        LOG_NET_WARN_RL("request {} failed", i);
    }
    REQUIRE(true);
}

TEST_CASE("LogManager: Thread safety", "[logging][threading]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("off");

    const int num_threads = 8;
    const int ops_per_thread = 100;
    std::atomic<int> success_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&success_count, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                auto logger = LogManager::GetLogger("pool");
                if (logger != nullptr) {
                    logger->trace("Thread {} iteration {}", t, i);
                    success_count++;
                }
                if (i % 20 == 0) {
                    LogManager::SetComponentLevel("pool", "off");
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(success_count == num_threads * ops_per_thread);
}
