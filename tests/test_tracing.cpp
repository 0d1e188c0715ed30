#include <catch2/catch_test_macros.hpp>
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include <chrono>
#include <fstream>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

using namespace ReelSync;

TEST_CASE("Tracing writes start and end records to file", "[tracing]") {
    auto now_ns = std::chrono::steady_clock::now().time_since_epoch().count();
    auto tmp = std::filesystem::temp_directory_path() / ("reelsync_test_trace_" + std::to_string(now_ns) + ".log");
    tracing::InitTracing(tmp.string());
    {
        TRACE_SCOPE("compose-segments");
    }
    tracing::ShutdownTracing();

    REQUIRE(std::filesystem::exists(tmp));
    {
        std::ifstream in(tmp.string());
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        REQUIRE(content.find("START compose-segments") != std::string::npos);
        REQUIRE(content.find("END compose-segments") != std::string::npos);
    }
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
}

TEST_CASE("Logger drops messages below the minimum level", "[logging]") {
    DebugLogger& logger = DebugLogger::getInstance();
    LogLevel previous = logger.getMinimumLevel();
    std::vector<std::pair<LogLevel, std::string>> captured;

    logger.setConsoleEnabled(false);
    logger.setSink([&](LogLevel level, const std::string& msg) { captured.emplace_back(level, msg); });
    logger.setMinimumLevel(LogLevel::Warn);

    logDebug("beat spacing adjusted");
    logInfo("clip registered");
    logWarn("transcript missing");
    logError("mux failed");

    logger.setSink(nullptr);
    logger.setMinimumLevel(previous);
    logger.setConsoleEnabled(true);

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].first == LogLevel::Warn);
    CHECK(captured[0].second == "transcript missing");
    CHECK(captured[1].first == LogLevel::Error);
    CHECK(std::string(logLevelName(LogLevel::Debug)) == "DEBUG");
}
