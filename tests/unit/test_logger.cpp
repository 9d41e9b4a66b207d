#include <catch2/catch_test_macros.hpp>
#include "sigkeep/logging/logger.hpp"
#include "helpers/capturing_log_sink.hpp"
using namespace sigkeep;
using namespace sigkeep::logging;
using test_helpers::ScopedLogCapture;

TEST_CASE("Logger - Level Filtering", "[logging]") {
    SECTION("Messages at or above the threshold reach the sink") {
        ScopedLogCapture capture(LogLevel::Warn);
        SIGKEEP_LOG_INFO("test", "dropped {}", 1);
        SIGKEEP_LOG_WARN("test", "kept {}", 2);
        SIGKEEP_LOG_ERROR("test", "kept {}", 3);
        const auto entries = capture.Sink().Entries();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].message == "kept 2");
        REQUIRE(entries[0].component == "test");
        REQUIRE(entries[1].level == LogLevel::Error);
    }
    SECTION("Off silences everything") {
        ScopedLogCapture capture(LogLevel::Off);
        SIGKEEP_LOG_ERROR("test", "never");
        REQUIRE(capture.Sink().Entries().empty());
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Error));
    }
    SECTION("Arguments are not formatted below the threshold") {
        ScopedLogCapture capture(LogLevel::Error);
        int evaluations = 0;
        auto count = [&evaluations]() { return ++evaluations; };
        SIGKEEP_LOG_DEBUG("test", "value {}", count());
        REQUIRE(evaluations == 0);
    }
}

TEST_CASE("Logger - Helpers", "[logging]") {
    SECTION("Level names") {
        REQUIRE(LevelName(LogLevel::Trace) == "TRACE");
        REQUIRE(LevelName(LogLevel::Warn) == "WARN");
    }
    SECTION("Hex rendering is lowercase") {
        const std::vector<uint8_t> bytes = {0x00, 0xAB, 0x10, 0xFF};
        REQUIRE(ToHex(bytes) == "00ab10ff");
        REQUIRE(ToHex({}).empty());
    }
    SECTION("Key material is not logged without the debug option") {
        ScopedLogCapture capture(LogLevel::Trace);
        const std::vector<uint8_t> secret = {0xDE, 0xAD};
        SIGKEEP_LOG_KEY("test", "secret", std::span<const uint8_t>(secret));
#ifdef SIGKEEP_DEBUG_KEYS
        REQUIRE(capture.Sink().Contains("dead"));
#else
        REQUIRE_FALSE(capture.Sink().Contains("dead"));
#endif
    }
}
