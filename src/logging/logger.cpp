#include "sigkeep/logging/logger.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace sigkeep::logging {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<ILogSink> sink = std::make_shared<StderrLogSink>();
    std::atomic<LogLevel> level{LogLevel::Info};
};

LoggerState& State() {
    static LoggerState state;
    return state;
}

} // namespace

std::string_view LevelName(const LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

void StderrLogSink::Write(const LogLevel level, const std::string_view component,
                          const std::string_view message) {
    fmt::print(stderr, "[sigkeep] {} {}: {}\n", LevelName(level), component, message);
    std::fflush(stderr);
}

void Logger::SetSink(std::shared_ptr<ILogSink> sink) {
    auto& state = State();
    std::lock_guard lock(state.mutex);
    state.sink = sink ? std::move(sink) : std::make_shared<StderrLogSink>();
}

void Logger::SetLevel(const LogLevel level) noexcept {
    State().level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() noexcept {
    return State().level.load(std::memory_order_relaxed);
}

bool Logger::IsEnabled(const LogLevel level) noexcept {
    const auto threshold = GetLevel();
    return level != LogLevel::Off && threshold != LogLevel::Off && level >= threshold;
}

void Logger::Write(const LogLevel level, const std::string_view component,
                   const std::string_view message) {
    std::shared_ptr<ILogSink> sink;
    {
        auto& state = State();
        std::lock_guard lock(state.mutex);
        sink = state.sink;
    }
    sink->Write(level, component, message);
}

std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

} // namespace sigkeep::logging
