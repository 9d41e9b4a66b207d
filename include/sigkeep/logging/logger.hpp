#pragma once

/**
 * @file logger.hpp
 * @brief Levelled logging for the key lifecycle stores.
 *
 * Messages are formatted with fmt and handed to a replaceable sink. The
 * default sink writes to stderr. Formatting is skipped entirely when the
 * level is below the threshold.
 *
 * SECURITY WARNING: SIGKEEP_LOG_KEY prints key material in hex and is only
 * compiled in with SIGKEEP_DEBUG_KEYS. Never enable it in production builds.
 *
 * Enable via CMake: -DSIGKEEP_DEBUG_KEYS=ON
 */

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace sigkeep::logging {

enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

[[nodiscard]] std::string_view LevelName(LogLevel level) noexcept;

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component, std::string_view message) = 0;
};

/**
 * @brief Writes "[sigkeep] LEVEL component: message" lines to stderr.
 */
class StderrLogSink final : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component, std::string_view message) override;
};

/**
 * @brief Process-wide log dispatch.
 *
 * Thread-safe. SetSink(nullptr) restores the stderr sink.
 */
class Logger {
public:
    static void SetSink(std::shared_ptr<ILogSink> sink);
    static void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel GetLevel() noexcept;
    [[nodiscard]] static bool IsEnabled(LogLevel level) noexcept;
    static void Write(LogLevel level, std::string_view component, std::string_view message);
};

[[nodiscard]] std::string ToHex(std::span<const uint8_t> data);

} // namespace sigkeep::logging

#define SIGKEEP_LOG_AT(level, component, ...) \
    do { \
        if (::sigkeep::logging::Logger::IsEnabled(level)) { \
            ::sigkeep::logging::Logger::Write(level, component, fmt::format(__VA_ARGS__)); \
        } \
    } while (0)

#define SIGKEEP_LOG_TRACE(component, ...) SIGKEEP_LOG_AT(::sigkeep::logging::LogLevel::Trace, component, __VA_ARGS__)
#define SIGKEEP_LOG_DEBUG(component, ...) SIGKEEP_LOG_AT(::sigkeep::logging::LogLevel::Debug, component, __VA_ARGS__)
#define SIGKEEP_LOG_INFO(component, ...) SIGKEEP_LOG_AT(::sigkeep::logging::LogLevel::Info, component, __VA_ARGS__)
#define SIGKEEP_LOG_WARN(component, ...) SIGKEEP_LOG_AT(::sigkeep::logging::LogLevel::Warn, component, __VA_ARGS__)
#define SIGKEEP_LOG_ERROR(component, ...) SIGKEEP_LOG_AT(::sigkeep::logging::LogLevel::Error, component, __VA_ARGS__)

#ifdef SIGKEEP_DEBUG_KEYS
#define SIGKEEP_LOG_KEY(component, key_name, data) \
    SIGKEEP_LOG_AT(::sigkeep::logging::LogLevel::Debug, component, "{}: {}", key_name, \
        ::sigkeep::logging::ToHex(data))
#else
#define SIGKEEP_LOG_KEY(component, key_name, data) ((void)0)
#endif
