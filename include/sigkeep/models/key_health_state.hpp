#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace sigkeep::models {
enum class KeyHealthStatus : uint8_t {
    Unknown,
    Healthy,
    Low,
    Excess,
    Generating,
    Error
};
/**
 * @brief In-memory summary of one store, never persisted.
 */
struct KeyHealthState {
    using TimePoint = std::chrono::system_clock::time_point;

    KeyHealthStatus status = KeyHealthStatus::Unknown;
    size_t key_count = 0;
    // Generation, rotation or regeneration currently running.
    bool in_progress = false;
    std::optional<std::string> last_error;
    std::optional<TimePoint> last_check;
    std::optional<TimePoint> last_generation;
};
inline std::string_view ToString(const KeyHealthStatus status) noexcept {
    switch (status) {
        case KeyHealthStatus::Unknown: return "unknown";
        case KeyHealthStatus::Healthy: return "healthy";
        case KeyHealthStatus::Low: return "low";
        case KeyHealthStatus::Excess: return "excess";
        case KeyHealthStatus::Generating: return "generating";
        case KeyHealthStatus::Error: return "error";
    }
    return "unknown";
}
}
