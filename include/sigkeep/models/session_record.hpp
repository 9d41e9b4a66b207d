#pragma once
#include <cstdint>
#include <span>
#include <vector>
namespace sigkeep::models {
/**
 * @brief Opaque serialized ratchet state for one peer device.
 *
 * An empty record means no session has been established yet.
 */
class SessionRecord {
public:
    SessionRecord() = default;
    explicit SessionRecord(std::vector<uint8_t> serialized)
        : serialized_(std::move(serialized)) {}

    [[nodiscard]] bool IsEmpty() const noexcept {
        return serialized_.empty();
    }
    [[nodiscard]] std::span<const uint8_t> Serialized() const noexcept {
        return serialized_;
    }
private:
    std::vector<uint8_t> serialized_;
};
}
