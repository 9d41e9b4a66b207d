#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigkeep::stores::detail {

template<typename Message>
Result<std::vector<uint8_t>, KeyStoreFailure> SerializeRecord(const Message& message, std::string_view what) {
    std::vector<uint8_t> bytes(message.ByteSizeLong());
    if (!bytes.empty() && !message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::Encode("Failed to serialize " + std::string(what)));
    }
    return Result<std::vector<uint8_t>, KeyStoreFailure>::Ok(std::move(bytes));
}

template<typename Message>
Result<Message, KeyStoreFailure> ParseRecord(std::span<const uint8_t> bytes, std::string_view what) {
    Message message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<Message, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption(std::string(what) + " does not parse"));
    }
    return Result<Message, KeyStoreFailure>::Ok(std::move(message));
}

inline std::optional<uint32_t> ParseDecimal(std::string_view text) {
    if (text.empty() || text.size() > 10) {
        return std::nullopt;
    }
    uint32_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief "prefix123" -> 123; nullopt when the key has another shape.
 */
inline std::optional<uint32_t> ParseIdSuffix(std::string_view key, std::string_view prefix) {
    if (!key.starts_with(prefix)) {
        return std::nullopt;
    }
    return ParseDecimal(key.substr(prefix.size()));
}

inline std::string PeerDeviceKey(std::string_view prefix, std::string_view peer, uint32_t device_id) {
    std::string key;
    key.reserve(prefix.size() + peer.size() + 11);
    key.append(prefix).append(peer).append("_").append(std::to_string(device_id));
    return key;
}

} // namespace sigkeep::stores::detail
