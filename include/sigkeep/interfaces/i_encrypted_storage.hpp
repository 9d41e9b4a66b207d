#pragma once
#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace sigkeep::interfaces {
/**
 * @brief Key/value store that encrypts values at rest.
 *
 * Values are grouped in named collections. Get reports a value that fails
 * to decrypt as KeyStoreFailure::StorageCorruption; a missing key is Ok(nullopt).
 * No transactions: every call stands alone.
 */
class IEncryptedStorage {
public:
    virtual ~IEncryptedStorage() = default;
    virtual Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> Get(
        std::string_view collection, std::string_view key) = 0;
    virtual Result<Unit, KeyStoreFailure> Put(
        std::string_view collection, std::string_view key, std::span<const uint8_t> value) = 0;
    virtual Result<Unit, KeyStoreFailure> Delete(
        std::string_view collection, std::string_view key) = 0;
    virtual Result<std::vector<std::string>, KeyStoreFailure> ListKeys(
        std::string_view collection) = 0;
};
}
