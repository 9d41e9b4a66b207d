#pragma once

#include "sigkeep/configuration/key_lifecycle_config.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sigkeep::stores {

/**
 * @brief Inclusive run of consecutive pre-key ids.
 */
struct PreKeyIdRange {
    uint32_t first;
    uint32_t last;

    [[nodiscard]] size_t Size() const noexcept {
        return static_cast<size_t>(last - first) + 1;
    }
    bool operator==(const PreKeyIdRange&) const = default;
};

/**
 * @brief Pick ids for `needed` new pre-keys.
 *
 * While the highest live id is below policy.wrap_threshold, ids continue
 * contiguously after it (from 0 for an empty pool). Once it reaches the
 * threshold, the lowest ids not currently live are reused, on the
 * assumption that keys that old have long been consumed.
 *
 * @param existing_ids Live ids in any order
 * @return Ascending ids, at most `needed` of them, never overlapping existing_ids
 */
[[nodiscard]] std::vector<uint32_t> AllocatePreKeyIds(
    std::span<const uint32_t> existing_ids,
    size_t needed,
    const configuration::PreKeyPolicy& policy);

[[nodiscard]] bool IsWrapMode(std::span<const uint32_t> existing_ids,
                              const configuration::PreKeyPolicy& policy) noexcept;

/**
 * @brief Group ids into maximal runs of consecutive values, e.g. [1,2,3,7,8] -> [1-3],[7-8].
 */
[[nodiscard]] std::vector<PreKeyIdRange> GroupContiguousRuns(std::span<const uint32_t> ids);

} // namespace sigkeep::stores
