#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace sigkeep::configuration {

/**
 * @brief One-time pre-key pool bounds and id space.
 *
 * The pool is refilled to target_count whenever fewer than min_count keys
 * remain. Ids are assigned by contiguous increment until the highest live
 * id reaches wrap_threshold; after that the lowest unused ids are reused.
 */
struct PreKeyPolicy {
    size_t min_count = 20;
    size_t target_count = 110;
    uint32_t max_id = 16'777'215;
    uint32_t wrap_threshold = 16'000'000;
};

/**
 * @brief Signed pre-key rotation and two-tier retention.
 *
 * **Retention**:
 * - local_retention: current key plus backups kept to decrypt messages
 *   encrypted against a recently rotated key
 * - remote_retention: current plus immediately previous, so bundles fetched
 *   moments before a rotation stay valid
 */
struct SignedPreKeyPolicy {
    std::chrono::milliseconds rotation_interval = std::chrono::hours(24 * 7);
    size_t local_retention = 3;
    size_t remote_retention = 2;
};

/**
 * @brief Server publication behaviour.
 *
 * Only the pre-key batch upload retries. A 202 response means the server
 * queued the write; the client waits accepted_settle_delay before treating
 * it as settled.
 */
struct PublicationPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds retry_delay = std::chrono::seconds(2);
    std::chrono::milliseconds accepted_settle_delay = std::chrono::seconds(2);
};

struct RegenerationPolicy {
    std::chrono::milliseconds lock_timeout = std::chrono::seconds(30);
};

/**
 * @brief Pacing of server self-verification.
 *
 * Verifications closer together than min_verification_interval are skipped
 * unless forced. An identity mismatch is repaired at most once per
 * repair_backoff.
 */
struct HealingPolicy {
    std::chrono::milliseconds min_verification_interval = std::chrono::minutes(5);
    std::chrono::milliseconds repair_backoff = std::chrono::minutes(10);
};

/**
 * @brief Complete configuration of a KeyManager.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = KeyLifecycleConfig::Default();
 * config.publication.retry_delay = std::chrono::milliseconds(500);
 * if (auto valid = config.Validate(); valid.IsErr()) {
 *     // reject
 * }
 * ```
 */
struct KeyLifecycleConfig {
    PreKeyPolicy pre_keys;
    SignedPreKeyPolicy signed_pre_keys;
    PublicationPolicy publication;
    RegenerationPolicy regeneration;
    HealingPolicy healing;
    // Keep per-group sender keys and wipe them during identity regeneration.
    bool enable_sender_keys = true;
    logging::LogLevel log_level = logging::LogLevel::Info;

    [[nodiscard]] static KeyLifecycleConfig Default() {
        return KeyLifecycleConfig{};
    }

    /**
     * @brief Check cross-field constraints.
     *
     * @return Ok, or Err(InvalidInput) naming the first violated constraint
     */
    [[nodiscard]] Result<Unit, KeyStoreFailure> Validate() const;
};

} // namespace sigkeep::configuration
