#include "sigkeep/configuration/key_lifecycle_config.hpp"

namespace sigkeep::configuration {

Result<Unit, KeyStoreFailure> KeyLifecycleConfig::Validate() const {
    using ValidationResult = Result<Unit, KeyStoreFailure>;
    if (pre_keys.target_count == 0) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("pre_keys.target_count must be positive"));
    }
    if (pre_keys.min_count > pre_keys.target_count) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("pre_keys.min_count exceeds pre_keys.target_count"));
    }
    if (pre_keys.wrap_threshold >= pre_keys.max_id) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("pre_keys.wrap_threshold must be below pre_keys.max_id"));
    }
    if (static_cast<uint64_t>(pre_keys.max_id) - pre_keys.wrap_threshold < pre_keys.target_count) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("pre_keys id headroom above wrap_threshold is smaller than one batch"));
    }
    if (signed_pre_keys.remote_retention == 0) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("signed_pre_keys.remote_retention must be positive"));
    }
    if (signed_pre_keys.local_retention < signed_pre_keys.remote_retention) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("signed_pre_keys.local_retention is below remote_retention"));
    }
    if (signed_pre_keys.rotation_interval.count() <= 0) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("signed_pre_keys.rotation_interval must be positive"));
    }
    if (publication.max_attempts == 0) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("publication.max_attempts must be positive"));
    }
    if (regeneration.lock_timeout.count() <= 0) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("regeneration.lock_timeout must be positive"));
    }
    if (healing.min_verification_interval.count() < 0 || healing.repair_backoff.count() < 0) {
        return ValidationResult::Err(
            KeyStoreFailure::InvalidInput("healing intervals must not be negative"));
    }
    return ValidationResult::Ok(unit);
}

} // namespace sigkeep::configuration
