#pragma once
#include "sigkeep/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace sigkeep::models {
enum class CascadePhase : uint8_t {
    Idle,
    CleaningLocal,
    CleaningRemote,
    Uploading
};
enum class CleanupStep : uint8_t {
    LocalPreKeys,
    LocalSignedPreKeys,
    LocalSessions,
    LocalSenderKeys,
    ServerKeyMaterial,
    PublishIdentity
};
struct CleanupStepOutcome {
    CleanupStep step;
    bool succeeded = false;
    bool skipped = false;
    size_t removed = 0;
    std::string error;
};
struct CleanupReport {
    std::vector<CleanupStepOutcome> steps;
    std::optional<KeyStoreFailure> publication_error;

    [[nodiscard]] bool Published() const noexcept {
        return !publication_error.has_value();
    }
    [[nodiscard]] bool FullyCleaned() const noexcept {
        for (const auto& outcome : steps) {
            if (outcome.step != CleanupStep::PublishIdentity && !outcome.succeeded && !outcome.skipped) {
                return false;
            }
        }
        return true;
    }
    [[nodiscard]] const CleanupStepOutcome* Find(const CleanupStep step) const noexcept {
        for (const auto& outcome : steps) {
            if (outcome.step == step) {
                return &outcome;
            }
        }
        return nullptr;
    }
};
inline std::string_view ToString(const CascadePhase phase) noexcept {
    switch (phase) {
        case CascadePhase::Idle: return "idle";
        case CascadePhase::CleaningLocal: return "cleaning-local";
        case CascadePhase::CleaningRemote: return "cleaning-remote";
        case CascadePhase::Uploading: return "uploading";
    }
    return "unknown";
}
inline std::string_view ToString(const CleanupStep step) noexcept {
    switch (step) {
        case CleanupStep::LocalPreKeys: return "local pre-keys";
        case CleanupStep::LocalSignedPreKeys: return "local signed pre-keys";
        case CleanupStep::LocalSessions: return "local sessions";
        case CleanupStep::LocalSenderKeys: return "local sender keys";
        case CleanupStep::ServerKeyMaterial: return "server key material";
        case CleanupStep::PublishIdentity: return "identity publication";
    }
    return "unknown";
}
}
