#include "sigkeep/stores/pre_key_id_allocator.hpp"

#include <algorithm>
#include <unordered_set>

namespace sigkeep::stores {

bool IsWrapMode(const std::span<const uint32_t> existing_ids,
                const configuration::PreKeyPolicy& policy) noexcept {
    if (existing_ids.empty()) {
        return false;
    }
    return *std::max_element(existing_ids.begin(), existing_ids.end()) >= policy.wrap_threshold;
}

std::vector<uint32_t> AllocatePreKeyIds(
    const std::span<const uint32_t> existing_ids,
    const size_t needed,
    const configuration::PreKeyPolicy& policy) {
    std::vector<uint32_t> ids;
    if (needed == 0) {
        return ids;
    }
    ids.reserve(needed);

    if (!IsWrapMode(existing_ids, policy)) {
        const uint32_t start = existing_ids.empty()
            ? 0
            : *std::max_element(existing_ids.begin(), existing_ids.end()) + 1;
        for (uint32_t id = start; ids.size() < needed && id <= policy.max_id; ++id) {
            ids.push_back(id);
        }
        return ids;
    }

    const std::unordered_set<uint32_t> live(existing_ids.begin(), existing_ids.end());
    for (uint32_t id = 0; ids.size() < needed; ++id) {
        if (!live.contains(id)) {
            ids.push_back(id);
        }
        if (id == policy.max_id) {
            break;
        }
    }
    return ids;
}

std::vector<PreKeyIdRange> GroupContiguousRuns(const std::span<const uint32_t> ids) {
    std::vector<PreKeyIdRange> runs;
    if (ids.empty()) {
        return runs;
    }
    std::vector<uint32_t> sorted(ids.begin(), ids.end());
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    PreKeyIdRange current{sorted.front(), sorted.front()};
    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i] == current.last + 1) {
            current.last = sorted[i];
        } else {
            runs.push_back(current);
            current = PreKeyIdRange{sorted[i], sorted[i]};
        }
    }
    runs.push_back(current);
    return runs;
}

} // namespace sigkeep::stores
