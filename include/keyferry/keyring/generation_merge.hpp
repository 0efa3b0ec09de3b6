#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <vector>
namespace keyferry::onboarding::keyring {

struct MergePlan {
    /// Incoming ids not present locally, first occurrence order
    std::vector<uint32_t> new_ids;
    std::optional<uint32_t> next_current;
};

/**
 * @brief Decide which incoming generations to merge and where current lands
 *
 * Pure bookkeeping, no key material involved. Ids already present
 * locally and ids repeated within @p incoming_ids are skipped; the caller
 * has already rejected any of them whose key differs. The
 * current generation only moves forward: it becomes the largest merged
 * id when that exceeds @p local_current, and stays put otherwise.
 */
[[nodiscard]] MergePlan PlanGenerationMerge(
    const std::set<uint32_t>& local_ids,
    std::optional<uint32_t> local_current,
    std::span<const uint32_t> incoming_ids);
}
