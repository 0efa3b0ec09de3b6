#include "keyferry/keyring/generation_merge.hpp"

namespace keyferry::onboarding::keyring {

MergePlan PlanGenerationMerge(
    const std::set<uint32_t>& local_ids,
    const std::optional<uint32_t> local_current,
    const std::span<const uint32_t> incoming_ids) {
    MergePlan plan;
    plan.next_current = local_current;
    std::set<uint32_t> seen;
    for (const uint32_t id : incoming_ids) {
        if (local_ids.contains(id) || !seen.insert(id).second) {
            continue;
        }
        plan.new_ids.push_back(id);
        if (!plan.next_current.has_value() || id > *plan.next_current) {
            plan.next_current = id;
        }
    }
    return plan;
}

}
