#pragma once

#include <umbra/overrides/override_store.hpp>

#include <string>
#include <unordered_set>
#include <vector>

namespace umbra::overrides {

/**
 * @brief Coalesces bursts of world-change triggers into one revalidation sweep.
 *
 * Repeated moves of the same entity collapse into a single entry. Any global
 * trigger (lighting or wall change) widens the next sweep to every pair.
 */
class RevalidationQueue {
public:
    void push(const RevalidationTrigger& trigger);

    // Runs one sweep over the affected pairs and empties the queue
    std::vector<InvalidOverride> drain(const OverrideStore& store, const ContextProbe& probe);

    void clear();

    bool empty() const noexcept { return !global_ && entities_.empty(); }

    // Distinct pending entities, plus one for a pending global sweep
    usize pending_count() const noexcept { return entities_.size() + (global_ ? 1 : 0); }

    // Triggers absorbed into an already pending entry since the last drain
    u64 coalesced_count() const noexcept { return coalesced_; }

private:
    std::unordered_set<std::string> entities_;
    bool global_ = false;
    TriggerCause global_cause_ = TriggerCause::Manual;
    u64 coalesced_ = 0;
};

} // namespace umbra::overrides
