#include <umbra/overrides/revalidation_queue.hpp>
#include <umbra/core/log.hpp>

namespace umbra::overrides {

void RevalidationQueue::push(const RevalidationTrigger& trigger) {
    if (trigger.is_global()) {
        if (global_) {
            ++coalesced_;
        }
        global_ = true;
        global_cause_ = trigger.cause;
        return;
    }

    if (global_ || !entities_.insert(trigger.entity_id).second) {
        ++coalesced_;
    }
}

std::vector<InvalidOverride> RevalidationQueue::drain(const OverrideStore& store, const ContextProbe& probe) {
    if (empty()) {
        return {};
    }

    std::vector<InvalidOverride> invalid;
    if (global_) {
        invalid = store.revalidate_all(RevalidationTrigger{global_cause_, {}}, probe);
    } else {
        invalid = store.revalidate_entities(entities_, probe);
    }

    LOG_DEBUG(Overrides, "Drained revalidation queue ({} pending, {} coalesced): {} invalid",
              pending_count(), coalesced_, invalid.size());
    clear();
    return invalid;
}

void RevalidationQueue::clear() {
    entities_.clear();
    global_ = false;
    global_cause_ = TriggerCause::Manual;
    coalesced_ = 0;
}

} // namespace umbra::overrides
