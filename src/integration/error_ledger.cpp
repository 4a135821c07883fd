#include <umbra/integration/error_ledger.hpp>
#include <umbra/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

namespace umbra::integration {

const char* to_string(SystemTag tag) noexcept {
    switch (tag) {
        case SystemTag::Visibility: return "visibility";
        case SystemTag::Cover: return "cover";
        case SystemTag::PositionTracker: return "position-tracker";
        case SystemTag::Overrides: return "overrides";
    }
    return "visibility";
}

const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

const char* to_string(FallbackStrategy strategy) noexcept {
    switch (strategy) {
        case FallbackStrategy::BasicCalculation: return "basic-calculation";
        case FallbackStrategy::ManualOverride: return "manual-override";
        case FallbackStrategy::GracefulDegradation: return "graceful-degradation";
        case FallbackStrategy::SkipFeature: return "skip-feature";
    }
    return "skip-feature";
}

namespace {

    i64 now_ms() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

} // namespace

ErrorLedger::ErrorLedger(core::NotificationConfig notifications,
                         core::RecoveryConfig recovery,
                         scene::INotificationSink* sink)
    : notifications_(notifications)
    , recovery_(recovery)
    , sink_(sink) {
}

ErrorHandlingResult ErrorLedger::handle_system_error(SystemTag tag, const std::string& message,
                                                     const ErrorContext& context) {
    ErrorHandlingResult result;
    result.severity = determine_severity(tag, message);
    result.strategy = strategy_for(tag);

    const u64 sequence = next_sequence_++;
    const i64 timestamp = now_ms();
    result.error_id = std::format("{}-{}-{}", to_string(tag), timestamp, sequence);

    switch (result.severity) {
        case Severity::Critical:
        case Severity::High:
            LOG_ERROR(Recovery, "{} system error ({}): {}", to_string(tag), to_string(result.severity), message);
            break;
        default:
            LOG_WARNING(Recovery, "{} system error ({}): {}", to_string(tag), to_string(result.severity), message);
            break;
    }

    SystemStatus& system = state(tag);
    system.available = false;
    system.fallback_active = true;
    system.last_error = message;
    system.last_check_ms = timestamp;
    ++system.error_count;

    if (context.fallback) {
        result.fallback_applied = context.fallback->applied;
        result.fallback_data = context.fallback->data;
    }

    track(ErrorRecord{result.error_id, tag, message, result.severity, context, timestamp, sequence});

    if (notifications_.show_fallback && result.severity != Severity::Low &&
        fallback_notifications_ < notifications_.max_notifications_per_session) {
        if (result.fallback_applied) {
            const std::string tier = context.fallback->tier.empty() ? to_string(result.strategy)
                                                                    : context.fallback->tier;
            send(scene::NotificationLevel::Info,
                 std::format("{} system temporarily unavailable. Using fallback: {}", to_string(tag), tier));
        } else {
            send(scene::NotificationLevel::Error,
                 std::format("{} system failed and fallback unsuccessful. Some features may not work correctly.",
                             to_string(tag)));
        }
        ++fallback_notifications_;
        result.notified = true;
    }

    return result;
}

bool ErrorLedger::attempt_system_recovery(SystemTag tag) {
    SystemStatus& system = state(tag);
    if (system.recovery_attempts >= recovery_.max_recovery_attempts) {
        LOG_WARNING(Recovery, "Maximum recovery attempts reached for {} system", to_string(tag));
        return false;
    }
    ++system.recovery_attempts;

    const AvailabilityProbe& probe = probes_[static_cast<usize>(tag)];
    if (!probe) {
        LOG_WARNING(Recovery, "No recovery probe registered for {} system", to_string(tag));
        return false;
    }

    LOG_INFO(Recovery, "Attempting recovery for {} system (attempt {}/{})", to_string(tag),
             system.recovery_attempts, recovery_.max_recovery_attempts);

    bool recovered = false;
    try {
        recovered = probe();
    } catch (const std::exception& e) {
        LOG_ERROR(Recovery, "Recovery probe for {} system threw: {}", to_string(tag), e.what());
        recovered = false;
    }

    system.last_check_ms = now_ms();
    if (!recovered) {
        LOG_WARNING(Recovery, "Failed to recover {} system", to_string(tag));
        return false;
    }

    const bool was_degraded = !system.available;
    system.available = true;
    system.fallback_active = false;
    system.recovery_attempts = 0;
    LOG_INFO(Recovery, "Recovered {} system", to_string(tag));

    if (was_degraded && notifications_.show_recovery &&
        recovery_notifications_ < notifications_.max_recovery_notifications) {
        send(scene::NotificationLevel::Info, std::format("{} system recovered", to_string(tag)));
        ++recovery_notifications_;
    }
    return true;
}

void ErrorLedger::register_probe(SystemTag tag, AvailabilityProbe probe) {
    probes_[static_cast<usize>(tag)] = std::move(probe);
}

void ErrorLedger::escalate(SystemTag tag, const std::string& message) {
    const u64 sequence = next_sequence_++;
    const i64 timestamp = now_ms();

    SystemStatus& system = state(tag);
    system.available = false;
    system.fallback_active = true;
    system.last_error = message;
    system.last_check_ms = timestamp;
    ++system.error_count;

    LOG_CRITICAL(Recovery, "{} system escalated: {}", to_string(tag), message);

    ErrorContext context;
    context.operation = "escalation";
    track(ErrorRecord{std::format("{}-{}-{}", to_string(tag), timestamp, sequence), tag, message,
                      Severity::Critical, context, timestamp, sequence});

    send(scene::NotificationLevel::Error, std::format("{} system disabled: {}", to_string(tag), message));
}

std::map<SystemTag, SystemStatus> ErrorLedger::get_system_status() const {
    std::map<SystemTag, SystemStatus> result;
    for (usize i = 0; i < SYSTEM_TAG_COUNT; ++i) {
        result.emplace(static_cast<SystemTag>(i), systems_[i]);
    }
    return result;
}

const SystemStatus& ErrorLedger::status(SystemTag tag) const {
    return systems_[static_cast<usize>(tag)];
}

std::vector<ErrorRecord> ErrorLedger::get_error_history(Option<SystemTag> tag) const {
    std::vector<ErrorRecord> result;
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (!tag || it->tag == *tag) {
            result.push_back(*it);
        }
    }
    return result;
}

void ErrorLedger::reset_session() {
    fallback_notifications_ = 0;
    recovery_notifications_ = 0;
    for (auto& system : systems_) {
        system.recovery_attempts = 0;
    }
    LOG_DEBUG(Recovery, "Error ledger session reset");
}

Severity ErrorLedger::determine_severity(SystemTag tag, const std::string& message) const {
    const SystemStatus& system = status(tag);
    if (!system.available && system.recovery_attempts >= recovery_.max_recovery_attempts) {
        return Severity::Critical;
    }

    const std::string text = lowercase(message);
    if (text.find("unavailable") != std::string::npos || text.find("not found") != std::string::npos) {
        return Severity::High;
    }
    if (text.find("calculation") != std::string::npos || text.find("detection") != std::string::npos) {
        return Severity::Medium;
    }
    return Severity::Low;
}

FallbackStrategy ErrorLedger::strategy_for(SystemTag tag) noexcept {
    switch (tag) {
        case SystemTag::Visibility: return FallbackStrategy::BasicCalculation;
        case SystemTag::Cover: return FallbackStrategy::ManualOverride;
        case SystemTag::PositionTracker: return FallbackStrategy::GracefulDegradation;
        case SystemTag::Overrides: return FallbackStrategy::SkipFeature;
    }
    return FallbackStrategy::SkipFeature;
}

void ErrorLedger::track(ErrorRecord record) {
    history_.push_back(std::move(record));
    while (history_.size() > recovery_.history_capacity) {
        history_.pop_front();
    }
}

void ErrorLedger::send(scene::NotificationLevel level, const std::string& message) {
    if (!sink_) {
        return;
    }
    try {
        sink_->notify(level, message);
    } catch (const std::exception& e) {
        LOG_WARNING(Recovery, "Notification sink failed: {}", e.what());
    }
}

} // namespace umbra::integration
