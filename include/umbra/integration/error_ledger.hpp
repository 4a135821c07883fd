#pragma once

#include <umbra/core/config.hpp>
#include <umbra/core/types.hpp>
#include <umbra/scene/providers.hpp>

#include <array>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace umbra::integration {

// Subsystems whose failures are tracked
enum class SystemTag : u8 {
    Visibility,
    Cover,
    PositionTracker,
    Overrides
};

inline constexpr usize SYSTEM_TAG_COUNT = 4;

enum class Severity : u8 {
    Low,
    Medium,
    High,
    Critical
};

enum class FallbackStrategy : u8 {
    BasicCalculation,     // visibility: lighting and distance only
    ManualOverride,       // cover: wall collision, then lingering manual values
    GracefulDegradation,  // tracker: snapshot with errors instead of aborting
    SkipFeature           // overrides: behave as if none were set
};

const char* to_string(SystemTag tag) noexcept;
const char* to_string(Severity severity) noexcept;
const char* to_string(FallbackStrategy strategy) noexcept;

// What the caller's fallback tier produced
struct FallbackReport {
    bool applied = false;
    std::string tier;   // e.g. "wall-collision-fallback"
    std::string data;   // resulting state name
};

struct ErrorContext {
    std::string observer_id;
    std::string target_id;
    std::string operation;
    core::ErrorCategory category = core::ErrorCategory::Other;
    Option<FallbackReport> fallback;
};

struct ErrorHandlingResult {
    std::string error_id;
    Severity severity = Severity::Low;
    FallbackStrategy strategy = FallbackStrategy::SkipFeature;
    bool fallback_applied = false;
    std::string fallback_data;
    bool notified = false;
};

struct ErrorRecord {
    std::string error_id;
    SystemTag tag = SystemTag::Visibility;
    std::string message;
    Severity severity = Severity::Low;
    ErrorContext context;
    i64 timestamp_ms = 0;
    u64 sequence = 0;
};

struct SystemStatus {
    bool available = true;
    bool fallback_active = false;
    std::string last_error;
    i64 last_check_ms = 0;
    u32 recovery_attempts = 0;
    u64 error_count = 0;
};

// Re-checks whether a subsystem works again
using AvailabilityProbe = std::function<bool()>;

/**
 * @brief Process-wide record of subsystem failures and recoveries.
 *
 * Every fallback use is recorded against a system tag, which marks the
 * system degraded until a recovery probe succeeds. The history is bounded
 * (oldest evicted first) and read most recent first. User notifications are
 * rate limited per session, separately for fallback and recovery messages;
 * errors beyond the cap are still recorded.
 */
class ErrorLedger {
public:
    ErrorLedger(core::NotificationConfig notifications,
                core::RecoveryConfig recovery,
                scene::INotificationSink* sink = nullptr);

    ErrorHandlingResult handle_system_error(SystemTag tag, const std::string& message,
                                            const ErrorContext& context = {});

    /**
     * @brief Re-probe a degraded system
     * @return true if the probe reports the system available again
     *
     * Attempts are capped per session; once the cap is reached this returns
     * false without probing until reset_session() is called.
     */
    bool attempt_system_recovery(SystemTag tag);

    void register_probe(SystemTag tag, AvailabilityProbe probe);

    // Records a critical failure and notifies regardless of the session cap
    void escalate(SystemTag tag, const std::string& message);

    std::map<SystemTag, SystemStatus> get_system_status() const;
    const SystemStatus& status(SystemTag tag) const;
    bool is_available(SystemTag tag) const { return status(tag).available; }

    // Most recent first, optionally restricted to one system
    std::vector<ErrorRecord> get_error_history(Option<SystemTag> tag = std::nullopt) const;

    // Resets notification counters and recovery attempts
    void reset_session();

    void configure_notifications(const core::NotificationConfig& notifications) { notifications_ = notifications; }
    void set_sink(scene::INotificationSink* sink) { sink_ = sink; }

    u32 notifications_sent() const noexcept { return fallback_notifications_; }
    u32 recovery_notifications_sent() const noexcept { return recovery_notifications_; }

private:
    Severity determine_severity(SystemTag tag, const std::string& message) const;
    static FallbackStrategy strategy_for(SystemTag tag) noexcept;

    void track(ErrorRecord record);
    void send(scene::NotificationLevel level, const std::string& message);

    SystemStatus& state(SystemTag tag) { return systems_[static_cast<usize>(tag)]; }

    core::NotificationConfig notifications_;
    core::RecoveryConfig recovery_;
    scene::INotificationSink* sink_;

    std::array<SystemStatus, SYSTEM_TAG_COUNT> systems_{};
    std::array<AvailabilityProbe, SYSTEM_TAG_COUNT> probes_{};
    std::deque<ErrorRecord> history_;

    u32 fallback_notifications_ = 0;
    u32 recovery_notifications_ = 0;
    u64 next_sequence_ = 1;
};

} // namespace umbra::integration
