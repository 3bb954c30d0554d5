#ifndef LPM_DRIFT_HPP
#define LPM_DRIFT_HPP

#include <cstdint>

namespace lpm {

// =============================================================================
// Drift Classification
// =============================================================================

enum class DriftState : uint8_t {
    Disabled,     // Monitoring turned off, no action
    Centered,     // In range, drift <= threshold
    Drifting,     // In range, drift > threshold: preemptive rebalance
    OutOfRange,   // tick < lower or tick >= upper: immediate rebalance
};

enum class DriftDirection : uint8_t {
    Lower,
    Upper,
};

const char* to_string(DriftState state);
const char* to_string(DriftDirection direction);

constexpr double DEFAULT_DRIFT_THRESHOLD_PCT = 75.0;

struct DriftReport {
    double drift_pct = 0.0;          // 0 = centered, 100 = at an edge, >100 = outside
    DriftDirection direction = DriftDirection::Upper;
    double center_tick = 0.0;
    double half_width = 0.0;         // In ticks
    bool in_range = true;
    DriftState state = DriftState::Centered;

    bool needs_rebalance() const {
        return state == DriftState::Drifting || state == DriftState::OutOfRange;
    }
};

// |tick - center| / half_width * 100. Throws InvalidRange if lower >= upper.
double drift_pct(int32_t tick, int32_t tick_lower, int32_t tick_upper);

// Classify a position from a live snapshot; always computed against the
// position's existing range. Throws ConfigError for a threshold outside (0, 100].
DriftReport evaluate_drift(int32_t tick,
                           int32_t tick_lower,
                           int32_t tick_upper,
                           double threshold_pct = DEFAULT_DRIFT_THRESHOLD_PCT,
                           bool monitoring_enabled = true);

} // namespace lpm

#endif // LPM_DRIFT_HPP
