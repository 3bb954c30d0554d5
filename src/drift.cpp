#include "lpm/drift.hpp"
#include "lpm/errors.hpp"

#include <cmath>
#include <string>

namespace lpm {

const char* to_string(DriftState state) {
    switch (state) {
        case DriftState::Disabled:   return "disabled";
        case DriftState::Centered:   return "centered";
        case DriftState::Drifting:   return "drifting";
        case DriftState::OutOfRange: return "out_of_range";
    }
    return "unknown";
}

const char* to_string(DriftDirection direction) {
    return direction == DriftDirection::Lower ? "lower" : "upper";
}

double drift_pct(int32_t tick, int32_t tick_lower, int32_t tick_upper) {
    if (tick_lower >= tick_upper) {
        throw InvalidRange("tick_lower " + std::to_string(tick_lower) +
                           " must be below tick_upper " + std::to_string(tick_upper));
    }
    const double center = (static_cast<double>(tick_lower) + tick_upper) / 2.0;
    const double half = (static_cast<double>(tick_upper) - tick_lower) / 2.0;
    return std::fabs(static_cast<double>(tick) - center) / half * 100.0;
}

DriftReport evaluate_drift(int32_t tick,
                           int32_t tick_lower,
                           int32_t tick_upper,
                           double threshold_pct,
                           bool monitoring_enabled) {
    if (!(threshold_pct > 0.0 && threshold_pct <= 100.0)) {
        throw ConfigError("drift threshold must be in (0, 100], got " + std::to_string(threshold_pct));
    }

    DriftReport report;
    report.drift_pct = drift_pct(tick, tick_lower, tick_upper);
    report.center_tick = (static_cast<double>(tick_lower) + tick_upper) / 2.0;
    report.half_width = (static_cast<double>(tick_upper) - tick_lower) / 2.0;
    report.direction = tick < report.center_tick ? DriftDirection::Lower : DriftDirection::Upper;
    report.in_range = tick >= tick_lower && tick < tick_upper;

    if (!monitoring_enabled) {
        report.state = DriftState::Disabled;
    } else if (!report.in_range) {
        report.state = DriftState::OutOfRange;
    } else if (report.drift_pct > threshold_pct) {
        report.state = DriftState::Drifting;
    } else {
        report.state = DriftState::Centered;
    }
    return report;
}

} // namespace lpm
