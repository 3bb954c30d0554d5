#ifndef LPM_REPORT_HPP
#define LPM_REPORT_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "action_set.hpp"
#include "drift.hpp"
#include "errors.hpp"
#include "planner.hpp"
#include "pool.hpp"

namespace lpm {

// =============================================================================
// Run Report
// =============================================================================

enum class RunPath : uint8_t {
    NoOp,
    Compound,
    Rebalance,
    Recover,
    Close,
};

enum class StepStatus : uint8_t {
    Planned,     // Dry run: computed, not submitted
    Succeeded,
    Failed,
    Degraded,    // Failed but the sequence continued
    Skipped,
};

enum class Outcome : uint8_t {
    NoOp,
    Success,
    Degraded,
    Failed,
    DryRun,
};

const char* to_string(RunPath path);
const char* to_string(StepStatus status);
const char* to_string(Outcome outcome);

struct StepRecord {
    std::string name;
    StepStatus status = StepStatus::Planned;
    std::string tx_hash;
    std::string detail;
};

struct RunReport {
    std::string operation;                  // check, run, compound, recover, close

    // Pre-state
    std::optional<U256> position_id;
    std::optional<Position> position;
    std::optional<PoolState> pool;
    std::optional<TokenAmounts> wallet;
    std::optional<DriftReport> drift;

    RunPath path = RunPath::NoOp;
    std::optional<Encoding> encoding;
    std::string encoding_reason;
    std::optional<RebalancePlan> plan;
    std::vector<StepRecord> steps;

    // Result
    std::optional<U256> new_position_id;
    std::optional<TickRange> new_range;
    U128 new_liquidity = 0;
    Outcome outcome = Outcome::NoOp;
    std::optional<ErrorCode> error_code;
    std::string error;

    StepRecord& add_step(std::string name, StepStatus status,
                         std::string tx_hash = {}, std::string detail = {});

    // Last-known-good: steps that landed on chain
    [[nodiscard]] std::vector<std::string> completed_steps() const;

    [[nodiscard]] const StepRecord* find_step(const std::string& name) const;
};

nlohmann::json to_json(const RunReport& report);

} // namespace lpm

#endif // LPM_REPORT_HPP
