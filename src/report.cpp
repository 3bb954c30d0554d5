#include "lpm/report.hpp"

#include <utility>

namespace lpm {

using json = nlohmann::json;

const char* to_string(RunPath path) {
    switch (path) {
        case RunPath::NoOp:      return "noop";
        case RunPath::Compound:  return "compound";
        case RunPath::Rebalance: return "rebalance";
        case RunPath::Recover:   return "recover";
        case RunPath::Close:     return "close";
    }
    return "unknown";
}

const char* to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Planned:   return "planned";
        case StepStatus::Succeeded: return "succeeded";
        case StepStatus::Failed:    return "failed";
        case StepStatus::Degraded:  return "degraded";
        case StepStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::NoOp:     return "noop";
        case Outcome::Success:  return "success";
        case Outcome::Degraded: return "degraded";
        case Outcome::Failed:   return "failed";
        case Outcome::DryRun:   return "dry_run";
    }
    return "unknown";
}

StepRecord& RunReport::add_step(std::string name, StepStatus status,
                                std::string tx_hash, std::string detail) {
    steps.push_back({std::move(name), status, std::move(tx_hash), std::move(detail)});
    return steps.back();
}

std::vector<std::string> RunReport::completed_steps() const {
    std::vector<std::string> out;
    for (const auto& s : steps) {
        if (s.status == StepStatus::Succeeded) out.push_back(s.name);
    }
    return out;
}

const StepRecord* RunReport::find_step(const std::string& name) const {
    for (const auto& s : steps) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

namespace {

json amounts_json(const TokenAmounts& a) {
    return {{"amount0", to_string(a.amount0)}, {"amount1", to_string(a.amount1)}};
}

json range_json(const TickRange& r) {
    return {{"tick_lower", r.lower}, {"tick_upper", r.upper}};
}

} // namespace

json to_json(const RunReport& r) {
    json j;
    j["operation"] = r.operation;
    j["path"] = to_string(r.path);
    j["outcome"] = to_string(r.outcome);

    json pre = json::object();
    if (r.position_id) pre["position_id"] = to_string(*r.position_id);
    if (r.pool) {
        pre["pool"] = {
            {"sqrt_price_x96", to_string(r.pool->sqrt_price_x96)},
            {"tick", r.pool->tick},
            {"tick_spacing", r.pool->tick_spacing},
        };
    }
    if (r.position) {
        pre["position"] = {
            {"tick_lower", r.position->tick_lower},
            {"tick_upper", r.position->tick_upper},
            {"liquidity", to_string(r.position->liquidity)},
            {"owner", hex::encode(r.position->owner)},
        };
    }
    if (r.wallet) pre["wallet"] = amounts_json(*r.wallet);
    j["pre_state"] = pre;

    if (r.drift) {
        j["drift"] = {
            {"drift_pct", r.drift->drift_pct},
            {"direction", to_string(r.drift->direction)},
            {"state", to_string(r.drift->state)},
            {"in_range", r.drift->in_range},
        };
    }

    if (r.encoding) {
        j["encoding"] = to_string(*r.encoding);
        j["encoding_reason"] = r.encoding_reason;
    }

    if (r.plan) {
        const auto& p = *r.plan;
        j["plan"] = {
            {"new_range", range_json(p.new_range)},
            {"planned_tick", p.planned_tick},
            {"expected_withdrawal", amounts_json(p.expected_withdrawal)},
            {"holdings", amounts_json(p.holdings)},
            {"target_ratio0", p.target_ratio0},
            {"value0_usd", p.value0_usd},
            {"value1_usd", p.value1_usd},
            {"swap", {
                {"direction", to_string(p.swap.direction)},
                {"amount_in", to_string(p.swap.amount_in)},
                {"expected_out", to_string(p.swap.expected_out)},
                {"min_amount_out", to_string(p.swap.min_amount_out)},
                {"imbalance_usd", p.swap.imbalance_usd},
            }},
            {"new_liquidity", to_string(p.new_liquidity)},
            {"mint_max", amounts_json(p.mint_max)},
        };
    }

    json steps = json::array();
    for (const auto& s : r.steps) {
        json step = {{"name", s.name}, {"status", to_string(s.status)}};
        if (!s.tx_hash.empty()) step["tx_hash"] = s.tx_hash;
        if (!s.detail.empty()) step["detail"] = s.detail;
        steps.push_back(step);
    }
    j["steps"] = steps;

    if (r.new_position_id) j["new_position_id"] = to_string(*r.new_position_id);
    if (r.new_range) j["new_range"] = range_json(*r.new_range);
    if (r.new_liquidity > 0) j["new_liquidity"] = to_string(r.new_liquidity);

    if (r.outcome == Outcome::Failed) {
        j["error"] = r.error;
        if (r.error_code) j["error_code"] = error_code_name(*r.error_code);
        j["last_known_good"] = r.completed_steps();
    }
    return j;
}

} // namespace lpm
