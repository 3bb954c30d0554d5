// LPM - Position Keeper Tests

#include <catch2/catch_test_macros.hpp>
#include <lpm/errors.hpp>
#include <lpm/keeper.hpp>
#include <lpm/price_source.hpp>
#include <lpm/report.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include "fake_chain.hpp"

using namespace lpm;
using lpm::testing::FakeChain;
using lpm::testing::test_harvest;
using lpm::testing::test_pool_key;
using lpm::testing::test_wallet;
using std::chrono::milliseconds;

namespace {

constexpr U128 ONE = static_cast<U128>(1000000000000000000ULL);

// Quotes token0 at the pool's own price, token1 at $1
class PoolPriceSource : public PriceSource {
public:
    explicit PoolPriceSource(const FakeChain& chain) : chain_(chain) {}

    double usd_price(const Currency& currency) override {
        if (currency == test_pool_key().currency1) return 1.0;
        return std::pow(1.0001, chain_.pool.tick);
    }

private:
    const FakeChain& chain_;
};

struct Harness {
    FakeChain chain;
    PoolPriceSource prices{chain};
    Config cfg = lpm::testing::test_config();
    std::vector<milliseconds> backoff;

    PositionKeeper keeper() {
        RetryPolicy retry(BackoffPolicy{}, [this](milliseconds d) { backoff.push_back(d); });
        return PositionKeeper(cfg, chain, prices, std::move(retry),
                              [](milliseconds) {}, [] { return uint64_t{1700000000}; });
    }

    // Drifting position: [-600, 600) with the pool at tick 500
    U256 drifted_position() {
        U256 id = chain.add_position(-600, 600, 1000 * ONE, test_wallet());
        chain.set_tick(500);
        return id;
    }

    size_t index_of(const std::string& call, size_t from = 0) const {
        auto it = std::find(chain.calls.begin() + static_cast<std::ptrdiff_t>(from), chain.calls.end(), call);
        return static_cast<size_t>(it - chain.calls.begin());
    }

    bool called(const std::string& call) const { return index_of(call) < chain.calls.size(); }

    bool submitted_anything() const {
        return std::any_of(chain.calls.begin(), chain.calls.end(),
                           [](const std::string& c) { return c.rfind("submit:", 0) == 0; });
    }
};

StepStatus status_of(const RunReport& r, const std::string& step) {
    const StepRecord* s = r.find_step(step);
    REQUIRE(s != nullptr);
    return s->status;
}

} // namespace

TEST_CASE("Check reports drift without acting", "[keeper]") {
    Harness h;
    U256 id = h.chain.add_position(-600, 600, 1000 * ONE, test_wallet());

    SECTION("Centered") {
        RunReport r = h.keeper().check(id);
        REQUIRE(r.outcome == Outcome::NoOp);
        REQUIRE(r.path == RunPath::NoOp);
        REQUIRE(r.drift->state == DriftState::Centered);
        REQUIRE(r.position->liquidity == 1000 * ONE);
    }

    SECTION("Drifting names the path it would take") {
        h.chain.set_tick(500);
        RunReport r = h.keeper().check(id);
        REQUIRE(r.outcome == Outcome::NoOp);
        REQUIRE(r.path == RunPath::Rebalance);
        REQUIRE(r.drift->state == DriftState::Drifting);
        REQUIRE_FALSE(h.submitted_anything());
    }

    SECTION("Unknown position") {
        RunReport r = h.keeper().check(U256(5));
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::Chain);
    }
}

TEST_CASE("Run leaves healthy positions alone", "[keeper]") {
    Harness h;
    U256 id = h.chain.add_position(-600, 600, 1000 * ONE, test_wallet());

    SECTION("Centered") {
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::NoOp);
        REQUIRE(r.steps.empty());
        REQUIRE_FALSE(h.submitted_anything());
    }

    SECTION("Monitoring disabled") {
        h.cfg.strategy.monitoring_enabled = false;
        h.chain.set_tick(700);
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::NoOp);
        REQUIRE(r.drift->state == DriftState::Disabled);
        REQUIRE_FALSE(h.submitted_anything());
    }
}

TEST_CASE("Sequential rebalance", "[keeper]") {
    Harness h;
    U256 id = h.drifted_position();

    SECTION("Withdraw, swap and mint with fresh balances between steps") {
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.path == RunPath::Rebalance);
        REQUIRE(*r.encoding == Encoding::Sequential);
        REQUIRE(r.plan->swap.required());
        REQUIRE(r.completed_steps() == std::vector<std::string>{"withdraw", "swap", "mint"});

        const size_t withdraw = h.index_of("submit:withdraw");
        const size_t swap = h.index_of("submit:swap");
        const size_t mint = h.index_of("submit:mint");
        REQUIRE(withdraw < swap);
        REQUIRE(swap < mint);
        REQUIRE(h.index_of("read_balances", withdraw) < swap);
        REQUIRE(h.index_of("read_balances", swap) < mint);

        REQUIRE(h.chain.positions.at(id).liquidity == 0);
        REQUIRE(r.new_position_id.has_value());
        const Position& minted = h.chain.positions.at(*r.new_position_id);
        REQUIRE(minted.owner == test_wallet());
        REQUIRE(minted.liquidity == r.new_liquidity);
        REQUIRE(r.new_range->contains(500));
    }

    SECTION("Every step carries its transaction reference") {
        RunReport r = h.keeper().run(id);
        for (const auto& step : r.steps) {
            REQUIRE_FALSE(step.tx_hash.empty());
        }
        nlohmann::json j = to_json(r);
        REQUIRE(j["outcome"] == "success");
        REQUIRE(j["encoding"] == "sequential");
        REQUIRE(j["steps"].size() == 3);
        REQUIRE(j["new_position_id"] == to_string(*r.new_position_id));
        REQUIRE_FALSE(j.contains("error"));
    }

    SECTION("Tick moving after the withdrawal re-derives the range") {
        bool moved = false;
        h.chain.on_read = [&](const std::string& what) {
            if (!moved && what == "read_balances" && h.chain.positions.at(id).liquidity == 0) {
                h.chain.set_tick(2700);
                moved = true;
            }
        };
        RunReport r = h.keeper().run(id);
        REQUIRE(moved);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.plan->new_range.lower == -1560);
        REQUIRE(r.new_range->lower == 660);
        REQUIRE(r.new_range->upper == 4740);
    }

    SECTION("Reverted swap degrades to an unbalanced mint") {
        h.chain.revert_labels = {"swap"};
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Degraded);
        REQUIRE(status_of(r, "swap") == StepStatus::Degraded);
        REQUIRE(status_of(r, "mint") == StepStatus::Succeeded);
        REQUIRE(r.new_position_id.has_value());
        REQUIRE(r.new_liquidity > 0);
    }

    SECTION("Rejected swap degrades the same way") {
        h.chain.reject_labels = {"swap"};
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Degraded);
        REQUIRE(status_of(r, "swap") == StepStatus::Degraded);
    }

    SECTION("Reverted withdrawal stops the sequence") {
        h.chain.revert_labels = {"withdraw"};
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::Revert);
        REQUIRE(status_of(r, "withdraw") == StepStatus::Failed);
        REQUIRE_FALSE(h.called("submit:swap"));
        REQUIRE_FALSE(h.called("submit:mint"));
        REQUIRE(h.chain.positions.at(id).liquidity == 1000 * ONE);

        nlohmann::json j = to_json(r);
        REQUIRE(j["error_code"] == "revert");
        REQUIRE(j["last_known_good"].empty());
    }

    SECTION("Reverted mint reports how far the run got") {
        h.chain.revert_labels = {"mint"};
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(r.completed_steps() == std::vector<std::string>{"withdraw", "swap"});

        nlohmann::json j = to_json(r);
        REQUIRE(j["last_known_good"] == nlohmann::json::array({"withdraw", "swap"}));
        REQUIRE_FALSE(j.contains("new_position_id"));
    }

    SECTION("Missing mint log is fatal") {
        h.chain.omit_mint_logs = true;
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::PositionIdNotFound);
        REQUIRE(status_of(r, "mint") == StepStatus::Succeeded);
    }
}

TEST_CASE("Atomic rebalance", "[keeper]") {
    Harness h;
    U256 id = h.drifted_position();
    h.cfg.strategy.materiality_usd = 1e12;   // No swap
    h.chain.balances = {ONE, ONE};            // Covers the worst-case shortfall

    SECTION("Validated, then one transaction") {
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(*r.encoding == Encoding::Atomic);
        REQUIRE(r.completed_steps() == std::vector<std::string>{"validate", "rebalance"});
        REQUIRE(h.index_of("dry_run:rebalance") < h.index_of("submit:rebalance"));
        REQUIRE_FALSE(h.called("submit:withdraw"));

        REQUIRE(h.chain.positions.at(id).liquidity == 0);
        REQUIRE(h.chain.positions.at(*r.new_position_id).liquidity == r.new_liquidity);
        REQUIRE(r.new_liquidity == r.plan->new_liquidity);
    }

    SECTION("Failed simulation aborts without falling back") {
        h.chain.dry_run_failures = {"rebalance"};
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(status_of(r, "validate") == StepStatus::Failed);
        REQUIRE_FALSE(h.submitted_anything());
        REQUIRE(h.chain.positions.at(id).liquidity == 1000 * ONE);
    }

    SECTION("No simulation capability submits directly") {
        h.chain.caps.dry_run = false;
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.find_step("validate") == nullptr);
    }

    SECTION("Thin buffer falls back to the sequential path") {
        h.chain.balances = {};
        RunReport r = h.keeper().run(id);
        REQUIRE(*r.encoding == Encoding::Sequential);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(status_of(r, "swap") == StepStatus::Skipped);
        REQUIRE(status_of(r, "mint") == StepStatus::Succeeded);
    }

    SECTION("Disabled by configuration") {
        h.cfg.enable_atomic(false);
        RunReport r = h.keeper().run(id);
        REQUIRE(*r.encoding == Encoding::Sequential);
    }

    SECTION("Protocol without multi-action support") {
        h.chain.caps.multi_action = false;
        RunReport r = h.keeper().run(id);
        REQUIRE(*r.encoding == Encoding::Sequential);
        REQUIRE_FALSE(h.called("dry_run:rebalance"));
    }

    SECTION("Sweep leaves the pre-run wallet in place") {
        h.cfg.set_harvest_address(hex::encode(test_harvest()));
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(*r.encoding == Encoding::Atomic);
        REQUIRE(status_of(r, "sweep_BBB") == StepStatus::Succeeded);
        REQUIRE(h.chain.balances == TokenAmounts{ONE, ONE});
        REQUIRE(h.chain.transferred.at(test_pool_key().currency1.addr) > 0);
    }
}

TEST_CASE("Dry run computes without submitting", "[keeper]") {
    Harness h;
    U256 id = h.drifted_position();
    h.cfg.enable_dry_run();

    SECTION("Sequential plan") {
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::DryRun);
        REQUIRE(status_of(r, "withdraw") == StepStatus::Planned);
        REQUIRE(status_of(r, "swap") == StepStatus::Planned);
        REQUIRE(status_of(r, "mint") == StepStatus::Planned);
        REQUIRE_FALSE(h.submitted_anything());
        REQUIRE(h.chain.positions.at(id).liquidity == 1000 * ONE);
    }

    SECTION("Atomic plan is simulated") {
        h.cfg.strategy.materiality_usd = 1e12;
        h.chain.balances = {ONE, ONE};
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::DryRun);
        REQUIRE(*r.encoding == Encoding::Atomic);
        REQUIRE(status_of(r, "rebalance") == StepStatus::Planned);
        REQUIRE(h.called("dry_run:rebalance"));
        REQUIRE_FALSE(h.submitted_anything());
    }
}

TEST_CASE("Refusals before any transaction", "[keeper]") {
    Harness h;

    SECTION("Position owned by someone else") {
        U256 id = h.chain.add_position(-600, 600, 1000 * ONE, test_harvest());
        h.chain.set_tick(500);
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::Unauthorized);
        REQUIRE_FALSE(h.submitted_anything());
    }

    SECTION("Empty position") {
        U256 id = h.chain.add_position(-600, 600, 0, test_wallet());
        h.chain.set_tick(700);
        RunReport r = h.keeper().run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::InvalidInput);
        REQUIRE_FALSE(h.submitted_anything());
    }

    SECTION("No price data") {
        U256 id = h.drifted_position();
        StaticPriceSource empty;
        PositionKeeper keeper(h.cfg, h.chain, empty, RetryPolicy(BackoffPolicy{}, [](milliseconds) {}));
        RunReport r = keeper.run(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::NoPriceData);
        REQUIRE_FALSE(h.submitted_anything());
    }
}

TEST_CASE("Rate-limited reads are retried", "[keeper]") {
    Harness h;
    U256 id = h.chain.add_position(-600, 600, 1000 * ONE, test_wallet());

    SECTION("Recovered within the attempt budget") {
        h.chain.transient_reads = 2;
        RunReport r = h.keeper().check(id);
        REQUIRE(r.outcome == Outcome::NoOp);
        REQUIRE(h.backoff == std::vector<milliseconds>{milliseconds(2000), milliseconds(4000)});
    }

    SECTION("Gives up after the last attempt") {
        h.chain.transient_reads = 100;
        RunReport r = h.keeper().check(id);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::Transient);
        REQUIRE(h.backoff.size() == 3);
    }
}

TEST_CASE("Compound collected fees", "[keeper]") {
    Harness h;
    U256 id = h.chain.add_position(-600, 600, 1000 * ONE, test_wallet());

    SECTION("Fees go back into the same position") {
        h.chain.add_fees(id, {ONE, ONE});
        RunReport r = h.keeper().compound(id);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.path == RunPath::Compound);
        REQUIRE(r.completed_steps() == std::vector<std::string>{"collect", "increase"});
        REQUIRE(r.new_liquidity > 1000 * ONE);
        REQUIRE(h.chain.positions.at(id).liquidity == r.new_liquidity);
        REQUIRE(h.chain.positions.size() == 1);
    }

    SECTION("Nothing collected") {
        RunReport r = h.keeper().compound(id);
        REQUIRE(r.outcome == Outcome::NoOp);
        REQUIRE(status_of(r, "collect") == StepStatus::Succeeded);
        REQUIRE(status_of(r, "increase") == StepStatus::Skipped);
    }

    SECTION("Dry run") {
        h.cfg.enable_dry_run();
        h.chain.add_fees(id, {ONE, ONE});
        RunReport r = h.keeper().compound(id);
        REQUIRE(r.outcome == Outcome::DryRun);
        REQUIRE_FALSE(h.submitted_anything());
    }
}

TEST_CASE("Recover mints from wallet balances", "[keeper]") {
    Harness h;
    h.chain.balances = {10 * ONE, 10 * ONE};

    SECTION("Balanced wallet needs no swap") {
        RunReport r = h.keeper().recover();
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.path == RunPath::Recover);
        REQUIRE(*r.encoding == Encoding::Sequential);
        REQUIRE(status_of(r, "swap") == StepStatus::Skipped);
        REQUIRE(*r.new_position_id == U256(1000));
        REQUIRE(r.new_range->lower == -2040);
        REQUIRE(r.new_range->upper == 2040);
    }

    SECTION("One-sided wallet is swapped first") {
        h.chain.balances = {20 * ONE, 0};
        RunReport r = h.keeper().recover();
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(status_of(r, "swap") == StepStatus::Succeeded);
        REQUIRE(r.plan->swap.direction == SwapDirection::ZeroForOne);
    }

    SECTION("Empty wallet") {
        h.chain.balances = {};
        RunReport r = h.keeper().recover();
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::InvalidInput);
        REQUIRE_FALSE(h.submitted_anything());
    }
}

TEST_CASE("Close removes liquidity to the wallet", "[keeper]") {
    Harness h;
    U256 id = h.chain.add_position(-600, 600, 1000 * ONE, test_wallet());

    SECTION("Full close burns the position") {
        RunReport r = h.keeper().close(id);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.path == RunPath::Close);
        REQUIRE(r.completed_steps() == std::vector<std::string>{"close"});
        REQUIRE(h.chain.submitted.back().contains(ActionKind::BurnPosition));
        REQUIRE(h.chain.positions.count(id) == 0);
        REQUIRE(h.chain.balances.amount0 > 0);
        REQUIRE(h.chain.balances.amount1 > 0);
        REQUIRE(r.new_liquidity == 0);
    }

    SECTION("Partial close leaves the rest in place") {
        RunReport r = h.keeper().close(id, 50.0);
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE_FALSE(h.chain.submitted.back().contains(ActionKind::BurnPosition));
        REQUIRE(h.chain.positions.at(id).liquidity == 500 * ONE);
        REQUIRE(r.new_liquidity == 500 * ONE);
        REQUIRE_FALSE(h.chain.balances.is_zero());
    }

    SECTION("Percentage outside (0, 100] is refused before any read") {
        RunReport r = h.keeper().close(id, 0.0);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE(*r.error_code == ErrorCode::InvalidInput);
        REQUIRE(h.chain.calls.empty());
    }

    SECTION("Someone else's position") {
        U256 theirs = h.chain.add_position(-600, 600, ONE, test_harvest());
        RunReport r = h.keeper().close(theirs);
        REQUIRE(r.outcome == Outcome::Failed);
        REQUIRE_FALSE(h.submitted_anything());
    }

    SECTION("Dry run only plans") {
        h.cfg.enable_dry_run();
        RunReport r = h.keeper().close(id);
        REQUIRE(r.outcome == Outcome::DryRun);
        REQUIRE(status_of(r, "close") == StepStatus::Planned);
        REQUIRE_FALSE(h.submitted_anything());
        REQUIRE(h.chain.positions.at(id).liquidity == 1000 * ONE);
    }
}

TEST_CASE("Leftovers are swept to the harvest address", "[keeper]") {
    Harness h;
    h.chain.balances = {10 * ONE, 10 * ONE};
    h.cfg.set_harvest_address(hex::encode(test_harvest()));

    SECTION("Both tokens above the dust floor") {
        RunReport r = h.keeper().recover();
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(status_of(r, "sweep_AAA") == StepStatus::Succeeded);
        REQUIRE(status_of(r, "sweep_BBB") == StepStatus::Succeeded);
        REQUIRE(h.chain.balances.is_zero());
        REQUIRE(h.chain.transferred.at(test_pool_key().currency0.addr) > 0);
        REQUIRE(h.chain.transferred.at(test_pool_key().currency1.addr) > 0);
    }

    SECTION("Dust below the floor stays") {
        h.cfg.execution.dust_min0 = 100 * ONE;
        h.cfg.execution.dust_min1 = 100 * ONE;
        RunReport r = h.keeper().recover();
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(r.find_step("sweep_AAA") == nullptr);
        REQUIRE(r.find_step("sweep_BBB") == nullptr);
        REQUIRE(h.chain.transferred.empty());
    }

    SECTION("Failed sweep does not fail the run") {
        h.chain.revert_labels = {"sweep_AAA"};
        RunReport r = h.keeper().recover();
        REQUIRE(r.outcome == Outcome::Success);
        REQUIRE(status_of(r, "sweep_AAA") == StepStatus::Failed);
        REQUIRE(status_of(r, "sweep_BBB") == StepStatus::Succeeded);
    }
}
