#ifndef LPM_CONFIG_HPP
#define LPM_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "pool.hpp"
#include "types.hpp"
#include "uint256.hpp"

namespace lpm {

// =============================================================================
// Configuration Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
    int timeout_ms = 30000;           // Per network call
};

struct ChainConfig {
    std::string rpc_url;
    std::string wallet;               // Sender; signing happens behind the endpoint
    uint64_t chain_id = 8453;
    std::string position_manager;
    std::string state_view;
    std::string universal_router;
    std::string permit2 = "0x000000000022D473030F116dDEE9F6B43aC78BA3";
    bool multi_action = true;         // Same-transaction composition available
    int receipt_timeout_ms = 120000;
    int poll_interval_ms = 1000;
};

struct StrategyConfig {
    double range_pct = 20.0;            // New range is +/- this around the current price
    double drift_threshold_pct = 75.0;
    double slippage_pct = 5.0;
    double materiality_usd = 0.01;      // Smaller imbalances are not swapped
    bool monitoring_enabled = true;
    bool prefer_atomic = true;

    // Slippage in basis points for integer scaling
    uint32_t slippage_bps() const;
};

struct RetryConfig {
    int max_attempts = 4;
    int base_delay_ms = 2000;
    double multiplier = 2.0;
};

struct ExecutionConfig {
    int settle_delay_ms = 3000;         // After a confirmed step, before re-reading balances
    int deadline_secs = 1800;
    bool dry_run = false;
    std::optional<std::string> harvest_address;
    U128 dust_min0 = static_cast<U128>(100000000000000ULL);     // 1e14
    U128 dust_min1 = static_cast<U128>(10000000000000000ULL);   // 1e16
    U128 native_gas_reserve = static_cast<U128>(2000000000000000ULL);  // 2e15 wei
};

struct PriceConfig {
    std::string source = "coingecko";   // "coingecko" or "static"
    std::string api_url = "https://api.coingecko.com/api/v3";
    std::string platform = "base";
    std::string native_id = "ethereum";
    std::optional<std::string> api_key;
    std::optional<double> usd0;
    std::optional<double> usd1;
};

// =============================================================================
// Main Configuration
// =============================================================================

class Config {
public:
    GeneralConfig general;
    ChainConfig chain;
    PoolConfig pool;
    StrategyConfig strategy;
    RetryConfig retry;
    ExecutionConfig execution;
    PriceConfig prices;
    std::optional<U256> position_id;

    Config() = default;

    // Load from TOML file; throws ConfigError
    static Config from_file(std::string_view path);

    // Load from TOML string; throws ConfigError
    static Config from_toml(std::string_view content);

    // Throws ConfigError naming the first invalid field
    void validate() const;

    // Builder methods
    Config& with_position(const U256& id) {
        position_id = id;
        return *this;
    }

    Config& with_pool(PoolConfig cfg) {
        pool = std::move(cfg);
        return *this;
    }

    Config& set_range_pct(double pct) {
        strategy.range_pct = pct;
        return *this;
    }

    Config& set_drift_threshold(double pct) {
        strategy.drift_threshold_pct = pct;
        return *this;
    }

    Config& set_slippage(double pct) {
        strategy.slippage_pct = pct;
        return *this;
    }

    Config& enable_dry_run(bool enabled = true) {
        execution.dry_run = enabled;
        return *this;
    }

    Config& enable_atomic(bool enabled = true) {
        strategy.prefer_atomic = enabled;
        return *this;
    }

    Config& set_harvest_address(std::string_view address) {
        execution.harvest_address = std::string(address);
        return *this;
    }

    Config& set_settle_delay(int ms) {
        execution.settle_delay_ms = ms;
        return *this;
    }

    Config& set_static_prices(double usd0, double usd1) {
        prices.source = "static";
        prices.usd0 = usd0;
        prices.usd1 = usd1;
        return *this;
    }
};

} // namespace lpm

#endif // LPM_CONFIG_HPP
