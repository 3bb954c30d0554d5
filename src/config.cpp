#include "lpm/config.hpp"
#include "lpm/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace lpm {

// Simple TOML parser (flat sections, scalar values)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

int to_int(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("expected an integer for '" + key + "', got '" + value + "'");
    }
}

double to_double(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("expected a number for '" + key + "', got '" + value + "'");
    }
}

bool to_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("expected true or false for '" + key + "', got '" + value + "'");
}

U128 to_amount(const std::string& key, const std::string& value) {
    try {
        return parse_u128(value);
    } catch (const InvalidInput&) {
        throw ConfigError("expected an integer amount for '" + key + "', got '" + value + "'");
    }
}

Address to_addr(const std::string& key, const std::string& value) {
    try {
        return hex::to_address(value);
    } catch (const InvalidInput&) {
        throw ConfigError("expected a 20-byte address for '" + key + "', got '" + value + "'");
    }
}

void require_address(const std::string& key, const std::string& value) {
    if (value.empty()) throw ConfigError("missing required setting '" + key + "'");
    to_addr(key, value);
}

} // namespace

uint32_t StrategyConfig::slippage_bps() const {
    return static_cast<uint32_t>(std::lround(slippage_pct * 100.0));
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("unterminated section header on line " + std::to_string(line_no));
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("expected key = value on line " + std::to_string(line_no));
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        std::string qualified = current_section + "." + key;

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "timeout_ms") config.general.timeout_ms = to_int(qualified, value);
        }
        else if (current_section == "chain") {
            if (key == "rpc_url") config.chain.rpc_url = value;
            else if (key == "wallet") config.chain.wallet = value;
            else if (key == "chain_id") config.chain.chain_id = static_cast<uint64_t>(to_int(qualified, value));
            else if (key == "position_manager") config.chain.position_manager = value;
            else if (key == "state_view") config.chain.state_view = value;
            else if (key == "universal_router") config.chain.universal_router = value;
            else if (key == "permit2") config.chain.permit2 = value;
            else if (key == "multi_action") config.chain.multi_action = to_bool(qualified, value);
            else if (key == "receipt_timeout_ms") config.chain.receipt_timeout_ms = to_int(qualified, value);
            else if (key == "poll_interval_ms") config.chain.poll_interval_ms = to_int(qualified, value);
        }
        else if (current_section == "pool") {
            if (key == "currency0") config.pool.key.currency0 = Currency(to_addr(qualified, value));
            else if (key == "currency1") config.pool.key.currency1 = Currency(to_addr(qualified, value));
            else if (key == "fee") config.pool.key.fee = static_cast<uint32_t>(to_int(qualified, value));
            else if (key == "tick_spacing") config.pool.key.tick_spacing = to_int(qualified, value);
            else if (key == "hooks") config.pool.key.hooks = to_addr(qualified, value);
            else if (key == "pool_id") config.pool.pool_id = value;
            else if (key == "decimals0") config.pool.decimals0 = to_int(qualified, value);
            else if (key == "decimals1") config.pool.decimals1 = to_int(qualified, value);
            else if (key == "symbol0") config.pool.symbol0 = value;
            else if (key == "symbol1") config.pool.symbol1 = value;
        }
        else if (current_section == "position") {
            if (key == "id") {
                try {
                    config.position_id = parse_u256(value);
                } catch (const InvalidInput&) {
                    throw ConfigError("expected a token id for 'position.id', got '" + value + "'");
                }
            }
        }
        else if (current_section == "strategy") {
            if (key == "range_pct") config.strategy.range_pct = to_double(qualified, value);
            else if (key == "drift_threshold_pct") config.strategy.drift_threshold_pct = to_double(qualified, value);
            else if (key == "slippage_pct") config.strategy.slippage_pct = to_double(qualified, value);
            else if (key == "materiality_usd") config.strategy.materiality_usd = to_double(qualified, value);
            else if (key == "monitoring_enabled") config.strategy.monitoring_enabled = to_bool(qualified, value);
            else if (key == "prefer_atomic") config.strategy.prefer_atomic = to_bool(qualified, value);
        }
        else if (current_section == "retry") {
            if (key == "max_attempts") config.retry.max_attempts = to_int(qualified, value);
            else if (key == "base_delay_ms") config.retry.base_delay_ms = to_int(qualified, value);
            else if (key == "multiplier") config.retry.multiplier = to_double(qualified, value);
        }
        else if (current_section == "execution") {
            if (key == "settle_delay_ms") config.execution.settle_delay_ms = to_int(qualified, value);
            else if (key == "deadline_secs") config.execution.deadline_secs = to_int(qualified, value);
            else if (key == "dry_run") config.execution.dry_run = to_bool(qualified, value);
            else if (key == "harvest_address") {
                if (!value.empty()) config.execution.harvest_address = value;
            }
            else if (key == "dust_min0") config.execution.dust_min0 = to_amount(qualified, value);
            else if (key == "dust_min1") config.execution.dust_min1 = to_amount(qualified, value);
            else if (key == "native_gas_reserve") config.execution.native_gas_reserve = to_amount(qualified, value);
        }
        else if (current_section == "prices") {
            if (key == "source") config.prices.source = value;
            else if (key == "api_url") config.prices.api_url = value;
            else if (key == "platform") config.prices.platform = value;
            else if (key == "native_id") config.prices.native_id = value;
            else if (key == "api_key") config.prices.api_key = value;
            else if (key == "usd0") config.prices.usd0 = to_double(qualified, value);
            else if (key == "usd1") config.prices.usd1 = to_double(qualified, value);
        }
    }

    return config;
}

void Config::validate() const {
    const auto& s = strategy;
    if (!(s.range_pct > 0.0 && s.range_pct < 100.0)) {
        throw ConfigError("strategy.range_pct must be in (0, 100)");
    }
    if (!(s.drift_threshold_pct > 0.0 && s.drift_threshold_pct <= 100.0)) {
        throw ConfigError("strategy.drift_threshold_pct must be in (0, 100]");
    }
    if (!(s.slippage_pct >= 0.0 && s.slippage_pct < 50.0)) {
        throw ConfigError("strategy.slippage_pct must be in [0, 50)");
    }
    if (!(s.materiality_usd >= 0.0)) {
        throw ConfigError("strategy.materiality_usd must not be negative");
    }

    if (retry.max_attempts < 1) throw ConfigError("retry.max_attempts must be at least 1");
    if (retry.base_delay_ms < 0) throw ConfigError("retry.base_delay_ms must not be negative");
    if (retry.multiplier < 1.0) throw ConfigError("retry.multiplier must be at least 1");

    if (pool.key.tick_spacing <= 0) throw ConfigError("pool.tick_spacing must be positive");
    if (!(pool.key.currency0 < pool.key.currency1)) {
        throw ConfigError("pool.currency0 must sort below pool.currency1");
    }
    if (pool.decimals0 < 0 || pool.decimals0 > 36 || pool.decimals1 < 0 || pool.decimals1 > 36) {
        throw ConfigError("pool decimals must be in [0, 36]");
    }

    if (execution.settle_delay_ms < 0) throw ConfigError("execution.settle_delay_ms must not be negative");
    if (execution.deadline_secs <= 0) throw ConfigError("execution.deadline_secs must be positive");
    if (execution.harvest_address) {
        to_addr("execution.harvest_address", *execution.harvest_address);
    }

    if (prices.source == "static") {
        if (!prices.usd0 || !prices.usd1) {
            throw ConfigError("prices.usd0 and prices.usd1 are required for the static price source");
        }
    } else if (prices.source != "coingecko") {
        throw ConfigError("prices.source must be 'coingecko' or 'static'");
    }

    if (!chain.rpc_url.empty()) {
        require_address("chain.wallet", chain.wallet);
        require_address("chain.position_manager", chain.position_manager);
        require_address("chain.state_view", chain.state_view);
        require_address("chain.universal_router", chain.universal_router);
        require_address("chain.permit2", chain.permit2);

        Bytes id;
        try {
            id = hex::decode(pool.pool_id);
        } catch (const InvalidInput&) {
            throw ConfigError("pool.pool_id must be a 32-byte hex string");
        }
        if (id.size() != 32) throw ConfigError("pool.pool_id must be a 32-byte hex string");
    }
    if (general.timeout_ms <= 0) throw ConfigError("general.timeout_ms must be positive");
}

} // namespace lpm
