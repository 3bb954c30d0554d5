#include "lpm/price_source.hpp"
#include "lpm/errors.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace lpm {

using json = nlohmann::json;

double StaticPriceSource::usd_price(const Currency& currency) {
    auto it = prices_.find(currency.addr);
    if (it == prices_.end()) {
        throw NoPriceData("no static price for " + currency.to_hex());
    }
    return it->second;
}

HttpPriceSource::HttpPriceSource(PriceConfig config, int timeout_ms)
    : config_(std::move(config)), timeout_ms_(timeout_ms) {}

double HttpPriceSource::usd_price(const Currency& currency) {
    if (currency.is_native()) {
        return fetch(config_.api_url + "/simple/price?ids=" + config_.native_id + "&vs_currencies=usd",
                     config_.native_id);
    }

    // Response is keyed by the lowercased contract address
    std::string addr = currency.to_hex();
    std::transform(addr.begin(), addr.end(), addr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return fetch(config_.api_url + "/simple/token_price/" + config_.platform +
                     "?contract_addresses=" + addr + "&vs_currencies=usd",
                 addr);
}

double HttpPriceSource::fetch(const std::string& url, const std::string& key) {
    cpr::Header headers{{"Accept", "application/json"}};
    if (config_.api_key) {
        headers["x-cg-demo-api-key"] = *config_.api_key;
    }

    auto response = cpr::Get(cpr::Url{url}, headers, cpr::Timeout{timeout_ms_});

    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        throw TransientError("price request timed out: " + url);
    }
    if (response.status_code == 429) {
        throw TransientError("price provider rate limit (HTTP 429)");
    }
    if (response.status_code != 200) {
        throw NoPriceData("price request failed: HTTP " + std::to_string(response.status_code) +
                          ": " + response.text);
    }

    json body;
    try {
        body = json::parse(response.text);
    } catch (const json::parse_error& e) {
        throw NoPriceData(std::string("malformed price response: ") + e.what());
    }

    if (!body.contains(key) || !body[key].contains("usd") || !body[key]["usd"].is_number()) {
        throw NoPriceData("no USD price returned for " + key);
    }
    double usd = body[key]["usd"].get<double>();
    spdlog::debug("price {} = ${}", key, usd);
    return usd;
}

std::unique_ptr<PriceSource> make_price_source(const Config& config) {
    if (config.prices.source == "static") {
        if (!config.prices.usd0 || !config.prices.usd1) {
            throw ConfigError("static price source needs prices.usd0 and prices.usd1");
        }
        auto source = std::make_unique<StaticPriceSource>();
        source->set(config.pool.key.currency0, *config.prices.usd0)
               .set(config.pool.key.currency1, *config.prices.usd1);
        return source;
    }
    return std::make_unique<HttpPriceSource>(config.prices, config.general.timeout_ms);
}

} // namespace lpm
