#ifndef LPM_PRICE_SOURCE_HPP
#define LPM_PRICE_SOURCE_HPP

#include <map>
#include <memory>
#include <string>

#include "config.hpp"
#include "planner.hpp"
#include "types.hpp"

namespace lpm {

// =============================================================================
// Price Source Interface (off-chain USD valuation)
// =============================================================================

class PriceSource {
public:
    virtual ~PriceSource() = default;

    // USD per whole token. Throws NoPriceData when unknown,
    // TransientError when the provider is rate limiting.
    virtual double usd_price(const Currency& currency) = 0;

    PriceQuote quote(const PoolKey& key) {
        PriceQuote q;
        q.usd0 = usd_price(key.currency0);
        q.usd1 = usd_price(key.currency1);
        return q;
    }
};

// Fixed prices, from configuration or tests
class StaticPriceSource : public PriceSource {
public:
    StaticPriceSource() = default;

    StaticPriceSource& set(const Currency& currency, double usd) {
        prices_[currency.addr] = usd;
        return *this;
    }

    double usd_price(const Currency& currency) override;

private:
    std::map<Address, double> prices_;
};

// CoinGecko simple price API
class HttpPriceSource : public PriceSource {
public:
    HttpPriceSource(PriceConfig config, int timeout_ms);

    double usd_price(const Currency& currency) override;

private:
    double fetch(const std::string& url, const std::string& key);

    PriceConfig config_;
    int timeout_ms_;
};

std::unique_ptr<PriceSource> make_price_source(const Config& config);

} // namespace lpm

#endif // LPM_PRICE_SOURCE_HPP
