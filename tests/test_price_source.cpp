// LPM - Price Source Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <lpm/config.hpp>
#include <lpm/errors.hpp>
#include <lpm/price_source.hpp>

#include "fake_chain.hpp"

using namespace lpm;
using namespace lpm::testing;
using Catch::Approx;

TEST_CASE("Static price source", "[prices]") {
    const PoolKey key = test_pool_key();

    SECTION("Quotes both tokens") {
        StaticPriceSource prices;
        prices.set(key.currency0, 2500.0).set(key.currency1, 1.0);

        PriceQuote q = prices.quote(key);
        REQUIRE(q.usd0 == Approx(2500.0));
        REQUIRE(q.usd1 == Approx(1.0));
    }

    SECTION("Unknown token") {
        StaticPriceSource prices;
        prices.set(key.currency0, 2500.0);
        REQUIRE_THROWS_AS(prices.quote(key), NoPriceData);
    }

    SECTION("Native currency is keyed by the zero address") {
        StaticPriceSource prices;
        prices.set(Currency(), 3000.0);
        REQUIRE(prices.usd_price(Currency()) == Approx(3000.0));
    }
}

TEST_CASE("Price source from configuration", "[prices]") {
    Config cfg = test_config();

    SECTION("Static prices") {
        cfg.set_static_prices(2.5, 0.5);
        auto source = make_price_source(cfg);
        REQUIRE(dynamic_cast<StaticPriceSource*>(source.get()) != nullptr);

        PriceQuote q = source->quote(cfg.pool.key);
        REQUIRE(q.usd0 == Approx(2.5));
        REQUIRE(q.usd1 == Approx(0.5));
    }

    SECTION("Static source without prices") {
        cfg.prices.source = "static";
        cfg.prices.usd0.reset();
        REQUIRE_THROWS_AS(make_price_source(cfg), ConfigError);
    }

    SECTION("HTTP source by default") {
        cfg.prices.source = "coingecko";
        auto source = make_price_source(cfg);
        REQUIRE(dynamic_cast<HttpPriceSource*>(source.get()) != nullptr);
    }
}
