// LPM - Retry Tests

#include <catch2/catch_test_macros.hpp>
#include <lpm/errors.hpp>
#include <lpm/retry.hpp>

#include <chrono>
#include <vector>

using namespace lpm;
using std::chrono::milliseconds;

namespace {

struct RecordingSleeper {
    std::vector<milliseconds>* delays;
    void operator()(milliseconds d) const { delays->push_back(d); }
};

} // namespace

TEST_CASE("Backoff schedule", "[retry]") {
    BackoffPolicy p;
    REQUIRE(p.delay_for(1) == milliseconds(2000));
    REQUIRE(p.delay_for(2) == milliseconds(4000));
    REQUIRE(p.delay_for(3) == milliseconds(8000));

    RetryConfig cfg;
    cfg.max_attempts = 2;
    cfg.base_delay_ms = 100;
    cfg.multiplier = 3.0;
    BackoffPolicy from = BackoffPolicy::from_config(cfg);
    REQUIRE(from.max_attempts == 2);
    REQUIRE(from.delay_for(2) == milliseconds(300));
}

TEST_CASE("Retry policy", "[retry]") {
    std::vector<milliseconds> delays;
    RetryPolicy retry(BackoffPolicy{}, RecordingSleeper{&delays});
    int calls = 0;

    SECTION("Rate limits are retried with growing delays") {
        int result = retry.run("read", [&] {
            if (++calls < 3) throw TransientError("429 Too Many Requests");
            return 42;
        });
        REQUIRE(result == 42);
        REQUIRE(calls == 3);
        REQUIRE(delays == std::vector<milliseconds>{milliseconds(2000), milliseconds(4000)});
    }

    SECTION("Other errors propagate immediately") {
        REQUIRE_THROWS_AS(retry.run("read", [&]() -> int {
            ++calls;
            throw ChainError("execution reverted");
        }), ChainError);
        REQUIRE(calls == 1);
        REQUIRE(delays.empty());
    }

    SECTION("Last transient error propagates when attempts run out") {
        REQUIRE_THROWS_AS(retry.run("read", [&]() -> int {
            ++calls;
            throw TransientError("rate limited");
        }), TransientError);
        REQUIRE(calls == 4);
        REQUIRE(delays.size() == 3);
    }

    SECTION("Void callables") {
        retry.run("noop", [&] { ++calls; });
        REQUIRE(calls == 1);
    }
}
