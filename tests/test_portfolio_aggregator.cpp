#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "portfolio/portfolio_aggregator.hpp"
#include "test_fixtures.hpp"
#include <limits>

using namespace riskengine;
using namespace riskengine::portfolio;
using Catch::Matchers::WithinAbs;

namespace
{
    class AggregatorFixture
    {
    protected:
        test_fixtures::SyntheticMarket market_ = test_fixtures::make_market();
        data::HistoricalMarketDataProvider provider_{market_.prices};
        FactorProxySet proxies_ = test_fixtures::market_only_proxies();
        PortfolioAggregator aggregator_;

        AggregatedPortfolio run(const std::vector<Holding> &holdings)
        {
            return aggregator_.aggregate(test_fixtures::make_portfolio(holdings), proxies_, provider_);
        }
    };
} // namespace

TEST_CASE_METHOD(AggregatorFixture, "Cash is replaced by its currency proxy", "[Aggregator]")
{
    auto result = run({Holding::dollars("AAPL", 60000.0),
                       Holding::cash("CUR:USD", 40000.0, "USD")});

    REQUIRE(result.tickers == std::vector<std::string>{"AAPL", "SGOV"});
    REQUIRE_THAT(result.total_value, WithinAbs(100000.0, 1e-9));
    REQUIRE_THAT(result.weights(0), WithinAbs(0.6, 1e-12));
    REQUIRE_THAT(result.weights(1), WithinAbs(0.4, 1e-12));
    REQUIRE(result.cash_tickers.count("SGOV") == 1);
    REQUIRE(result.unmapped_cash.empty());
    REQUIRE_THAT(result.original_cash_dollars, WithinAbs(40000.0, 1e-9));
    REQUIRE_THAT(result.mapped_cash_dollars, WithinAbs(40000.0, 1e-9));

    // Positive cash is not a risky position
    REQUIRE_THAT(result.leverage, WithinAbs(1.0, 1e-12));
}

TEST_CASE_METHOD(AggregatorFixture, "Cash merges into an existing proxy position", "[Aggregator]")
{
    auto result = run({Holding::dollars("SGOV", 10000.0),
                       Holding::dollars("AAPL", 30000.0),
                       Holding::cash("CUR:USD", 10000.0, "USD")});

    REQUIRE(result.tickers.size() == 2);
    REQUIRE(result.index_of("SGOV") == 0);
    REQUIRE_THAT(result.dollar_exposures(0), WithinAbs(20000.0, 1e-9));
    REQUIRE_THAT(result.total_value, WithinAbs(50000.0, 1e-9));
    REQUIRE_THAT(result.original_cash_dollars, WithinAbs(10000.0, 1e-9));
    REQUIRE_THAT(result.mapped_cash_dollars, WithinAbs(10000.0, 1e-9));

    // Only the cash-derived half of SGOV is excluded from exposure
    REQUIRE_THAT(result.net_exposure, WithinAbs(0.8, 1e-12));
    REQUIRE_THAT(result.gross_exposure, WithinAbs(0.8, 1e-12));
}

TEST_CASE_METHOD(AggregatorFixture, "A short cash-proxy position stays risky after cash is added", "[Aggregator]")
{
    auto result = run({Holding::dollars("SGOV", -10000.0),
                       Holding::dollars("AAPL", 30000.0),
                       Holding::cash("CUR:USD", 30000.0, "USD")});

    REQUIRE_THAT(result.dollar_exposures(result.index_of("SGOV")), WithinAbs(20000.0, 1e-9));
    REQUIRE_THAT(result.mapped_cash_dollars, WithinAbs(30000.0, 1e-9));
    REQUIRE_THAT(result.net_exposure, WithinAbs(0.4, 1e-12));
    REQUIRE_THAT(result.gross_exposure, WithinAbs(0.8, 1e-12));
    REQUIRE_THAT(result.leverage, WithinAbs(2.0, 1e-12));
}

TEST_CASE_METHOD(AggregatorFixture, "Share counts are valued at the valuation date", "[Aggregator]")
{
    auto portfolio = test_fixtures::make_portfolio({Holding::equity("AAPL", 10.0),
                                                    Holding::dollars("MSFT", 1000.0)});

    SECTION("Defaults to the window end")
    {
        auto result = aggregator_.aggregate(portfolio, proxies_, provider_);
        const double price = market_.prices.price_on_or_before("AAPL", "2024-01-31");
        REQUIRE_THAT(result.dollar_exposures(0), WithinAbs(10.0 * price, 1e-9));
    }

    SECTION("Explicit valuation date uses the last price on or before it")
    {
        portfolio.valuation_date = "2021-06-15";
        auto result = aggregator_.aggregate(portfolio, proxies_, provider_);
        const double price = market_.prices.price_on_or_before("AAPL", "2021-05-31");
        REQUIRE_THAT(result.dollar_exposures(0), WithinAbs(10.0 * price, 1e-9));
    }
}

TEST_CASE_METHOD(AggregatorFixture, "Cash without a proxy stays unmapped", "[Aggregator]")
{
    auto result = run({Holding::dollars("AAPL", 50000.0),
                       Holding::cash("CUR:EUR", 50000.0, "EUR")});

    REQUIRE(result.index_of("CUR:EUR") == 1);
    REQUIRE(result.unmapped_cash == std::vector<std::string>{"CUR:EUR"});
    REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-12));
}

TEST_CASE_METHOD(AggregatorFixture, "Shorts and leverage", "[Aggregator]")
{
    SECTION("Long/short equity")
    {
        auto result = run({Holding::dollars("AAPL", 150000.0),
                           Holding::dollars("MSFT", -50000.0)});

        REQUIRE_THAT(result.weights(0), WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(result.weights(1), WithinAbs(-0.5, 1e-12));
        REQUIRE_THAT(result.net_exposure, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(result.gross_exposure, WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(result.leverage, WithinAbs(2.0, 1e-12));
    }

    SECTION("Borrowed cash counts as a risky position")
    {
        auto result = run({Holding::dollars("AAPL", 150000.0),
                           Holding::cash("CUR:USD", -50000.0, "USD")});

        REQUIRE_THAT(result.weights(result.index_of("SGOV")), WithinAbs(-0.5, 1e-12));
        REQUIRE_THAT(result.leverage, WithinAbs(2.0, 1e-12));
    }

    SECTION("Zero net value gives zero weights")
    {
        auto result = run({Holding::dollars("AAPL", 1000.0),
                           Holding::dollars("MSFT", -1000.0)});

        REQUIRE(result.total_value == 0.0);
        REQUIRE(result.weights.isZero());
        REQUIRE(result.leverage == 0.0);
    }
}

TEST_CASE_METHOD(AggregatorFixture, "Aggregation errors", "[Aggregator]")
{
    SECTION("Ticker held in shares and in dollars")
    {
        REQUIRE_THROWS_AS(run({Holding::equity("AAPL", 10.0), Holding::dollars("AAPL", 100.0)}),
                          ConfigurationError);
    }

    SECTION("No price for a share count")
    {
        REQUIRE_THROWS_AS(run({Holding::equity("ZZZZ", 10.0)}), DataInsufficientError);
    }

    SECTION("Non-finite amount")
    {
        REQUIRE_THROWS_AS(run({Holding::dollars("AAPL", std::numeric_limits<double>::infinity())}),
                          ConfigurationError);
    }

    SECTION("Negative dollar tolerance")
    {
        REQUIRE_THROWS_AS(PortfolioAggregator(-1.0), ConfigurationError);
    }
}
