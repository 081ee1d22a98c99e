/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader, MarketData and the historical provider
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/market_data_provider.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace riskengine;
using namespace riskengine::data;
using Catch::Matchers::WithinAbs;

namespace
{
    const std::string kDataDir = RISKENGINE_TEST_DATA_DIR;

    // Writes a file under the temp directory and removes it on scope exit
    class TempFile
    {
    public:
        TempFile(const std::string &name, const std::string &contents)
            : path_((std::filesystem::temp_directory_path() / name).string())
        {
            std::ofstream out(path_);
            out << contents;
        }
        ~TempFile() { std::filesystem::remove(path_); }

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

    MarketData small_market()
    {
        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, 200.0,
            110.0, 210.0,
            105.0, std::nan(""),
            115.0, 215.0;
        return MarketData(prices, {"2020-01-31", "2020-02-29", "2020-03-31", "2020-04-30"}, {"AAPL", "MSFT"});
    }
} // namespace

TEST_CASE("MarketData construction", "[MarketData]")
{
    auto data = small_market();
    REQUIRE(data.num_dates() == 4);
    REQUIRE(data.num_assets() == 2);
    REQUIRE(data.has_ticker("MSFT"));
    REQUIRE_FALSE(data.has_ticker("GOOG"));
    REQUIRE(data.count_missing() == 1);

    SECTION("Dates must ascend")
    {
        Eigen::MatrixXd prices = Eigen::MatrixXd::Ones(2, 1);
        REQUIRE_THROWS_AS(MarketData(prices, {"2020-02-01", "2020-01-01"}, {"A"}), std::invalid_argument);
    }

    SECTION("Tickers must be unique")
    {
        Eigen::MatrixXd prices = Eigen::MatrixXd::Ones(1, 2);
        REQUIRE_THROWS_AS(MarketData(prices, {"2020-01-01"}, {"A", "A"}), std::invalid_argument);
    }
}

TEST_CASE("Return series are labelled with the later date", "[MarketData]")
{
    auto data = small_market();

    SECTION("Simple returns over the whole history")
    {
        auto series = data.return_series("AAPL", "2020-01-01", "2020-12-31");
        REQUIRE(series.size() == 3);
        REQUIRE(series.dates.front() == "2020-02-29");
        REQUIRE_THAT(series.values(0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(series.values(1), WithinAbs(105.0 / 110.0 - 1.0, 1e-12));
    }

    SECTION("Log returns")
    {
        auto series = data.return_series("AAPL", "2020-01-01", "2020-12-31", ReturnType::LOG);
        REQUIRE_THAT(series.values(0), WithinAbs(std::log(1.1), 1e-12));
    }

    SECTION("The first in-window date only anchors the first return")
    {
        auto series = data.return_series("AAPL", "2020-02-15", "2020-03-31");
        REQUIRE(series.size() == 1);
        REQUIRE(series.dates.front() == "2020-03-31");
    }

    SECTION("Returns touching a missing price are skipped")
    {
        auto series = data.return_series("MSFT", "2020-01-01", "2020-12-31");
        REQUIRE(series.size() == 1);
        REQUIRE(series.dates.front() == "2020-02-29");
    }
}

TEST_CASE("Prices on or before a date", "[MarketData]")
{
    auto data = small_market();
    REQUIRE(data.price_on_or_before("AAPL", "2020-03-15") == 110.0);
    REQUIRE(data.price_on_or_before("MSFT", "2020-04-15") == 210.0);
    REQUIRE(std::isnan(data.price_on_or_before("AAPL", "2019-12-31")));
    REQUIRE(std::isnan(data.price_on_or_before("GOOG", "2020-03-31")));
}

TEST_CASE("Historical provider", "[MarketDataProvider]")
{
    HistoricalMarketDataProvider provider(small_market());

    REQUIRE(provider.get_returns("AAPL", "2020-01-01", "2020-12-31").size() == 3);
    REQUIRE(provider.get_price("AAPL", "2020-04-30") == 115.0);
    REQUIRE_THROWS_AS(provider.get_returns("GOOG", "2020-01-01", "2020-12-31"), DataUnavailable);
    REQUIRE_THROWS_AS(provider.get_returns("AAPL", "2021-01-01", "2021-12-31"), DataUnavailable);
    REQUIRE_THROWS_AS(provider.get_price("AAPL", "2019-01-01"), DataUnavailable);
}

TEST_CASE("Loading wide CSV files", "[DataLoader]")
{
    TempFile csv("riskengine_wide.csv",
                 "date,SPY,AAPL\n"
                 "2020-01-31,300.0,75.0\n"
                 "2020-02-29,290.5,\n"
                 "not-a-date,1,2\n"
                 "2020-03-31,260.0,63.5\n");

    SECTION("All columns")
    {
        auto data = DataLoader::load_csv(csv.path());
        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.get_tickers() == std::vector<std::string>{"SPY", "AAPL"});
        REQUIRE(std::isnan(data.get_prices()(1, 1)));
        REQUIRE(data.get_prices()(2, 0) == 260.0);
    }

    SECTION("Selected columns")
    {
        auto data = DataLoader::load_csv_wide(csv.path(), {"AAPL"});
        REQUIRE(data.num_assets() == 1);
        REQUIRE(data.get_prices()(0, 0) == 75.0);
    }

    SECTION("Unknown columns only")
    {
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(csv.path(), {"GOOG"}), DataUnavailable);
    }

    SECTION("Round trip keeps missing cells empty")
    {
        const auto out = (std::filesystem::temp_directory_path() / "riskengine_wide_copy.csv").string();
        DataLoader::save_csv_wide(DataLoader::load_csv(csv.path()), out);
        auto copy = DataLoader::load_csv(out);
        std::filesystem::remove(out);

        REQUIRE(copy.num_dates() == 3);
        REQUIRE(std::isnan(copy.get_prices()(1, 1)));
        REQUIRE_THAT(copy.get_prices()(1, 0), WithinAbs(290.5, 1e-9));
    }
}

TEST_CASE("Loading long CSV files", "[DataLoader]")
{
    TempFile csv("riskengine_long.csv",
                 "date,ticker,price\n"
                 "2020-02-29,SPY,290.5\n"
                 "2020-01-31,SPY,300.0\n"
                 "2020-01-31,AAPL,75.0\n");

    auto data = DataLoader::load_csv(csv.path());
    REQUIRE(data.get_dates() == std::vector<std::string>{"2020-01-31", "2020-02-29"});
    REQUIRE(data.get_tickers() == std::vector<std::string>{"AAPL", "SPY"});
    REQUIRE(std::isnan(data.price_on_or_before("AAPL", "2020-01-30")));
    REQUIRE(data.price_on_or_before("AAPL", "2020-02-29") == 75.0);
}

TEST_CASE("Bad CSV input", "[DataLoader]")
{
    REQUIRE_THROWS_AS(DataLoader::load_csv("/nonexistent/prices.csv"), DataUnavailable);

    TempFile no_date("riskengine_nodate.csv", "ticker,SPY\nx,1\n");
    REQUIRE_THROWS_AS(DataLoader::load_csv_wide(no_date.path()), DataUnavailable);
}

TEST_CASE("Example configuration", "[DataLoader]")
{
    auto config = DataLoader::load_config(kDataDir + "/example_config.json");

    REQUIRE(std::filesystem::exists(config.data.data_file));
    REQUIRE(config.portfolio.holdings.size() == 5);
    REQUIRE(config.portfolio.window.start_date == "2020-01-01");
    REQUIRE(config.portfolio.window.end_date == "2024-12-31");
    REQUIRE(config.proxies.factor_names() == std::vector<std::string>{"market", "momentum", "value"});
    REQUIRE(config.proxies.cash_proxy_for("USD").value() == "SGOV");
    REQUIRE(config.limits.max_volatility.value() == 0.20);
    REQUIRE(config.limits.max_factor_betas.at("market") == 1.2);
    REQUIRE(config.engine.estimation.min_observations == 24);
    REQUIRE(config.objective.value() == optimizer::ObjectiveType::MIN_VARIANCE);
    REQUIRE(config.optimization.candidates == std::vector<std::string>{"SPY", "VLUE"});
    REQUIRE(config.optimization.box.max_weight == 0.35);
    REQUIRE(config.optimization.proxies.identity() == config.proxies.identity());
}

TEST_CASE("Example configuration runs end to end", "[DataLoader][RiskEngine]")
{
    auto config = DataLoader::load_config(kDataDir + "/example_config.json");
    auto provider = std::make_shared<HistoricalMarketDataProvider>(DataLoader::load_csv(config.data.data_file));
    engine::RiskEngine engine(provider, config.engine);

    auto analysis = engine.analyze_portfolio(config.portfolio, config.proxies, config.limits);
    REQUIRE(analysis->tickers.size() == 5);
    REQUIRE(analysis->verdicts.size() == 6);
    REQUIRE_THAT(analysis->weights.sum(), WithinAbs(1.0, 1e-12));
    REQUIRE(analysis->decomposition.volatility > 0.0);
}

TEST_CASE("Invalid configuration", "[DataLoader]")
{
    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(DataLoader::load_config("nonexistent_config.json"), ConfigurationError);
    }

    SECTION("Malformed JSON")
    {
        TempFile bad("riskengine_bad.json", "{ \"data\": ");
        REQUIRE_THROWS_AS(DataLoader::load_json(bad.path()), ConfigurationError);
    }

    SECTION("No factor proxies")
    {
        nlohmann::json j = {{"data", {{"data_file", "prices.csv"},
                                      {"start_date", "2020-01-01"},
                                      {"end_date", "2020-12-31"}}},
                            {"portfolio", {{"holdings", nlohmann::json::array()}}}};
        REQUIRE_THROWS_AS(ApplicationConfig::from_json(j), ConfigurationError);
    }

    SECTION("Data file is required")
    {
        REQUIRE_THROWS_AS(DataConfig::from_json(nlohmann::json::object()), ConfigurationError);
    }

    SECTION("Wrong value type")
    {
        nlohmann::json j = {{"data", {{"data_file", 42}}}};
        REQUIRE_THROWS_AS(ApplicationConfig::from_json(j), ConfigurationError);
    }
}
