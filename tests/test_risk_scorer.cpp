#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "risk/risk_analysis_result.hpp"
#include "risk/risk_scorer.hpp"
#include <algorithm>

using namespace riskengine;
using namespace riskengine::risk;
using Catch::Matchers::WithinAbs;

namespace
{
    RiskContribution share(const std::string &name, double percent)
    {
        RiskContribution c;
        c.name = name;
        c.percent = percent;
        return c;
    }

    // Ten equal holdings, low volatility, modest market share
    RiskAnalysisResult diversified()
    {
        RiskAnalysisResult r;
        for (int i = 0; i < 10; ++i)
        {
            r.tickers.push_back("T" + std::to_string(i));
        }
        r.weights = Eigen::VectorXd::Constant(10, 0.1);
        r.herfindahl = 0.1;
        r.leverage = 1.0;
        r.decomposition.volatility = 0.10;
        r.factor_names = {"market"};
        r.factor_contributions = {share("market", 0.20), share("idiosyncratic", 0.80)};
        return r;
    }

    // Two holdings, one of them over the weight limit
    RiskAnalysisResult concentrated()
    {
        RiskAnalysisResult r;
        r.tickers = {"AAPL", "SGOV"};
        r.weights = Eigen::VectorXd(2);
        r.weights << 0.6, 0.4;
        r.herfindahl = 0.52;
        r.leverage = 1.0;
        r.decomposition.volatility = 0.30;
        r.factor_names = {"market", "momentum"};
        r.factor_contributions = {share("market", 0.45), share("momentum", 0.05), share("idiosyncratic", 0.50)};
        r.limits.max_single_holding_weight = 0.5;
        r.verdicts = {ComplianceVerdict{"max_single_holding_weight", "AAPL", 0.6, 0.5, ComplianceStatus::FAIL}};
        return r;
    }

    bool contains(const std::vector<std::string> &list, const std::string &item)
    {
        return std::find(list.begin(), list.end(), item) != list.end();
    }
} // namespace

TEST_CASE("Excess ratio curve", "[RiskScorer]")
{
    REQUIRE(RiskScorer::score_excess_ratio(0.0) == 100.0);
    REQUIRE(RiskScorer::score_excess_ratio(0.8) == 100.0);
    REQUIRE_THAT(RiskScorer::score_excess_ratio(0.9), WithinAbs(87.5, 1e-12));
    REQUIRE_THAT(RiskScorer::score_excess_ratio(1.0), WithinAbs(75.0, 1e-12));
    REQUIRE_THAT(RiskScorer::score_excess_ratio(1.25), WithinAbs(62.5, 1e-12));
    REQUIRE_THAT(RiskScorer::score_excess_ratio(1.5), WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(RiskScorer::score_excess_ratio(1.75), WithinAbs(25.0, 1e-12));
    REQUIRE_THAT(RiskScorer::score_excess_ratio(2.0), WithinAbs(0.0, 1e-12));
    REQUIRE(RiskScorer::score_excess_ratio(3.0) == 0.0);
}

TEST_CASE("Categories and interpretations", "[RiskScorer]")
{
    REQUIRE(RiskScorer::categorize(95.0) == RiskCategory::LOW);
    REQUIRE(RiskScorer::categorize(80.0) == RiskCategory::LOW);
    REQUIRE(RiskScorer::categorize(79.9) == RiskCategory::MODERATE);
    REQUIRE(RiskScorer::categorize(65.0) == RiskCategory::MODERATE);
    REQUIRE(RiskScorer::categorize(50.0) == RiskCategory::HIGH);
    REQUIRE(RiskScorer::categorize(49.9) == RiskCategory::VERY_HIGH);
    REQUIRE(to_string(RiskCategory::VERY_HIGH) == "VERY_HIGH");

    REQUIRE(RiskScorer::interpret(90.0) == "Excellent");
    REQUIRE(RiskScorer::interpret(85.0) == "Good");
    REQUIRE(RiskScorer::interpret(70.0) == "Fair");
    REQUIRE(RiskScorer::interpret(60.0) == "Poor");
    REQUIRE(RiskScorer::interpret(10.0) == "Very Poor");
}

TEST_CASE("Diversified portfolio scores perfectly", "[RiskScorer]")
{
    RiskScorer scorer;
    auto result = scorer.score(diversified());

    REQUIRE_THAT(result.score, WithinAbs(100.0, 1e-9));
    REQUIRE(result.category == RiskCategory::LOW);
    REQUIRE(result.interpretation == "Excellent");
    REQUIRE(result.recommendations.empty());
    REQUIRE(result.sub_scores.size() == 4);
}

TEST_CASE("Concentrated portfolio", "[RiskScorer]")
{
    RiskScorer scorer;
    auto result = scorer.score(concentrated());

    // 0.6 / 0.5 weight, 0.45 / 0.30 factor share, one failed limit
    REQUIRE(result.sub_scores.at("volatility") == 100.0);
    REQUIRE_THAT(result.sub_scores.at("concentration"), WithinAbs(65.0, 1e-9));
    REQUIRE_THAT(result.sub_scores.at("factor_concentration"), WithinAbs(50.0, 1e-9));
    REQUIRE(result.sub_scores.at("compliance") == 75.0);
    REQUIRE_THAT(result.score, WithinAbs(71.25, 1e-9));
    REQUIRE(result.category == RiskCategory::MODERATE);
    REQUIRE(result.interpretation == "Fair");

    REQUIRE(result.recommendations.size() == 3);
    REQUIRE(result.recommendations[0] == "Reduce position size in largest holding AAPL");
    REQUIRE(result.recommendations[1] == "Reduce market exposure (sell high-beta stocks or add market hedges)");
    REQUIRE(result.recommendations[2] == "Add more positions to improve diversification");
}

TEST_CASE("Recommendations are not repeated", "[RiskScorer]")
{
    auto analysis = diversified();
    analysis.decomposition.volatility = 0.35;
    analysis.limits.max_volatility = 0.30;
    analysis.verdicts = {ComplianceVerdict{"max_volatility", "portfolio", 0.35, 0.30, ComplianceStatus::FAIL}};

    RiskScorer scorer;
    auto result = scorer.score(analysis);

    // The failed limit and the weakest sub-score give the same advice
    REQUIRE(std::count(result.recommendations.begin(), result.recommendations.end(),
                       "Reduce portfolio volatility through diversification or defensive positions") == 1);
}

TEST_CASE("Leverage and factor-loss advice", "[RiskScorer]")
{
    auto analysis = diversified();
    analysis.leverage = 2.0;
    analysis.verdicts = {ComplianceVerdict{"max_single_factor_loss", "market", 0.315, 0.25, ComplianceStatus::FAIL}};

    RiskScorer scorer;
    auto result = scorer.score(analysis);

    REQUIRE(contains(result.recommendations,
                     "Hedge market exposure to limit worst-case loss (31.5% in a market crash)"));
    REQUIRE(contains(result.recommendations, "Consider reducing leverage to limit downside risk"));
    REQUIRE(contains(result.recommendations, "Bring positions back within configured risk limits"));
}

TEST_CASE("Compliance sub-score floors at zero", "[RiskScorer]")
{
    auto analysis = diversified();
    for (int i = 0; i < 5; ++i)
    {
        analysis.verdicts.push_back(ComplianceVerdict{"max_factor_beta:market", "market", 1.0, 0.5,
                                                      ComplianceStatus::FAIL});
    }

    RiskScorer scorer;
    auto result = scorer.score(analysis);
    REQUIRE(result.sub_scores.at("compliance") == 0.0);
    REQUIRE_THAT(result.score, WithinAbs(80.0, 1e-9));
}

TEST_CASE("Configured limits replace scoring targets", "[RiskScorer]")
{
    auto analysis = diversified();
    analysis.limits.max_volatility = 0.10;

    RiskScorer scorer;
    REQUIRE_THAT(scorer.score(analysis).sub_scores.at("volatility"), WithinAbs(75.0, 1e-9));

    ScoringSettings tight;
    tight.volatility_target = 0.05;
    RiskScorer strict(tight);
    REQUIRE(strict.score(diversified()).sub_scores.at("volatility") == 0.0);
}

TEST_CASE("Scoring settings", "[RiskScorer]")
{
    auto settings = ScoringSettings::from_json({{"volatility_target", 0.25}, {"hhi_warning", 0.2}});
    REQUIRE(settings.volatility_target == 0.25);
    REQUIRE(settings.hhi_warning == 0.2);
    REQUIRE(settings.concentration_target == 0.40);

    REQUIRE_THROWS_AS(ScoringSettings::from_json({{"volatility_target", 0.0}}), ConfigurationError);

    ScoringSettings bad;
    bad.leverage_warning = -1.0;
    REQUIRE_THROWS_AS(RiskScorer(bad), ConfigurationError);
}

TEST_CASE("Score JSON", "[RiskScorer]")
{
    RiskScorer scorer;
    auto j = scorer.score(concentrated()).to_json();
    REQUIRE(j["category"] == "MODERATE");
    REQUIRE(j["sub_scores"].contains("compliance"));
    REQUIRE(j["recommendations"].size() == 3);
}
