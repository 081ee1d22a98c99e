#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "risk/risk_contribution.hpp"
#include "risk/variance_decomposition.hpp"
#include <limits>

using namespace riskengine;
using namespace riskengine::risk;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace
{
    // Two holdings, two factors
    class DecompositionFixture
    {
    protected:
        Eigen::VectorXd weights_;
        Eigen::MatrixXd betas_;
        Eigen::VectorXd residual_;
        Eigen::MatrixXd factor_cov_;
        std::vector<std::string> tickers_{"AAA", "BBB"};
        std::vector<std::string> factors_{"market", "value"};

        DecompositionFixture()
        {
            weights_ = Eigen::VectorXd(2);
            weights_ << 0.6, 0.4;

            betas_ = Eigen::MatrixXd(2, 2);
            betas_ << 1.2, -0.3,
                0.8, 0.5;

            residual_ = Eigen::VectorXd(2);
            residual_ << 0.04, 0.02;

            factor_cov_ = Eigen::MatrixXd(2, 2);
            factor_cov_ << 0.0324, 0.0036,
                0.0036, 0.0100;
        }
    };
} // namespace

TEST_CASE_METHOD(DecompositionFixture, "Variance splits into factor and idiosyncratic parts", "[Decomposition]")
{
    auto split = VarianceDecomposer::decompose(weights_, betas_, residual_, factor_cov_);

    // b = Bᵀw = (1.04, 0.02)
    REQUIRE_THAT(split.portfolio_betas(0), WithinAbs(1.04, 1e-12));
    REQUIRE_THAT(split.portfolio_betas(1), WithinAbs(0.02, 1e-12));

    const double factor_var = 1.04 * 1.04 * 0.0324 + 2 * 1.04 * 0.02 * 0.0036 + 0.02 * 0.02 * 0.01;
    const double idio_var = 0.36 * 0.04 + 0.16 * 0.02;

    REQUIRE_THAT(split.factor_variance, WithinAbs(factor_var, 1e-14));
    REQUIRE_THAT(split.idiosyncratic_variance, WithinAbs(idio_var, 1e-14));
    REQUIRE_THAT(split.total_variance, WithinAbs(factor_var + idio_var, 1e-14));
    REQUIRE_THAT(split.volatility, WithinAbs(std::sqrt(factor_var + idio_var), 1e-14));
    REQUIRE_THAT(split.factor_share + split.idiosyncratic_share, WithinAbs(1.0, 1e-14));
}

TEST_CASE_METHOD(DecompositionFixture, "Decomposition matches the full asset covariance", "[Decomposition]")
{
    auto split = VarianceDecomposer::decompose(weights_, betas_, residual_, factor_cov_);
    Eigen::MatrixXd sigma = VarianceDecomposer::asset_covariance(betas_, residual_, factor_cov_);

    REQUIRE_THAT((sigma - sigma.transpose()).norm(), WithinAbs(0.0, 1e-16));
    REQUIRE_THAT(weights_.dot(sigma * weights_), WithinRel(split.total_variance, 1e-12));
}

TEST_CASE_METHOD(DecompositionFixture, "Euler contributions add up", "[Contribution]")
{
    auto split = VarianceDecomposer::decompose(weights_, betas_, residual_, factor_cov_);
    Eigen::MatrixXd sigma = VarianceDecomposer::asset_covariance(betas_, residual_, factor_cov_);

    SECTION("By holding")
    {
        auto contributions = RiskContributionCalculator::by_holding(tickers_, weights_, sigma, split);
        REQUIRE(contributions.size() == 2);

        double variance = 0.0, percent = 0.0, vol = 0.0;
        for (const auto &c : contributions)
        {
            variance += c.variance;
            percent += c.percent;
            vol += c.volatility;
        }
        REQUIRE_THAT(variance, WithinRel(split.total_variance, 1e-12));
        REQUIRE_THAT(percent, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(vol, WithinRel(split.volatility, 1e-12));
        REQUIRE(contributions[0].name == "AAA");
    }

    SECTION("By factor with an idiosyncratic entry")
    {
        auto contributions = RiskContributionCalculator::by_factor(factors_, factor_cov_, split);
        REQUIRE(contributions.size() == 3);
        REQUIRE(contributions.back().name == RiskContributionCalculator::kIdiosyncratic);
        REQUIRE_THAT(contributions.back().variance, WithinAbs(split.idiosyncratic_variance, 1e-16));

        double factor_sum = contributions[0].variance + contributions[1].variance;
        REQUIRE_THAT(factor_sum, WithinRel(split.factor_variance, 1e-12));

        double percent = 0.0;
        for (const auto &c : contributions)
        {
            percent += c.percent;
        }
        REQUIRE_THAT(percent, WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("Short positions can carry negative contributions", "[Contribution]")
{
    Eigen::VectorXd w(2);
    w << 1.5, -0.5;
    Eigen::MatrixXd B(2, 1);
    B << 1.0, 1.0;
    Eigen::VectorXd d(2);
    d << 0.01, 0.01;
    Eigen::MatrixXd F = Eigen::MatrixXd::Constant(1, 1, 0.04);

    auto split = VarianceDecomposer::decompose(w, B, d, F);
    auto sigma = VarianceDecomposer::asset_covariance(B, d, F);
    auto contributions = RiskContributionCalculator::by_holding({"LONG", "SHORT"}, w, sigma, split);

    // Net beta 1.0, so factor variance equals the factor's own variance
    REQUIRE_THAT(split.factor_variance, WithinAbs(0.04, 1e-14));
    REQUIRE(contributions[1].variance < 0.0);
    REQUIRE_THAT(contributions[0].variance + contributions[1].variance,
                 WithinRel(split.total_variance, 1e-12));
}

TEST_CASE("Degenerate portfolios", "[Decomposition]")
{
    Eigen::MatrixXd B = Eigen::MatrixXd::Ones(2, 1);
    Eigen::VectorXd d = Eigen::VectorXd::Constant(2, 0.01);
    Eigen::MatrixXd F = Eigen::MatrixXd::Constant(1, 1, 0.04);

    SECTION("All-zero weights give zero variance and zero shares")
    {
        auto split = VarianceDecomposer::decompose(Eigen::VectorXd::Zero(2), B, d, F);
        REQUIRE(split.total_variance == 0.0);
        REQUIRE(split.volatility == 0.0);
        REQUIRE(split.factor_share == 0.0);
        REQUIRE(split.idiosyncratic_share == 0.0);

        auto by_factor = RiskContributionCalculator::by_factor({"market"}, F, split);
        REQUIRE(by_factor[0].percent == 0.0);
        REQUIRE(by_factor[0].volatility == 0.0);
    }

    SECTION("Dimension mismatch")
    {
        REQUIRE_THROWS_AS(VarianceDecomposer::decompose(Eigen::VectorXd::Ones(3), B, d, F),
                          ConfigurationError);
    }

    SECTION("Non-finite weights")
    {
        Eigen::VectorXd w(2);
        w << 0.5, std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(VarianceDecomposer::decompose(w, B, d, F), ConfigurationError);
    }

    SECTION("Non-finite model")
    {
        Eigen::VectorXd bad = d;
        bad(1) = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(VarianceDecomposer::decompose(Eigen::VectorXd::Ones(2), B, bad, F),
                          DataInsufficientError);
    }
}

TEST_CASE("Herfindahl and worst-case factor losses", "[Contribution]")
{
    Eigen::VectorXd w(4);
    w << 0.25, 0.25, 0.25, 0.25;
    REQUIRE_THAT(RiskContributionCalculator::herfindahl(w), WithinAbs(0.25, 1e-15));

    Eigen::VectorXd b(3);
    b << 0.9, -0.4, 0.2;
    std::map<std::string, double> moves{{"market", 0.35}, {"momentum", 0.50}};

    auto losses = RiskContributionCalculator::worst_case_factor_losses({"market", "momentum", "value"}, b, moves);

    REQUIRE_THAT(losses(0), WithinAbs(0.315, 1e-12));
    // Negative beta gains when the factor crashes
    REQUIRE(losses(1) == 0.0);
    // No configured move
    REQUIRE(losses(2) == 0.0);

    // Leverage amplifies the loss; a zero-net book is not scaled down
    auto levered = RiskContributionCalculator::worst_case_factor_losses({"market", "momentum", "value"}, b, moves, 2.0);
    REQUIRE_THAT(levered(0), WithinAbs(0.63, 1e-12));
    REQUIRE(levered(1) == 0.0);
    auto hedged = RiskContributionCalculator::worst_case_factor_losses({"market", "momentum", "value"}, b, moves, 0.0);
    REQUIRE_THAT(hedged(0), WithinAbs(0.315, 1e-12));
}

TEST_CASE_METHOD(DecompositionFixture, "A single holding has no diversification benefit", "[Decomposition]")
{
    Eigen::VectorXd w(1);
    w << 1.0;
    Eigen::MatrixXd b = betas_.topRows(1);
    Eigen::VectorXd d = residual_.head(1);

    auto split = VarianceDecomposer::decompose(w, b, d, factor_cov_);

    const Eigen::VectorXd row = b.row(0).transpose();
    REQUIRE_THAT(split.idiosyncratic_variance, WithinAbs(0.04, 1e-15));
    REQUIRE_THAT(split.factor_variance, WithinRel(row.dot(factor_cov_ * row), 1e-12));

    auto contributions = RiskContributionCalculator::by_holding(
        {"AAA"}, w, VarianceDecomposer::asset_covariance(b, d, factor_cov_), split);
    REQUIRE_THAT(contributions[0].percent, WithinAbs(1.0, 1e-12));
}
