#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "risk/covariance_factory.hpp"
#include <cmath>
#include <limits>
#include <random>

using namespace riskengine;
using namespace riskengine::risk;
using Catch::Matchers::WithinAbs;

namespace
{
    // Two months of three factors
    Eigen::MatrixXd two_periods()
    {
        Eigen::MatrixXd r(2, 3);
        r << 0.01, 0.02, -0.01,
            0.02, -0.01, 0.01;
        return r;
    }

    // Five years of monthly market, momentum and value returns
    Eigen::MatrixXd five_years()
    {
        std::mt19937 rng(7);
        std::normal_distribution<double> shock(0.0, 0.04);
        Eigen::MatrixXd r(60, 3);
        for (Eigen::Index t = 0; t < r.rows(); ++t)
        {
            const double market = shock(rng);
            r(t, 0) = market;
            r(t, 1) = 0.3 * market + 0.5 * shock(rng);
            r(t, 2) = -0.2 * market + 0.5 * shock(rng);
        }
        return r;
    }
} // namespace

TEST_CASE("Sample covariance", "[Covariance]")
{
    SampleCovariance estimator;
    REQUIRE(estimator.unbiased());
    REQUIRE(estimator.name() == "sample");

    SECTION("Two periods by hand")
    {
        const Eigen::MatrixXd cov = estimator.estimate(two_periods());
        REQUIRE(cov.rows() == 3);
        REQUIRE_THAT(cov(0, 0), WithinAbs(0.00005, 1e-15));
        REQUIRE_THAT(cov(1, 1), WithinAbs(0.00045, 1e-15));
        REQUIRE_THAT(cov(0, 1), WithinAbs(-0.00015, 1e-15));
        REQUIRE_THAT(cov(2, 1), WithinAbs(-0.0003, 1e-15));
        REQUIRE(cov == cov.transpose());
    }

    SECTION("Dividing by T instead of T-1")
    {
        const auto data = five_years();
        const Eigen::MatrixXd biased = SampleCovariance(false).estimate(data);
        const Eigen::MatrixXd unbiased = estimator.estimate(data);
        REQUIRE_THAT((unbiased - biased * 60.0 / 59.0).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-15));
    }
}

TEST_CASE("Estimators reject unusable factor returns", "[Covariance]")
{
    SampleCovariance sample;
    EWMACovariance ewma;

    REQUIRE_THROWS_AS(sample.estimate(Eigen::MatrixXd(0, 0)), DataInsufficientError);

    Eigen::MatrixXd one_period(1, 3);
    one_period << 0.01, 0.02, 0.03;
    REQUIRE_THROWS_AS(sample.estimate(one_period), DataInsufficientError);
    REQUIRE_THROWS_AS(ewma.estimate(one_period), DataInsufficientError);

    Eigen::MatrixXd gap = two_periods();
    gap(1, 1) = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(sample.estimate(gap), DataInsufficientError);
}

TEST_CASE("EWMA covariance", "[Covariance][EWMA]")
{
    SECTION("Decay and half-life")
    {
        EWMACovariance ewma(0.5);
        REQUIRE(ewma.name() == "ewma");
        REQUIRE_THAT(ewma.half_life(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(EWMACovariance::from_half_life(12.0).half_life(), WithinAbs(12.0, 1e-9));

        const Eigen::VectorXd w = ewma.weights(3);
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-15));
        REQUIRE_THAT(w(2), WithinAbs(4.0 / 7.0, 1e-14));
        REQUIRE_THAT(w(0), WithinAbs(1.0 / 7.0, 1e-14));
    }

    SECTION("Decay outside (0, 1)")
    {
        REQUIRE_THROWS_AS(EWMACovariance(0.0), ConfigurationError);
        REQUIRE_THROWS_AS(EWMACovariance(1.0), ConfigurationError);
        REQUIRE_THROWS_AS(EWMACovariance(-0.5), ConfigurationError);
        REQUIRE_THROWS_AS(EWMACovariance::from_half_life(0.0), ConfigurationError);
    }

    SECTION("Weighted mean and variance by hand")
    {
        // Weights 1/7, 2/7, 4/7; weighted mean -1/7
        Eigen::MatrixXd r(3, 1);
        r << 1.0, -1.0, 0.0;
        REQUIRE_THAT(EWMACovariance(0.5).estimate(r)(0, 0), WithinAbs(20.0 / 49.0, 1e-14));
    }

    SECTION("Positive semi-definite")
    {
        const Eigen::MatrixXd cov = EWMACovariance(0.97).estimate(five_years());
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(cov);
        REQUIRE(eig.eigenvalues().minCoeff() >= -1e-12);
    }

    SECTION("Recent volatility dominates")
    {
        Eigen::MatrixXd rising(100, 2);
        for (int t = 0; t < 100; ++t)
        {
            const double move = (t % 2 == 0 ? 1.0 : -1.0) * (1.0 + t / 25.0) * 0.01;
            rising.row(t) << move, move;
        }
        REQUIRE(EWMACovariance(0.94).estimate(rising)(0, 0) > SampleCovariance().estimate(rising)(0, 0));
    }
}

TEST_CASE("Annualization and correlation", "[Covariance]")
{
    SampleCovariance estimator;
    const auto data = five_years();

    const Eigen::MatrixXd annual = estimator.annualized(data, 12);
    REQUIRE_THAT((annual - 12.0 * estimator.estimate(data)).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-15));
    REQUIRE_THROWS_AS(estimator.annualized(data, 0), ConfigurationError);

    const Eigen::MatrixXd corr = CovarianceEstimator::correlation(annual);
    REQUIRE((corr.diagonal().array() == 1.0).all());
    REQUIRE(corr.cwiseAbs().maxCoeff() <= 1.0);

    // With two periods every pair moves in lockstep or against it
    const Eigen::MatrixXd lockstep = CovarianceEstimator::correlation(estimator.estimate(two_periods()));
    REQUIRE_THAT(lockstep(0, 1), WithinAbs(-1.0, 1e-12));
    REQUIRE_THAT(lockstep(0, 2), WithinAbs(1.0, 1e-12));

    Eigen::MatrixXd flat = Eigen::MatrixXd::Zero(2, 2);
    flat(0, 0) = 0.04;
    REQUIRE_THROWS_AS(CovarianceEstimator::correlation(flat), DataInsufficientError);
}

TEST_CASE("Configured estimators", "[Covariance][Config]")
{
    SECTION("Sample by default")
    {
        REQUIRE(make_covariance_estimator(CovarianceSettings())->name() == "sample");
    }

    SECTION("EWMA by decay, case-insensitive")
    {
        auto settings = CovarianceSettings::from_json({{"type", "EWMA"}, {"lambda", 0.97}});
        auto estimator = make_covariance_estimator(settings);
        REQUIRE(dynamic_cast<EWMACovariance &>(*estimator).lambda() == 0.97);
    }

    SECTION("EWMA by half-life")
    {
        auto settings = CovarianceSettings::from_json({{"type", "ewma"}, {"half_life", 6}});
        auto estimator = make_covariance_estimator(settings);
        REQUIRE_THAT(dynamic_cast<EWMACovariance &>(*estimator).half_life(), WithinAbs(6.0, 1e-9));
        REQUIRE(settings.to_json().contains("half_life"));
    }

    SECTION("Rejected settings")
    {
        CovarianceSettings garch;
        garch.type = "garch";
        REQUIRE_THROWS_AS(make_covariance_estimator(garch), ConfigurationError);
        REQUIRE_THROWS_AS(CovarianceSettings::from_json({{"lambda", "fast"}}), ConfigurationError);
        REQUIRE_THROWS_AS(CovarianceSettings::from_json({{"type", 3}}), ConfigurationError);
        REQUIRE_THROWS_AS(CovarianceSettings::from_json({{"lambda", 0.9}, {"half_life", 6}}), ConfigurationError);
    }

    REQUIRE(covariance_estimator_types() == std::vector<std::string>{"sample", "ewma"});
}
