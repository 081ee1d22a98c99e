/**
 * @file risk_analysis_result.hpp
 * @brief Immutable output of one portfolio risk analysis
 */

#pragma once

#include "portfolio/holding.hpp"
#include "risk/factor_exposure_estimator.hpp"
#include "risk/limits_checker.hpp"
#include "risk/risk_contribution.hpp"
#include "risk/risk_limits.hpp"
#include "risk/variance_decomposition.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {
        /**
         * @struct RiskAnalysisResult
         * @brief Snapshot of everything computed for a portfolio
         *
         * Built once by the engine and shared as
         * std::shared_ptr<const RiskAnalysisResult>; never mutated after
         * construction, so cached copies are safe to hand to several callers.
         */
        struct RiskAnalysisResult
        {
            std::string fingerprint;
            portfolio::AnalysisWindow window;
            std::string valuation_date;

            // Mapped holdings
            std::vector<std::string> tickers;
            Eigen::VectorXd weights;
            Eigen::VectorXd dollar_exposures;
            double total_value = 0.0;
            double leverage = 0.0;
            double herfindahl = 0.0;
            std::vector<std::string> unmapped_cash;

            // Factor model
            std::vector<std::string> factor_names;
            FactorBetaMatrix betas;
            Eigen::MatrixXd factor_covariance;  ///< Annualized
            Eigen::MatrixXd factor_correlation;

            // Risk
            VarianceDecomposition decomposition;
            std::vector<RiskContribution> holding_contributions;
            std::vector<RiskContribution> factor_contributions; ///< Factors, then idiosyncratic
            Eigen::VectorXd factor_losses;                      ///< Worst-case loss per factor

            // Compliance
            RiskLimitSet limits;
            std::vector<ComplianceVerdict> verdicts;

            /**
             * @brief Inputs to LimitsChecker derived from this result
             */
            RiskMetrics metrics() const;

            /**
             * @brief Per-factor Euler share of total variance, in factor order
             */
            Eigen::VectorXd factor_shares() const;

            /**
             * @brief Index of the holding with the largest |weight|, or -1 when empty
             */
            int largest_holding() const;

            /**
             * @brief Index of the factor with the largest variance share, or -1 when none
             */
            int largest_factor() const;

            size_t failed_verdicts() const;

            nlohmann::json to_json() const;
        };

    } // namespace risk
} // namespace riskengine
