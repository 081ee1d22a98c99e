/**
 * @file risk_contribution.hpp
 * @brief Euler allocation of portfolio variance to holdings and factors
 *
 * For total variance V = wᵀΣw the contribution of holding i is
 * c_i = w_i (Σw)_i = w_i ∂V/∂w_i / 2, and the contributions sum to V.
 * Factor contributions use the same rule on portfolio betas:
 * c_f = β_f (Σf β)_f, which sum to the factor variance; the
 * idiosyncratic variance is reported as one more entry so that all
 * factor entries add up to V as well.
 */

#pragma once

#include "risk/variance_decomposition.hpp"
#include <Eigen/Dense>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {
        /**
         * @struct RiskContribution
         * @brief Variance attributed to one holding or factor
         */
        struct RiskContribution
        {
            std::string name;
            double variance = 0.0;   ///< Raw variance units
            double percent = 0.0;    ///< variance / total variance (fraction)
            double volatility = 0.0; ///< variance / portfolio volatility; sums to volatility

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskContributionCalculator
         * @brief Stateless Euler allocation
         */
        class RiskContributionCalculator
        {
        public:
            static const std::string kIdiosyncratic; ///< Name of the residual entry in by_factor

            /**
             * @brief Contribution of each holding
             * @param tickers Holding names (n)
             * @param weights Holding weights (n)
             * @param asset_covariance Full asset covariance (n x n)
             * @param decomposition Decomposition of the same portfolio
             */
            static std::vector<RiskContribution> by_holding(const std::vector<std::string> &tickers,
                                                            const Eigen::VectorXd &weights,
                                                            const Eigen::MatrixXd &asset_covariance,
                                                            const VarianceDecomposition &decomposition);

            /**
             * @brief Contribution of each factor plus one idiosyncratic entry
             */
            static std::vector<RiskContribution> by_factor(const std::vector<std::string> &factor_names,
                                                           const Eigen::MatrixXd &factor_covariance,
                                                           const VarianceDecomposition &decomposition);

            /**
             * @brief Herfindahl index Σ w_i²
             */
            static double herfindahl(const Eigen::VectorXd &weights);

            /**
             * @brief Loss from a crash of each factor
             *
             * A factor falling by move_f costs β_f × move_f × leverage when
             * β_f is positive; negative betas gain in the crash and count as
             * zero. Factors without a configured move get zero.
             *
             * @param factor_names Factor order of portfolio_betas
             * @param portfolio_betas Bᵀw
             * @param worst_case_moves Adverse move magnitude per factor (0.35 = 35% drop)
             * @param leverage Gross / |net| of the portfolio; values below 1 count as 1
             * @return Loss magnitude per factor (fraction of portfolio value)
             */
            static Eigen::VectorXd worst_case_factor_losses(const std::vector<std::string> &factor_names,
                                                            const Eigen::VectorXd &portfolio_betas,
                                                            const std::map<std::string, double> &worst_case_moves,
                                                            double leverage = 1.0);
        };

    } // namespace risk
} // namespace riskengine
