/**
 * @file ewma_covariance.hpp
 * @brief Exponentially weighted factor covariance
 *
 * Period t of T gets weight w_t ∝ λ^(T-1-t), normalized to sum to one,
 * and both the mean and the covariance use the same weights:
 *
 *     Σ = Σ_t w_t (r_t - μ_w)(r_t - μ_w)ᵀ
 *
 * λ = 0.94 on monthly data gives a half-life of about 11 months.
 *
 * References:
 * - J.P. Morgan (1996), "RiskMetrics Technical Document"
 */

#pragma once

#include "risk/covariance_estimator.hpp"

namespace riskengine
{
    namespace risk
    {

        class EWMACovariance : public CovarianceEstimator
        {
        public:
            /// @throws ConfigurationError unless 0 < lambda < 1
            explicit EWMACovariance(double lambda = 0.94);

            /**
             * @brief Decay chosen so an observation's weight halves every half_life periods
             * @throws ConfigurationError if half_life is not positive
             */
            static EWMACovariance from_half_life(double half_life);

            Eigen::MatrixXd estimate(const Eigen::MatrixXd &factor_returns) const override;

            std::string name() const override { return "ewma"; }

            double lambda() const { return lambda_; }

            double half_life() const;

            /// Normalized weights for a window of the given length, oldest first
            Eigen::VectorXd weights(Eigen::Index periods) const;

        private:
            double lambda_;
        };

    } // namespace risk
} // namespace riskengine
