/**
 * @file covariance_estimator.hpp
 * @brief Factor covariance estimation from aligned factor proxy returns
 *
 * Estimators produce a per-period covariance of the factor return
 * matrix (rows = periods, cols = factors). The engine annualizes it so
 * the factor and residual terms of the variance decomposition share
 * units.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace riskengine
{
    namespace risk
    {

        /**
         * @class CovarianceEstimator
         * @brief Interface for factor covariance estimators
         *
         * @code
         * SampleCovariance estimator;
         * Eigen::MatrixXd sigma_f = estimator.annualized(factors.values, 12);
         * @endcode
         */
        class CovarianceEstimator
        {
        public:
            virtual ~CovarianceEstimator() = default;

            /**
             * @brief Per-period covariance, symmetric (n_factors x n_factors)
             * @throws DataInsufficientError if fewer than 2 rows or any value is non-finite
             */
            virtual Eigen::MatrixXd estimate(const Eigen::MatrixXd &factor_returns) const = 0;

            virtual std::string name() const = 0;

            /**
             * @brief estimate() scaled by periods_per_year
             * @throws ConfigurationError if periods_per_year < 1
             */
            Eigen::MatrixXd annualized(const Eigen::MatrixXd &factor_returns, int periods_per_year) const;

            /**
             * @brief Correlation with unit diagonal, off-diagonals clipped to [-1, 1]
             * @throws DataInsufficientError if a factor has zero variance
             */
            static Eigen::MatrixXd correlation(const Eigen::MatrixXd &covariance);

        protected:
            static void check_returns(const Eigen::MatrixXd &factor_returns);

            /// Column means removed
            static Eigen::MatrixXd demeaned(const Eigen::MatrixXd &factor_returns);
        };

    } // namespace risk
} // namespace riskengine
