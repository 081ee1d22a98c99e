/**
 * @file covariance_estimator.cpp
 * @brief Shared checks and conversions for factor covariance estimators
 */

#include "risk/covariance_estimator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace riskengine
{
    namespace risk
    {
        Eigen::MatrixXd CovarianceEstimator::annualized(const Eigen::MatrixXd &factor_returns,
                                                        int periods_per_year) const
        {
            if (periods_per_year < 1)
            {
                throw ConfigurationError("periods_per_year must be at least 1, got " +
                                         std::to_string(periods_per_year));
            }
            return estimate(factor_returns) * static_cast<double>(periods_per_year);
        }

        Eigen::MatrixXd CovarianceEstimator::correlation(const Eigen::MatrixXd &covariance)
        {
            if (covariance.rows() == 0 || covariance.rows() != covariance.cols())
            {
                throw ConfigurationError("Covariance matrix must be square and non-empty");
            }

            const Eigen::VectorXd variances = covariance.diagonal();
            for (Eigen::Index k = 0; k < variances.size(); ++k)
            {
                if (!(variances(k) > 0.0))
                {
                    throw DataInsufficientError("Factor " + std::to_string(k) +
                                                " has no return variance over the window");
                }
            }

            const Eigen::VectorXd inv_sd = variances.cwiseSqrt().cwiseInverse();
            Eigen::MatrixXd corr = inv_sd.asDiagonal() * covariance * inv_sd.asDiagonal();
            corr = corr.unaryExpr([](double v) { return std::clamp(v, -1.0, 1.0); });
            corr.diagonal().setOnes();
            return corr;
        }

        void CovarianceEstimator::check_returns(const Eigen::MatrixXd &factor_returns)
        {
            if (factor_returns.cols() == 0)
            {
                throw DataInsufficientError("No factor returns to estimate covariance from");
            }
            if (factor_returns.rows() < 2)
            {
                throw DataInsufficientError("Factor covariance needs 2 or more periods, got " +
                                            std::to_string(factor_returns.rows()));
            }
            if (!factor_returns.allFinite())
            {
                throw DataInsufficientError("Factor returns contain NaN or Inf");
            }
        }

        Eigen::MatrixXd CovarianceEstimator::demeaned(const Eigen::MatrixXd &factor_returns)
        {
            return factor_returns.rowwise() - factor_returns.colwise().mean();
        }
    } // namespace risk
} // namespace riskengine
