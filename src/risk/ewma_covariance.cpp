/**
 * @file ewma_covariance.cpp
 */

#include "risk/ewma_covariance.hpp"
#include "core/errors.hpp"
#include <cmath>

namespace riskengine
{
    namespace risk
    {
        EWMACovariance::EWMACovariance(double lambda) : lambda_(lambda)
        {
            if (!(lambda > 0.0 && lambda < 1.0))
            {
                throw ConfigurationError("EWMA decay must lie strictly between 0 and 1, got " +
                                         std::to_string(lambda));
            }
        }

        EWMACovariance EWMACovariance::from_half_life(double half_life)
        {
            if (!(half_life > 0.0))
            {
                throw ConfigurationError("EWMA half-life must be positive, got " + std::to_string(half_life));
            }
            return EWMACovariance(std::pow(0.5, 1.0 / half_life));
        }

        double EWMACovariance::half_life() const
        {
            return std::log(0.5) / std::log(lambda_);
        }

        Eigen::VectorXd EWMACovariance::weights(Eigen::Index periods) const
        {
            Eigen::VectorXd w(periods);
            double decay = 1.0;
            for (Eigen::Index t = periods - 1; t >= 0; --t)
            {
                w(t) = decay;
                decay *= lambda_;
            }
            return w / w.sum();
        }

        Eigen::MatrixXd EWMACovariance::estimate(const Eigen::MatrixXd &factor_returns) const
        {
            check_returns(factor_returns);

            const Eigen::VectorXd w = weights(factor_returns.rows());
            const Eigen::RowVectorXd mean = w.transpose() * factor_returns;
            const Eigen::MatrixXd x = factor_returns.rowwise() - mean;

            Eigen::MatrixXd cov = x.transpose() * w.asDiagonal() * x;
            return 0.5 * (cov + cov.transpose());
        }
    } // namespace risk
} // namespace riskengine
