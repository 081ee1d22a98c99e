/**
 * @file variance_decomposition.cpp
 * @brief Implementation of VarianceDecomposer
 */

#include "risk/variance_decomposition.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <string>

namespace riskengine
{
    namespace risk
    {
        void VarianceDecomposer::check_dimensions(Eigen::Index n_weights,
                                                  const Eigen::MatrixXd &betas,
                                                  const Eigen::VectorXd &residual_variance,
                                                  const Eigen::MatrixXd &factor_covariance)
        {
            const Eigen::Index k = factor_covariance.rows();

            if (factor_covariance.cols() != k)
            {
                throw ConfigurationError("Factor covariance must be square");
            }
            if (betas.rows() != n_weights || betas.cols() != k)
            {
                throw ConfigurationError("Beta matrix is " + std::to_string(betas.rows()) + "x" +
                                         std::to_string(betas.cols()) + ", expected " +
                                         std::to_string(n_weights) + "x" + std::to_string(k));
            }
            if (residual_variance.size() != n_weights)
            {
                throw ConfigurationError("Residual variance vector has " + std::to_string(residual_variance.size()) +
                                         " entries, expected " + std::to_string(n_weights));
            }
            if (!betas.allFinite() || !residual_variance.allFinite() || !factor_covariance.allFinite())
            {
                throw DataInsufficientError("Risk model inputs contain NaN or Inf values");
            }
        }

        VarianceDecomposition VarianceDecomposer::decompose(const Eigen::VectorXd &weights,
                                                            const Eigen::MatrixXd &betas,
                                                            const Eigen::VectorXd &residual_variance,
                                                            const Eigen::MatrixXd &factor_covariance)
        {
            check_dimensions(weights.size(), betas, residual_variance, factor_covariance);

            if (!weights.allFinite())
            {
                throw ConfigurationError("Portfolio weights contain NaN or Inf values");
            }

            VarianceDecomposition result;
            result.portfolio_betas = betas.transpose() * weights;
            result.factor_variance = result.portfolio_betas.dot(factor_covariance * result.portfolio_betas);
            result.idiosyncratic_variance = weights.cwiseAbs2().dot(residual_variance);
            result.total_variance = result.factor_variance + result.idiosyncratic_variance;

            require_finite_data(result.total_variance, "Portfolio variance");

            if (result.total_variance < 0.0)
            {
                throw DataInsufficientError("Portfolio variance is negative (" +
                                            std::to_string(result.total_variance) +
                                            "); factor covariance is not positive semi-definite");
            }

            result.volatility = std::sqrt(result.total_variance);

            if (result.total_variance > 0.0)
            {
                result.factor_share = result.factor_variance / result.total_variance;
                result.idiosyncratic_share = result.idiosyncratic_variance / result.total_variance;
            }

            return result;
        }

        Eigen::MatrixXd VarianceDecomposer::asset_covariance(const Eigen::MatrixXd &betas,
                                                             const Eigen::VectorXd &residual_variance,
                                                             const Eigen::MatrixXd &factor_covariance)
        {
            check_dimensions(betas.rows(), betas, residual_variance, factor_covariance);

            Eigen::MatrixXd covariance = betas * factor_covariance * betas.transpose();
            covariance.diagonal() += residual_variance;

            // Exact symmetry for the QP solver
            return 0.5 * (covariance + covariance.transpose());
        }

    } // namespace risk
} // namespace riskengine
