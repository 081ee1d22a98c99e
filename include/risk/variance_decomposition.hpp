/**
 * @file variance_decomposition.hpp
 * @brief Portfolio variance split into factor and idiosyncratic parts
 *
 * With weights w, holdings x factors betas B, factor covariance Σf and
 * residual variances d:
 *
 *     portfolio betas      β = Bᵀ w
 *     factor variance        = βᵀ Σf β  (= wᵀ B Σf Bᵀ w)
 *     idiosyncratic variance = Σ w_i² d_i
 *     total variance         = factor + idiosyncratic
 *
 * Residuals are assumed independent across holdings. All quantities are
 * annual when Σf and d are annualized.
 */

#pragma once

#include <Eigen/Dense>

namespace riskengine
{
    namespace risk
    {
        /**
         * @struct VarianceDecomposition
         * @brief Output of VarianceDecomposer::decompose
         */
        struct VarianceDecomposition
        {
            double total_variance = 0.0;
            double factor_variance = 0.0;
            double idiosyncratic_variance = 0.0;
            double volatility = 0.0;          ///< sqrt(total_variance)
            double factor_share = 0.0;        ///< factor / total, 0 when total is 0
            double idiosyncratic_share = 0.0; ///< idiosyncratic / total, 0 when total is 0
            Eigen::VectorXd portfolio_betas;  ///< Bᵀw, one per factor
        };

        /**
         * @class VarianceDecomposer
         * @brief Stateless variance decomposition
         *
         * Usage Example:
         * @code
         * auto split = VarianceDecomposer::decompose(w, B, d, factor_cov);
         * std::cout << "Systematic share: " << split.factor_share << "\n";
         * @endcode
         */
        class VarianceDecomposer
        {
        public:
            /**
             * @brief Decompose portfolio variance
             * @param weights Holding weights (n)
             * @param betas Beta matrix (n x k)
             * @param residual_variance Idiosyncratic variances (n)
             * @param factor_covariance Factor covariance (k x k)
             * @return Decomposition; an all-zero weight vector gives zero variance
             * @throws ConfigurationError on dimension mismatch or non-finite weights
             * @throws DataInsufficientError on non-finite model inputs or results
             */
            static VarianceDecomposition decompose(const Eigen::VectorXd &weights,
                                                   const Eigen::MatrixXd &betas,
                                                   const Eigen::VectorXd &residual_variance,
                                                   const Eigen::MatrixXd &factor_covariance);

            /**
             * @brief Full asset covariance B Σf Bᵀ + diag(d)
             */
            static Eigen::MatrixXd asset_covariance(const Eigen::MatrixXd &betas,
                                                    const Eigen::VectorXd &residual_variance,
                                                    const Eigen::MatrixXd &factor_covariance);

        private:
            static void check_dimensions(Eigen::Index n_weights,
                                         const Eigen::MatrixXd &betas,
                                         const Eigen::VectorXd &residual_variance,
                                         const Eigen::MatrixXd &factor_covariance);
        };

    } // namespace risk
} // namespace riskengine
