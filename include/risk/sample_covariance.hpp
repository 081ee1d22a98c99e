/**
 * @file sample_covariance.hpp
 * @brief Equally weighted factor covariance
 */

#pragma once

#include "risk/covariance_estimator.hpp"

namespace riskengine
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief XᶜᵀXᶜ / (T - ddof) over the demeaned factor returns Xᶜ
         *
         * The default factor covariance. It is positive semi-definite, so
         * the factor variance term wᵀBΣfBᵀw of a decomposition is never
         * negative.
         */
        class SampleCovariance : public CovarianceEstimator
        {
        public:
            /// @param unbiased Divide by T-1 when true, by T otherwise
            explicit SampleCovariance(bool unbiased = true);

            Eigen::MatrixXd estimate(const Eigen::MatrixXd &factor_returns) const override;

            std::string name() const override { return "sample"; }

            bool unbiased() const { return unbiased_; }

        private:
            bool unbiased_;
        };

    } // namespace risk
} // namespace riskengine
