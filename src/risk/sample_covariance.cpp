/**
 * @file sample_covariance.cpp
 */

#include "risk/sample_covariance.hpp"

namespace riskengine
{
    namespace risk
    {
        SampleCovariance::SampleCovariance(bool unbiased) : unbiased_(unbiased)
        {
        }

        Eigen::MatrixXd SampleCovariance::estimate(const Eigen::MatrixXd &factor_returns) const
        {
            check_returns(factor_returns);

            const Eigen::MatrixXd x = demeaned(factor_returns);
            const double periods = static_cast<double>(x.rows());
            const double divisor = unbiased_ ? periods - 1.0 : periods;

            Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(x.cols(), x.cols());
            cov.selfadjointView<Eigen::Lower>().rankUpdate(x.transpose(), 1.0 / divisor);
            return cov.selfadjointView<Eigen::Lower>().toDenseMatrix();
        }
    } // namespace risk
} // namespace riskengine
