/**
 * @file risk_contribution.cpp
 * @brief Implementation of RiskContributionCalculator
 */

#include "risk/risk_contribution.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace riskengine
{
    namespace risk
    {
        const std::string RiskContributionCalculator::kIdiosyncratic = "idiosyncratic";

        namespace
        {
            RiskContribution make_contribution(const std::string &name,
                                               double variance,
                                               const VarianceDecomposition &decomposition)
            {
                RiskContribution c;
                c.name = name;
                c.variance = variance;
                if (decomposition.total_variance > 0.0)
                {
                    c.percent = variance / decomposition.total_variance;
                    c.volatility = variance / decomposition.volatility;
                }
                return c;
            }
        } // namespace

        nlohmann::json RiskContribution::to_json() const
        {
            return nlohmann::json{
                {"name", name},
                {"variance", variance},
                {"percent", percent},
                {"volatility", volatility}};
        }

        std::vector<RiskContribution> RiskContributionCalculator::by_holding(const std::vector<std::string> &tickers,
                                                                             const Eigen::VectorXd &weights,
                                                                             const Eigen::MatrixXd &asset_covariance,
                                                                             const VarianceDecomposition &decomposition)
        {
            const Eigen::Index n = weights.size();
            if (static_cast<Eigen::Index>(tickers.size()) != n ||
                asset_covariance.rows() != n || asset_covariance.cols() != n)
            {
                throw ConfigurationError("Holding contribution inputs have inconsistent sizes");
            }

            // c_i = w_i (Σw)_i
            const Eigen::VectorXd contributions = weights.cwiseProduct(asset_covariance * weights);

            std::vector<RiskContribution> result;
            result.reserve(tickers.size());
            for (Eigen::Index i = 0; i < n; ++i)
            {
                require_finite_data(contributions(i), "Risk contribution of " + tickers[i]);
                result.push_back(make_contribution(tickers[i], contributions(i), decomposition));
            }
            return result;
        }

        std::vector<RiskContribution> RiskContributionCalculator::by_factor(const std::vector<std::string> &factor_names,
                                                                            const Eigen::MatrixXd &factor_covariance,
                                                                            const VarianceDecomposition &decomposition)
        {
            const Eigen::VectorXd &beta = decomposition.portfolio_betas;
            if (static_cast<Eigen::Index>(factor_names.size()) != beta.size() ||
                factor_covariance.rows() != beta.size())
            {
                throw ConfigurationError("Factor contribution inputs have inconsistent sizes");
            }

            const Eigen::VectorXd contributions = beta.cwiseProduct(factor_covariance * beta);

            std::vector<RiskContribution> result;
            result.reserve(factor_names.size() + 1);
            for (Eigen::Index f = 0; f < beta.size(); ++f)
            {
                require_finite_data(contributions(f), "Risk contribution of factor " + factor_names[f]);
                result.push_back(make_contribution(factor_names[f], contributions(f), decomposition));
            }
            result.push_back(make_contribution(kIdiosyncratic, decomposition.idiosyncratic_variance, decomposition));
            return result;
        }

        double RiskContributionCalculator::herfindahl(const Eigen::VectorXd &weights)
        {
            return weights.squaredNorm();
        }

        Eigen::VectorXd RiskContributionCalculator::worst_case_factor_losses(const std::vector<std::string> &factor_names,
                                                                             const Eigen::VectorXd &portfolio_betas,
                                                                             const std::map<std::string, double> &worst_case_moves,
                                                                             double leverage)
        {
            // Leverage is 0 only for a zero-net book; its losses are not scaled down
            const double scale = std::max(leverage, 1.0);
            Eigen::VectorXd losses = Eigen::VectorXd::Zero(portfolio_betas.size());
            for (Eigen::Index f = 0; f < portfolio_betas.size(); ++f)
            {
                auto move = worst_case_moves.find(factor_names[f]);
                if (move == worst_case_moves.end())
                {
                    continue;
                }
                losses(f) = std::max(0.0, portfolio_betas(f) * std::abs(move->second) * scale);
            }
            return losses;
        }

    } // namespace risk
} // namespace riskengine
