/**
 * @file risk_analysis_result.cpp
 * @brief Implementation of RiskAnalysisResult helpers and serialization
 */

#include "risk/risk_analysis_result.hpp"
#include <cmath>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            nlohmann::json matrix_to_json(const Eigen::MatrixXd &m)
            {
                nlohmann::json rows = nlohmann::json::array();
                for (Eigen::Index i = 0; i < m.rows(); ++i)
                {
                    nlohmann::json row = nlohmann::json::array();
                    for (Eigen::Index j = 0; j < m.cols(); ++j)
                    {
                        row.push_back(m(i, j));
                    }
                    rows.push_back(row);
                }
                return rows;
            }

            nlohmann::json contributions_to_json(const std::vector<RiskContribution> &items)
            {
                nlohmann::json out = nlohmann::json::array();
                for (const auto &item : items)
                {
                    out.push_back(item.to_json());
                }
                return out;
            }
        } // namespace

        Eigen::VectorXd RiskAnalysisResult::factor_shares() const
        {
            const Eigen::Index k = static_cast<Eigen::Index>(factor_names.size());
            Eigen::VectorXd shares = Eigen::VectorXd::Zero(k);
            // factor_contributions lists the factors first, in factor order
            for (Eigen::Index f = 0; f < k && f < static_cast<Eigen::Index>(factor_contributions.size()); ++f)
            {
                shares(f) = factor_contributions[f].percent;
            }
            return shares;
        }

        RiskMetrics RiskAnalysisResult::metrics() const
        {
            RiskMetrics m;
            m.volatility = decomposition.volatility;
            m.systematic_share = decomposition.factor_share;
            m.leverage = leverage;
            m.tickers = tickers;
            m.weights = weights;
            m.factor_names = factor_names;
            m.portfolio_betas = decomposition.portfolio_betas;
            m.factor_shares = factor_shares();
            m.factor_losses = factor_losses;
            return m;
        }

        int RiskAnalysisResult::largest_holding() const
        {
            int best = -1;
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (best < 0 || std::abs(weights(i)) > std::abs(weights(best)))
                {
                    best = static_cast<int>(i);
                }
            }
            return best;
        }

        int RiskAnalysisResult::largest_factor() const
        {
            const Eigen::VectorXd shares = factor_shares();
            int best = -1;
            for (Eigen::Index f = 0; f < shares.size(); ++f)
            {
                if (best < 0 || shares(f) > shares(best))
                {
                    best = static_cast<int>(f);
                }
            }
            return best;
        }

        size_t RiskAnalysisResult::failed_verdicts() const
        {
            return LimitsChecker::count_failures(verdicts);
        }

        nlohmann::json RiskAnalysisResult::to_json() const
        {
            nlohmann::json j;
            j["fingerprint"] = fingerprint;
            j["window"] = {{"start_date", window.start_date}, {"end_date", window.end_date}};
            j["valuation_date"] = valuation_date;

            nlohmann::json holdings = nlohmann::json::array();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                nlohmann::json h{
                    {"ticker", tickers[i]},
                    {"weight", weights(idx)},
                    {"dollars", dollar_exposures(idx)}};
                if (i < betas.rows.size())
                {
                    const auto &row = betas.rows[i];
                    nlohmann::json beta_obj = nlohmann::json::object();
                    for (size_t f = 0; f < factor_names.size(); ++f)
                    {
                        beta_obj[factor_names[f]] = row.betas(static_cast<Eigen::Index>(f));
                    }
                    h["betas"] = beta_obj;
                    h["residual_variance"] = row.residual_variance;
                    h["r_squared"] = row.r_squared;
                    h["observations"] = row.observations;
                }
                holdings.push_back(h);
            }
            j["holdings"] = holdings;
            j["total_value"] = total_value;
            j["leverage"] = leverage;
            j["herfindahl"] = herfindahl;
            j["unmapped_cash"] = unmapped_cash;

            nlohmann::json portfolio_betas = nlohmann::json::object();
            nlohmann::json losses = nlohmann::json::object();
            for (size_t f = 0; f < factor_names.size(); ++f)
            {
                const auto idx = static_cast<Eigen::Index>(f);
                portfolio_betas[factor_names[f]] = decomposition.portfolio_betas(idx);
                losses[factor_names[f]] = idx < factor_losses.size() ? factor_losses(idx) : 0.0;
            }
            j["factors"] = factor_names;
            j["portfolio_betas"] = portfolio_betas;
            j["factor_losses"] = losses;
            j["factor_covariance"] = matrix_to_json(factor_covariance);
            j["factor_correlation"] = matrix_to_json(factor_correlation);

            j["variance"] = {
                {"total", decomposition.total_variance},
                {"factor", decomposition.factor_variance},
                {"idiosyncratic", decomposition.idiosyncratic_variance},
                {"volatility", decomposition.volatility},
                {"factor_share", decomposition.factor_share},
                {"idiosyncratic_share", decomposition.idiosyncratic_share}};

            j["holding_contributions"] = contributions_to_json(holding_contributions);
            j["factor_contributions"] = contributions_to_json(factor_contributions);

            j["limits"] = limits.to_json();
            nlohmann::json verdict_list = nlohmann::json::array();
            for (const auto &v : verdicts)
            {
                verdict_list.push_back(v.to_json());
            }
            j["verdicts"] = verdict_list;
            j["compliant"] = LimitsChecker::all_pass(verdicts);
            return j;
        }

    } // namespace risk
} // namespace riskengine
