/**
 * @file limits_checker.cpp
 * @brief Implementation of LimitsChecker
 */

#include "risk/limits_checker.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            ComplianceVerdict verdict(const std::string &rule,
                                      const std::string &subject,
                                      double current,
                                      double limit)
            {
                ComplianceVerdict v;
                v.rule_name = rule;
                v.subject = subject;
                v.current_value = current;
                v.limit_value = limit;
                v.status = current > limit ? ComplianceStatus::FAIL : ComplianceStatus::PASS;
                return v;
            }

            // Index of the largest entry of values (after transform), or -1 when empty
            template <typename Transform>
            Eigen::Index arg_max(const Eigen::VectorXd &values, Transform transform)
            {
                Eigen::Index best = -1;
                for (Eigen::Index i = 0; i < values.size(); ++i)
                {
                    if (best < 0 || transform(values(i)) > transform(values(best)))
                    {
                        best = i;
                    }
                }
                return best;
            }
        } // namespace

        std::string to_string(ComplianceStatus status)
        {
            return status == ComplianceStatus::PASS ? "PASS" : "FAIL";
        }

        nlohmann::json ComplianceVerdict::to_json() const
        {
            return nlohmann::json{
                {"rule", rule_name},
                {"subject", subject},
                {"current_value", current_value},
                {"limit_value", limit_value},
                {"status", to_string(status)}};
        }

        std::vector<ComplianceVerdict> LimitsChecker::check(const RiskMetrics &metrics,
                                                            const RiskLimitSet &limits)
        {
            std::vector<ComplianceVerdict> verdicts;

            if (limits.max_volatility)
            {
                require_finite_data(metrics.volatility, "Portfolio volatility");
                verdicts.push_back(verdict("max_volatility", "portfolio",
                                           metrics.volatility, *limits.max_volatility));
            }

            if (limits.max_single_holding_weight)
            {
                const auto abs_value = [](double w)
                { return std::abs(w); };
                const Eigen::Index i = arg_max(metrics.weights, abs_value);
                verdicts.push_back(verdict("max_single_holding_weight",
                                           i < 0 ? "portfolio" : metrics.tickers[i],
                                           i < 0 ? 0.0 : std::abs(metrics.weights(i)),
                                           *limits.max_single_holding_weight));
            }

            if (limits.max_factor_variance_contribution)
            {
                const auto identity = [](double s)
                { return s; };
                const Eigen::Index f = arg_max(metrics.factor_shares, identity);
                verdicts.push_back(verdict("max_factor_variance_contribution",
                                           f < 0 ? "portfolio" : metrics.factor_names[f],
                                           f < 0 ? 0.0 : metrics.factor_shares(f),
                                           *limits.max_factor_variance_contribution));
            }

            if (limits.max_systematic_share)
            {
                verdicts.push_back(verdict("max_systematic_share", "portfolio",
                                           metrics.systematic_share, *limits.max_systematic_share));
            }

            if (limits.max_single_factor_loss)
            {
                const auto identity = [](double s)
                { return s; };
                const Eigen::Index f = arg_max(metrics.factor_losses, identity);
                verdicts.push_back(verdict("max_single_factor_loss",
                                           f < 0 ? "portfolio" : metrics.factor_names[f],
                                           f < 0 ? 0.0 : metrics.factor_losses(f),
                                           std::abs(*limits.max_single_factor_loss)));
            }

            if (limits.max_leverage)
            {
                verdicts.push_back(verdict("max_leverage", "portfolio",
                                           metrics.leverage, *limits.max_leverage));
            }

            for (const auto &entry : limits.max_factor_betas)
            {
                auto it = std::find(metrics.factor_names.begin(), metrics.factor_names.end(), entry.first);
                if (it == metrics.factor_names.end())
                {
                    throw ConfigurationError("Beta limit set for unknown factor '" + entry.first + "'");
                }
                const auto f = std::distance(metrics.factor_names.begin(), it);
                verdicts.push_back(verdict("max_factor_beta:" + entry.first, entry.first,
                                           std::abs(metrics.portfolio_betas(f)), entry.second));
            }

            return verdicts;
        }

        bool LimitsChecker::all_pass(const std::vector<ComplianceVerdict> &verdicts)
        {
            return count_failures(verdicts) == 0;
        }

        size_t LimitsChecker::count_failures(const std::vector<ComplianceVerdict> &verdicts)
        {
            return static_cast<size_t>(std::count_if(verdicts.begin(), verdicts.end(),
                                                     [](const ComplianceVerdict &v)
                                                     { return !v.passed(); }));
        }

    } // namespace risk
} // namespace riskengine
