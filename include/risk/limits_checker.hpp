/**
 * @file limits_checker.hpp
 * @brief Compare computed risk metrics against a RiskLimitSet
 */

#pragma once

#include "risk/risk_limits.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {
        enum class ComplianceStatus
        {
            PASS,
            FAIL
        };

        /**
         * @struct ComplianceVerdict
         * @brief Outcome of one configured limit
         */
        struct ComplianceVerdict
        {
            std::string rule_name;    ///< Limit key, e.g. "max_volatility"
            std::string subject;      ///< Holding or factor that produced current_value, or "portfolio"
            double current_value = 0.0;
            double limit_value = 0.0;
            ComplianceStatus status = ComplianceStatus::PASS;

            bool passed() const { return status == ComplianceStatus::PASS; }

            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskMetrics
         * @brief The metrics the limits apply to
         */
        struct RiskMetrics
        {
            double volatility = 0.0;       ///< Annualized
            double systematic_share = 0.0; ///< Factor variance / total variance
            double leverage = 0.0;         ///< Gross / net risky exposure
            std::vector<std::string> tickers;
            Eigen::VectorXd weights;
            std::vector<std::string> factor_names;
            Eigen::VectorXd portfolio_betas;
            Eigen::VectorXd factor_shares; ///< Euler share of total variance per factor
            Eigen::VectorXd factor_losses; ///< Worst-case loss magnitude per factor
        };

        std::string to_string(ComplianceStatus status);

        /**
         * @class LimitsChecker
         * @brief Pure, side-effect-free limit evaluation
         *
         * One verdict per configured limit, in a fixed order. FAIL iff the
         * current value is strictly greater than the limit; equality passes.
         * Unconfigured limits produce no verdict at all.
         *
         * Usage Example:
         * @code
         * auto verdicts = LimitsChecker::check(result.metrics(), limits);
         * bool compliant = LimitsChecker::all_pass(verdicts);
         * @endcode
         */
        class LimitsChecker
        {
        public:
            static std::vector<ComplianceVerdict> check(const RiskMetrics &metrics,
                                                        const RiskLimitSet &limits);

            static bool all_pass(const std::vector<ComplianceVerdict> &verdicts);

            static size_t count_failures(const std::vector<ComplianceVerdict> &verdicts);
        };

    } // namespace risk
} // namespace riskengine
