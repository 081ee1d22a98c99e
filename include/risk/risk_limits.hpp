/**
 * @file risk_limits.hpp
 * @brief User-configurable risk thresholds
 */

#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace riskengine
{
    namespace risk
    {
        /**
         * @struct RiskLimitSet
         * @brief Named thresholds, each independently optional
         *
         * Absent thresholds are never checked and never constrain the optimizer.
         * Fractions are expressed as decimals (0.40 = 40%).
         *
         * Example JSON:
         * @code{.json}
         * {
         *   "max_volatility": 0.40,
         *   "max_single_holding_weight": 0.40,
         *   "max_factor_variance_contribution": 0.30,
         *   "max_single_factor_loss": -0.10,
         *   "max_factor_betas": {"market": 1.3}
         * }
         * @endcode
         */
        struct RiskLimitSet
        {
            std::optional<double> max_volatility;                   ///< Annualized portfolio volatility
            std::optional<double> max_single_holding_weight;        ///< Largest |weight| of any holding
            std::optional<double> max_factor_variance_contribution; ///< Largest single-factor share of total variance
            std::optional<double> max_systematic_share;             ///< Factor variance / total variance
            std::optional<double> max_single_factor_loss;           ///< Worst-case loss from one factor move (sign ignored)
            std::optional<double> max_leverage;                     ///< Gross / net risky exposure
            std::map<std::string, double> max_factor_betas;         ///< Per-factor |portfolio beta| cap

            bool empty() const;

            /**
             * @brief Check that every configured threshold is meaningful
             * @throws ConfigurationError on non-finite, non-positive or out-of-range values
             */
            void validate() const;

            /**
             * @brief Fingerprint of the canonical JSON form
             */
            std::string identity() const;

            nlohmann::json to_json() const;

            /**
             * @throws ConfigurationError on wrong types or invalid values
             */
            static RiskLimitSet from_json(const nlohmann::json &j);
        };

    } // namespace risk
} // namespace riskengine
