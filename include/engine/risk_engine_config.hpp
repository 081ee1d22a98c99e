/**
 * @file risk_engine_config.hpp
 * @brief Engine-wide settings (the "engine" section of the config file)
 */

#pragma once

#include "risk/factor_exposure_estimator.hpp"
#include "risk/covariance_factory.hpp"
#include "risk/risk_scorer.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace riskengine
{
    namespace engine
    {
        /**
         * @struct RiskEngineConfig
         * @brief Estimation, covariance, scoring, scenario and cache settings
         *
         * Example JSON:
         * @code{.json}
         * {
         *   "periods_per_year": 12,
         *   "min_observations": 24,
         *   "beta_estimation": "joint",
         *   "covariance": {"type": "ewma", "half_life": 12},
         *   "worst_case_moves": {"market": 0.35, "momentum": 0.5},
         *   "cache_ttl_seconds": 900
         * }
         * @endcode
         */
        struct RiskEngineConfig
        {
            risk::EstimatorSettings estimation;
            risk::CovarianceSettings covariance;
            risk::ScoringSettings scoring;

            /// Adverse move per factor for max_single_factor_loss (0.35 = 35% drop)
            std::map<std::string, double> worst_case_moves = {
                {"market", 0.35}, {"momentum", 0.50}, {"value", 0.40}};

            int cache_ttl_seconds = 900;
            size_t cache_max_entries = 100;

            double cash_proxy_return = 0.02;                 ///< MAX_RETURN default for cash proxies
            std::optional<double> expected_return_fallback;  ///< MAX_RETURN default for other tickers

            /**
             * @throws ConfigurationError on invalid values
             */
            void validate() const;

            static RiskEngineConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

    } // namespace engine
} // namespace riskengine
