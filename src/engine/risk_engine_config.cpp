/**
 * @file risk_engine_config.cpp
 * @brief RiskEngineConfig parsing
 */

#include "engine/risk_engine_config.hpp"
#include "core/errors.hpp"

namespace riskengine
{
    namespace engine
    {

        void RiskEngineConfig::validate() const
        {
            estimation.validate();
            scoring.validate();
            risk::make_covariance_estimator(covariance); // throws on an unknown type or bad decay

            for (const auto &move : worst_case_moves)
            {
                require_finite_input(move.second, "worst_case_moves." + move.first);
                if (move.second < 0.0)
                {
                    throw ConfigurationError("worst_case_moves." + move.first +
                                             " is a move magnitude and cannot be negative");
                }
            }

            if (cache_ttl_seconds <= 0)
            {
                throw ConfigurationError("cache_ttl_seconds must be positive");
            }

            require_finite_input(cash_proxy_return, "cash_proxy_return");
            if (expected_return_fallback)
            {
                require_finite_input(*expected_return_fallback, "expected_return_fallback");
            }
        }

        RiskEngineConfig RiskEngineConfig::from_json(const nlohmann::json &j)
        {
            RiskEngineConfig config;
            config.estimation = risk::EstimatorSettings::from_json(j);
            config.covariance = risk::CovarianceSettings::from_json(j.value("covariance", nlohmann::json::object()));
            config.scoring = risk::ScoringSettings::from_json(j.value("scoring", nlohmann::json::object()));

            if (j.contains("worst_case_moves"))
            {
                config.worst_case_moves = j.at("worst_case_moves").get<std::map<std::string, double>>();
            }

            config.cache_ttl_seconds = j.value("cache_ttl_seconds", config.cache_ttl_seconds);
            config.cache_max_entries = j.value("cache_max_entries", config.cache_max_entries);
            config.cash_proxy_return = j.value("cash_proxy_return", config.cash_proxy_return);
            if (j.contains("expected_return_fallback") && !j["expected_return_fallback"].is_null())
            {
                config.expected_return_fallback = j["expected_return_fallback"].get<double>();
            }

            config.validate();
            return config;
        }

        nlohmann::json RiskEngineConfig::to_json() const
        {
            nlohmann::json j = estimation.to_json();
            j["covariance"] = covariance.to_json();
            j["scoring"] = scoring.to_json();
            j["worst_case_moves"] = worst_case_moves;
            j["cache_ttl_seconds"] = cache_ttl_seconds;
            j["cache_max_entries"] = cache_max_entries;
            j["cash_proxy_return"] = cash_proxy_return;
            j["expected_return_fallback"] =
                expected_return_fallback ? nlohmann::json(*expected_return_fallback) : nlohmann::json(nullptr);
            return j;
        }

    } // namespace engine
} // namespace riskengine
