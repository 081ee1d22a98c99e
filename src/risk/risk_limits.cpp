/**
 * @file risk_limits.cpp
 * @brief RiskLimitSet parsing and validation
 */

#include "risk/risk_limits.hpp"
#include "core/errors.hpp"
#include "core/fingerprint.hpp"
#include <cmath>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            std::optional<double> optional_number(const nlohmann::json &j, const char *key)
            {
                if (!j.contains(key) || j[key].is_null())
                {
                    return std::nullopt;
                }
                if (!j[key].is_number())
                {
                    throw ConfigurationError(std::string("Risk limit '") + key + "' must be a number");
                }
                return j[key].get<double>();
            }

            void require_positive(const std::optional<double> &value, const std::string &name)
            {
                if (!value)
                    return;
                require_finite_input(*value, "Risk limit " + name);
                if (*value <= 0.0)
                {
                    throw ConfigurationError("Risk limit " + name + " must be positive, got " +
                                             std::to_string(*value));
                }
            }

            void require_fraction(const std::optional<double> &value, const std::string &name)
            {
                require_positive(value, name);
                if (value && *value > 1.0)
                {
                    throw ConfigurationError("Risk limit " + name + " is a fraction and cannot exceed 1, got " +
                                             std::to_string(*value));
                }
            }
        } // namespace

        bool RiskLimitSet::empty() const
        {
            return !max_volatility && !max_single_holding_weight &&
                   !max_factor_variance_contribution && !max_systematic_share &&
                   !max_single_factor_loss && !max_leverage && max_factor_betas.empty();
        }

        void RiskLimitSet::validate() const
        {
            require_positive(max_volatility, "max_volatility");
            require_positive(max_single_holding_weight, "max_single_holding_weight");
            require_fraction(max_factor_variance_contribution, "max_factor_variance_contribution");
            require_fraction(max_systematic_share, "max_systematic_share");

            if (max_single_factor_loss)
            {
                require_finite_input(*max_single_factor_loss, "Risk limit max_single_factor_loss");
                if (*max_single_factor_loss == 0.0)
                {
                    throw ConfigurationError("Risk limit max_single_factor_loss cannot be zero");
                }
            }

            if (max_leverage)
            {
                require_finite_input(*max_leverage, "Risk limit max_leverage");
                if (*max_leverage < 1.0)
                {
                    throw ConfigurationError("Risk limit max_leverage must be at least 1, got " +
                                             std::to_string(*max_leverage));
                }
            }

            for (const auto &entry : max_factor_betas)
            {
                require_finite_input(entry.second, "Beta limit for " + entry.first);
                if (entry.second < 0.0)
                {
                    throw ConfigurationError("Beta limit for " + entry.first + " must be non-negative");
                }
            }
        }

        std::string RiskLimitSet::identity() const
        {
            return fingerprint_of(to_json());
        }

        nlohmann::json RiskLimitSet::to_json() const
        {
            nlohmann::json j = nlohmann::json::object();

            auto put = [&j](const char *key, const std::optional<double> &value)
            {
                if (value)
                {
                    j[key] = *value;
                }
            };

            put("max_volatility", max_volatility);
            put("max_single_holding_weight", max_single_holding_weight);
            put("max_factor_variance_contribution", max_factor_variance_contribution);
            put("max_systematic_share", max_systematic_share);
            put("max_single_factor_loss", max_single_factor_loss);
            put("max_leverage", max_leverage);

            if (!max_factor_betas.empty())
            {
                j["max_factor_betas"] = max_factor_betas;
            }

            return j;
        }

        RiskLimitSet RiskLimitSet::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ConfigurationError("Risk limits must be a JSON object");
            }

            RiskLimitSet limits;
            limits.max_volatility = optional_number(j, "max_volatility");
            limits.max_single_holding_weight = optional_number(j, "max_single_holding_weight");
            limits.max_factor_variance_contribution = optional_number(j, "max_factor_variance_contribution");
            limits.max_systematic_share = optional_number(j, "max_systematic_share");
            limits.max_single_factor_loss = optional_number(j, "max_single_factor_loss");
            limits.max_leverage = optional_number(j, "max_leverage");

            if (j.contains("max_factor_betas"))
            {
                const auto &betas = j["max_factor_betas"];
                if (!betas.is_object())
                {
                    throw ConfigurationError("'max_factor_betas' must be an object of factor -> limit");
                }
                for (auto it = betas.begin(); it != betas.end(); ++it)
                {
                    if (!it.value().is_number())
                    {
                        throw ConfigurationError("Beta limit for " + it.key() + " must be a number");
                    }
                    limits.max_factor_betas[it.key()] = it.value().get<double>();
                }
            }

            limits.validate();
            return limits;
        }

    } // namespace risk
} // namespace riskengine
