/**
 * @file covariance_factory.cpp
 */

#include "risk/covariance_factory.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            double number_field(const nlohmann::json &j, const char *key)
            {
                if (!j.at(key).is_number())
                {
                    throw ConfigurationError(std::string("covariance.") + key + " must be a number");
                }
                return j.at(key).get<double>();
            }

            std::string lowercase(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }
        } // namespace

        CovarianceSettings CovarianceSettings::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ConfigurationError("covariance must be an object");
            }

            CovarianceSettings s;
            if (j.contains("type"))
            {
                if (!j["type"].is_string())
                {
                    throw ConfigurationError("covariance.type must be a string");
                }
                s.type = j["type"].get<std::string>();
            }
            if (j.contains("unbiased"))
            {
                if (!j["unbiased"].is_boolean())
                {
                    throw ConfigurationError("covariance.unbiased must be true or false");
                }
                s.unbiased = j["unbiased"].get<bool>();
            }
            if (j.contains("lambda"))
            {
                s.lambda = number_field(j, "lambda");
            }
            if (j.contains("half_life"))
            {
                if (j.contains("lambda"))
                {
                    throw ConfigurationError("covariance: give either lambda or half_life, not both");
                }
                s.half_life = number_field(j, "half_life");
            }
            return s;
        }

        nlohmann::json CovarianceSettings::to_json() const
        {
            nlohmann::json j = {{"type", type}, {"unbiased", unbiased}};
            if (half_life)
            {
                j["half_life"] = *half_life;
            }
            else
            {
                j["lambda"] = lambda;
            }
            return j;
        }

        std::unique_ptr<CovarianceEstimator> make_covariance_estimator(const CovarianceSettings &settings)
        {
            const std::string type = lowercase(settings.type);
            if (type == "sample")
            {
                return std::make_unique<SampleCovariance>(settings.unbiased);
            }
            if (type == "ewma")
            {
                if (settings.half_life)
                {
                    return std::make_unique<EWMACovariance>(EWMACovariance::from_half_life(*settings.half_life));
                }
                return std::make_unique<EWMACovariance>(settings.lambda);
            }
            throw ConfigurationError("Unknown covariance estimator '" + settings.type + "' (expected sample or ewma)");
        }

        std::vector<std::string> covariance_estimator_types()
        {
            return {"sample", "ewma"};
        }
    } // namespace risk
} // namespace riskengine
