/**
 * @file covariance_factory.hpp
 * @brief Builds the configured factor covariance estimator
 *
 * Configuration block:
 * @code{.json}
 * "covariance": { "type": "ewma", "half_life": 12 }
 * @endcode
 *
 * "lambda" and "half_life" are alternatives; giving both is an error.
 */

#pragma once

#include "risk/ewma_covariance.hpp"
#include "risk/sample_covariance.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {

        struct CovarianceSettings
        {
            std::string type = "sample"; ///< "sample" or "ewma", case-insensitive
            bool unbiased = true;
            double lambda = 0.94;
            std::optional<double> half_life;

            /// @throws ConfigurationError on wrong field types or conflicting decay fields
            static CovarianceSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @brief Estimator named by the settings
         * @throws ConfigurationError for an unknown type or an invalid decay
         */
        std::unique_ptr<CovarianceEstimator> make_covariance_estimator(const CovarianceSettings &settings);

        std::vector<std::string> covariance_estimator_types();

    } // namespace risk
} // namespace riskengine
