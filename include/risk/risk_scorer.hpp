/**
 * @file risk_scorer.hpp
 * @brief Single 0-100 risk score with category and recommendations
 *
 * Each sub-score maps an excess ratio (metric / limit) through a
 * piecewise-linear curve:
 *
 *     ratio <= 0.8        -> 100
 *     0.8 .. 1.0          -> 100 .. 75
 *     1.0 .. 1.5          ->  75 .. 50
 *     1.5 .. 2.0          ->  50 .. 0
 *     ratio >= 2.0        -> 0
 *
 * Higher scores mean lower risk.
 */

#pragma once

#include "risk/risk_analysis_result.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {
        enum class RiskCategory
        {
            LOW,
            MODERATE,
            HIGH,
            VERY_HIGH
        };

        std::string to_string(RiskCategory category);

        /**
         * @struct ScoringSettings
         * @brief Targets used when the limit set leaves a metric unconfigured
         */
        struct ScoringSettings
        {
            double volatility_target = 0.40;
            double concentration_target = 0.40;
            double factor_concentration_target = 0.30;
            double leverage_warning = 1.1; ///< Leverage above this adds a recommendation
            double hhi_warning = 0.15;     ///< Herfindahl index above this adds a recommendation

            /**
             * @throws ConfigurationError on non-positive or non-finite values
             */
            void validate() const;

            static ScoringSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskScoreResult
         * @brief Output of RiskScorer::score
         */
        struct RiskScoreResult
        {
            double score = 0.0;                      ///< Overall score in [0, 100]
            std::map<std::string, double> sub_scores; ///< volatility, concentration, factor_concentration, compliance
            RiskCategory category = RiskCategory::VERY_HIGH;
            std::string interpretation; ///< Excellent, Good, Fair, Poor or Very Poor
            std::vector<std::string> recommendations;

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskScorer
         * @brief Weighted combination of normalized sub-scores
         *
         * Usage Example:
         * @code
         * RiskScorer scorer;
         * auto score = scorer.score(*analysis);
         * std::cout << score.score << " (" << to_string(score.category) << ")\n";
         * @endcode
         */
        class RiskScorer
        {
        public:
            static constexpr double kVolatilityWeight = 0.25;
            static constexpr double kConcentrationWeight = 0.25;
            static constexpr double kFactorConcentrationWeight = 0.30;
            static constexpr double kComplianceWeight = 0.20;
            static constexpr double kPenaltyPerFailure = 25.0;

            explicit RiskScorer(ScoringSettings settings = ScoringSettings());

            RiskScoreResult score(const RiskAnalysisResult &analysis) const;

            /**
             * @brief Piecewise-linear excess ratio curve
             * @param excess_ratio metric / limit
             * @return Score in [0, 100]
             */
            static double score_excess_ratio(double excess_ratio);

            static RiskCategory categorize(double score);

            static std::string interpret(double score);

        private:
            std::vector<std::string> recommend(const RiskAnalysisResult &analysis,
                                               const std::map<std::string, double> &sub_scores) const;

            ScoringSettings settings_;
        };

    } // namespace risk
} // namespace riskengine
