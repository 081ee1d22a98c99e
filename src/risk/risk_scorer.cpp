/**
 * @file risk_scorer.cpp
 * @brief Implementation of RiskScorer
 */

#include "risk/risk_scorer.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            constexpr double kSafeRatio = 0.8;
            constexpr double kCautionRatio = 1.0;
            constexpr double kDangerRatio = 1.5;
            constexpr double kCriticalRatio = 2.0;

            double interpolate(double x, double x0, double x1, double y0, double y1)
            {
                return y0 + (x - x0) / (x1 - x0) * (y1 - y0);
            }

            std::string percent(double fraction)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
                return oss.str();
            }

            std::string factor_recommendation(const std::string &factor)
            {
                if (factor == portfolio::FactorProxySet::kMarketFactor)
                {
                    return "Reduce market exposure (sell high-beta stocks or add market hedges)";
                }
                return "Reduce " + factor + " factor exposure";
            }

            void add_unique(std::vector<std::string> &list, const std::string &item)
            {
                if (std::find(list.begin(), list.end(), item) == list.end())
                {
                    list.push_back(item);
                }
            }

            const char *kVolatilityAdvice =
                "Reduce portfolio volatility through diversification or defensive positions";
            const char *kLeverageAdvice = "Consider reducing leverage to limit downside risk";
        } // namespace

        std::string to_string(RiskCategory category)
        {
            switch (category)
            {
            case RiskCategory::LOW:
                return "LOW";
            case RiskCategory::MODERATE:
                return "MODERATE";
            case RiskCategory::HIGH:
                return "HIGH";
            case RiskCategory::VERY_HIGH:
                return "VERY_HIGH";
            }
            return "UNKNOWN";
        }

        // ====================================================================
        // ScoringSettings
        // ====================================================================

        void ScoringSettings::validate() const
        {
            const std::pair<const char *, double> fields[] = {
                {"volatility_target", volatility_target},
                {"concentration_target", concentration_target},
                {"factor_concentration_target", factor_concentration_target},
                {"leverage_warning", leverage_warning},
                {"hhi_warning", hhi_warning}};
            for (const auto &field : fields)
            {
                require_finite_input(field.second, std::string("scoring.") + field.first);
                if (field.second <= 0.0)
                {
                    throw ConfigurationError(std::string("scoring.") + field.first + " must be positive");
                }
            }
        }

        ScoringSettings ScoringSettings::from_json(const nlohmann::json &j)
        {
            ScoringSettings s;
            s.volatility_target = j.value("volatility_target", s.volatility_target);
            s.concentration_target = j.value("concentration_target", s.concentration_target);
            s.factor_concentration_target = j.value("factor_concentration_target", s.factor_concentration_target);
            s.leverage_warning = j.value("leverage_warning", s.leverage_warning);
            s.hhi_warning = j.value("hhi_warning", s.hhi_warning);
            s.validate();
            return s;
        }

        nlohmann::json ScoringSettings::to_json() const
        {
            return nlohmann::json{
                {"volatility_target", volatility_target},
                {"concentration_target", concentration_target},
                {"factor_concentration_target", factor_concentration_target},
                {"leverage_warning", leverage_warning},
                {"hhi_warning", hhi_warning}};
        }

        nlohmann::json RiskScoreResult::to_json() const
        {
            return nlohmann::json{
                {"score", score},
                {"sub_scores", sub_scores},
                {"category", to_string(category)},
                {"interpretation", interpretation},
                {"recommendations", recommendations}};
        }

        // ====================================================================
        // RiskScorer
        // ====================================================================

        RiskScorer::RiskScorer(ScoringSettings settings)
            : settings_(settings)
        {
            settings_.validate();
        }

        double RiskScorer::score_excess_ratio(double excess_ratio)
        {
            require_finite_data(excess_ratio, "Excess ratio");
            if (excess_ratio <= kSafeRatio)
            {
                return 100.0;
            }
            if (excess_ratio <= kCautionRatio)
            {
                return interpolate(excess_ratio, kSafeRatio, kCautionRatio, 100.0, 75.0);
            }
            if (excess_ratio <= kDangerRatio)
            {
                return interpolate(excess_ratio, kCautionRatio, kDangerRatio, 75.0, 50.0);
            }
            if (excess_ratio <= kCriticalRatio)
            {
                return interpolate(excess_ratio, kDangerRatio, kCriticalRatio, 50.0, 0.0);
            }
            return 0.0;
        }

        RiskCategory RiskScorer::categorize(double score)
        {
            if (score >= 80.0)
                return RiskCategory::LOW;
            if (score >= 65.0)
                return RiskCategory::MODERATE;
            if (score >= 50.0)
                return RiskCategory::HIGH;
            return RiskCategory::VERY_HIGH;
        }

        std::string RiskScorer::interpret(double score)
        {
            if (score >= 90.0)
                return "Excellent";
            if (score >= 80.0)
                return "Good";
            if (score >= 70.0)
                return "Fair";
            if (score >= 60.0)
                return "Poor";
            return "Very Poor";
        }

        RiskScoreResult RiskScorer::score(const RiskAnalysisResult &analysis) const
        {
            const RiskLimitSet &limits = analysis.limits;

            const double vol_limit = limits.max_volatility.value_or(settings_.volatility_target);
            const double weight_limit = limits.max_single_holding_weight.value_or(settings_.concentration_target);
            const double factor_limit =
                limits.max_factor_variance_contribution.value_or(settings_.factor_concentration_target);

            const int top_holding = analysis.largest_holding();
            const int top_factor = analysis.largest_factor();
            const double largest_weight = top_holding < 0 ? 0.0 : std::abs(analysis.weights(top_holding));
            const double largest_share = top_factor < 0 ? 0.0 : analysis.factor_shares()(top_factor);

            RiskScoreResult result;
            result.sub_scores["volatility"] = score_excess_ratio(analysis.decomposition.volatility / vol_limit);
            result.sub_scores["concentration"] = score_excess_ratio(largest_weight / weight_limit);
            result.sub_scores["factor_concentration"] = score_excess_ratio(largest_share / factor_limit);
            result.sub_scores["compliance"] =
                std::max(0.0, 100.0 - kPenaltyPerFailure * static_cast<double>(analysis.failed_verdicts()));

            const double overall = kVolatilityWeight * result.sub_scores["volatility"] +
                                   kConcentrationWeight * result.sub_scores["concentration"] +
                                   kFactorConcentrationWeight * result.sub_scores["factor_concentration"] +
                                   kComplianceWeight * result.sub_scores["compliance"];

            result.score = std::min(100.0, std::max(0.0, overall));
            result.category = categorize(result.score);
            result.interpretation = interpret(result.score);
            result.recommendations = recommend(analysis, result.sub_scores);
            return result;
        }

        std::vector<std::string> RiskScorer::recommend(const RiskAnalysisResult &analysis,
                                                       const std::map<std::string, double> &sub_scores) const
        {
            std::vector<std::string> out;
            const int top_holding = analysis.largest_holding();
            const int top_factor = analysis.largest_factor();

            // Failed limits first, in verdict order
            for (const auto &v : analysis.verdicts)
            {
                if (v.passed())
                    continue;

                if (v.rule_name == "max_volatility")
                {
                    add_unique(out, kVolatilityAdvice);
                }
                else if (v.rule_name == "max_single_holding_weight")
                {
                    add_unique(out, "Reduce position size in largest holding " + v.subject);
                }
                else if (v.rule_name == "max_factor_variance_contribution")
                {
                    if (v.subject == portfolio::FactorProxySet::kMarketFactor)
                    {
                        add_unique(out, factor_recommendation(v.subject));
                    }
                    else
                    {
                        add_unique(out, "Diversify factor exposures (reduce dominant " + v.subject +
                                            " exposure, contributing " + percent(v.current_value) +
                                            " to variance)");
                    }
                }
                else if (v.rule_name == "max_systematic_share")
                {
                    add_unique(out, "Reduce systematic factor exposures");
                }
                else if (v.rule_name == "max_single_factor_loss")
                {
                    add_unique(out, "Hedge " + v.subject + " exposure to limit worst-case loss (" +
                                        percent(v.current_value) + " in a " + v.subject + " crash)");
                }
                else if (v.rule_name == "max_leverage")
                {
                    add_unique(out, kLeverageAdvice);
                }
                else
                {
                    add_unique(out, factor_recommendation(v.subject));
                }
            }

            // Then the weakest sub-score, if it is not perfect
            auto worst = std::min_element(sub_scores.begin(), sub_scores.end(),
                                          [](const std::pair<const std::string, double> &a,
                                             const std::pair<const std::string, double> &b)
                                          { return a.second < b.second; });
            if (worst != sub_scores.end() && worst->second < 100.0)
            {
                if (worst->first == "volatility")
                {
                    add_unique(out, kVolatilityAdvice);
                }
                else if (worst->first == "concentration" && top_holding >= 0)
                {
                    add_unique(out, "Reduce position size in largest holding " + analysis.tickers[top_holding]);
                }
                else if (worst->first == "factor_concentration" && top_factor >= 0)
                {
                    add_unique(out, factor_recommendation(analysis.factor_names[top_factor]));
                }
                else if (worst->first == "compliance")
                {
                    add_unique(out, "Bring positions back within configured risk limits");
                }
            }

            if (analysis.herfindahl > settings_.hhi_warning)
            {
                add_unique(out, "Add more positions to improve diversification");
            }
            if (analysis.leverage > settings_.leverage_warning)
            {
                add_unique(out, kLeverageAdvice);
            }
            return out;
        }

    } // namespace risk
} // namespace riskengine
