/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "optimizer/optimizer_interface.hpp"
#include "core/errors.hpp"
#include "risk/risk_contribution.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace riskengine
{
    namespace optimizer
    {

        std::string to_string(ObjectiveType objective)
        {
            return objective == ObjectiveType::MIN_VARIANCE ? "min_variance" : "max_return";
        }

        ObjectiveType objective_from_string(const std::string &name)
        {
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
            if (lower == "min_variance")
                return ObjectiveType::MIN_VARIANCE;
            if (lower == "max_return")
                return ObjectiveType::MAX_RETURN;
            throw ConfigurationError("Unknown optimization objective: " + name +
                                     " (expected min_variance or max_return)");
        }

        std::string to_string(OptimizationStatus status)
        {
            switch (status)
            {
            case OptimizationStatus::FEASIBLE:
                return "FEASIBLE";
            case OptimizationStatus::INFEASIBLE:
                return "INFEASIBLE";
            case OptimizationStatus::DID_NOT_CONVERGE:
                return "DID_NOT_CONVERGE";
            }
            return "UNKNOWN";
        }

        // ============================================================================
        // BoxConstraints Implementation
        // ============================================================================

        void BoxConstraints::validate() const
        {
            require_finite_input(min_weight, "min_weight");
            require_finite_input(max_weight, "max_weight");

            if (min_weight < 0.0 && long_only)
            {
                throw ConfigurationError(
                    "min_weight must be non-negative for long_only portfolios, got: " +
                    std::to_string(min_weight));
            }

            if (max_weight <= 0.0)
            {
                throw ConfigurationError("max_weight must be positive, got: " + std::to_string(max_weight));
            }

            if (min_weight > max_weight)
            {
                throw ConfigurationError(
                    "min_weight (" + std::to_string(min_weight) +
                    ") cannot exceed max_weight (" + std::to_string(max_weight) + ")");
            }

            if (max_leverage)
            {
                require_finite_input(*max_leverage, "max_leverage");
                if (*max_leverage < 1.0)
                {
                    throw ConfigurationError("max_leverage must be at least 1, got: " +
                                             std::to_string(*max_leverage));
                }
            }
        }

        BoxConstraints BoxConstraints::from_json(const nlohmann::json &j)
        {
            BoxConstraints box;
            box.long_only = j.value("long_only", true);
            box.min_weight = j.value("min_weight", 0.0);
            box.max_weight = j.value("max_weight", 1.0);
            if (j.contains("max_leverage") && !j["max_leverage"].is_null())
            {
                box.max_leverage = j["max_leverage"].get<double>();
            }
            box.validate();
            return box;
        }

        nlohmann::json BoxConstraints::to_json() const
        {
            nlohmann::json j{
                {"long_only", long_only},
                {"min_weight", min_weight},
                {"max_weight", max_weight}};
            j["max_leverage"] = max_leverage ? nlohmann::json(*max_leverage) : nlohmann::json(nullptr);
            return j;
        }

        // ============================================================================
        // SolverBudget Implementation
        // ============================================================================

        void SolverBudget::validate() const
        {
            if (max_iterations <= 0 || max_outer_iterations <= 0 || max_solves <= 0)
            {
                throw ConfigurationError("Solver budget iteration counts must be positive");
            }
            require_finite_input(timeout_ms, "timeout_ms");
            require_finite_input(tolerance, "tolerance");
            if (timeout_ms <= 0.0 || tolerance <= 0.0)
            {
                throw ConfigurationError("timeout_ms and tolerance must be positive");
            }
        }

        SolverBudget SolverBudget::from_json(const nlohmann::json &j)
        {
            SolverBudget budget;
            budget.max_iterations = j.value("max_iterations", budget.max_iterations);
            budget.max_outer_iterations = j.value("max_outer_iterations", budget.max_outer_iterations);
            budget.max_solves = j.value("max_solves", budget.max_solves);
            budget.timeout_ms = j.value("timeout_ms", budget.timeout_ms);
            budget.tolerance = j.value("tolerance", budget.tolerance);
            budget.validate();
            return budget;
        }

        // ============================================================================
        // OptimizationProblem Implementation
        // ============================================================================

        void OptimizationProblem::validate() const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(tickers.size());
            const Eigen::Index k = static_cast<Eigen::Index>(factor_names.size());

            if (n == 0)
            {
                throw ConfigurationError("Optimization universe is empty");
            }
            if (betas.rows() != n || betas.cols() != k)
            {
                throw ConfigurationError("Beta matrix must be " + std::to_string(n) + "x" + std::to_string(k));
            }
            if (residual_variance.size() != n)
            {
                throw ConfigurationError("Residual variance must have one entry per asset");
            }
            if (factor_covariance.rows() != k || factor_covariance.cols() != k)
            {
                throw ConfigurationError("Factor covariance must be " + std::to_string(k) + "x" + std::to_string(k));
            }
            if (!betas.allFinite() || !residual_variance.allFinite() || !factor_covariance.allFinite())
            {
                throw DataInsufficientError("Factor model contains NaN or Inf");
            }
            if (!cash_flags.empty() && static_cast<Eigen::Index>(cash_flags.size()) != n)
            {
                throw ConfigurationError("cash_flags must have one entry per asset");
            }
            if (current_weights.size() != 0 && current_weights.size() != n)
            {
                throw ConfigurationError("current_weights must have one entry per asset");
            }
            if (current_weights.size() != 0 && !current_weights.allFinite())
            {
                throw ConfigurationError("current_weights contain NaN or Inf");
            }

            if (objective == ObjectiveType::MAX_RETURN)
            {
                if (expected_returns.size() != n)
                {
                    throw ConfigurationError("MAX_RETURN requires one expected return per asset");
                }
                if (!expected_returns.allFinite())
                {
                    throw ConfigurationError("Expected returns contain NaN or Inf");
                }
            }

            for (const auto &entry : limits.max_factor_betas)
            {
                if (std::find(factor_names.begin(), factor_names.end(), entry.first) == factor_names.end())
                {
                    throw ConfigurationError("Beta limit set for unknown factor '" + entry.first + "'");
                }
            }

            limits.validate();
            box.validate();
            budget.validate();
        }

        Eigen::MatrixXd OptimizationProblem::asset_covariance() const
        {
            return risk::VarianceDecomposer::asset_covariance(betas, residual_variance, factor_covariance);
        }

        double OptimizationProblem::leverage_of(const Eigen::VectorXd &weights) const
        {
            double net = 0.0;
            double gross = 0.0;
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                const bool is_cash = !cash_flags.empty() && cash_flags[static_cast<size_t>(i)];
                if (is_cash && weights(i) > 0.0)
                {
                    continue;
                }
                net += weights(i);
                gross += std::abs(weights(i));
            }
            return net == 0.0 ? 0.0 : gross / std::abs(net);
        }

        risk::RiskMetrics OptimizationProblem::metrics_for(const Eigen::VectorXd &weights,
                                                           risk::VarianceDecomposition &decomposition) const
        {
            decomposition = risk::VarianceDecomposer::decompose(weights, betas, residual_variance, factor_covariance);

            risk::RiskMetrics m;
            m.volatility = decomposition.volatility;
            m.systematic_share = decomposition.factor_share;
            m.leverage = leverage_of(weights);
            m.tickers = tickers;
            m.weights = weights;
            m.factor_names = factor_names;
            m.portfolio_betas = decomposition.portfolio_betas;

            const auto contributions =
                risk::RiskContributionCalculator::by_factor(factor_names, factor_covariance, decomposition);
            m.factor_shares = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(factor_names.size()));
            for (size_t f = 0; f < factor_names.size(); ++f)
            {
                m.factor_shares(static_cast<Eigen::Index>(f)) = contributions[f].percent;
            }

            m.factor_losses = risk::RiskContributionCalculator::worst_case_factor_losses(
                factor_names, decomposition.portfolio_betas, worst_case_moves, m.leverage);
            return m;
        }

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        void OptimizationResult::require_feasible() const
        {
            switch (status)
            {
            case OptimizationStatus::FEASIBLE:
                return;
            case OptimizationStatus::INFEASIBLE:
                throw OptimizationInfeasible("Optimization infeasible: " + message);
            case OptimizationStatus::DID_NOT_CONVERGE:
                throw SolverDidNotConverge("Optimizer did not converge: " + message);
            }
        }

        std::map<std::string, double> OptimizationResult::weight_map(double threshold) const
        {
            std::map<std::string, double> out;
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (std::abs(weights(i)) > threshold || threshold == 0.0)
                {
                    out[tickers[static_cast<size_t>(i)]] = weights(i);
                }
            }
            return out;
        }

        nlohmann::json OptimizationResult::to_json() const
        {
            nlohmann::json j;
            j["status"] = to_string(status);
            j["authoritative"] = authoritative;
            j["message"] = message;
            j["iterations"] = iterations;
            j["solves"] = solves;
            j["weights"] = weights.size() > 0 ? nlohmann::json(weight_map()) : nlohmann::json::object();
            j["expected_return"] = expected_return;
            j["volatility"] = volatility;
            j["turnover"] = turnover;

            nlohmann::json verdict_list = nlohmann::json::array();
            for (const auto &v : verdicts)
            {
                verdict_list.push_back(v.to_json());
            }
            j["verdicts"] = verdict_list;
            return j;
        }

        void OptimizationResult::print_summary() const
        {
            std::cout << "\n=== Optimization Result ===\n";
            std::cout << "Status: " << to_string(status)
                      << (authoritative ? "" : " (non-authoritative)") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Solves: " << solves << "  Iterations: " << iterations << "\n";
            std::cout << std::string(50, '-') << "\n";

            if (weights.size() > 0)
            {
                std::cout << "Portfolio Statistics:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << expected_return * 100 << "%\n";
                std::cout << "  Volatility:       " << volatility * 100 << "%\n";
                std::cout << "  Turnover:         " << turnover * 100 << "%\n";

                std::cout << "\nWeights:\n";
                for (Eigen::Index i = 0; i < weights.size(); ++i)
                {
                    if (std::abs(weights(i)) > 1e-6)
                    {
                        std::cout << "  " << std::left << std::setw(10) << tickers[static_cast<size_t>(i)]
                                  << std::right << std::setw(9) << std::setprecision(2)
                                  << weights(i) * 100 << "%\n";
                    }
                }

                size_t failures = risk::LimitsChecker::count_failures(verdicts);
                std::cout << "\nLimit verdicts: " << verdicts.size() - failures << " pass, "
                          << failures << " fail\n";
            }

            std::cout << "===========================\n"
                      << std::endl;
        }

    } // namespace optimizer
} // namespace riskengine
