/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface and shared types for limit-constrained optimizers
 *
 * An optimizer searches for a weight vector over a universe of holdings
 * whose factor model is already estimated. Configured risk limits are hard
 * constraints: a result is only marked FEASIBLE after the candidate weights
 * have been re-run through the variance decomposition and the limits
 * checker with zero failures.
 *
 * Non-convergence is a result status, not an exception; callers that
 * prefer exceptions use OptimizationResult::require_feasible().
 */

#pragma once

#include "risk/limits_checker.hpp"
#include "risk/risk_limits.hpp"
#include "risk/variance_decomposition.hpp"
#include <Eigen/Dense>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace riskengine
{
    namespace optimizer
    {

        /**
         * @enum ObjectiveType
         */
        enum class ObjectiveType
        {
            MIN_VARIANCE, ///< minimize w'Σw
            MAX_RETURN    ///< maximize μ'w
        };

        std::string to_string(ObjectiveType objective);

        /**
         * @brief Parse "min_variance" / "max_return"
         * @throws ConfigurationError for anything else
         */
        ObjectiveType objective_from_string(const std::string &name);

        /**
         * @struct BoxConstraints
         * @brief Caller-supplied bounds independent of the risk limits
         */
        struct BoxConstraints
        {
            bool long_only = true;              ///< No short positions
            double min_weight = 0.0;            ///< Per-holding lower bound
            double max_weight = 1.0;            ///< Per-holding upper bound
            std::optional<double> max_leverage; ///< Gross / net risky exposure cap

            /**
             * @throws ConfigurationError if bounds are inconsistent
             */
            void validate() const;

            static BoxConstraints from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct SolverBudget
         * @brief Bounds on the work one optimize() call may do
         */
        struct SolverBudget
        {
            int max_iterations = 20000;      ///< ADMM iterations per QP solve
            int max_outer_iterations = 25;   ///< Cutting-plane rounds for nonlinear limits
            int max_solves = 200;            ///< QP solves across the whole call
            double timeout_ms = 5000.0;      ///< Wall-clock deadline for the whole call
            double tolerance = 1e-7;         ///< QP tolerance

            void validate() const;

            static SolverBudget from_json(const nlohmann::json &j);
        };

        /**
         * @struct OptimizationProblem
         * @brief Everything an optimizer needs, already resolved to weights space
         */
        struct OptimizationProblem
        {
            ObjectiveType objective = ObjectiveType::MIN_VARIANCE;
            std::vector<std::string> tickers;          ///< Universe (n)
            std::vector<std::string> factor_names;     ///< Factors (k)
            Eigen::MatrixXd betas;                     ///< n x k
            Eigen::VectorXd residual_variance;         ///< n, annualized
            Eigen::MatrixXd factor_covariance;         ///< k x k, annualized
            Eigen::VectorXd expected_returns;          ///< n, required for MAX_RETURN
            Eigen::VectorXd current_weights;           ///< n, optional, for turnover reporting
            std::vector<bool> cash_flags;              ///< n, true for cash proxies (excluded from leverage when long)
            risk::RiskLimitSet limits;                 ///< Hard constraints
            BoxConstraints box;
            SolverBudget budget;
            std::map<std::string, double> worst_case_moves; ///< Factor crash magnitudes for the loss limit

            /**
             * @throws ConfigurationError on dimension mismatch, non-finite input,
             *         missing expected returns or a beta limit on an unknown factor
             */
            void validate() const;

            size_t num_assets() const { return tickers.size(); }

            /**
             * @brief Full asset covariance B Σf B' + diag(d)
             */
            Eigen::MatrixXd asset_covariance() const;

            /**
             * @brief Gross / |net| over risky positions; positive cash is not risk
             */
            double leverage_of(const Eigen::VectorXd &weights) const;

            /**
             * @brief Decompose a candidate and derive the metrics the limits apply to
             * @param weights Candidate weights
             * @param decomposition Output: variance decomposition of the candidate
             */
            risk::RiskMetrics metrics_for(const Eigen::VectorXd &weights,
                                          risk::VarianceDecomposition &decomposition) const;
        };

        enum class OptimizationStatus
        {
            FEASIBLE,        ///< Verified limit-compliant weights
            INFEASIBLE,      ///< No weights satisfy the limits within the universe
            DID_NOT_CONVERGE ///< Budget exhausted; weights (if any) are a non-authoritative candidate
        };

        std::string to_string(OptimizationStatus status);

        /**
         * @struct OptimizationResult
         * @brief Tagged optimizer outcome
         */
        struct OptimizationResult
        {
            OptimizationStatus status = OptimizationStatus::DID_NOT_CONVERGE;
            bool authoritative = false;  ///< True only for FEASIBLE
            std::vector<std::string> tickers;
            Eigen::VectorXd weights;     ///< Empty for INFEASIBLE
            double expected_return = 0.0;
            double volatility = 0.0;
            double turnover = 0.0;       ///< Sum |w - current| when current weights are known
            std::vector<risk::ComplianceVerdict> verdicts;
            int iterations = 0;          ///< ADMM iterations across all solves
            int solves = 0;              ///< QP solves performed
            std::string message;

            bool is_feasible() const { return status == OptimizationStatus::FEASIBLE; }

            /**
             * @throws SolverDidNotConverge if status is DID_NOT_CONVERGE
             * @throws OptimizationInfeasible if status is INFEASIBLE
             */
            void require_feasible() const;

            /**
             * @brief Ticker -> weight, skipping weights below threshold in magnitude
             */
            std::map<std::string, double> weight_map(double threshold = 0.0) const;

            nlohmann::json to_json() const;

            void print_summary() const;
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for portfolio optimizers
         *
         * Usage Example:
         * @code
         * std::unique_ptr<OptimizerInterface> optimizer = std::make_unique<PortfolioOptimizer>();
         * auto result = optimizer->optimize(problem);
         * if (result.is_feasible()) { ... }
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @brief Search for limit-compliant weights
             * @throws ConfigurationError if the problem is malformed
             */
            virtual OptimizationResult optimize(const OptimizationProblem &problem) const = 0;

            virtual std::string get_name() const = 0;
        };

    } // namespace optimizer
} // namespace riskengine
