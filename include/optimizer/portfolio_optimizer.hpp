/**
 * @file portfolio_optimizer.hpp
 * @brief Limit-constrained portfolio optimizer on a factor risk model
 *
 * Mathematical Formulation (weights split as w = w+ - w-, both >= 0):
 *
 * MIN_VARIANCE:  minimize (1/2) w'Σw
 * MAX_RETURN:    minimize (1/2) λ w'Σw - μ'w
 *
 * Subject to:    sum(w) = 1
 *                lo_i <= w_i <= hi_i                  (box and max_single_holding_weight)
 *                blo_f <= (B'w)_f <= bhi_f            (max_factor_betas, max_single_factor_loss)
 *                gross <= L * net                     (max_leverage, shorts only)
 *
 * where Σ = B Σf B' + diag(d) is the factor-model asset covariance.
 *
 * For MAX_RETURN with a volatility limit, λ is searched by bisection on a
 * log scale until the limit binds. Limits on variance shares
 * (max_factor_variance_contribution, max_systematic_share) are not linear;
 * they are enforced by an outer loop that tightens the offending factors'
 * beta bounds and re-solves.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"
#include "optimizer/quadratic_problem.hpp"
#include <chrono>
#include <optional>

namespace riskengine
{
    namespace optimizer
    {

        /**
         * @class PortfolioOptimizer
         * @brief OSQP-backed optimizer that only reports verified solutions as feasible
         *
         * Usage Example:
         * @code
         * OptimizationProblem problem;
         * problem.objective = ObjectiveType::MIN_VARIANCE;
         * problem.tickers = {"AAPL", "MSFT", "SGOV"};
         * problem.betas = betas;                   // 3 x k
         * problem.residual_variance = residuals;   // 3
         * problem.factor_covariance = factor_cov;  // k x k
         * problem.limits.max_single_holding_weight = 0.5;
         *
         * PortfolioOptimizer optimizer;
         * auto result = optimizer.optimize(problem);
         * result.require_feasible();
         * @endcode
         *
         * Thread Safety: optimize() keeps all state on the stack.
         */
        class PortfolioOptimizer : public OptimizerInterface
        {
        public:
            static constexpr double kMinRiskAversion = 1e-3;  ///< λ used when no volatility limit binds
            static constexpr double kMaxRiskAversion = 1e8;   ///< Upper end of the λ search
            static constexpr double kBisectionRatio = 1.001;  ///< Stop when hi/lo falls below this
            static constexpr double kConstraintMargin = 1e-6; ///< Linear limits are imposed this far inside
            static constexpr double kCutShrink = 0.98;        ///< Extra shrink applied by each cut
            static constexpr double kBudgetTolerance = 1e-6;  ///< Allowed |sum(w) - 1| in a verified result

            PortfolioOptimizer() = default;
            ~PortfolioOptimizer() override = default;

            OptimizationResult optimize(const OptimizationProblem &problem) const override;

            std::string get_name() const override;

        private:
            struct Candidate
            {
                Eigen::VectorXd weights;
                risk::VarianceDecomposition decomposition;
                risk::RiskMetrics metrics;
                std::vector<risk::ComplianceVerdict> verdicts;
                bool within_bounds = false; ///< sum(w) = 1 and every weight inside the box
                bool compliant = false;
            };

            struct Bounds
            {
                Eigen::VectorXd weight_lower;
                Eigen::VectorXd weight_upper;
                double clip_lower = 0.0; ///< Exact per-holding bounds applied after the solve
                double clip_upper = 1.0;
                Eigen::VectorXd beta_lower;
                Eigen::VectorXd beta_upper;
                std::optional<double> leverage;
            };

            struct SearchState
            {
                std::chrono::steady_clock::time_point deadline;
                int solves = 0;
                int iterations = 0;
                std::optional<Candidate> last; ///< Most recent evaluated candidate
                std::string reason;            ///< Why the search stopped early
            };

            enum class PassOutcome
            {
                SOLVED,     ///< Candidate produced (may still fail nonlinear limits)
                INFEASIBLE, ///< QP infeasible or volatility limit unreachable
                EXHAUSTED   ///< Iteration, solve or time budget ran out
            };

            Bounds initial_bounds(const OptimizationProblem &problem) const;

            QuadraticProblem build_qp(const OptimizationProblem &problem,
                                      const Eigen::MatrixXd &covariance,
                                      const Bounds &bounds,
                                      double risk_aversion,
                                      bool include_returns) const;

            std::optional<Candidate> solve_once(const OptimizationProblem &problem,
                                                const Eigen::MatrixXd &covariance,
                                                const Bounds &bounds,
                                                double risk_aversion,
                                                bool include_returns,
                                                SearchState &state,
                                                PassOutcome &outcome) const;

            PassOutcome solve_objective(const OptimizationProblem &problem,
                                        const Eigen::MatrixXd &covariance,
                                        const Bounds &bounds,
                                        SearchState &state,
                                        Candidate &out) const;

            Candidate evaluate(const OptimizationProblem &problem, const Eigen::VectorXd &weights) const;

            /**
             * @brief Tighten beta bounds for variance-share limits the candidate breaks
             * @return false if the candidate fails a limit no cut can address
             */
            bool tighten(const Candidate &candidate, Bounds &bounds) const;

            OptimizationResult make_result(const OptimizationProblem &problem,
                                           OptimizationStatus status,
                                           const std::optional<Candidate> &candidate,
                                           const SearchState &state,
                                           const std::string &message) const;
        };

    } // namespace optimizer
} // namespace riskengine
