/**
 * @file portfolio_optimizer.cpp
 * @brief Implementation of PortfolioOptimizer
 */

#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace riskengine
{
    namespace optimizer
    {
        namespace
        {
            constexpr double kInf = std::numeric_limits<double>::infinity();
            constexpr double kTieBreak = 1e-8; // Penalty on w+ + w- so the split stays complementary
            constexpr double kSnap = 1e-9;     // Split variables below this are treated as zero

            double seconds_left(std::chrono::steady_clock::time_point deadline)
            {
                return std::chrono::duration<double>(deadline - std::chrono::steady_clock::now()).count();
            }
        } // namespace

        std::string PortfolioOptimizer::get_name() const
        {
            return "PortfolioOptimizer";
        }

        // ============================================================================
        // Constraint construction
        // ============================================================================

        PortfolioOptimizer::Bounds PortfolioOptimizer::initial_bounds(const OptimizationProblem &problem) const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(problem.num_assets());
            const Eigen::Index k = static_cast<Eigen::Index>(problem.factor_names.size());
            const risk::RiskLimitSet &limits = problem.limits;
            const BoxConstraints &box = problem.box;

            Bounds b;

            double cap = kInf;
            if (limits.max_single_holding_weight)
            {
                cap = *limits.max_single_holding_weight - kConstraintMargin;
            }

            // Without the margin when n equal caps are exactly what sum(w) = 1 needs
            const double raw_cap = limits.max_single_holding_weight.value_or(kInf);
            if (static_cast<double>(n) * cap < 1.0)
            {
                cap = raw_cap;
            }

            const double hi = std::min(box.max_weight, cap);
            const double lo = box.long_only ? std::max(box.min_weight, 0.0) : std::max(box.min_weight, -cap);
            b.weight_lower = Eigen::VectorXd::Constant(n, lo);
            b.weight_upper = Eigen::VectorXd::Constant(n, hi);
            b.clip_upper = std::min(box.max_weight, raw_cap);
            b.clip_lower = box.long_only ? std::max(box.min_weight, 0.0) : std::max(box.min_weight, -raw_cap);

            if (box.max_leverage || limits.max_leverage)
            {
                b.leverage = std::min(box.max_leverage.value_or(kInf), limits.max_leverage.value_or(kInf));
            }

            // Losses scale with leverage, which is 1 for a long-only book
            const double loss_leverage = box.long_only ? 1.0 : std::max(1.0, b.leverage.value_or(1.0));

            b.beta_lower = Eigen::VectorXd::Constant(k, -kInf);
            b.beta_upper = Eigen::VectorXd::Constant(k, kInf);
            for (Eigen::Index f = 0; f < k; ++f)
            {
                const std::string &factor = problem.factor_names[static_cast<size_t>(f)];

                auto beta_limit = limits.max_factor_betas.find(factor);
                if (beta_limit != limits.max_factor_betas.end())
                {
                    b.beta_lower(f) = -beta_limit->second + kConstraintMargin;
                    b.beta_upper(f) = beta_limit->second - kConstraintMargin;
                }

                // Loss = max(0, β_f × move_f × leverage), so only the upper side is bounded
                auto move = problem.worst_case_moves.find(factor);
                if (limits.max_single_factor_loss && move != problem.worst_case_moves.end() &&
                    std::abs(move->second) > 0.0)
                {
                    const double bound =
                        std::abs(*limits.max_single_factor_loss) / (std::abs(move->second) * loss_leverage);
                    b.beta_upper(f) = std::min(b.beta_upper(f), bound - kConstraintMargin);
                }
            }

            return b;
        }

        QuadraticProblem PortfolioOptimizer::build_qp(const OptimizationProblem &problem,
                                                      const Eigen::MatrixXd &covariance,
                                                      const Bounds &bounds,
                                                      double risk_aversion,
                                                      bool include_returns) const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(problem.num_assets());
            const Eigen::Index k = static_cast<Eigen::Index>(problem.factor_names.size());

            // w = S x with x = [w+; w-]
            Eigen::MatrixXd S(n, 2 * n);
            S << Eigen::MatrixXd::Identity(n, n), -Eigen::MatrixXd::Identity(n, n);

            QuadraticProblem qp;
            qp.P = risk_aversion * (S.transpose() * covariance * S);
            qp.q = Eigen::VectorXd::Constant(2 * n, kTieBreak);
            if (include_returns)
            {
                qp.q -= S.transpose() * problem.expected_returns;
            }

            qp.A_eq = Eigen::RowVectorXd::Ones(n) * S;
            qp.b_eq = Eigen::VectorXd::Ones(1);

            // Finite beta bounds only
            std::vector<Eigen::Index> beta_rows;
            for (Eigen::Index f = 0; f < k; ++f)
            {
                if (std::isfinite(bounds.beta_lower(f)) || std::isfinite(bounds.beta_upper(f)))
                {
                    beta_rows.push_back(f);
                }
            }

            const bool leverage_row = bounds.leverage.has_value() && !problem.box.long_only;
            const Eigen::Index m = n + static_cast<Eigen::Index>(beta_rows.size()) + (leverage_row ? 1 : 0);

            qp.A_ineq = Eigen::MatrixXd::Zero(m, 2 * n);
            qp.b_ineq_lower = Eigen::VectorXd::Zero(m);
            qp.b_ineq_upper = Eigen::VectorXd::Zero(m);

            qp.A_ineq.topRows(n) = S;
            qp.b_ineq_lower.head(n) = bounds.weight_lower;
            qp.b_ineq_upper.head(n) = bounds.weight_upper;

            Eigen::Index row = n;
            for (Eigen::Index f : beta_rows)
            {
                qp.A_ineq.row(row) = problem.betas.col(f).transpose() * S;
                qp.b_ineq_lower(row) = bounds.beta_lower(f);
                qp.b_ineq_upper(row) = bounds.beta_upper(f);
                ++row;
            }

            if (leverage_row)
            {
                // gross <= L * net over risky positions; long cash is not risk
                const double L = *bounds.leverage;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    const bool is_cash = !problem.cash_flags.empty() && problem.cash_flags[static_cast<size_t>(i)];
                    qp.A_ineq(row, i) = is_cash ? 0.0 : (1.0 - L);
                    qp.A_ineq(row, n + i) = 1.0 + L;
                }
                qp.b_ineq_lower(row) = -kInf;
                qp.b_ineq_upper(row) = 0.0;
            }

            qp.lower_bounds = Eigen::VectorXd::Zero(2 * n);
            qp.upper_bounds.resize(2 * n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                qp.upper_bounds(i) = std::max(bounds.weight_upper(i), 0.0);
                qp.upper_bounds(n + i) = problem.box.long_only ? 0.0 : std::max(-bounds.weight_lower(i), 0.0);
            }

            return qp;
        }

        // ============================================================================
        // Solving and verification
        // ============================================================================

        PortfolioOptimizer::Candidate PortfolioOptimizer::evaluate(const OptimizationProblem &problem,
                                                                   const Eigen::VectorXd &weights) const
        {
            Candidate c;
            c.weights = weights;
            c.metrics = problem.metrics_for(weights, c.decomposition);
            c.verdicts = risk::LimitsChecker::check(c.metrics, problem.limits);

            // An imprecise solve can leave the budget or box violated
            const Bounds bounds = initial_bounds(problem);
            c.within_bounds = std::abs(weights.sum() - 1.0) <= kBudgetTolerance &&
                              weights.minCoeff() >= bounds.clip_lower - kSnap &&
                              weights.maxCoeff() <= bounds.clip_upper + kSnap;
            c.compliant = c.within_bounds && risk::LimitsChecker::all_pass(c.verdicts);
            return c;
        }

        std::optional<PortfolioOptimizer::Candidate> PortfolioOptimizer::solve_once(
            const OptimizationProblem &problem,
            const Eigen::MatrixXd &covariance,
            const Bounds &bounds,
            double risk_aversion,
            bool include_returns,
            SearchState &state,
            PassOutcome &outcome) const
        {
            const double remaining = seconds_left(state.deadline);
            if (remaining <= 0.0)
            {
                outcome = PassOutcome::EXHAUSTED;
                state.reason = "timeout reached";
                return std::nullopt;
            }
            if (state.solves >= problem.budget.max_solves)
            {
                outcome = PassOutcome::EXHAUSTED;
                state.reason = "solve budget exhausted";
                return std::nullopt;
            }

            SolverOptions options;
            options.max_iterations = problem.budget.max_iterations;
            options.tolerance = problem.budget.tolerance;
            options.time_limit_seconds = remaining;

            OSQPSolver solver(options);
            const SolverResult sr = solver.solve(build_qp(problem, covariance, bounds, risk_aversion, include_returns));
            ++state.solves;
            state.iterations += sr.iterations;

            const Eigen::Index n = static_cast<Eigen::Index>(problem.num_assets());
            auto to_weights = [n, &bounds](const Eigen::VectorXd &x)
            {
                Eigen::VectorXd split = x;
                for (Eigen::Index j = 0; j < split.size(); ++j)
                {
                    if (split(j) < kSnap)
                        split(j) = 0.0;
                }
                Eigen::VectorXd w = split.head(n) - split.tail(n);
                const double total = w.sum();
                if (std::abs(total - 1.0) < 1e-4)
                {
                    w /= total;
                }
                return w.cwiseMin(bounds.clip_upper).cwiseMax(bounds.clip_lower).eval();
            };

            if (sr.success)
            {
                outcome = PassOutcome::SOLVED;
                Candidate c = evaluate(problem, to_weights(sr.solution));
                state.last = c;
                return c;
            }

            if (sr.status == SolverStatus::PRIMAL_INFEASIBLE)
            {
                outcome = PassOutcome::INFEASIBLE;
                state.reason = "constraints are infeasible";
                return std::nullopt;
            }

            outcome = PassOutcome::EXHAUSTED;
            state.reason = "QP solver stopped: " + to_string(sr.status);
            if (sr.solution.size() == 2 * n && sr.solution.allFinite())
            {
                // Unverified iterate, kept only as a non-authoritative candidate
                state.last = evaluate(problem, to_weights(sr.solution));
            }
            return std::nullopt;
        }

        PortfolioOptimizer::PassOutcome PortfolioOptimizer::solve_objective(const OptimizationProblem &problem,
                                                                            const Eigen::MatrixXd &covariance,
                                                                            const Bounds &bounds,
                                                                            SearchState &state,
                                                                            Candidate &out) const
        {
            PassOutcome outcome = PassOutcome::SOLVED;
            const std::optional<double> vol_limit = problem.limits.max_volatility;
            auto within_vol = [&vol_limit](const Candidate &c)
            { return !vol_limit || c.metrics.volatility <= *vol_limit; };

            if (problem.objective == ObjectiveType::MIN_VARIANCE)
            {
                auto c = solve_once(problem, covariance, bounds, 1.0, false, state, outcome);
                if (!c)
                    return outcome;
                out = *c;
                if (!within_vol(*c))
                {
                    state.reason = "minimum achievable volatility exceeds max_volatility";
                    return PassOutcome::INFEASIBLE;
                }
                return PassOutcome::SOLVED;
            }

            // MAX_RETURN: start from the return-seeking end of the λ range
            auto aggressive = solve_once(problem, covariance, bounds, kMinRiskAversion, true, state, outcome);
            if (!aggressive)
                return outcome;
            if (within_vol(*aggressive))
            {
                out = *aggressive;
                return PassOutcome::SOLVED;
            }

            // The volatility limit binds; it must be reachable at all
            auto min_var = solve_once(problem, covariance, bounds, 1.0, false, state, outcome);
            if (!min_var)
                return outcome;
            if (!within_vol(*min_var))
            {
                out = *min_var;
                state.reason = "minimum achievable volatility exceeds max_volatility";
                return PassOutcome::INFEASIBLE;
            }

            // Bracket: lo breaks the limit, hi satisfies it
            double lo = kMinRiskAversion;
            double hi = kMinRiskAversion * 10.0;
            std::optional<Candidate> best;
            while (hi <= kMaxRiskAversion)
            {
                auto c = solve_once(problem, covariance, bounds, hi, true, state, outcome);
                if (!c)
                    return outcome;
                if (within_vol(*c))
                {
                    best = c;
                    break;
                }
                lo = hi;
                hi *= 10.0;
            }

            if (!best)
            {
                out = *min_var;
                return PassOutcome::SOLVED;
            }

            while (hi / lo > kBisectionRatio)
            {
                const double mid = std::sqrt(lo * hi);
                auto c = solve_once(problem, covariance, bounds, mid, true, state, outcome);
                if (!c)
                {
                    // Out of budget mid-bisection: the bracketing solution is still verified
                    if (outcome == PassOutcome::EXHAUSTED)
                        break;
                    return outcome;
                }
                if (within_vol(*c))
                {
                    hi = mid;
                    best = c;
                }
                else
                {
                    lo = mid;
                }
            }

            out = *best;
            return PassOutcome::SOLVED;
        }

        bool PortfolioOptimizer::tighten(const Candidate &candidate, Bounds &bounds) const
        {
            bool cut = false;
            const risk::RiskMetrics &m = candidate.metrics;

            auto cap_factor = [&bounds, &m, &cut](Eigen::Index f, double scale)
            {
                const double cap = std::abs(m.portfolio_betas(f)) * scale;
                bounds.beta_upper(f) = std::min(bounds.beta_upper(f), cap);
                bounds.beta_lower(f) = std::max(bounds.beta_lower(f), -cap);
                cut = true;
            };

            for (const auto &v : candidate.verdicts)
            {
                if (v.passed())
                    continue;

                if (v.rule_name == "max_factor_variance_contribution")
                {
                    const double limit = v.limit_value;
                    for (Eigen::Index f = 0; f < m.factor_shares.size(); ++f)
                    {
                        if (m.factor_shares(f) > limit)
                        {
                            cap_factor(f, std::sqrt(limit / m.factor_shares(f)) * kCutShrink);
                        }
                    }
                }
                else if (v.rule_name == "max_systematic_share")
                {
                    const double scale = std::sqrt(v.limit_value / m.systematic_share) * kCutShrink;
                    for (Eigen::Index f = 0; f < m.portfolio_betas.size(); ++f)
                    {
                        cap_factor(f, scale);
                    }
                }
                else
                {
                    // A linear limit failed verification; cutting cannot help
                    return false;
                }
            }

            return cut;
        }

        OptimizationResult PortfolioOptimizer::make_result(const OptimizationProblem &problem,
                                                           OptimizationStatus status,
                                                           const std::optional<Candidate> &candidate,
                                                           const SearchState &state,
                                                           const std::string &message) const
        {
            OptimizationResult result;
            result.status = status;
            result.authoritative = status == OptimizationStatus::FEASIBLE;
            result.tickers = problem.tickers;
            result.iterations = state.iterations;
            result.solves = state.solves;
            result.message = message;

            if (candidate && status != OptimizationStatus::INFEASIBLE)
            {
                result.weights = candidate->weights;
                result.volatility = candidate->decomposition.volatility;
                result.verdicts = candidate->verdicts;
                if (problem.expected_returns.size() == result.weights.size())
                {
                    result.expected_return = problem.expected_returns.dot(result.weights);
                }
                if (problem.current_weights.size() == result.weights.size())
                {
                    result.turnover = (result.weights - problem.current_weights).cwiseAbs().sum();
                }
            }

            spdlog::info("{} ({}) finished {} after {} solves, {} iterations: {}",
                         get_name(), to_string(problem.objective), to_string(status),
                         state.solves, state.iterations, message);
            return result;
        }

        // ============================================================================
        // Entry point
        // ============================================================================

        OptimizationResult PortfolioOptimizer::optimize(const OptimizationProblem &problem) const
        {
            problem.validate();

            SearchState state;
            state.deadline = std::chrono::steady_clock::now() +
                             std::chrono::microseconds(static_cast<long long>(problem.budget.timeout_ms * 1000.0));

            Bounds bounds = initial_bounds(problem);

            // sum(w) = 1 cannot hold inside the per-holding bounds
            if (bounds.weight_upper.sum() < 1.0 || bounds.weight_lower.sum() > 1.0 ||
                (bounds.weight_lower.array() > bounds.weight_upper.array()).any())
            {
                return make_result(problem, OptimizationStatus::INFEASIBLE, std::nullopt, state,
                                   "per-holding bounds cannot sum to 1 over " +
                                       std::to_string(problem.num_assets()) + " holdings");
            }
            if ((bounds.beta_lower.array() > bounds.beta_upper.array()).any())
            {
                return make_result(problem, OptimizationStatus::INFEASIBLE, std::nullopt, state,
                                   "factor beta bounds are contradictory");
            }

            const Eigen::MatrixXd covariance = problem.asset_covariance();

            for (int round = 0; round < problem.budget.max_outer_iterations; ++round)
            {
                Candidate candidate;
                const PassOutcome outcome = solve_objective(problem, covariance, bounds, state, candidate);

                if (outcome == PassOutcome::INFEASIBLE)
                {
                    // Only the uncut problem proves infeasibility; later rounds added our own cuts
                    if (round == 0)
                    {
                        return make_result(problem, OptimizationStatus::INFEASIBLE, std::nullopt, state, state.reason);
                    }
                    return make_result(problem, OptimizationStatus::DID_NOT_CONVERGE, state.last, state,
                                       "tightened factor bounds: " + state.reason);
                }

                if (outcome == PassOutcome::EXHAUSTED)
                {
                    return make_result(problem, OptimizationStatus::DID_NOT_CONVERGE, state.last, state, state.reason);
                }

                if (candidate.compliant)
                {
                    return make_result(problem, OptimizationStatus::FEASIBLE, candidate, state,
                                       round == 0 ? "solved" : "solved after " + std::to_string(round) + " cuts");
                }

                if (!candidate.within_bounds)
                {
                    return make_result(problem, OptimizationStatus::DID_NOT_CONVERGE, candidate, state,
                                       "solver result misses the budget or weight bounds");
                }

                if (!tighten(candidate, bounds))
                {
                    return make_result(problem, OptimizationStatus::DID_NOT_CONVERGE, candidate, state,
                                       "candidate failed limit verification");
                }

                spdlog::debug("{} round {}: variance-share limit breached, tightening factor bounds",
                              get_name(), round + 1);
            }

            return make_result(problem, OptimizationStatus::DID_NOT_CONVERGE, state.last, state,
                               "cutting-plane budget exhausted");
        }

    } // namespace optimizer
} // namespace riskengine
