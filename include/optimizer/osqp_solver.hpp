/**
 * @file osqp_solver.hpp
 * @brief Solves QuadraticProblem instances with OSQP (v1 C API)
 *
 * OSQP takes one two-sided constraint block, so the problem rows are
 * stacked as:
 *
 *   A = [A_eq; A_ineq; I]
 *   l = [b_eq; b_ineq_lower; lower_bounds]
 *   u = [b_eq; b_ineq_upper; upper_bounds]
 *
 * Iteration and wall-clock limits are always passed through, so a solve
 * never runs unbounded.
 */

#pragma once

#include "optimizer/quadratic_problem.hpp"
#include <Eigen/Dense>

namespace riskengine
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Runs one QuadraticProblem through OSQP
         *
         * Each solve() builds and frees its own OSQP workspace, so a shared
         * instance is safe across threads. Infeasibility and budget
         * exhaustion come back as a SolverStatus, never as an exception.
         */
        class OSQPSolver
        {
        public:
            explicit OSQPSolver(const SolverOptions &options = SolverOptions());

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

            /// @throws ConfigurationError if the problem fails QuadraticProblem::validate()
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_;
        };

    } // namespace optimizer
} // namespace riskengine
