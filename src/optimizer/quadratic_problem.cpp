/**
 * @file quadratic_problem.cpp
 * @brief Validation for QuadraticProblem
 */

#include "optimizer/quadratic_problem.hpp"
#include "core/errors.hpp"

namespace riskengine
{
    namespace optimizer
    {

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw ConfigurationError("QuadraticProblem: empty problem");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw ConfigurationError("QuadraticProblem: P must be " + std::to_string(n) + "x" +
                                         std::to_string(n));
            }

            if (!P.allFinite() || !q.allFinite())
            {
                throw ConfigurationError("QuadraticProblem: objective contains NaN or Inf");
            }

            if (A_eq.size() > 0 && (A_eq.cols() != n || A_eq.rows() != b_eq.size()))
            {
                throw ConfigurationError("QuadraticProblem: A_eq / b_eq dimension mismatch");
            }

            if (A_ineq.size() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw ConfigurationError("QuadraticProblem: A_ineq has wrong column count");
                }
                if (b_ineq_lower.size() > 0 && b_ineq_lower.size() != A_ineq.rows())
                {
                    throw ConfigurationError("QuadraticProblem: b_ineq_lower dimension mismatch");
                }
                if (b_ineq_upper.size() > 0 && b_ineq_upper.size() != A_ineq.rows())
                {
                    throw ConfigurationError("QuadraticProblem: b_ineq_upper dimension mismatch");
                }
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw ConfigurationError("QuadraticProblem: bounds must have one entry per variable");
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw ConfigurationError("QuadraticProblem: lower bound exceeds upper bound for variable " +
                                             std::to_string(i));
                }
            }
        }

        std::string to_string(SolverStatus status)
        {
            switch (status)
            {
            case SolverStatus::SOLVED:
                return "solved";
            case SolverStatus::SOLVED_INACCURATE:
                return "solved inaccurate";
            case SolverStatus::PRIMAL_INFEASIBLE:
                return "primal infeasible";
            case SolverStatus::DUAL_INFEASIBLE:
                return "dual infeasible";
            case SolverStatus::MAX_ITERATIONS:
                return "maximum iterations reached";
            case SolverStatus::TIME_LIMIT:
                return "time limit reached";
            case SolverStatus::SETUP_FAILED:
                return "setup failed";
            case SolverStatus::FAILED:
                return "failed";
            }
            return "unknown";
        }

    } // namespace optimizer
} // namespace riskengine
