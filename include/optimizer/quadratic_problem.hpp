/**
 * @file quadratic_problem.hpp
 * @brief Quadratic program specification shared by the QP backends
 *
 * Problems have the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq                        (equality constraints)
 *               b_ineq_lower <= A_ineq * x <= b_ineq_upper
 *               lower_bounds <= x <= upper_bounds       (box constraints)
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace riskengine
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem specification
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric PSD
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::MatrixXd A_ineq;       ///< Inequality constraint matrix
            Eigen::VectorXd b_ineq_lower; ///< Lower bounds for A_ineq * x (empty = unbounded)
            Eigen::VectorXd b_ineq_upper; ///< Upper bounds for A_ineq * x (empty = unbounded)

            Eigen::VectorXd lower_bounds; ///< Lower bounds on x
            Eigen::VectorXd upper_bounds; ///< Upper bounds on x

            /**
             * @brief Validate problem specification
             * @throws ConfigurationError if dimensions disagree or values are not finite
             */
            void validate() const;

            Eigen::Index num_variables() const { return q.size(); }
        };

        /**
         * @struct SolverOptions
         * @brief Options passed through to the QP backend
         */
        struct SolverOptions
        {
            int max_iterations = 20000;       ///< ADMM iteration cap
            double tolerance = 1e-7;          ///< Absolute and relative tolerance
            double time_limit_seconds = 0.0;  ///< 0 disables the limit
            bool polish = true;               ///< Refine the ADMM solution on the active set
            bool verbose = false;             ///< Solver console output
        };

        /**
         * @enum SolverStatus
         * @brief Backend-independent termination status
         */
        enum class SolverStatus
        {
            SOLVED,
            SOLVED_INACCURATE,
            PRIMAL_INFEASIBLE,
            DUAL_INFEASIBLE,
            MAX_ITERATIONS,
            TIME_LIMIT,
            SETUP_FAILED,
            FAILED
        };

        std::string to_string(SolverStatus status);

        /**
         * @struct SolverResult
         * @brief Result from a QP solve
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;     ///< Last iterate (meaningful only when success is true)
            double objective_value = 0.0; ///< Final objective value
            SolverStatus status = SolverStatus::FAILED;
            bool success = false;         ///< SOLVED or SOLVED_INACCURATE
            int iterations = 0;           ///< Number of iterations
            std::string message;          ///< Backend status text
        };

    } // namespace optimizer
} // namespace riskengine
