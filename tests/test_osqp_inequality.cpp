#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <limits>

using namespace riskengine;
using namespace riskengine::optimizer;
using Catch::Matchers::WithinAbs;

TEST_CASE("Two-sided beta band binds the return-seeking weight", "[OSQP]")
{
    // max 0.10 x + 0.05 y on a unit budget with |1.2 x + 0.2 y| <= 0.3:
    // the band caps x at 0.1
    QuadraticProblem problem;
    problem.P = 2e-6 * Eigen::MatrixXd::Identity(2, 2);
    problem.q = Eigen::Vector2d(-0.10, -0.05);

    problem.A_eq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_eq = Eigen::VectorXd::Ones(1);

    problem.A_ineq = Eigen::MatrixXd(1, 2);
    problem.A_ineq << 1.2, 0.2;
    problem.b_ineq_lower = Eigen::VectorXd::Constant(1, -0.3);
    problem.b_ineq_upper = Eigen::VectorXd::Constant(1, 0.3);

    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    auto result = OSQPSolver().solve(problem);

    REQUIRE(result.success);
    REQUIRE(result.status == SolverStatus::SOLVED);
    REQUIRE_THAT(result.solution(0), WithinAbs(0.1, 1e-5));
    REQUIRE_THAT(result.solution(1), WithinAbs(0.9, 1e-5));
}

TEST_CASE("Unbounded inequality sides are passed as infinity", "[OSQP]")
{
    QuadraticProblem problem;
    problem.P = 2e-6 * Eigen::MatrixXd::Identity(2, 2);
    problem.q = -Eigen::VectorXd::Ones(2);
    problem.A_ineq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_ineq_lower = Eigen::VectorXd::Constant(1, -std::numeric_limits<double>::infinity());
    problem.b_ineq_upper = Eigen::VectorXd::Constant(1, 0.5);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    auto result = OSQPSolver().solve(problem);
    REQUIRE(result.success);
    REQUIRE_THAT(result.solution.sum(), WithinAbs(0.5, 1e-6));
}

TEST_CASE("OSQP minimum variance with a budget constraint", "[OSQP]")
{
    // min wᵀΣw s.t. 1ᵀw = 1, diagonal Σ: w_i ∝ 1/σ_i²
    Eigen::VectorXd variances(3);
    variances << 0.04, 0.09, 0.16;

    QuadraticProblem problem;
    problem.P = 2.0 * variances.asDiagonal().toDenseMatrix();
    problem.q = Eigen::VectorXd::Zero(3);
    problem.A_eq = Eigen::MatrixXd::Ones(1, 3);
    problem.b_eq = Eigen::VectorXd::Ones(1);
    problem.lower_bounds = Eigen::VectorXd::Zero(3);
    problem.upper_bounds = Eigen::VectorXd::Ones(3);

    SolverOptions options;
    options.tolerance = 1e-9;
    OSQPSolver solver(options);
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    const Eigen::VectorXd inverse = variances.cwiseInverse();
    const Eigen::VectorXd expected = inverse / inverse.sum();
    for (Eigen::Index i = 0; i < 3; ++i)
    {
        REQUIRE_THAT(result.solution(i), WithinAbs(expected(i), 1e-5));
    }
    REQUIRE(result.iterations > 0);
}

TEST_CASE("OSQP reports primal infeasibility", "[OSQP]")
{
    // Budget of one with every weight capped at 0.2
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(3, 3);
    problem.q = Eigen::VectorXd::Zero(3);
    problem.A_eq = Eigen::MatrixXd::Ones(1, 3);
    problem.b_eq = Eigen::VectorXd::Ones(1);
    problem.lower_bounds = Eigen::VectorXd::Zero(3);
    problem.upper_bounds = Eigen::VectorXd::Constant(3, 0.2);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.status == SolverStatus::PRIMAL_INFEASIBLE);
    REQUIRE(to_string(result.status) == "primal infeasible");
}

TEST_CASE("OSQP rejects ill-formed problems", "[OSQP]")
{
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(2, 2);
    problem.q = Eigen::VectorXd::Zero(2);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    OSQPSolver solver;

    SECTION("Wrong P size")
    {
        problem.P = Eigen::MatrixXd::Identity(3, 3);
        REQUIRE_THROWS_AS(solver.solve(problem), ConfigurationError);
    }

    SECTION("Crossed bounds")
    {
        problem.lower_bounds(1) = 2.0;
        REQUIRE_THROWS_AS(solver.solve(problem), ConfigurationError);
    }

    SECTION("Inequality bound size")
    {
        problem.A_ineq = Eigen::MatrixXd::Ones(2, 2);
        problem.b_ineq_upper = Eigen::VectorXd::Ones(1);
        REQUIRE_THROWS_AS(solver.solve(problem), ConfigurationError);
    }

    SECTION("Non-finite objective")
    {
        problem.q(0) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(solver.solve(problem), ConfigurationError);
    }
}

TEST_CASE("OSQP solver options round-trip", "[OSQP]")
{
    SolverOptions options;
    options.max_iterations = 500;
    options.time_limit_seconds = 0.25;

    OSQPSolver solver;
    solver.set_options(options);
    REQUIRE(solver.get_options().max_iterations == 500);
    REQUIRE(solver.get_options().time_limit_seconds == 0.25);
}
