/**
 * @file osqp_solver.cpp
 * @brief OSQP wrapper: CSC conversion, constraint stacking and status mapping
 */

#include "optimizer/osqp_solver.hpp"
#include <Eigen/SparseCore>
#include <osqp/osqp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

namespace riskengine
{
    namespace optimizer
    {
        namespace
        {
            using CscMatrix = Eigen::SparseMatrix<OSQPFloat, Eigen::ColMajor, OSQPInt>;
            using Entry = Eigen::Triplet<OSQPFloat, OSQPInt>;
            using Bounds = Eigen::Matrix<OSQPFloat, Eigen::Dynamic, 1>;

            constexpr double kDropBelow = 1e-14;

            void append_dense(std::vector<Entry> &entries, const Eigen::MatrixXd &block, Eigen::Index row_offset)
            {
                for (Eigen::Index j = 0; j < block.cols(); ++j)
                {
                    for (Eigen::Index i = 0; i < block.rows(); ++i)
                    {
                        if (std::abs(block(i, j)) > kDropBelow)
                        {
                            entries.emplace_back(static_cast<OSQPInt>(row_offset + i), static_cast<OSQPInt>(j),
                                                 static_cast<OSQPFloat>(block(i, j)));
                        }
                    }
                }
            }

            // OSQP reads only the upper triangle of P; the diagonal is always stored
            CscMatrix upper_triangle(const Eigen::MatrixXd &P)
            {
                std::vector<Entry> entries;
                for (Eigen::Index j = 0; j < P.cols(); ++j)
                {
                    entries.emplace_back(static_cast<OSQPInt>(j), static_cast<OSQPInt>(j), static_cast<OSQPFloat>(P(j, j)));
                    for (Eigen::Index i = 0; i < j; ++i)
                    {
                        if (std::abs(P(i, j)) > kDropBelow)
                        {
                            entries.emplace_back(static_cast<OSQPInt>(i), static_cast<OSQPInt>(j), static_cast<OSQPFloat>(P(i, j)));
                        }
                    }
                }
                CscMatrix m(P.rows(), P.cols());
                m.setFromTriplets(entries.begin(), entries.end());
                m.makeCompressed();
                return m;
            }

            struct StackedConstraints
            {
                CscMatrix A;
                Bounds lower;
                Bounds upper;
            };

            StackedConstraints stack_constraints(const QuadraticProblem &problem)
            {
                const Eigen::Index n = problem.q.size();
                const Eigen::Index n_eq = problem.A_eq.size() > 0 ? problem.A_eq.rows() : 0;
                const Eigen::Index n_ineq = problem.A_ineq.size() > 0 ? problem.A_ineq.rows() : 0;
                const Eigen::Index m = n_eq + n_ineq + n;

                std::vector<Entry> entries;
                if (n_eq > 0)
                {
                    append_dense(entries, problem.A_eq, 0);
                }
                if (n_ineq > 0)
                {
                    append_dense(entries, problem.A_ineq, n_eq);
                }
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    entries.emplace_back(static_cast<OSQPInt>(n_eq + n_ineq + j), static_cast<OSQPInt>(j), 1.0);
                }

                StackedConstraints c;
                c.A.resize(m, n);
                c.A.setFromTriplets(entries.begin(), entries.end());
                c.A.makeCompressed();

                c.lower = Bounds::Constant(m, -OSQP_INFTY);
                c.upper = Bounds::Constant(m, OSQP_INFTY);
                if (n_eq > 0)
                {
                    c.lower.head(n_eq) = problem.b_eq.cast<OSQPFloat>();
                    c.upper.head(n_eq) = problem.b_eq.cast<OSQPFloat>();
                }
                if (n_ineq > 0 && problem.b_ineq_lower.size() > 0)
                {
                    c.lower.segment(n_eq, n_ineq) = problem.b_ineq_lower.cast<OSQPFloat>();
                }
                if (n_ineq > 0 && problem.b_ineq_upper.size() > 0)
                {
                    c.upper.segment(n_eq, n_ineq) = problem.b_ineq_upper.cast<OSQPFloat>();
                }
                c.lower.tail(n) = problem.lower_bounds.cast<OSQPFloat>();
                c.upper.tail(n) = problem.upper_bounds.cast<OSQPFloat>();

                // Infinite bounds are passed as OSQP_INFTY
                c.lower = c.lower.cwiseMax(-OSQP_INFTY).cwiseMin(OSQP_INFTY);
                c.upper = c.upper.cwiseMax(-OSQP_INFTY).cwiseMin(OSQP_INFTY);
                return c;
            }

            // Non-owning OSQP view of a compressed Eigen matrix
            OSQPCscMatrix csc_view(CscMatrix &m)
            {
                OSQPCscMatrix view{};
                view.m = static_cast<OSQPInt>(m.rows());
                view.n = static_cast<OSQPInt>(m.cols());
                view.p = m.outerIndexPtr();
                view.i = m.innerIndexPtr();
                view.x = m.valuePtr();
                view.nzmax = static_cast<OSQPInt>(m.nonZeros());
                view.nz = -1;
                return view;
            }

            SolverStatus to_solver_status(OSQPInt status_val)
            {
                switch (status_val)
                {
                case OSQP_SOLVED:
                    return SolverStatus::SOLVED;
                case OSQP_SOLVED_INACCURATE:
                    return SolverStatus::SOLVED_INACCURATE;
                case OSQP_PRIMAL_INFEASIBLE:
                case OSQP_PRIMAL_INFEASIBLE_INACCURATE:
                    return SolverStatus::PRIMAL_INFEASIBLE;
                case OSQP_DUAL_INFEASIBLE:
                case OSQP_DUAL_INFEASIBLE_INACCURATE:
                    return SolverStatus::DUAL_INFEASIBLE;
                case OSQP_MAX_ITER_REACHED:
                    return SolverStatus::MAX_ITERATIONS;
                case OSQP_TIME_LIMIT_REACHED:
                    return SolverStatus::TIME_LIMIT;
                default:
                    return SolverStatus::FAILED;
                }
            }
        } // namespace

        OSQPSolver::OSQPSolver(const SolverOptions &options) : options_(options)
        {
        }

        void OSQPSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            const auto n = static_cast<OSQPInt>(problem.q.size());
            CscMatrix P = upper_triangle(problem.P);
            StackedConstraints constraints = stack_constraints(problem);
            Bounds q = problem.q.cast<OSQPFloat>();

            OSQPCscMatrix P_view = csc_view(P);
            OSQPCscMatrix A_view = csc_view(constraints.A);

            OSQPSettings settings{};
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = options_.polish ? 1 : 0;
            settings.time_limit = std::max(0.0, options_.time_limit_seconds);

            ::OSQPSolver *raw = nullptr;
            const OSQPInt setup_code = osqp_setup(&raw, &P_view, q.data(), &A_view,
                                                  constraints.lower.data(), constraints.upper.data(),
                                                  A_view.m, n, &settings);
            std::unique_ptr<::OSQPSolver, decltype(&osqp_cleanup)> workspace(raw, &osqp_cleanup);

            SolverResult result;
            if (setup_code != 0 || !workspace)
            {
                result.status = SolverStatus::SETUP_FAILED;
                result.message = "OSQP setup failed with code " + std::to_string(setup_code);
                spdlog::warn("OSQP setup failed with code {}", static_cast<long long>(setup_code));
                return result;
            }

            osqp_solve(workspace.get());

            const OSQPInfo &info = *workspace->info;
            result.solution = Eigen::Map<const Bounds>(workspace->solution->x, n).cast<double>();
            result.iterations = static_cast<int>(info.iter);
            result.objective_value = info.obj_val;
            result.status = to_solver_status(info.status_val);
            result.message = info.status;
            result.success = result.status == SolverStatus::SOLVED ||
                             result.status == SolverStatus::SOLVED_INACCURATE;

            if (result.success && !result.solution.allFinite())
            {
                result.success = false;
                result.status = SolverStatus::FAILED;
                result.message = "OSQP returned a non-finite solution";
            }
            return result;
        }

    } // namespace optimizer
} // namespace riskengine
