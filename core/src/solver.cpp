#include "schemasim/solver.hpp"

#include <cmath>

namespace schemasim {

bool ConvergenceHistory::is_diverging(std::size_t window) const {
    if (window < 2 || records_.size() < window) return false;

    for (std::size_t i = records_.size() - window + 1; i < records_.size(); ++i) {
        if (records_[i].max_delta <= records_[i - 1].max_delta) {
            return false;
        }
    }
    return true;
}

NewtonSolver::NewtonSolver(NewtonOptions options)
    : options_(options) {}

NewtonResult NewtonSolver::solve(const Vector& x0, const SystemFunction& system) {
    NewtonResult result;
    result.x = x0;

    const Eigen::Index n = x0.size();
    Vector x = x0;
    SparseMatrix A;
    Vector b;
    Vector y;

    for (int iter = 1; iter <= options_.max_iterations; ++iter) {
        system(x, A, b);

        SolverStatus status = linear_solver_.solve(A, b, y);
        result.iterations = iter;
        if (status != SolverStatus::Success) {
            result.status = status;
            result.error_message = linear_solver_.last_error();
            result.history.add_record({iter, result.max_delta, false});
            return result;
        }

        Vector x_new = Vector::Zero(n);
        if (n > 1) {
            x_new.tail(n - 1) = y;
        }

        const Real delta = n > 0 ? (x_new - x).cwiseAbs().maxCoeff() : 0.0;
        const bool converged = delta < options_.tolerance;

        x = std::move(x_new);
        result.x = x;
        result.max_delta = delta;
        result.history.add_record({iter, delta, converged});

        if (converged) {
            result.status = SolverStatus::Success;
            return result;
        }
    }

    result.status = SolverStatus::MaxIterationsReached;
    result.error_message = "Newton iteration did not converge in " +
                           std::to_string(options_.max_iterations) + " iterations";
    if (result.history.is_diverging()) {
        result.error_message += " (max delta kept growing)";
    }
    return result;
}

}  // namespace schemasim
