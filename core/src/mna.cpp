#include "schemasim/mna.hpp"

#include <cmath>
#include <vector>

namespace schemasim {

namespace {

constexpr Real kResidualTolerance = 1e-8;

}  // namespace

MNAAssembler::MNAAssembler(const Netlist& netlist)
    : netlist_(netlist) {}

Index MNAAssembler::variable_count() const {
    return netlist_.nodes().unknown_count();
}

void MNAAssembler::assemble(SparseMatrix& A, Vector& b) const {
    const Index n = variable_count();
    std::vector<Triplet> triplets;
    triplets.reserve(netlist_.device_count() * 9);
    b = Vector::Zero(n);

    for (const auto& device : netlist_.devices()) {
        const DeviceBase& d = base_of(device);
        const auto nodes = d.nodes();
        const Matrix& jac = d.jacobian();
        const Vector& rhs = d.rhs();

        for (std::size_t i = 0; i < nodes.size(); ++i) {
            // Ground row/column is dropped
            if (nodes[i] == ground_node) continue;
            const Index row = nodes[i] - 1;
            const auto li = static_cast<Eigen::Index>(i);

            b(row) += rhs(li);
            for (std::size_t j = 0; j < nodes.size(); ++j) {
                if (nodes[j] == ground_node) continue;
                const Real value = jac(li, static_cast<Eigen::Index>(j));
                if (value != 0.0) {
                    triplets.emplace_back(row, nodes[j] - 1, value);
                }
            }
        }
    }

    A.resize(n, n);
    A.setFromTriplets(triplets.begin(), triplets.end());
    A.makeCompressed();
}

SolverStatus LinearSolver::solve(const SparseMatrix& A, const Vector& b, Vector& x) {
    last_error_.clear();
    if (A.rows() == 0) {
        x = Vector::Zero(0);
        return SolverStatus::Success;
    }

    lu_.analyzePattern(A);
    lu_.factorize(A);
    if (lu_.info() != Eigen::Success) {
        last_error_ = "LU factorization failed: " + lu_.lastErrorMessage();
        return SolverStatus::SingularMatrix;
    }

    x = lu_.solve(b);
    if (lu_.info() != Eigen::Success) {
        last_error_ = "LU solve failed";
        return SolverStatus::NumericalError;
    }
    if (!x.allFinite()) {
        last_error_ = "Solution contains non-finite values";
        return SolverStatus::NumericalError;
    }

    // A rounding-level pivot factorizes but leaves a residual far above
    // what a backward-stable LU produces
    Vector row_sums = Vector::Zero(A.rows());
    for (Eigen::Index k = 0; k < A.outerSize(); ++k) {
        for (SparseMatrix::InnerIterator it(A, k); it; ++it) {
            row_sums(it.row()) += std::abs(it.value());
        }
    }
    const Real a_norm = row_sums.maxCoeff();
    const Real residual = (A * x - b).lpNorm<Eigen::Infinity>();
    const Real scale = a_norm * x.lpNorm<Eigen::Infinity>() + b.lpNorm<Eigen::Infinity>();
    if (residual > kResidualTolerance * scale) {
        last_error_ = "Residual " + std::to_string(residual) + " indicates a near-singular matrix";
        return SolverStatus::SingularMatrix;
    }
    return SolverStatus::Success;
}

}  // namespace schemasim
