#pragma once

#include "schemasim/netlist.hpp"
#include "schemasim/types.hpp"

#include <Eigen/SparseLU>
#include <string>

namespace schemasim {

// MNA (Modified Nodal Analysis) system assembler. The global system is
// rebuilt from scratch by summing every device's local stamp; ground
// (node 0) is excluded, so unknown k of the system is node k + 1.
class MNAAssembler {
public:
    explicit MNAAssembler(const Netlist& netlist);

    void assemble(SparseMatrix& A, Vector& b) const;

    // Number of unknowns (nodes + branch currents, ground excluded)
    [[nodiscard]] Index variable_count() const;

private:
    const Netlist& netlist_;
};

// Direct sparse LU solve of the assembled system
class LinearSolver {
public:
    [[nodiscard]] SolverStatus solve(const SparseMatrix& A, const Vector& b, Vector& x);

    [[nodiscard]] const std::string& last_error() const { return last_error_; }

private:
    Eigen::SparseLU<SparseMatrix, Eigen::COLAMDOrdering<int>> lu_;
    std::string last_error_;
};

}  // namespace schemasim
