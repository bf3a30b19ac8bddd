#pragma once

#include "schemasim/mna.hpp"
#include "schemasim/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace schemasim {

// =============================================================================
// Convergence History Tracking
// =============================================================================

/// Single Newton iteration record
struct IterationRecord {
    int iteration = 0;
    Real max_delta = 0.0;  // max |x_k - x_{k-1}| over all unknowns
    bool converged = false;
};

class ConvergenceHistory {
public:
    static constexpr std::size_t max_history = 100;

    void clear() { records_.clear(); }

    void add_record(const IterationRecord& record) {
        if (records_.size() < max_history) {
            records_.push_back(record);
        }
    }

    [[nodiscard]] std::size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }
    [[nodiscard]] const IterationRecord& operator[](std::size_t i) const { return records_[i]; }
    [[nodiscard]] const IterationRecord& last() const { return records_.back(); }

    [[nodiscard]] auto begin() const { return records_.begin(); }
    [[nodiscard]] auto end() const { return records_.end(); }

    /// Max delta grew over the last `window` iterations
    [[nodiscard]] bool is_diverging(std::size_t window = 3) const;

private:
    std::vector<IterationRecord> records_;
};

// =============================================================================
// Newton-Raphson Solver
// =============================================================================

struct NewtonOptions {
    int max_iterations = 100;
    Real tolerance = 1e-3;
};

struct NewtonResult {
    Vector x;  // full node vector, ground at index 0
    SolverStatus status = SolverStatus::Success;
    int iterations = 0;
    Real max_delta = 0.0;
    ConvergenceHistory history;
    std::string error_message;

    [[nodiscard]] bool success() const { return status == SolverStatus::Success; }
};

class NewtonSolver {
public:
    /// Linearize every device at x and assemble A * y = b (ground excluded)
    using SystemFunction = std::function<void(const Vector& x, SparseMatrix& A, Vector& b)>;

    explicit NewtonSolver(NewtonOptions options = {});

    /// Iterate from x0 until max |dx| < tolerance or max_iterations is hit
    [[nodiscard]] NewtonResult solve(const Vector& x0, const SystemFunction& system);

    [[nodiscard]] const NewtonOptions& options() const { return options_; }
    void set_options(const NewtonOptions& options) { options_ = options; }

private:
    NewtonOptions options_;
    LinearSolver linear_solver_;
};

}  // namespace schemasim
