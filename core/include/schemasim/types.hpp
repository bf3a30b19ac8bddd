#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace schemasim {

// Basic numeric types
using Real = double;
using Index = std::int32_t;

// Node identifier; node 0 is always ground
using NodeIndex = std::int32_t;
constexpr NodeIndex ground_node = 0;

// Sparse matrix types (CSC format for efficiency with Eigen)
using SparseMatrix = Eigen::SparseMatrix<Real, Eigen::ColMajor>;
using Triplet = Eigen::Triplet<Real>;

// Dense vector/matrix types
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;

constexpr Real infinity = std::numeric_limits<Real>::infinity();

// Solver status
enum class SolverStatus {
    Success,
    MaxIterationsReached,
    SingularMatrix,
    NumericalError,
};

[[nodiscard]] constexpr const char* to_string(SolverStatus status) noexcept {
    switch (status) {
        case SolverStatus::Success: return "Success";
        case SolverStatus::MaxIterationsReached: return "MaxIterationsReached";
        case SolverStatus::SingularMatrix: return "SingularMatrix";
        case SolverStatus::NumericalError: return "NumericalError";
        default: return "Unknown";
    }
}

// Transient controller state machine
enum class SimulationState {
    Initializing,
    Stepping,
    Done,
    Failed,
    Cancelled,
};

[[nodiscard]] constexpr const char* to_string(SimulationState state) noexcept {
    switch (state) {
        case SimulationState::Initializing: return "Initializing";
        case SimulationState::Stepping: return "Stepping";
        case SimulationState::Done: return "Done";
        case SimulationState::Failed: return "Failed";
        case SimulationState::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

// Simulation options
struct SimulationOptions {
    // Time parameters
    Real dt = 1e-6;
    Real tmax = 1e-3;

    // Newton-Raphson bounds
    int max_iterations = 100;
    Real tolerance = 1e-3;

    // Throws ParameterError on non-physical settings
    void validate() const;

    // Number of steps after t = 0
    [[nodiscard]] std::size_t step_count() const;
};

}  // namespace schemasim
