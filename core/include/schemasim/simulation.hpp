#pragma once

#include "schemasim/mna.hpp"
#include "schemasim/netlist.hpp"
#include "schemasim/solver.hpp"
#include "schemasim/types.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace schemasim {

// Callback for streaming results during simulation
using SimulationCallback = std::function<void(Real time, const Vector& state)>;

// =============================================================================
// Simulation Control (cooperative cancellation between timesteps)
// =============================================================================

class SimulationControl {
public:
    void request_stop() { stop_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool should_stop() const { return stop_.load(std::memory_order_relaxed); }
    void reset() { stop_.store(false, std::memory_order_relaxed); }

private:
    std::atomic<bool> stop_{false};
};

// =============================================================================
// Simulation History
// =============================================================================

/// Append-only record of every accepted timestep
struct SimulationHistory {
    std::vector<Real> time;
    std::vector<Vector> states;  // full node vector, ground at index 0

    std::vector<std::string> node_names;    // label per node index
    std::vector<std::string> device_names;  // netlist order
    std::vector<bool> has_current;          // device carries a branch current
    std::vector<std::vector<Real>> currents;  // [step][device]

    std::vector<std::string> probe_names;   // voltage probes
    std::vector<std::vector<Real>> probe_values;  // [step][probe]

    [[nodiscard]] std::size_t size() const { return time.size(); }
    [[nodiscard]] bool empty() const { return time.empty(); }

    [[nodiscard]] std::optional<NodeIndex> find_node(const std::string& label) const;
    [[nodiscard]] std::optional<std::size_t> find_device(const std::string& name) const;
    [[nodiscard]] std::optional<std::size_t> find_probe(const std::string& name) const;
};

// =============================================================================
// Simulation Result
// =============================================================================

struct SimulationResult {
    SimulationHistory history;

    SimulationState state = SimulationState::Initializing;
    SolverStatus final_status = SolverStatus::Success;
    std::string message;

    Real last_stable_time = 0.0;  // time of the last accepted step
    bool has_stable_time = false;

    // Metadata
    int total_steps = 0;
    int newton_iterations_total = 0;
    int min_iterations_per_step = 0;
    int max_iterations_per_step = 0;
    double total_time_seconds = 0.0;

    /// Newton history of the last attempted solve
    ConvergenceHistory last_convergence;

    /// Typed error for Failed runs (ConvergenceError or SingularSystemError)
    std::exception_ptr error;

    [[nodiscard]] bool success() const { return state == SimulationState::Done; }
    [[nodiscard]] bool cancelled() const { return state == SimulationState::Cancelled; }

    void rethrow_if_failed() const {
        if (error) {
            std::rethrow_exception(error);
        }
    }
};

// =============================================================================
// Transient Simulator (fixed-step backward Euler)
// =============================================================================

class Simulator {
public:
    Simulator(Netlist& netlist, const SimulationOptions& options);

    /// Build the netlist, solve the t = 0 operating point and step to tmax.
    /// Construction errors (FloatingPortError, ParameterError) are thrown;
    /// solve-time errors are captured in the result with the partial history.
    SimulationResult run_transient(const SimulationCallback& callback = nullptr,
                                   SimulationControl* control = nullptr);

    [[nodiscard]] SimulationState state() const { return state_; }
    [[nodiscard]] const SimulationOptions& options() const { return options_; }
    [[nodiscard]] const Netlist& netlist() const { return netlist_; }

private:
    NewtonResult solve_at(Real time, bool initial, const Vector& x_prev);
    void record(SimulationResult& result, Real time, const Vector& x) const;
    void fail(SimulationResult& result, Real time, const NewtonResult& newton);

    Netlist& netlist_;
    SimulationOptions options_;
    NewtonSolver newton_solver_;
    SimulationState state_ = SimulationState::Initializing;
};

/// Convenience wrapper: Simulator(netlist, options).run_transient()
SimulationResult transient(Netlist& netlist, const SimulationOptions& options,
                           SimulationControl* control = nullptr);

}  // namespace schemasim
