#include "schemasim/simulation.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace schemasim {

// =============================================================================
// SimulationOptions
// =============================================================================

void SimulationOptions::validate() const {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw ParameterError("Timestep dt must be positive and finite");
    }
    if (!(tmax >= 0.0) || !std::isfinite(tmax)) {
        throw ParameterError("Stop time tmax must be non-negative and finite");
    }
    if (max_iterations < 1) {
        throw ParameterError("max_iterations must be at least 1");
    }
    if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
        throw ParameterError("Newton tolerance must be non-negative and finite");
    }
}

std::size_t SimulationOptions::step_count() const {
    // Small slack so tmax = k * dt is not lost to rounding
    return static_cast<std::size_t>(std::floor(tmax / dt + 1e-9));
}

// =============================================================================
// SimulationHistory
// =============================================================================

std::optional<NodeIndex> SimulationHistory::find_node(const std::string& label) const {
    if (NodeTable::is_ground_label(label)) {
        return ground_node;
    }
    auto it = std::find(node_names.begin(), node_names.end(), label);
    if (it == node_names.end()) {
        return std::nullopt;
    }
    return static_cast<NodeIndex>(it - node_names.begin());
}

std::optional<std::size_t> SimulationHistory::find_device(const std::string& name) const {
    auto it = std::find(device_names.begin(), device_names.end(), name);
    if (it == device_names.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - device_names.begin());
}

std::optional<std::size_t> SimulationHistory::find_probe(const std::string& name) const {
    auto it = std::find(probe_names.begin(), probe_names.end(), name);
    if (it == probe_names.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - probe_names.begin());
}

// =============================================================================
// Simulator
// =============================================================================

Simulator::Simulator(Netlist& netlist, const SimulationOptions& options)
    : netlist_(netlist)
    , options_(options)
{
    NewtonOptions newton_opts;
    newton_opts.max_iterations = options.max_iterations;
    newton_opts.tolerance = options.tolerance;
    newton_solver_.set_options(newton_opts);
}

NewtonResult Simulator::solve_at(Real time, bool initial, const Vector& x_prev) {
    MNAAssembler assembler(netlist_);

    auto system_func = [&](const Vector& x, SparseMatrix& A, Vector& b) {
        StepContext context{options_.dt, time, initial, x, x_prev};
        netlist_.update(context);
        assembler.assemble(A, b);
    };

    // Previous converged solution is the initial guess
    return newton_solver_.solve(x_prev, system_func);
}

void Simulator::record(SimulationResult& result, Real time, const Vector& x) const {
    auto& history = result.history;
    history.time.push_back(time);
    history.states.push_back(x);

    std::vector<Real> currents;
    currents.reserve(netlist_.device_count());
    std::vector<Real> probes;
    probes.reserve(history.probe_names.size());

    for (std::size_t i = 0; i < netlist_.device_count(); ++i) {
        const PrimitiveDevice& device = netlist_.device(i);
        currents.push_back(history.has_current[i]
                               ? base_of(device).branch_current(x)
                               : std::numeric_limits<Real>::quiet_NaN());
        if (const auto* probe = std::get_if<VoltageProbe>(&device)) {
            probes.push_back(probe->measure(x));
        }
    }

    history.currents.push_back(std::move(currents));
    history.probe_values.push_back(std::move(probes));
}

void Simulator::fail(SimulationResult& result, Real time, const NewtonResult& newton) {
    state_ = SimulationState::Failed;
    result.state = state_;
    result.final_status = newton.status;
    result.last_convergence = newton.history;
    result.newton_iterations_total += newton.iterations;

    if (newton.status == SolverStatus::MaxIterationsReached) {
        ConvergenceError error(time, newton.iterations, newton.max_delta);
        result.message = error.what();
        if (newton.history.is_diverging()) {
            result.message += "; the iterates were diverging";
        }
        result.error = std::make_exception_ptr(error);
    } else {
        SingularSystemError error(time, newton.error_message.empty()
                                            ? std::string(to_string(newton.status))
                                            : newton.error_message);
        result.message = error.what();
        result.error = std::make_exception_ptr(error);
    }
}

SimulationResult Simulator::run_transient(const SimulationCallback& callback,
                                          SimulationControl* control) {
    SimulationResult result;
    auto start_time = std::chrono::high_resolution_clock::now();
    auto finish = [&]() {
        auto end_time = std::chrono::high_resolution_clock::now();
        result.total_time_seconds = std::chrono::duration<double>(end_time - start_time).count();
        return std::move(result);
    };

    state_ = SimulationState::Initializing;
    result.state = state_;
    options_.validate();

    // Connect devices, allocate internal nodes and seed the stamps
    netlist_.initialize(options_.dt);

    // A net without a path to ground leaves the system singular even when
    // rounding keeps LU from hitting an exact zero pivot
    if (auto floating = netlist_.floating_node()) {
        NewtonResult check;
        check.status = SolverStatus::SingularMatrix;
        check.error_message = "node '" + netlist_.nodes().name(*floating) +
                              "' has no conducting path to ground";
        fail(result, 0.0, check);
        return finish();
    }

    const NodeTable& nodes = netlist_.nodes();
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        result.history.node_names.push_back(nodes.name(static_cast<NodeIndex>(i)));
    }
    for (std::size_t i = 0; i < netlist_.device_count(); ++i) {
        const PrimitiveDevice& device = netlist_.device(i);
        result.history.device_names.push_back(netlist_.device_name(i));
        // Voltage probes observe nodes and carry no current
        const bool is_probe = std::holds_alternative<VoltageProbe>(device);
        result.history.has_current.push_back(base_of(device).has_branch_current() && !is_probe);
        if (is_probe) {
            result.history.probe_names.push_back(netlist_.device_name(i));
        }
    }

    auto track_iterations = [&result](int iterations) {
        if (result.history.empty()) {
            result.min_iterations_per_step = iterations;
            result.max_iterations_per_step = iterations;
        } else {
            result.min_iterations_per_step = std::min(result.min_iterations_per_step, iterations);
            result.max_iterations_per_step = std::max(result.max_iterations_per_step, iterations);
        }
        result.newton_iterations_total += iterations;
    };

    // Operating point at t = 0
    Vector x = Vector::Zero(static_cast<Eigen::Index>(nodes.size()));
    NewtonResult op = solve_at(0.0, true, x);
    if (!op.success()) {
        fail(result, 0.0, op);
        return finish();
    }
    track_iterations(op.iterations);
    x = op.x;
    result.last_convergence = op.history;
    record(result, 0.0, x);
    result.last_stable_time = 0.0;
    result.has_stable_time = true;
    if (callback) {
        callback(0.0, x);
    }

    state_ = SimulationState::Stepping;
    result.state = state_;

    const std::size_t steps = options_.step_count();
    for (std::size_t k = 1; k <= steps; ++k) {
        if (control && control->should_stop()) {
            state_ = SimulationState::Cancelled;
            result.state = state_;
            result.message = "Simulation stopped by user";
            return finish();
        }

        const Real time = static_cast<Real>(k) * options_.dt;
        NewtonResult step_result = solve_at(time, false, x);
        if (!step_result.success()) {
            fail(result, time, step_result);
            return finish();
        }

        track_iterations(step_result.iterations);
        x = step_result.x;
        result.last_convergence = step_result.history;
        record(result, time, x);
        result.last_stable_time = time;
        result.total_steps++;

        if (callback) {
            callback(time, x);
        }
    }

    state_ = SimulationState::Done;
    result.state = state_;
    result.final_status = SolverStatus::Success;
    result.message = "Simulation completed";
    return finish();
}

SimulationResult transient(Netlist& netlist, const SimulationOptions& options,
                           SimulationControl* control) {
    Simulator simulator(netlist, options);
    return simulator.run_transient(nullptr, control);
}

}  // namespace schemasim
