#pragma once

#include "schemasim/types.hpp"

#include <stdexcept>
#include <string>

namespace schemasim {

// Base class for every error raised by the engine
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A device port could not be resolved to any node
class FloatingPortError : public SimulationError {
public:
    FloatingPortError(std::string device, std::size_t port, const std::string& detail)
        : SimulationError("Floating port " + std::to_string(port) + " on device '" + device +
                          "': " + detail),
          device_(std::move(device)),
          port_(port) {}

    [[nodiscard]] const std::string& device() const { return device_; }
    [[nodiscard]] std::size_t port() const { return port_; }

private:
    std::string device_;
    std::size_t port_;
};

// The assembled system matrix could not be factorized
class SingularSystemError : public SimulationError {
public:
    SingularSystemError(Real time, const std::string& detail)
        : SimulationError("Singular system at t=" + std::to_string(time) + ": " + detail),
          time_(time) {}

    [[nodiscard]] Real time() const { return time_; }

private:
    Real time_;
};

// Newton-Raphson did not converge within max_iterations
class ConvergenceError : public SimulationError {
public:
    ConvergenceError(Real time, int iterations, Real max_delta)
        : SimulationError("Newton iteration did not converge at t=" + std::to_string(time) +
                          " after " + std::to_string(iterations) +
                          " iterations (max delta " + std::to_string(max_delta) + ")"),
          time_(time),
          iterations_(iterations),
          max_delta_(max_delta) {}

    [[nodiscard]] Real time() const { return time_; }
    [[nodiscard]] int iterations() const { return iterations_; }
    [[nodiscard]] Real max_delta() const { return max_delta_; }

private:
    Real time_;
    int iterations_;
    Real max_delta_;
};

// A device or option received a non-physical parameter
class ParameterError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

}  // namespace schemasim
