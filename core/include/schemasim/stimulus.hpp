#pragma once

#include "schemasim/types.hpp"

#include <concepts>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemasim {

// =============================================================================
// Waveform definitions
// =============================================================================

struct ConstantWaveform {
    Real value = 0.0;
};

// offset + amplitude * exp(-damping*(t-delay)) * sin(2*pi*frequency*(t-delay) + phase)
struct SineWaveform {
    Real offset = 0.0;
    Real amplitude = 1.0;
    Real frequency = 1.0;  // Hz
    Real delay = 0.0;      // s
    Real damping = 0.0;    // 1/s
    Real phase = 0.0;      // rad
};

// Periodic trapezoid. Unset edge times and width default to the time step.
struct PulseWaveform {
    Real v1 = 0.0;
    Real v2 = 1.0;
    Real td = 0.0;
    std::optional<Real> tr;
    std::optional<Real> tf;
    std::optional<Real> pw;
    Real period = infinity;
};

// SPICE EXP source. Unset time constants default to the time step,
// unset td2 to td1 + dt.
struct ExponentialWaveform {
    Real v1 = 0.0;
    Real v2 = 1.0;
    Real td1 = 0.0;
    std::optional<Real> tau1;
    std::optional<Real> td2;
    std::optional<Real> tau2;
};

// Piecewise-linear (time, value) points, clamped outside the range
struct PwlWaveform {
    std::vector<std::pair<Real, Real>> points;
};

using Waveform = std::variant<ConstantWaveform, SineWaveform, PulseWaveform,
                              ExponentialWaveform, PwlWaveform>;

// =============================================================================
// Stimulus
// =============================================================================

/// Time-domain source value. value(t) is a pure function of t once the
/// step-size dependent defaults have been bound.
class Stimulus {
public:
    Stimulus() = default;
    Stimulus(Real constant);  // NOLINT(google-explicit-constructor)
    Stimulus(Waveform waveform);  // NOLINT(google-explicit-constructor)

    template<typename W>
        requires(!std::same_as<std::decay_t<W>, Waveform> &&
                 std::constructible_from<Waveform, W>)
    Stimulus(W&& waveform)  // NOLINT(google-explicit-constructor)
        : Stimulus(Waveform(std::forward<W>(waveform))) {}

    /// Resolve defaults that depend on the simulation step size
    void bind_timestep(Real dt);

    [[nodiscard]] Real value(Real t) const;

    [[nodiscard]] const Waveform& waveform() const { return waveform_; }
    [[nodiscard]] bool is_constant() const {
        return std::holds_alternative<ConstantWaveform>(waveform_);
    }

    /// SPICE-like textual form, e.g. "PULSE(0 5 0 1e-06 1e-06 0.001 0.002)"
    [[nodiscard]] std::string describe() const;

private:
    Waveform waveform_ = ConstantWaveform{};
};

}  // namespace schemasim
