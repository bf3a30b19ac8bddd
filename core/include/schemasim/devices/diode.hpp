#pragma once

#include "schemasim/devices/base.hpp"

#include <algorithm>
#include <cmath>

namespace schemasim {

// =============================================================================
// Junction Diode (Shockley model, Newton linearized)
// =============================================================================

class Diode : public DeviceBase {
public:
    static constexpr std::string_view type_name = "diode";

    struct Params {
        Real saturation_current = 1e-14;  // Is
        Real emission_coefficient = 1.0;  // N
        Real thermal_voltage = 25.85e-3;  // Vt at 300 K
        Real max_voltage = 0.8;           // junction voltage clamp
    };

    /// Largest exponent V/(N*Vt) evaluated; beyond it the junction is linear
    static constexpr Real max_exponent = 80.0;

    Diode(NodeIndex anode, NodeIndex cathode)
        : Diode(anode, cathode, Params{}) {}

    Diode(NodeIndex anode, NodeIndex cathode, Params params)
        : DeviceBase({anode, cathode}, 0), params_(params) {
        if (!(params_.saturation_current > 0.0) || !std::isfinite(params_.saturation_current)) {
            throw ParameterError("Diode saturation current must be positive and finite");
        }
        if (!(params_.emission_coefficient > 0.0) || !std::isfinite(params_.emission_coefficient)) {
            throw ParameterError("Diode emission coefficient must be positive and finite");
        }
        if (!(params_.thermal_voltage > 0.0) || !std::isfinite(params_.thermal_voltage)) {
            throw ParameterError("Diode thermal voltage must be positive and finite");
        }
        if (!std::isfinite(params_.max_voltage)) {
            throw ParameterError("Diode voltage clamp must be finite");
        }
    }

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real /*dt*/) {
        allocate_stamp();
        linearize(0.0);
    }

    void update(const StepContext& context) {
        linearize(across(context.x, 0, 1));
    }

    /// Diode current I(V) with the junction voltage clamped
    [[nodiscard]] Real current(Real v) const {
        return params_.saturation_current * std::expm1(clamp(v) / nvt());
    }

    /// Small-signal conductance dI/dV with the junction voltage clamped
    [[nodiscard]] Real conductance(Real v) const {
        return params_.saturation_current / nvt() * std::exp(clamp(v) / nvt());
    }

    /// Junction voltage actually evaluated: min(vmax, max_exponent * N * Vt)
    [[nodiscard]] Real clamp_voltage() const {
        return std::min(params_.max_voltage, max_exponent * nvt());
    }

    [[nodiscard]] const Params& params() const { return params_; }

private:
    [[nodiscard]] Real nvt() const {
        return params_.emission_coefficient * params_.thermal_voltage;
    }

    [[nodiscard]] Real clamp(Real v) const { return std::min(v, clamp_voltage()); }

    void linearize(Real v) {
        const Real vd = clamp(v);
        const Real g = conductance(vd);
        const Real ieq = current(vd) - g * vd;

        jac_.setZero();
        stamp_conductance(0, 1, g);
        rhs_(0) = -ieq;
        rhs_(1) = ieq;
    }

    Params params_;
};

}  // namespace schemasim
