#pragma once

#include "schemasim/devices/base.hpp"

#include <cmath>
#include <optional>

namespace schemasim {

// =============================================================================
// Capacitor (Backward Euler companion model)
// =============================================================================

/// i = C dv/dt discretized as a conductance Geq = C/dt in parallel with a
/// current source Geq * v_prev, where v_prev is the voltage of the previous
/// converged timestep.
class Capacitor : public DeviceBase {
public:
    static constexpr std::string_view type_name = "capacitor";

    struct Params {
        Real capacitance = 1e-6;
        std::optional<Real> initial_voltage;  // used for the t = 0 history term
    };

    Capacitor(NodeIndex n1, NodeIndex n2, Params params)
        : DeviceBase({n1, n2}, 0), params_(params) {
        if (!(params_.capacitance > 0.0) || !std::isfinite(params_.capacitance)) {
            throw ParameterError("Capacitance must be positive and finite");
        }
        if (params_.initial_voltage && !std::isfinite(*params_.initial_voltage)) {
            throw ParameterError("Capacitor initial voltage must be finite");
        }
    }

    Capacitor(NodeIndex n1, NodeIndex n2, Real capacitance)
        : Capacitor(n1, n2, Params{capacitance, std::nullopt}) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real dt) {
        allocate_stamp();
        geq_ = params_.capacitance / dt;
        stamp_conductance(0, 1, geq_);
    }

    void update(const StepContext& context) {
        Real v_prev = across(context.x_prev, 0, 1);
        if (context.initial && params_.initial_voltage) {
            v_prev = *params_.initial_voltage;
        }
        const Real ieq = geq_ * v_prev;
        rhs_(0) = ieq;
        rhs_(1) = -ieq;
    }

    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] Real capacitance() const { return params_.capacitance; }

private:
    Params params_;
    Real geq_ = 0.0;
};

}  // namespace schemasim
