#pragma once

#include "schemasim/devices/base.hpp"

#include <cmath>

namespace schemasim {

// =============================================================================
// Voltage-Controlled Switch (S element)
// =============================================================================

/// Local nodes: 0 = n+, 1 = n-, 2 = ctrl+, 3 = ctrl-. The switch is a
/// conductance 1/Ron or 1/Roff between n+ and n-. An open switch closes
/// when v_ctrl >= Vt + Vh; a closed one opens when v_ctrl < Vt - Vh.
/// Inside the band it keeps the state of the last accepted step.
class VoltageControlledSwitch : public DeviceBase {
public:
    static constexpr std::string_view type_name = "switch";

    struct Params {
        Real on_resistance = 1e-6;   // Ron
        Real off_resistance = 1e6;   // Roff
        Real threshold = 0.0;        // Vt
        Real hysteresis = 0.0;       // Vh
        bool initially_on = false;   // state for the t = 0 solve
    };

    VoltageControlledSwitch(NodeIndex n_plus, NodeIndex n_minus,
                            NodeIndex ctrl_plus, NodeIndex ctrl_minus)
        : VoltageControlledSwitch(n_plus, n_minus, ctrl_plus, ctrl_minus, Params{}) {}

    VoltageControlledSwitch(NodeIndex n_plus, NodeIndex n_minus,
                            NodeIndex ctrl_plus, NodeIndex ctrl_minus, Params params)
        : DeviceBase({n_plus, n_minus, ctrl_plus, ctrl_minus}, 0), params_(params) {
        if (!(params_.on_resistance > 0.0) || !std::isfinite(params_.on_resistance)) {
            throw ParameterError("Switch on-resistance must be positive and finite");
        }
        if (!(params_.off_resistance > params_.on_resistance) ||
            !std::isfinite(params_.off_resistance)) {
            throw ParameterError("Switch off-resistance must be finite and above the on-resistance");
        }
        if (!std::isfinite(params_.threshold)) {
            throw ParameterError("Switch threshold must be finite");
        }
        if (!(params_.hysteresis >= 0.0) || !std::isfinite(params_.hysteresis)) {
            throw ParameterError("Switch hysteresis must be non-negative and finite");
        }
    }

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real /*dt*/) {
        allocate_stamp();
        accepted_on_ = params_.initially_on;
        step_time_ = 0.0;
        set_state(params_.initially_on);
    }

    void update(const StepContext& context) {
        if (context.initial) {
            accepted_on_ = params_.initially_on;
        } else if (context.time != step_time_) {
            // First iteration of a new step: the last state has been accepted
            accepted_on_ = on_;
            step_time_ = context.time;
        }
        set_state(next_state(across(context.x, 2, 3)));
    }

    /// State reached from the last accepted state at control voltage vc
    [[nodiscard]] bool next_state(Real vc) const {
        if (accepted_on_) {
            return !(vc < params_.threshold - params_.hysteresis);
        }
        return vc >= params_.threshold + params_.hysteresis;
    }

    [[nodiscard]] bool is_on() const { return on_; }
    [[nodiscard]] const Params& params() const { return params_; }

private:
    void set_state(bool on) {
        on_ = on;
        jac_.setZero();
        stamp_conductance(0, 1, 1.0 / (on ? params_.on_resistance : params_.off_resistance));
    }

    Params params_;
    bool on_ = false;
    bool accepted_on_ = false;
    Real step_time_ = 0.0;
};

}  // namespace schemasim
