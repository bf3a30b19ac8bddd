#pragma once

#include "schemasim/devices/base.hpp"

#include <cmath>
#include <optional>

namespace schemasim {

// =============================================================================
// Inductor (Backward Euler companion model, branch current unknown)
// =============================================================================

/// Local nodes: 0 = n+, 1 = n-, 2 = branch current (flows n+ -> n-).
/// Branch row: v+ - v- - (R + L/dt) i = -(L/dt) i_prev
class Inductor : public DeviceBase {
public:
    static constexpr std::string_view type_name = "inductor";

    struct Params {
        Real inductance = 1e-3;
        Real series_resistance = 0.0;
        std::optional<Real> initial_current;  // used for the t = 0 history term
    };

    Inductor(NodeIndex n1, NodeIndex n2, Params params)
        : DeviceBase({n1, n2}, 1), params_(params) {
        if (!(params_.inductance > 0.0) || !std::isfinite(params_.inductance)) {
            throw ParameterError("Inductance must be positive and finite");
        }
        if (!(params_.series_resistance >= 0.0) || !std::isfinite(params_.series_resistance)) {
            throw ParameterError("Inductor series resistance must be non-negative and finite");
        }
        if (params_.initial_current && !std::isfinite(*params_.initial_current)) {
            throw ParameterError("Inductor initial current must be finite");
        }
    }

    Inductor(NodeIndex n1, NodeIndex n2, Real inductance)
        : Inductor(n1, n2, Params{inductance, 0.0, std::nullopt}) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real dt) {
        allocate_stamp();
        req_ = params_.inductance / dt;
        stamp_incidence(0, 1, 2);
        jac_(2, 2) = -(params_.series_resistance + req_);
    }

    void update(const StepContext& context) {
        rhs_(2) = -req_ * history_current(context);
    }

    /// Branch current of the previous converged step (or the initial
    /// condition during the t = 0 solve)
    [[nodiscard]] Real history_current(const StepContext& context) const {
        if (context.initial && params_.initial_current) {
            return *params_.initial_current;
        }
        return node_value(context.x_prev, 2);
    }

    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] Real inductance() const { return params_.inductance; }

    /// Node carrying the branch current unknown (valid once connected)
    [[nodiscard]] NodeIndex branch_node() const {
        return connected_ ? nodes_[2] : -1;
    }

private:
    Params params_;
    Real req_ = 0.0;
};

}  // namespace schemasim
