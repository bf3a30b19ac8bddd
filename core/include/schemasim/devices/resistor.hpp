#pragma once

#include "schemasim/devices/base.hpp"

#include <cmath>

namespace schemasim {

// =============================================================================
// Resistor
// =============================================================================

class Resistor : public DeviceBase {
public:
    static constexpr std::string_view type_name = "resistor";

    struct Params {
        Real resistance = 1000.0;
    };

    Resistor(NodeIndex n1, NodeIndex n2, Params params)
        : DeviceBase({n1, n2}, 0), params_(params) {
        if (params_.resistance == 0.0 || !std::isfinite(params_.resistance)) {
            throw ParameterError("Resistance must be non-zero and finite");
        }
    }

    Resistor(NodeIndex n1, NodeIndex n2, Real resistance)
        : Resistor(n1, n2, Params{resistance}) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real /*dt*/) {
        allocate_stamp();
        stamp_conductance(0, 1, 1.0 / params_.resistance);
    }

    // Linear and time-invariant
    void update(const StepContext& /*context*/) {}

    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] Real resistance() const { return params_.resistance; }

private:
    Params params_;
};

}  // namespace schemasim
