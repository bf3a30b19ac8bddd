#pragma once

#include "schemasim/devices/base.hpp"
#include "schemasim/stimulus.hpp"

#include <utility>

namespace schemasim {

// =============================================================================
// Independent Voltage Source
// =============================================================================

/// Local nodes: 0 = n+, 1 = n-, 2 = branch current. Positive branch
/// current flows from n+ through the source to n-.
class VoltageSource : public DeviceBase {
public:
    static constexpr std::string_view type_name = "voltage_source";

    struct Params {
        Stimulus stimulus;
    };

    VoltageSource(NodeIndex n_plus, NodeIndex n_minus, Params params)
        : DeviceBase({n_plus, n_minus}, 1), params_(std::move(params)) {}

    VoltageSource(NodeIndex n_plus, NodeIndex n_minus, Stimulus stimulus)
        : VoltageSource(n_plus, n_minus, Params{std::move(stimulus)}) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real dt) {
        params_.stimulus.bind_timestep(dt);
        allocate_stamp();
        stamp_incidence(0, 1, 2);
        rhs_(2) = params_.stimulus.value(0.0);
    }

    void update(const StepContext& context) {
        rhs_(2) = params_.stimulus.value(context.time);
    }

    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] const Stimulus& stimulus() const { return params_.stimulus; }
    [[nodiscard]] NodeIndex branch_node() const { return connected_ ? nodes_[2] : -1; }

private:
    Params params_;
};

}  // namespace schemasim
