#pragma once

#include "schemasim/devices/base.hpp"

namespace schemasim {

// =============================================================================
// Voltage Probe (no stamp, observes v(n+) - v(n-))
// =============================================================================

class VoltageProbe : public DeviceBase {
public:
    static constexpr std::string_view type_name = "voltage_probe";

    VoltageProbe(NodeIndex n_plus, NodeIndex n_minus = ground_node)
        : DeviceBase({n_plus, n_minus}, 0) {}

    void connect(ConnectContext& context) { connect_ports(context); }
    void initialize(Real /*dt*/) { allocate_stamp(); }
    void update(const StepContext& /*context*/) {}

    [[nodiscard]] Real measure(const Vector& x) const { return across(x, 0, 1); }
};

// =============================================================================
// Current Probe (zero-volt source in series, an ammeter)
// =============================================================================

/// Local nodes: 0 = n+, 1 = n-, 2 = measured current (flows n+ -> n-).
class CurrentProbe : public DeviceBase {
public:
    static constexpr std::string_view type_name = "current_probe";

    CurrentProbe(NodeIndex n_plus, NodeIndex n_minus)
        : DeviceBase({n_plus, n_minus}, 1) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real /*dt*/) {
        allocate_stamp();
        stamp_incidence(0, 1, 2);
    }

    void update(const StepContext& /*context*/) {}

    [[nodiscard]] Real measure(const Vector& x) const { return node_value(x, 2); }
};

}  // namespace schemasim
