#pragma once

#include "schemasim/devices/base.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

namespace schemasim {

// =============================================================================
// Voltage-Controlled Voltage Source (E element)
// =============================================================================

/// Local nodes: 0 = out+, 1 = out-, 2 = ctrl+, 3 = ctrl-, 4 = output branch
/// current. The branch row enforces v_out = k * v_ctrl, where k is a fixed
/// gain or is interpolated from a (control voltage, gain) table. With a
/// limit the gain is reduced so that |v_out| never exceeds it.
class Vcvs : public DeviceBase {
public:
    static constexpr std::string_view type_name = "vcvs";

    struct Params {
        Real gain = 1.0;
        std::vector<std::pair<Real, Real>> gain_table;  // (v_ctrl, gain), replaces gain
        std::optional<Real> limit;                       // bound on |v_out|
    };

    Vcvs(NodeIndex out_plus, NodeIndex out_minus, NodeIndex ctrl_plus, NodeIndex ctrl_minus,
         Params params)
        : DeviceBase({out_plus, out_minus, ctrl_plus, ctrl_minus}, 1), params_(std::move(params)) {
        if (!std::isfinite(params_.gain)) {
            throw ParameterError("VCVS gain must be finite");
        }
        for (std::size_t i = 0; i < params_.gain_table.size(); ++i) {
            const auto& [v, k] = params_.gain_table[i];
            if (!std::isfinite(v) || !std::isfinite(k)) {
                throw ParameterError("VCVS gain table entries must be finite");
            }
            if (i > 0 && !(v > params_.gain_table[i - 1].first)) {
                throw ParameterError("VCVS gain table control voltages must be strictly increasing");
            }
        }
        if (params_.limit && (!(*params_.limit > 0.0) || !std::isfinite(*params_.limit))) {
            throw ParameterError("VCVS output limit must be positive and finite");
        }
    }

    Vcvs(NodeIndex out_plus, NodeIndex out_minus, NodeIndex ctrl_plus, NodeIndex ctrl_minus,
         Real gain)
        : Vcvs(out_plus, out_minus, ctrl_plus, ctrl_minus, Params{gain, {}, std::nullopt}) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real /*dt*/) {
        allocate_stamp();
        stamp_incidence(0, 1, 4);
        set_gain(effective_gain(0.0));
    }

    void update(const StepContext& context) {
        set_gain(effective_gain(across(context.x, 2, 3)));
    }

    /// Gain applied at control voltage vc, after table lookup and limiting
    [[nodiscard]] Real effective_gain(Real vc) const {
        Real k = params_.gain_table.empty() ? params_.gain : table_gain(vc);
        if (params_.limit && vc != 0.0) {
            const Real limit = *params_.limit;
            if (vc * k > limit) {
                k = limit / vc;
            } else if (vc * k < -limit) {
                k = -limit / vc;
            }
        }
        return k;
    }

    [[nodiscard]] Real gain() const { return gain_; }
    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] NodeIndex branch_node() const { return connected_ ? nodes_[4] : -1; }

private:
    // Piecewise-linear, held flat beyond the first and last entries
    [[nodiscard]] Real table_gain(Real vc) const {
        const auto& table = params_.gain_table;
        if (vc <= table.front().first) return table.front().second;
        if (vc >= table.back().first) return table.back().second;

        auto hi = std::upper_bound(table.begin(), table.end(), vc,
                                   [](Real v, const std::pair<Real, Real>& entry) {
                                       return v < entry.first;
                                   });
        auto lo = hi - 1;
        return lo->second + (hi->second - lo->second) * (vc - lo->first) / (hi->first - lo->first);
    }

    void set_gain(Real k) {
        gain_ = k;
        jac_(4, 2) = -k;
        jac_(4, 3) = k;
    }

    Params params_;
    Real gain_ = 0.0;
};

}  // namespace schemasim
