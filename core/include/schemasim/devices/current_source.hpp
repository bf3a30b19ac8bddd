#pragma once

#include "schemasim/devices/base.hpp"
#include "schemasim/stimulus.hpp"

#include <cmath>
#include <utility>

namespace schemasim {

// =============================================================================
// Independent Current Source
// =============================================================================

/// A positive value forces current out of n+, through the source, into n-.
/// An optional parallel resistance models a non-ideal (Norton) source.
class CurrentSource : public DeviceBase {
public:
    static constexpr std::string_view type_name = "current_source";

    struct Params {
        Stimulus stimulus;
        Real parallel_resistance = 0.0;  // 0 = ideal
    };

    CurrentSource(NodeIndex n_plus, NodeIndex n_minus, Params params)
        : DeviceBase({n_plus, n_minus}, 0), params_(std::move(params)) {
        if (!(params_.parallel_resistance >= 0.0) || !std::isfinite(params_.parallel_resistance)) {
            throw ParameterError("Current source parallel resistance must be non-negative and finite");
        }
    }

    CurrentSource(NodeIndex n_plus, NodeIndex n_minus, Stimulus stimulus)
        : CurrentSource(n_plus, n_minus, Params{std::move(stimulus), 0.0}) {}

    void connect(ConnectContext& context) { connect_ports(context); }

    void initialize(Real dt) {
        params_.stimulus.bind_timestep(dt);
        allocate_stamp();
        if (params_.parallel_resistance > 0.0) {
            stamp_conductance(0, 1, 1.0 / params_.parallel_resistance);
        }
        stamp_current(params_.stimulus.value(0.0));
    }

    void update(const StepContext& context) {
        stamp_current(params_.stimulus.value(context.time));
    }

    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] const Stimulus& stimulus() const { return params_.stimulus; }

private:
    void stamp_current(Real current) {
        rhs_(0) = -current;
        rhs_(1) = current;
    }

    Params params_;
};

}  // namespace schemasim
