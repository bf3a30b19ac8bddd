#pragma once

#include "schemasim/devices/base.hpp"
#include "schemasim/devices/inductor.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <utility>

namespace schemasim {

// =============================================================================
// Coupled Inductors (mutual inductance between two named inductors)
// =============================================================================

/// Couples the branch equations of two inductors with M = k*sqrt(L1*L2).
/// Local nodes are the branch-current nodes of the two inductors; the dot
/// is on the first node of each inductor.
class CoupledInductor : public DeviceBase {
public:
    static constexpr std::string_view type_name = "coupled_inductor";
    static constexpr int connect_pass = 1;

    struct Params {
        std::string inductor1;
        std::string inductor2;
        Real coupling = 1.0;
    };

    explicit CoupledInductor(Params params)
        : DeviceBase({}, 0), params_(std::move(params)) {
        if (params_.inductor1.empty() || params_.inductor2.empty()) {
            throw ParameterError("Coupled inductor requires two inductor names");
        }
        if (params_.inductor1 == params_.inductor2) {
            throw ParameterError("Coupled inductor cannot couple '" + params_.inductor1 +
                                 "' with itself");
        }
        if (!(params_.coupling > 0.0 && params_.coupling <= 1.0)) {
            throw ParameterError("Coupling coefficient must satisfy 0 < k <= 1");
        }
    }

    CoupledInductor(std::string inductor1, std::string inductor2, Real coupling)
        : CoupledInductor(Params{std::move(inductor1), std::move(inductor2), coupling}) {}

    void connect(ConnectContext& context) {
        if (connected_) return;

        const Inductor* l1 = resolve(context, params_.inductor1);
        const Inductor* l2 = resolve(context, params_.inductor2);

        mutual_ = params_.coupling * std::sqrt(l1->inductance() * l2->inductance());
        initial1_ = l1->params().initial_current;
        initial2_ = l2->params().initial_current;
        nodes_ = {l1->branch_node(), l2->branch_node()};
        allocate_stamp();
        connected_ = true;
    }

    void initialize(Real dt) {
        allocate_stamp();
        xm_ = mutual_ / dt;
        jac_(0, 1) = -xm_;
        jac_(1, 0) = -xm_;
    }

    void update(const StepContext& context) {
        Real i1 = node_value(context.x_prev, 0);
        Real i2 = node_value(context.x_prev, 1);
        if (context.initial) {
            i1 = initial1_.value_or(i1);
            i2 = initial2_.value_or(i2);
        }
        rhs_(0) = -xm_ * i2;
        rhs_(1) = -xm_ * i1;
    }

    /// Prefix the referenced inductor names (subcircuit flattening)
    void mangle_references(const std::string& prefix) {
        params_.inductor1 = prefix + params_.inductor1;
        params_.inductor2 = prefix + params_.inductor2;
    }

    [[nodiscard]] const Params& params() const { return params_; }
    [[nodiscard]] Real mutual_inductance() const { return mutual_; }

private:
    const Inductor* resolve(ConnectContext& context, const std::string& name) const {
        const Inductor* inductor = context.find_inductor(name);
        if (!inductor) {
            throw ParameterError("Coupled inductor '" + name_ + "' references unknown inductor '" +
                                 name + "'");
        }
        if (inductor->branch_node() < 0) {
            throw FloatingPortError(name_, 0, "inductor '" + name + "' is not connected");
        }
        return inductor;
    }

    Params params_;
    Real mutual_ = 0.0;
    Real xm_ = 0.0;
    std::optional<Real> initial1_;
    std::optional<Real> initial2_;
};

}  // namespace schemasim
