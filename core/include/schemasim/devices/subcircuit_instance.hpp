#pragma once

#include "schemasim/devices/base.hpp"

#include <string>
#include <utility>
#include <vector>

namespace schemasim {

// =============================================================================
// Subcircuit Instance (SPICE X)
// =============================================================================

/// Reference to a registered SubcircuitDefinition. The netlist flattens an
/// instance into primitive devices when it is added, so an instance never
/// reaches the assembler.
class SubcircuitInstance : public DeviceBase {
public:
    static constexpr std::string_view type_name = "subcircuit";

    struct Params {
        std::string definition;
    };

    SubcircuitInstance(std::vector<NodeIndex> nodes, Params params)
        : DeviceBase(std::move(nodes), 0), params_(std::move(params)) {
        if (params_.definition.empty()) {
            throw ParameterError("Subcircuit instance requires a definition name");
        }
    }

    SubcircuitInstance(std::vector<NodeIndex> nodes, std::string definition)
        : SubcircuitInstance(std::move(nodes), Params{std::move(definition)}) {}

    [[nodiscard]] const std::string& definition() const { return params_.definition; }
    [[nodiscard]] const Params& params() const { return params_; }

private:
    Params params_;
};

}  // namespace schemasim
