#include "schemasim/subcircuit.hpp"

#include <algorithm>

namespace schemasim {

SubcircuitDefinition::SubcircuitDefinition(std::string name,
                                           const std::vector<std::string>& port_labels)
    : name_(std::move(name)) {
    if (name_.empty()) {
        throw ParameterError("Subcircuit definition requires a name");
    }
    if (port_labels.empty()) {
        throw ParameterError("Subcircuit '" + name_ + "' must declare at least one port");
    }
    for (const auto& label : port_labels) {
        if (NodeTable::is_ground_label(label)) {
            throw ParameterError("Subcircuit '" + name_ + "' port '" + label +
                                 "' cannot be the ground node");
        }
        if (nodes_.find(label)) {
            throw ParameterError("Subcircuit '" + name_ + "' declares port '" + label + "' twice");
        }
        ports_.push_back(nodes_.node(label));
    }
}

void SubcircuitDefinition::add_device(std::string name, Device device) {
    if (name.empty()) {
        throw ParameterError("Device name must not be empty");
    }
    auto same_name = [&name](const auto& entry) { return entry.first == name; };
    if (std::any_of(devices_.begin(), devices_.end(), same_name)) {
        throw ParameterError("Subcircuit '" + name_ + "' already has a device named '" + name + "'");
    }
    base_of(device).set_name(name);
    devices_.emplace_back(std::move(name), std::move(device));
}

}  // namespace schemasim
