#include "schemasim/node_table.hpp"
#include "schemasim/errors.hpp"

namespace schemasim {

NodeTable::NodeTable() {
    records_.push_back({"0", false});
    for (const char* label : {"0", "gnd", "GND", "ground"}) {
        index_.emplace(label, ground_node);
    }
}

bool NodeTable::is_ground_label(std::string_view label) {
    return label == "0" || label == "gnd" || label == "GND" || label == "ground";
}

NodeIndex NodeTable::allocate(std::string name, bool internal) {
    if (frozen_) {
        throw SimulationError("Node table is frozen; cannot allocate node '" + name + "'");
    }
    NodeIndex idx = static_cast<NodeIndex>(records_.size());
    index_.emplace(name, idx);
    records_.push_back({std::move(name), internal});
    return idx;
}

NodeIndex NodeTable::node(const std::string& label) {
    if (label.empty()) {
        throw ParameterError("Node label must not be empty");
    }
    auto it = index_.find(label);
    if (it != index_.end()) {
        return it->second;
    }
    return allocate(label, false);
}

NodeIndex NodeTable::create_internal(const std::string& owner) {
    // Internal labels are unique even if an owner asks more than once
    std::string label = owner + "#" + std::to_string(records_.size());
    return allocate(std::move(label), true);
}

std::optional<NodeIndex> NodeTable::find(const std::string& label) const {
    auto it = index_.find(label);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& NodeTable::name(NodeIndex node) const {
    if (!contains(node)) {
        throw SimulationError("Unknown node index " + std::to_string(node));
    }
    return records_[static_cast<std::size_t>(node)].name;
}

bool NodeTable::is_internal(NodeIndex node) const {
    return contains(node) && records_[static_cast<std::size_t>(node)].internal;
}

std::vector<NodeIndex> NodeTable::external_nodes() const {
    std::vector<NodeIndex> nodes;
    for (std::size_t i = 1; i < records_.size(); ++i) {
        if (!records_[i].internal) {
            nodes.push_back(static_cast<NodeIndex>(i));
        }
    }
    return nodes;
}

}  // namespace schemasim
