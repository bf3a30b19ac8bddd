#pragma once

#include "schemasim/device.hpp"
#include "schemasim/node_table.hpp"

#include <string>
#include <utility>
#include <vector>

namespace schemasim {

/// Reusable circuit block (SPICE .SUBCKT). Devices are built against the
/// definition's local node table, where local node 0 is global ground and
/// the listed ports are bound to the instance nodes on instantiation.
class SubcircuitDefinition {
public:
    SubcircuitDefinition(std::string name, const std::vector<std::string>& port_labels);

    /// Local node for a label, allocated on first use
    NodeIndex node(const std::string& label) { return nodes_.node(label); }

    void add_device(std::string name, Device device);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<NodeIndex>& ports() const { return ports_; }
    [[nodiscard]] const NodeTable& local_nodes() const { return nodes_; }
    [[nodiscard]] const std::vector<std::pair<std::string, Device>>& devices() const {
        return devices_;
    }

private:
    std::string name_;
    NodeTable nodes_;
    std::vector<NodeIndex> ports_;
    std::vector<std::pair<std::string, Device>> devices_;
};

}  // namespace schemasim
