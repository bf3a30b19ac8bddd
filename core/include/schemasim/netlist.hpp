#pragma once

#include "schemasim/device.hpp"
#include "schemasim/node_table.hpp"
#include "schemasim/subcircuit.hpp"
#include "schemasim/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace schemasim {

// Ordered mapping of device name -> device plus the node table. A netlist
// is built once per simulation run: devices are added, build() connects
// them and freezes the node table, then the transient controller drives
// initialize()/update().
class Netlist : private ConnectContext {
public:
    explicit Netlist(std::string title = "");
    Netlist(NodeTable nodes, std::string title);

    Netlist(Netlist&&) = default;
    Netlist& operator=(Netlist&&) = default;
    Netlist(const Netlist&) = default;
    Netlist& operator=(const Netlist&) = default;
    ~Netlist() override = default;

    // Node management. Labels of flattened subcircuit nodes
    // ("<instance>.<label>") are reserved: add_node() rejects them.
    NodeIndex add_node(const std::string& label);
    [[nodiscard]] NodeIndex node(const std::string& label) const;
    [[nodiscard]] const NodeTable& nodes() const { return nodes_; }

    // Subcircuit definitions must be registered before their instances
    void add_subcircuit(SubcircuitDefinition definition);
    [[nodiscard]] const SubcircuitDefinition* find_subcircuit(const std::string& name) const;
    [[nodiscard]] const std::map<std::string, SubcircuitDefinition>& subcircuits() const {
        return subcircuits_;
    }

    /// Register a device. Subcircuit instances are flattened into their
    /// primitive devices under the names "<instance>_<device>".
    void add_device(std::string name, Device device);

    /// Connect every device (allocating internal nodes) and freeze the node table
    void build();
    [[nodiscard]] bool built() const { return built_; }

    void initialize(Real dt);
    void update(const StepContext& context);
    [[nodiscard]] bool initialized() const { return initialized_; }

    /// First non-ground node with no conducting path to ground. Two local
    /// nodes conduct when the seeded stamp couples them both ways, so
    /// controlling inputs and ideal current sources do not anchor a node.
    /// Meaningful once initialize() has seeded the stamps.
    [[nodiscard]] std::optional<NodeIndex> floating_node() const;

    // Device access
    [[nodiscard]] std::size_t device_count() const { return devices_.size(); }
    [[nodiscard]] const std::string& device_name(std::size_t i) const { return names_[i]; }
    [[nodiscard]] const PrimitiveDevice& device(std::size_t i) const { return devices_[i]; }
    [[nodiscard]] const PrimitiveDevice* find(const std::string& name) const;
    [[nodiscard]] const std::vector<PrimitiveDevice>& devices() const { return devices_; }

    /// Subcircuit instances added so far (instance name, definition name)
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& instances() const {
        return instances_;
    }

    [[nodiscard]] const std::string& title() const { return title_; }
    void set_title(std::string title) { title_ = std::move(title); }

    /// Structural checks before simulation; returns false with a message.
    /// After initialize() this includes nodes with no path to ground.
    [[nodiscard]] bool validate(std::string& error) const;

private:
    // ConnectContext
    [[nodiscard]] bool has_node(NodeIndex node) const override { return nodes_.contains(node); }
    NodeIndex create_internal(const std::string& owner) override {
        return nodes_.create_internal(owner);
    }
    [[nodiscard]] const Inductor* find_inductor(const std::string& name) const override;

    void add_primitive(std::string name, PrimitiveDevice device);
    void instantiate(const std::string& instance_name, const SubcircuitInstance& instance,
                     int depth);

    std::string title_;
    NodeTable nodes_;
    std::vector<std::string> names_;
    std::vector<PrimitiveDevice> devices_;
    std::unordered_map<std::string, std::size_t> index_;
    std::map<std::string, SubcircuitDefinition> subcircuits_;
    std::vector<std::pair<std::string, std::string>> instances_;
    std::unordered_set<std::string> flattened_nodes_;
    bool built_ = false;
    bool initialized_ = false;
};

}  // namespace schemasim
