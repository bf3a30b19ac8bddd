#include "schemasim/netlist.hpp"

#include <algorithm>
#include <type_traits>

namespace schemasim {

namespace {

constexpr int kMaxSubcircuitDepth = 32;

/// Disjoint sets over node indices
class NodeSets {
public:
    explicit NodeSets(std::size_t size) : parent_(size) {
        for (std::size_t i = 0; i < size; ++i) parent_[i] = i;
    }

    std::size_t find(std::size_t i) {
        while (parent_[i] != i) {
            parent_[i] = parent_[parent_[i]];
            i = parent_[i];
        }
        return i;
    }

    void unite(std::size_t a, std::size_t b) { parent_[find(a)] = find(b); }

private:
    std::vector<std::size_t> parent_;
};

template<typename... Ts>
constexpr bool all_stamping(const std::variant<Ts...>*) {
    return (StampingDevice<Ts> && ...);
}
static_assert(all_stamping(static_cast<const PrimitiveDevice*>(nullptr)),
              "every primitive device must implement connect/initialize/update");

}  // namespace

Netlist::Netlist(std::string title)
    : title_(std::move(title)) {}

Netlist::Netlist(NodeTable nodes, std::string title)
    : title_(std::move(title))
    , nodes_(std::move(nodes)) {}

NodeIndex Netlist::add_node(const std::string& label) {
    if (flattened_nodes_.count(label) != 0) {
        throw ParameterError("Node label '" + label + "' is reserved by a subcircuit instance");
    }
    return nodes_.node(label);
}

NodeIndex Netlist::node(const std::string& label) const {
    auto idx = nodes_.find(label);
    if (!idx) {
        throw SimulationError("Unknown node '" + label + "'");
    }
    return *idx;
}

void Netlist::add_subcircuit(SubcircuitDefinition definition) {
    std::string name = definition.name();
    if (subcircuits_.count(name) != 0) {
        throw ParameterError("Subcircuit '" + name + "' is already defined");
    }
    subcircuits_.emplace(std::move(name), std::move(definition));
}

const SubcircuitDefinition* Netlist::find_subcircuit(const std::string& name) const {
    auto it = subcircuits_.find(name);
    return it == subcircuits_.end() ? nullptr : &it->second;
}

void Netlist::add_device(std::string name, Device device) {
    if (built_) {
        throw SimulationError("Cannot add device '" + name + "' after the netlist was built");
    }
    if (name.empty()) {
        throw ParameterError("Device name must not be empty");
    }
    auto same_instance = [&name](const auto& entry) { return entry.first == name; };
    if (index_.count(name) != 0 ||
        std::any_of(instances_.begin(), instances_.end(), same_instance)) {
        throw ParameterError("Duplicate device name '" + name + "'");
    }

    std::visit([&](auto& d) {
        using T = std::decay_t<decltype(d)>;

        if constexpr (std::is_same_v<T, SubcircuitInstance>) {
            d.set_name(name);
            instances_.emplace_back(name, d.definition());
            instantiate(name, d, 0);
        } else {
            add_primitive(name, std::move(d));
        }
    }, device);
}

void Netlist::add_primitive(std::string name, PrimitiveDevice device) {
    if (index_.count(name) != 0) {
        throw ParameterError("Duplicate device name '" + name + "'");
    }
    base_of(device).set_name(name);
    index_.emplace(name, devices_.size());
    names_.push_back(std::move(name));
    devices_.push_back(std::move(device));
}

void Netlist::instantiate(const std::string& instance_name, const SubcircuitInstance& instance,
                          int depth) {
    if (depth > kMaxSubcircuitDepth) {
        throw ParameterError("Subcircuit nesting too deep at '" + instance_name +
                             "' (recursive definition?)");
    }

    const SubcircuitDefinition* definition = find_subcircuit(instance.definition());
    if (!definition) {
        throw ParameterError("Subcircuit instance '" + instance_name +
                             "' references unknown definition '" + instance.definition() + "'");
    }

    const auto ports = instance.nodes();
    if (ports.size() != definition->ports().size()) {
        throw ParameterError("Subcircuit instance '" + instance_name + "' has " +
                             std::to_string(ports.size()) + " nodes but '" +
                             definition->name() + "' declares " +
                             std::to_string(definition->ports().size()) + " ports");
    }

    // Local node -> netlist node
    const NodeTable& local = definition->local_nodes();
    std::vector<NodeIndex> map(local.size(), -1);
    map[0] = ground_node;
    for (std::size_t i = 0; i < ports.size(); ++i) {
        if (!nodes_.contains(ports[i])) {
            throw FloatingPortError(instance_name, i,
                                    "node " + std::to_string(ports[i]) + " does not exist");
        }
        map[static_cast<std::size_t>(definition->ports()[i])] = ports[i];
    }
    for (std::size_t j = 1; j < map.size(); ++j) {
        if (map[j] < 0) {
            std::string label = instance_name + "." + local.name(static_cast<NodeIndex>(j));
            if (nodes_.find(label)) {
                throw ParameterError("Subcircuit node '" + label +
                                     "' collides with an existing node");
            }
            map[j] = nodes_.node(label);
            flattened_nodes_.insert(std::move(label));
        }
    }

    auto remap = [&](NodeIndex n) {
        if (n < 0 || static_cast<std::size_t>(n) >= map.size()) {
            throw ParameterError("Device in subcircuit '" + definition->name() +
                                 "' uses node " + std::to_string(n) +
                                 " which is not part of the definition");
        }
        return map[static_cast<std::size_t>(n)];
    };

    const std::string prefix = instance_name + "_";
    for (const auto& [device_name, prototype] : definition->devices()) {
        Device copy = prototype;
        const std::string mangled = prefix + device_name;

        std::visit([&](auto& d) {
            using T = std::decay_t<decltype(d)>;

            d.remap_nodes(remap);
            if constexpr (requires { d.mangle_references(prefix); }) {
                d.mangle_references(prefix);
            }
            d.set_name(mangled);

            if constexpr (std::is_same_v<T, SubcircuitInstance>) {
                instances_.emplace_back(mangled, d.definition());
                instantiate(mangled, d, depth + 1);
            } else {
                add_primitive(mangled, std::move(d));
            }
        }, copy);
    }
}

void Netlist::build() {
    if (built_) {
        return;
    }
    // Devices that reference other devices connect in a second pass
    for (int pass = 0; pass < 2; ++pass) {
        for (auto& device : devices_) {
            std::visit([&](auto& d) {
                using T = std::decay_t<decltype(d)>;
                if (T::connect_pass == pass) {
                    d.connect(*this);
                }
            }, device);
        }
    }
    nodes_.freeze();
    built_ = true;
}

void Netlist::initialize(Real dt) {
    build();
    for (auto& device : devices_) {
        std::visit([dt](auto& d) { d.initialize(dt); }, device);
    }
    initialized_ = true;
}

void Netlist::update(const StepContext& context) {
    for (auto& device : devices_) {
        std::visit([&context](auto& d) { d.update(context); }, device);
    }
}

const PrimitiveDevice* Netlist::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &devices_[it->second];
}

const Inductor* Netlist::find_inductor(const std::string& name) const {
    const PrimitiveDevice* device = find(name);
    return device ? std::get_if<Inductor>(device) : nullptr;
}

bool Netlist::validate(std::string& error) const {
    if (devices_.empty()) {
        error = "Circuit has no components";
        return false;
    }

    bool touches_ground = false;
    for (const auto& device : devices_) {
        const DeviceBase& base = base_of(device);
        for (std::size_t port = 0; port < base.port_count(); ++port) {
            const NodeIndex n = base.port_node(port);
            if (!nodes_.contains(n)) {
                error = "Device '" + base.name() + "' port " + std::to_string(port) +
                        " refers to unknown node " + std::to_string(n);
                return false;
            }
            touches_ground = touches_ground || n == ground_node;
        }
    }
    if (!touches_ground) {
        error = "Circuit has no ground reference";
        return false;
    }

    if (initialized_) {
        if (auto floating = floating_node()) {
            error = "Node '" + nodes_.name(*floating) + "' has no conducting path to ground";
            return false;
        }
    }

    return true;
}

std::optional<NodeIndex> Netlist::floating_node() const {
    NodeSets sets(nodes_.size());
    for (const auto& device : devices_) {
        const DeviceBase& base = base_of(device);
        const auto local = base.nodes();
        const Matrix& jac = base.jacobian();
        if (static_cast<std::size_t>(jac.rows()) != local.size()) {
            continue;  // not stamped yet
        }
        for (std::size_t i = 0; i < local.size(); ++i) {
            for (std::size_t j = i + 1; j < local.size(); ++j) {
                const auto li = static_cast<Eigen::Index>(i);
                const auto lj = static_cast<Eigen::Index>(j);
                if (jac(li, lj) != 0.0 && jac(lj, li) != 0.0) {
                    sets.unite(static_cast<std::size_t>(local[i]),
                               static_cast<std::size_t>(local[j]));
                }
            }
        }
    }

    const std::size_t ground = sets.find(static_cast<std::size_t>(ground_node));
    for (std::size_t n = 1; n < nodes_.size(); ++n) {
        if (sets.find(n) != ground) {
            return static_cast<NodeIndex>(n);
        }
    }
    return std::nullopt;
}

}  // namespace schemasim
