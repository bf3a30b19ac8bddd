#include "schemasim/topology.hpp"
#include "schemasim/errors.hpp"

#include <numeric>
#include <unordered_set>

namespace schemasim {

namespace {

constexpr std::size_t kUnassigned = static_cast<std::size_t>(-1);

// Union-find with path halving and union by size
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : parent_(n), size_(n, 1) {
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
    }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (size_[a] < size_[b]) std::swap(a, b);
        parent_[b] = a;
        size_[a] += size_[b];
    }

private:
    std::vector<std::size_t> parent_;
    std::vector<std::size_t> size_;
};

void validate_graph(const SchematicGraph& graph) {
    std::unordered_set<std::string> names;
    for (const auto& device : graph.devices()) {
        if (device.name.empty()) {
            throw ParameterError("Schematic device name must not be empty");
        }
        if (!names.insert(device.name).second) {
            throw ParameterError("Duplicate schematic device name '" + device.name + "'");
        }
    }

    for (const auto& connector : graph.connectors()) {
        for (ConnectionPointId id : connector.points) {
            if (id >= graph.points().size()) {
                throw ParameterError("Connector references unknown connection point " +
                                     std::to_string(id));
            }
        }
    }
}

}  // namespace

// =============================================================================
// SchematicGraph
// =============================================================================

SchematicDeviceId SchematicGraph::add_device(std::string name, std::size_t port_count,
                                             DeviceRole role) {
    devices_.push_back({std::move(name), port_count, role});
    return devices_.size() - 1;
}

SchematicDeviceId SchematicGraph::add_ground_symbol(std::string name) {
    SchematicDeviceId id = add_device(std::move(name), 1, DeviceRole::GroundSymbol);
    add_port(id, 0, true);
    return id;
}

ConnectionPointId SchematicGraph::add_port(SchematicDeviceId device, std::size_t port,
                                           bool is_ground) {
    if (device >= devices_.size()) {
        throw ParameterError("Port references unknown schematic device " + std::to_string(device));
    }
    if (port >= devices_[device].port_count) {
        throw ParameterError("Device '" + devices_[device].name + "' has no port " +
                             std::to_string(port));
    }
    if (this->port(device, port)) {
        throw ParameterError("Port " + std::to_string(port) + " of device '" +
                             devices_[device].name + "' is declared twice");
    }
    points_.push_back({device, port, is_ground});
    return points_.size() - 1;
}

ConnectionPointId SchematicGraph::add_bend_point() {
    points_.push_back({std::nullopt, 0, false});
    return points_.size() - 1;
}

ConnectorId SchematicGraph::add_connector(std::vector<ConnectionPointId> points) {
    for (ConnectionPointId id : points) {
        if (id >= points_.size()) {
            throw ParameterError("Connector references unknown connection point " +
                                 std::to_string(id));
        }
    }
    connectors_.push_back({std::move(points)});
    return connectors_.size() - 1;
}

std::optional<ConnectionPointId> SchematicGraph::port(SchematicDeviceId device,
                                                      std::size_t port) const {
    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (points_[i].device == device && points_[i].port == port) {
            return i;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Topology
// =============================================================================

const ExtractedDevice* Topology::find(const std::string& name) const {
    for (const auto& device : devices) {
        if (device.name == name) return &device;
    }
    return nullptr;
}

NetPartition Topology::partition() const {
    NetPartition result;
    for (const auto& net : nets) {
        if (!net.empty()) {
            result.insert(net);
        }
    }
    return result;
}

// =============================================================================
// TopologyExtractor
// =============================================================================

TopologyExtractor::TopologyExtractor(ExtractionOptions options)
    : options_(options) {}

Topology TopologyExtractor::extract(const SchematicGraph& graph) const {
    validate_graph(graph);

    const auto& points = graph.points();
    const auto& connectors = graph.connectors();

    // Connectors sharing a connection point (port or bend) belong to the same
    // group; union-find reaches the fixpoint of repeated group merging.
    std::vector<std::vector<ConnectorId>> touching(points.size());
    for (ConnectorId c = 0; c < connectors.size(); ++c) {
        for (ConnectionPointId p : connectors[c].points) {
            touching[p].push_back(c);
        }
    }

    DisjointSet groups(connectors.size());
    for (const auto& list : touching) {
        for (std::size_t i = 1; i < list.size(); ++i) {
            groups.unite(list[0], list[i]);
        }
    }

    // Port group of each connector group, and whether it contains ground
    std::vector<std::vector<ConnectionPointId>> group_ports(connectors.size());
    std::vector<bool> group_grounded(connectors.size(), false);
    for (ConnectorId c = 0; c < connectors.size(); ++c) {
        const std::size_t root = groups.find(c);
        for (ConnectionPointId p : connectors[c].points) {
            if (points[p].is_port()) {
                group_ports[root].push_back(p);
                if (points[p].is_ground) {
                    group_grounded[root] = true;
                }
            }
        }
    }

    // Net numbering in first-encountered order; every grounded group is net 0
    std::vector<std::size_t> group_net(connectors.size(), kUnassigned);
    std::size_t net_count = 1;
    for (ConnectorId c = 0; c < connectors.size(); ++c) {
        const std::size_t root = groups.find(c);
        if (group_net[root] != kUnassigned || group_ports[root].empty()) {
            continue;
        }
        group_net[root] = group_grounded[root] ? 0 : net_count++;
    }

    std::vector<std::size_t> point_net(points.size(), kUnassigned);
    for (ConnectorId c = 0; c < connectors.size(); ++c) {
        const std::size_t net = group_net[groups.find(c)];
        for (ConnectionPointId p : connectors[c].points) {
            point_net[p] = net;
        }
    }

    // Unwired ports: ground-flagged ports are always ground, others ground
    // themselves unless that rule is disabled.
    for (ConnectionPointId p = 0; p < points.size(); ++p) {
        if (!points[p].is_port() || point_net[p] != kUnassigned) continue;
        if (points[p].is_ground || options_.ground_unconnected_ports) {
            point_net[p] = 0;
        }
    }

    Topology topology;
    for (std::size_t net = 1; net < net_count; ++net) {
        topology.nodes.node("N" + std::to_string(net));
    }
    topology.nets.resize(net_count);

    const auto& devices = graph.devices();
    for (ConnectionPointId p = 0; p < points.size(); ++p) {
        if (points[p].is_port() && point_net[p] != kUnassigned) {
            topology.nets[point_net[p]].emplace(devices[*points[p].device].name, points[p].port);
        }
    }

    for (SchematicDeviceId d = 0; d < devices.size(); ++d) {
        const auto& device = devices[d];
        if (device.role == DeviceRole::GroundSymbol) continue;

        ExtractedDevice extracted{device.name, device.role, {}};
        extracted.nodes.reserve(device.port_count);
        for (std::size_t port = 0; port < device.port_count; ++port) {
            auto point = graph.port(d, port);
            if (!point) {
                throw FloatingPortError(device.name, port, "port is not part of the schematic");
            }
            if (point_net[*point] == kUnassigned) {
                throw FloatingPortError(device.name, port, "port is not connected to any net");
            }
            extracted.nodes.push_back(static_cast<NodeIndex>(point_net[*point]));
        }
        topology.devices.push_back(std::move(extracted));
    }

    return topology;
}

}  // namespace schemasim
