#pragma once

#include "schemasim/node_table.hpp"
#include "schemasim/types.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace schemasim {

// =============================================================================
// Schematic Graph (arena of records referencing each other by index)
// =============================================================================

using SchematicDeviceId = std::size_t;
using ConnectionPointId = std::size_t;
using ConnectorId = std::size_t;

enum class DeviceRole {
    Primitive,
    Subcircuit,
    GroundSymbol,
};

struct SchematicDevice {
    std::string name;
    std::size_t port_count = 0;
    DeviceRole role = DeviceRole::Primitive;
};

/// A device port or a free bend point on a wire
struct ConnectionPoint {
    std::optional<SchematicDeviceId> device;  // empty for bend points
    std::size_t port = 0;
    bool is_ground = false;

    [[nodiscard]] bool is_port() const { return device.has_value(); }
};

struct Connector {
    std::vector<ConnectionPointId> points;
};

class SchematicGraph {
public:
    SchematicDeviceId add_device(std::string name, std::size_t port_count,
                                 DeviceRole role = DeviceRole::Primitive);

    /// Ground symbol: a single ground-flagged port
    SchematicDeviceId add_ground_symbol(std::string name);

    ConnectionPointId add_port(SchematicDeviceId device, std::size_t port, bool is_ground = false);
    ConnectionPointId add_bend_point();
    ConnectorId add_connector(std::vector<ConnectionPointId> points);

    /// Port connection point of a device, if it was declared
    [[nodiscard]] std::optional<ConnectionPointId> port(SchematicDeviceId device,
                                                        std::size_t port) const;

    [[nodiscard]] const std::vector<SchematicDevice>& devices() const { return devices_; }
    [[nodiscard]] const std::vector<ConnectionPoint>& points() const { return points_; }
    [[nodiscard]] const std::vector<Connector>& connectors() const { return connectors_; }

private:
    std::vector<SchematicDevice> devices_;
    std::vector<ConnectionPoint> points_;
    std::vector<Connector> connectors_;
};

// =============================================================================
// Topology Extraction
// =============================================================================

struct ExtractionOptions {
    bool ground_unconnected_ports = true;  // floating pins ground themselves
};

struct ExtractedDevice {
    std::string name;
    DeviceRole role = DeviceRole::Primitive;
    std::vector<NodeIndex> nodes;  // ordered by port index
};

/// (device name, port index)
using PortRef = std::pair<std::string, std::size_t>;
using NetPartition = std::set<std::set<PortRef>>;

struct Topology {
    NodeTable nodes;                      // one entry per net, ground = 0
    std::vector<ExtractedDevice> devices; // ground symbols excluded
    std::vector<std::set<PortRef>> nets;  // ports per net index

    [[nodiscard]] const ExtractedDevice* find(const std::string& name) const;

    /// Net partition as an unordered set of port sets (labels ignored)
    [[nodiscard]] NetPartition partition() const;
};

class TopologyExtractor {
public:
    explicit TopologyExtractor(ExtractionOptions options = {});

    /// Throws FloatingPortError for unresolved ports and ParameterError for
    /// malformed graphs.
    [[nodiscard]] Topology extract(const SchematicGraph& graph) const;

private:
    ExtractionOptions options_;
};

}  // namespace schemasim
