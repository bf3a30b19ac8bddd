#pragma once

#include "schemasim/simulation.hpp"
#include "schemasim/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace schemasim {

// =============================================================================
// Result Channels
// =============================================================================

/// Node reference by index or by label (a label may also name a voltage probe)
using NodeRef = std::variant<NodeIndex, std::string>;

struct Voltage {
    NodeRef node;
    NodeRef reference = ground_node;
};

struct Current {
    std::string device;
};

using Channel = std::variant<Voltage, Current>;

/// (time, value) series resolved from a simulation history
struct Series {
    std::string name;
    std::vector<Real> time;
    std::vector<Real> values;

    [[nodiscard]] std::size_t size() const { return time.size(); }
    [[nodiscard]] bool empty() const { return time.empty(); }
};

/// Resolve a channel against the history; throws SimulationError when the
/// node, probe or device is unknown.
[[nodiscard]] Series resolve(const SimulationHistory& history, const Channel& channel);

/// Display name: V(out), V(a,b), I(R1)
[[nodiscard]] std::string channel_name(const SimulationHistory& history, const Channel& channel);

/// Parse "V(node)", "V(node1,node2)" or "I(device)" (case-insensitive prefix)
[[nodiscard]] Channel parse_channel(const std::string& text);

/// Every named (non-internal) node voltage followed by every device
/// carrying a branch current
[[nodiscard]] std::vector<Channel> default_channels(const SimulationHistory& history);

}  // namespace schemasim
