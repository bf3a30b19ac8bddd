#include "schemasim/results.hpp"
#include "schemasim/errors.hpp"

#include <algorithm>
#include <cctype>

namespace schemasim {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::string ref_label(const SimulationHistory& history, const NodeRef& ref) {
    if (const auto* index = std::get_if<NodeIndex>(&ref)) {
        if (*index >= 0 && static_cast<std::size_t>(*index) < history.node_names.size()) {
            return history.node_names[static_cast<std::size_t>(*index)];
        }
        return std::to_string(*index);
    }
    return std::get<std::string>(ref);
}

// Per-step value of a node reference: a node voltage or a voltage probe
std::vector<Real> ref_values(const SimulationHistory& history, const NodeRef& ref) {
    std::vector<Real> values;
    values.reserve(history.size());

    std::optional<NodeIndex> node;
    if (const auto* index = std::get_if<NodeIndex>(&ref)) {
        if (*index < 0 || static_cast<std::size_t>(*index) >= history.node_names.size()) {
            throw SimulationError("Unknown node index " + std::to_string(*index));
        }
        node = *index;
    } else {
        const auto& label = std::get<std::string>(ref);
        node = history.find_node(label);
        if (!node) {
            auto probe = history.find_probe(label);
            if (!probe) {
                throw SimulationError("Unknown node or voltage probe '" + label + "'");
            }
            for (const auto& step : history.probe_values) {
                values.push_back(step[*probe]);
            }
            return values;
        }
    }

    for (const auto& state : history.states) {
        values.push_back(state[*node]);
    }
    return values;
}

bool is_ground_ref(const NodeRef& ref) {
    if (const auto* index = std::get_if<NodeIndex>(&ref)) {
        return *index == ground_node;
    }
    return NodeTable::is_ground_label(std::get<std::string>(ref));
}

}  // namespace

Series resolve(const SimulationHistory& history, const Channel& channel) {
    Series series;
    series.name = channel_name(history, channel);
    series.time = history.time;

    if (const auto* voltage = std::get_if<Voltage>(&channel)) {
        series.values = ref_values(history, voltage->node);
        if (!is_ground_ref(voltage->reference)) {
            const auto reference = ref_values(history, voltage->reference);
            for (std::size_t i = 0; i < series.values.size(); ++i) {
                series.values[i] -= reference[i];
            }
        }
        return series;
    }

    const auto& current = std::get<Current>(channel);
    auto device = history.find_device(current.device);
    if (!device) {
        throw SimulationError("Unknown device '" + current.device + "'");
    }
    if (!history.has_current[*device]) {
        throw SimulationError("Device '" + current.device + "' has no branch current");
    }
    series.values.reserve(history.size());
    for (const auto& step : history.currents) {
        series.values.push_back(step[*device]);
    }
    return series;
}

std::string channel_name(const SimulationHistory& history, const Channel& channel) {
    if (const auto* voltage = std::get_if<Voltage>(&channel)) {
        std::string name = "V(" + ref_label(history, voltage->node);
        if (!is_ground_ref(voltage->reference)) {
            name += "," + ref_label(history, voltage->reference);
        }
        return name + ")";
    }
    return "I(" + std::get<Current>(channel).device + ")";
}

Channel parse_channel(const std::string& text) {
    const std::string s = trim(text);
    if (s.size() < 4 || s[1] != '(' || s.back() != ')') {
        throw SimulationError("Invalid signal '" + text + "' (expected V(node), V(a,b) or I(device))");
    }

    const char kind = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    const std::string inner = s.substr(2, s.size() - 3);

    if (kind == 'V') {
        const auto comma = inner.find(',');
        if (comma == std::string::npos) {
            const std::string node = trim(inner);
            if (node.empty()) {
                throw SimulationError("Invalid signal '" + text + "': empty node name");
            }
            return Voltage{node, ground_node};
        }
        const std::string a = trim(inner.substr(0, comma));
        const std::string b = trim(inner.substr(comma + 1));
        if (a.empty() || b.empty()) {
            throw SimulationError("Invalid signal '" + text + "': empty node name");
        }
        return Voltage{a, b};
    }
    if (kind == 'I') {
        const std::string device = trim(inner);
        if (device.empty() || device.find(',') != std::string::npos) {
            throw SimulationError("Invalid signal '" + text + "': expected a single device name");
        }
        return Current{device};
    }

    throw SimulationError("Invalid signal '" + text + "' (expected V(...) or I(...))");
}

std::vector<Channel> default_channels(const SimulationHistory& history) {
    std::vector<Channel> channels;
    for (std::size_t i = 1; i < history.node_names.size(); ++i) {
        // Internal unknowns are labelled "<owner>#<n>"
        if (history.node_names[i].find('#') == std::string::npos) {
            channels.emplace_back(Voltage{static_cast<NodeIndex>(i), ground_node});
        }
    }
    for (std::size_t i = 0; i < history.device_names.size(); ++i) {
        if (history.has_current[i]) {
            channels.emplace_back(Current{history.device_names[i]});
        }
    }
    return channels;
}

}  // namespace schemasim
