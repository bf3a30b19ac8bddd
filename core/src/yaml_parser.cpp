#include "schemasim/parser/yaml_parser.hpp"
#include "schemasim/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace schemasim::parser {

namespace {

constexpr const char* kSchemaId = "schemasim-v1";
constexpr const char* kDiagSchema = "SCHEMASIM_YAML_E_SCHEMA";
constexpr const char* kDiagUnsupportedComponent = "SCHEMASIM_YAML_E_COMPONENT_UNSUPPORTED";
constexpr const char* kDiagInvalidPinCount = "SCHEMASIM_YAML_E_PIN_COUNT";
constexpr const char* kDiagInvalidParameter = "SCHEMASIM_YAML_E_PARAM_INVALID";
constexpr const char* kDiagMissingField = "SCHEMASIM_YAML_E_MISSING_FIELD";
constexpr const char* kDiagInvalidWaveform = "SCHEMASIM_YAML_E_WAVEFORM_INVALID";
constexpr const char* kDiagSubcircuit = "SCHEMASIM_YAML_E_SUBCIRCUIT";
constexpr const char* kDiagUnknownField = "SCHEMASIM_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagUnknownFieldWarning = "SCHEMASIM_YAML_W_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "SCHEMASIM_YAML_E_TYPE_MISMATCH";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_key(std::string s) {
    s = to_lower(s);
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

// Diagnostics sink shared by the parse helpers
struct Diagnostics {
    std::vector<std::string>& errors;
    std::vector<std::string>& warnings;
    bool strict = true;

    void error(const std::string& code, const std::string& message) {
        errors.push_back(with_diag_code(code, message));
    }
    void warning(const std::string& code, const std::string& message) {
        warnings.push_back(with_diag_code(code, message));
    }
};

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(Diagnostics& diag,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    diag.error(kDiagTypeMismatch,
               "Type mismatch at '" + path + "' (expected " + expected +
                   ", got " + yaml_node_class(received) + ")");
}

bool is_set(const YAML::Node& node) {
    return node.IsDefined() && !node.IsNull();
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   Diagnostics& diag) {
    if (!node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) != allowed.end()) continue;

        const std::string message = "Unknown field at '" + context + "." + key + "'";
        if (diag.strict) {
            diag.error(kDiagUnknownField, message);
        } else {
            diag.warning(kDiagUnknownFieldWarning, message);
        }
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               Diagnostics& diag) {
    if (!is_set(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(diag, path, "string", node);
        return std::nullopt;
    }
    return node.as<std::string>();
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    Diagnostics& diag) {
    if (!is_set(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(diag, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::BadConversion&) {
        push_type_mismatch_error(diag, path, "integer", node);
        return std::nullopt;
    }
}

/// Number with optional SPICE suffix; nullopt (with a diagnostic) when malformed
std::optional<Real> parse_real(const YAML::Node& node,
                               const std::string& path,
                               Diagnostics& diag) {
    if (!is_set(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(diag, path, "number", node);
        return std::nullopt;
    }
    try {
        return parse_spice_number(node.as<std::string>());
    } catch (const std::invalid_argument&) {
        push_type_mismatch_error(diag, path, "number", node);
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> parse_string_list(const YAML::Node& node,
                                                          const std::string& path,
                                                          Diagnostics& diag) {
    if (!node.IsSequence()) {
        push_type_mismatch_error(diag, path, "sequence", node);
        return std::nullopt;
    }
    std::vector<std::string> items;
    for (std::size_t i = 0; i < node.size(); ++i) {
        auto item = parse_string_scalar(node[i], path + "[" + std::to_string(i) + "]", diag);
        if (!item) {
            if (!is_set(node[i])) {
                push_type_mismatch_error(diag, path + "[" + std::to_string(i) + "]", "string", node[i]);
            }
            return std::nullopt;
        }
        items.push_back(*item);
    }
    return items;
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node,
                                     const std::string& path,
                                     Diagnostics& diag) {
    if (!is_set(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(diag, path, "boolean", node);
        return std::nullopt;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        push_type_mismatch_error(diag, path, "boolean", node);
        return std::nullopt;
    }
}

/// Sequence of [x, y] number pairs (PWL points, gain tables)
std::optional<std::vector<std::pair<Real, Real>>> parse_pair_list(const YAML::Node& node,
                                                                  const std::string& path,
                                                                  const std::string& expected,
                                                                  Diagnostics& diag) {
    if (!node || !node.IsSequence()) {
        push_type_mismatch_error(diag, path, "sequence of " + expected, node);
        return std::nullopt;
    }
    std::vector<std::pair<Real, Real>> pairs;
    for (std::size_t i = 0; i < node.size(); ++i) {
        const std::string item_path = path + "[" + std::to_string(i) + "]";
        const YAML::Node item = node[i];
        if (!item.IsSequence() || item.size() != 2) {
            push_type_mismatch_error(diag, item_path, expected, item);
            return std::nullopt;
        }
        auto x = parse_real(item[0], item_path + "[0]", diag);
        auto y = parse_real(item[1], item_path + "[1]", diag);
        if (!x || !y) return std::nullopt;
        pairs.emplace_back(*x, *y);
    }
    return pairs;
}

const std::unordered_map<std::string, std::string>& component_alias_map() {
    static const std::unordered_map<std::string, std::string> aliases = [] {
        std::unordered_map<std::string, std::string> map;

        auto add_aliases = [&](const std::string& canonical, std::initializer_list<const char*> names) {
            map.emplace(normalize_key(canonical), canonical);
            for (const char* name : names) {
                map.emplace(normalize_key(name), canonical);
            }
        };

        add_aliases("resistor", {"r"});
        add_aliases("capacitor", {"c"});
        add_aliases("inductor", {"l"});
        add_aliases("voltage_source", {"v", "vsource", "source_v"});
        add_aliases("current_source", {"i", "isource", "source_i"});
        add_aliases("diode", {"d"});
        add_aliases("coupled_inductor", {"k", "mutual"});
        add_aliases("vcvs", {"e"});
        add_aliases("switch", {"s", "vswitch"});
        add_aliases("voltage_probe", {"vprobe"});
        add_aliases("current_probe", {"iprobe", "ammeter"});
        add_aliases("subcircuit", {"x", "subckt", "instance"});

        return map;
    }();
    return aliases;
}

std::string canonical_component_type(const std::string& raw_type) {
    const auto& aliases = component_alias_map();
    const auto it = aliases.find(normalize_key(raw_type));
    return it == aliases.end() ? std::string{} : it->second;
}

bool validate_node_count(const std::string& type,
                         const std::vector<std::string>& nodes,
                         const std::string& name,
                         Diagnostics& diag) {
    std::size_t min_nodes = 2;
    std::size_t max_nodes = 2;
    if (type == "voltage_probe") {
        min_nodes = 1;
    } else if (type == "vcvs" || type == "switch") {
        min_nodes = 4;
        max_nodes = 4;
    } else if (type == "subcircuit") {
        min_nodes = 0;
        max_nodes = nodes.size();
    }

    if (nodes.size() < min_nodes || nodes.size() > max_nodes) {
        std::ostringstream oss;
        oss << "Invalid pin count for '" << name << "' (" << type << "): got "
            << nodes.size() << ", expected ";
        if (min_nodes == max_nodes) {
            oss << min_nodes;
        } else {
            oss << min_nodes << "-" << max_nodes;
        }
        diag.error(kDiagInvalidPinCount, oss.str());
        return false;
    }
    return true;
}

/// Parameter looked up at the component's top level, then under `params`
YAML::Node get_param(const YAML::Node& component, std::initializer_list<const char*> keys) {
    const YAML::Node params = component["params"];
    for (const char* key : keys) {
        YAML::Node top = component[key];
        if (is_set(top)) return top;
        if (params && params.IsMap()) {
            YAML::Node nested = params[key];
            if (is_set(nested)) return nested;
        }
    }
    return YAML::Node();
}

// =============================================================================
// Waveforms
// =============================================================================

std::optional<Waveform> parse_waveform(const YAML::Node& node,
                                       const std::string& path,
                                       Diagnostics& diag) {
    if (!node.IsMap()) {
        push_type_mismatch_error(diag, path, "map", node);
        return std::nullopt;
    }

    const auto raw_type = parse_string_scalar(node["type"], path + ".type", diag);
    if (!raw_type) {
        diag.error(kDiagMissingField, "Waveform at '" + path + "' is missing 'type'");
        return std::nullopt;
    }
    const std::string type = normalize_key(*raw_type);

    const std::size_t errors_before = diag.errors.size();
    auto read = [&](const char* key, Real& target) {
        if (auto v = parse_real(node[key], path + "." + key, diag)) target = *v;
    };
    auto read_opt = [&](const char* key, std::optional<Real>& target) {
        if (auto v = parse_real(node[key], path + "." + key, diag)) target = *v;
    };

    Waveform waveform;
    if (type == "dc" || type == "constant") {
        validate_keys(node, {"type", "value"}, path, diag);
        ConstantWaveform w;
        read("value", w.value);
        waveform = w;
    } else if (type == "sine" || type == "sin") {
        validate_keys(node, {"type", "offset", "amplitude", "frequency", "delay", "damping", "phase"},
                      path, diag);
        SineWaveform w;
        read("offset", w.offset);
        read("amplitude", w.amplitude);
        read("frequency", w.frequency);
        read("delay", w.delay);
        read("damping", w.damping);
        read("phase", w.phase);
        waveform = w;
    } else if (type == "pulse") {
        validate_keys(node, {"type", "v1", "v2", "td", "tr", "tf", "pw", "per", "period"}, path, diag);
        PulseWaveform w;
        read("v1", w.v1);
        read("v2", w.v2);
        read("td", w.td);
        read_opt("tr", w.tr);
        read_opt("tf", w.tf);
        read_opt("pw", w.pw);
        read("per", w.period);
        read("period", w.period);
        waveform = w;
    } else if (type == "exp" || type == "exponential") {
        validate_keys(node, {"type", "v1", "v2", "td1", "tau1", "td2", "tau2"}, path, diag);
        ExponentialWaveform w;
        read("v1", w.v1);
        read("v2", w.v2);
        read("td1", w.td1);
        read_opt("tau1", w.tau1);
        read_opt("td2", w.td2);
        read_opt("tau2", w.tau2);
        waveform = w;
    } else if (type == "pwl") {
        validate_keys(node, {"type", "points"}, path, diag);
        auto points = parse_pair_list(node["points"], path + ".points", "[time, value]", diag);
        if (!points) return std::nullopt;
        waveform = PwlWaveform{std::move(*points)};
    } else {
        diag.error(kDiagInvalidWaveform, "Unsupported waveform type '" + *raw_type + "' at '" + path + "'");
        return std::nullopt;
    }

    if (diag.errors.size() != errors_before) {
        return std::nullopt;
    }
    return waveform;
}

/// Source value: a `waveform` map or a plain `value`
std::optional<Stimulus> parse_stimulus(const YAML::Node& component,
                                       const std::string& name,
                                       Diagnostics& diag) {
    const YAML::Node waveform_node = get_param(component, {"waveform"});
    if (is_set(waveform_node)) {
        auto waveform = parse_waveform(waveform_node, name + ".waveform", diag);
        if (!waveform) return std::nullopt;
        try {
            return Stimulus(std::move(*waveform));
        } catch (const SimulationError& e) {
            diag.error(kDiagInvalidWaveform, "Invalid waveform for '" + name + "': " + e.what());
            return std::nullopt;
        }
    }

    const YAML::Node value_node = get_param(component, {"value", "dc"});
    if (!is_set(value_node)) {
        diag.error(kDiagMissingField, "Source '" + name + "' needs a 'value' or a 'waveform'");
        return std::nullopt;
    }
    auto value = parse_real(value_node, name + ".value", diag);
    if (!value) return std::nullopt;
    return Stimulus(*value);
}

// =============================================================================
// Components
// =============================================================================

/// Destination of parsed devices: the top-level netlist or a subcircuit body
struct DeviceSink {
    std::function<NodeIndex(const std::string&)> node;
    std::function<void(std::string, Device)> add;
};

const std::unordered_set<std::string>& component_keys() {
    static const std::unordered_set<std::string> keys = {
        "type", "name", "nodes", "params", "value", "waveform", "dc",
        "resistance", "capacitance", "inductance", "ic", "res", "series_resistance",
        "rpar", "parallel_resistance",
        "is", "n", "vt", "vmax",
        "inductors", "l1", "l2", "coupling", "k",
        "gain", "table", "limit", "ron", "roff", "vh", "on",
        "subcircuit", "definition",
    };
    return keys;
}

std::optional<Real> required_real(const YAML::Node& component,
                                  std::initializer_list<const char*> keys,
                                  const std::string& path,
                                  Diagnostics& diag) {
    const YAML::Node node = get_param(component, keys);
    if (!is_set(node)) {
        diag.error(kDiagMissingField, "Missing required field '" + std::string(*keys.begin()) +
                                          "' for '" + path + "'");
        return std::nullopt;
    }
    return parse_real(node, path + "." + *keys.begin(), diag);
}

std::optional<Real> optional_real(const YAML::Node& component,
                                  std::initializer_list<const char*> keys,
                                  const std::string& path,
                                  Diagnostics& diag) {
    return parse_real(get_param(component, keys), path + "." + *keys.begin(), diag);
}

std::optional<Device> build_coupled_inductor(const YAML::Node& comp,
                                             const std::string& name,
                                             Diagnostics& diag) {
    std::vector<std::string> inductors;
    const YAML::Node list = get_param(comp, {"inductors"});
    if (is_set(list)) {
        auto parsed = parse_string_list(list, name + ".inductors", diag);
        if (!parsed) return std::nullopt;
        inductors = *parsed;
    } else {
        auto l1 = parse_string_scalar(get_param(comp, {"l1"}), name + ".l1", diag);
        auto l2 = parse_string_scalar(get_param(comp, {"l2"}), name + ".l2", diag);
        if (l1 && l2) inductors = {*l1, *l2};
    }
    if (inductors.size() != 2) {
        diag.error(kDiagInvalidPinCount,
                   "Coupled inductor '" + name + "' needs exactly two inductor names");
        return std::nullopt;
    }

    auto coupling = required_real(comp, {"coupling", "k"}, name, diag);
    if (!coupling) return std::nullopt;
    return Device{CoupledInductor(inductors[0], inductors[1], *coupling)};
}

std::optional<Device> build_device(const std::string& type,
                                   const YAML::Node& comp,
                                   const std::string& name,
                                   const std::vector<NodeIndex>& nodes,
                                   Diagnostics& diag) {
    auto node_at = [&](std::size_t index) -> NodeIndex {
        return index < nodes.size() ? nodes[index] : ground_node;
    };

    if (type == "resistor") {
        auto value = required_real(comp, {"value", "resistance"}, name, diag);
        if (!value) return std::nullopt;
        return Device{Resistor(node_at(0), node_at(1), *value)};
    }
    if (type == "capacitor") {
        auto value = required_real(comp, {"value", "capacitance"}, name, diag);
        if (!value) return std::nullopt;
        Capacitor::Params p;
        p.capacitance = *value;
        p.initial_voltage = optional_real(comp, {"ic"}, name, diag);
        return Device{Capacitor(node_at(0), node_at(1), p)};
    }
    if (type == "inductor") {
        auto value = required_real(comp, {"value", "inductance"}, name, diag);
        if (!value) return std::nullopt;
        Inductor::Params p;
        p.inductance = *value;
        p.series_resistance = optional_real(comp, {"res", "series_resistance"}, name, diag).value_or(0.0);
        p.initial_current = optional_real(comp, {"ic"}, name, diag);
        return Device{Inductor(node_at(0), node_at(1), p)};
    }
    if (type == "voltage_source") {
        auto stimulus = parse_stimulus(comp, name, diag);
        if (!stimulus) return std::nullopt;
        return Device{VoltageSource(node_at(0), node_at(1), std::move(*stimulus))};
    }
    if (type == "current_source") {
        auto stimulus = parse_stimulus(comp, name, diag);
        if (!stimulus) return std::nullopt;
        CurrentSource::Params p{std::move(*stimulus), 0.0};
        p.parallel_resistance =
            optional_real(comp, {"rpar", "parallel_resistance"}, name, diag).value_or(0.0);
        return Device{CurrentSource(node_at(0), node_at(1), std::move(p))};
    }
    if (type == "diode") {
        Diode::Params p;
        if (auto v = optional_real(comp, {"is"}, name, diag)) p.saturation_current = *v;
        if (auto v = optional_real(comp, {"n"}, name, diag)) p.emission_coefficient = *v;
        if (auto v = optional_real(comp, {"vt"}, name, diag)) p.thermal_voltage = *v;
        if (auto v = optional_real(comp, {"vmax"}, name, diag)) p.max_voltage = *v;
        return Device{Diode(node_at(0), node_at(1), p)};
    }
    if (type == "vcvs") {
        Vcvs::Params p;
        if (auto v = optional_real(comp, {"gain", "value"}, name, diag)) p.gain = *v;
        const YAML::Node table = get_param(comp, {"table"});
        if (is_set(table)) {
            auto pairs = parse_pair_list(table, name + ".table", "[control voltage, gain]", diag);
            if (!pairs) return std::nullopt;
            p.gain_table = std::move(*pairs);
        }
        p.limit = optional_real(comp, {"limit"}, name, diag);
        return Device{Vcvs(node_at(0), node_at(1), node_at(2), node_at(3), std::move(p))};
    }
    if (type == "switch") {
        VoltageControlledSwitch::Params p;
        if (auto v = optional_real(comp, {"ron"}, name, diag)) p.on_resistance = *v;
        if (auto v = optional_real(comp, {"roff"}, name, diag)) p.off_resistance = *v;
        if (auto v = optional_real(comp, {"vt"}, name, diag)) p.threshold = *v;
        if (auto v = optional_real(comp, {"vh"}, name, diag)) p.hysteresis = *v;
        if (auto v = parse_bool_scalar(get_param(comp, {"on"}), name + ".on", diag)) {
            p.initially_on = *v;
        }
        return Device{VoltageControlledSwitch(node_at(0), node_at(1), node_at(2), node_at(3), p)};
    }
    if (type == "voltage_probe") {
        return Device{VoltageProbe(node_at(0), nodes.size() > 1 ? node_at(1) : ground_node)};
    }
    if (type == "current_probe") {
        return Device{CurrentProbe(node_at(0), node_at(1))};
    }
    if (type == "subcircuit") {
        auto definition = parse_string_scalar(get_param(comp, {"subcircuit", "definition"}),
                                              name + ".subcircuit", diag);
        if (!definition) {
            diag.error(kDiagMissingField, "Subcircuit instance '" + name + "' needs a 'subcircuit'");
            return std::nullopt;
        }
        return Device{SubcircuitInstance(nodes, *definition)};
    }

    diag.error(kDiagUnsupportedComponent, "Unsupported component type: " + type);
    return std::nullopt;
}

void parse_component(const YAML::Node& comp,
                     const std::string& path,
                     DeviceSink& sink,
                     Diagnostics& diag) {
    if (!comp.IsMap()) {
        push_type_mismatch_error(diag, path, "map", comp);
        return;
    }
    validate_keys(comp, component_keys(), path, diag);

    const auto raw_type = parse_string_scalar(comp["type"], path + ".type", diag);
    const auto name = parse_string_scalar(comp["name"], path + ".name", diag);
    if (!raw_type || !name || name->empty()) {
        diag.error(kDiagMissingField, "Component at '" + path + "' is missing type or name");
        return;
    }

    const std::string type = canonical_component_type(*raw_type);
    if (type.empty()) {
        diag.error(kDiagUnsupportedComponent, "Unsupported component type: " + *raw_type);
        return;
    }

    const std::size_t errors_before = diag.errors.size();
    std::optional<Device> device;
    try {
        if (type == "coupled_inductor") {
            device = build_coupled_inductor(comp, *name, diag);
        } else {
            const YAML::Node nodes_node = comp["nodes"];
            if (!nodes_node) {
                diag.error(kDiagInvalidPinCount, "Component missing nodes: " + *name);
                return;
            }
            auto labels = parse_string_list(nodes_node, *name + ".nodes", diag);
            if (!labels || !validate_node_count(type, *labels, *name, diag)) return;

            std::vector<NodeIndex> nodes;
            nodes.reserve(labels->size());
            for (const auto& label : *labels) {
                nodes.push_back(sink.node(label));
            }
            device = build_device(type, comp, *name, nodes, diag);
        }

        if (device && diag.errors.size() == errors_before) {
            sink.add(*name, std::move(*device));
        }
    } catch (const SimulationError& e) {
        diag.error(kDiagInvalidParameter, "Component '" + *name + "': " + e.what());
    }
}

void parse_components(const YAML::Node& list,
                      const std::string& path,
                      DeviceSink& sink,
                      Diagnostics& diag) {
    if (!list.IsSequence()) {
        push_type_mismatch_error(diag, path, "sequence", list);
        return;
    }
    for (std::size_t i = 0; i < list.size(); ++i) {
        parse_component(list[i], path + "[" + std::to_string(i) + "]", sink, diag);
    }
}

void parse_probes(const YAML::Node& list, Netlist& netlist, Diagnostics& diag) {
    if (!list.IsSequence()) {
        push_type_mismatch_error(diag, "probes", "sequence", list);
        return;
    }
    // Probes may observe the internal nodes of subcircuit instances
    DeviceSink sink{
        [&netlist](const std::string& label) {
            const auto existing = netlist.nodes().find(label);
            return existing ? *existing : netlist.add_node(label);
        },
        [&netlist](std::string name, Device device) {
            netlist.add_device(std::move(name), std::move(device));
        },
    };

    for (std::size_t i = 0; i < list.size(); ++i) {
        const std::string path = "probes[" + std::to_string(i) + "]";
        const YAML::Node probe = list[i];
        if (!probe.IsMap()) {
            push_type_mismatch_error(diag, path, "map", probe);
            continue;
        }
        // "voltage" / "current" are shorthands for the probe component types
        YAML::Node as_component = YAML::Clone(probe);
        const auto kind = parse_string_scalar(probe["type"], path + ".type", diag);
        if (kind) {
            const std::string key = normalize_key(*kind);
            if (key == "voltage" || key == "v") {
                as_component["type"] = "voltage_probe";
            } else if (key == "current" || key == "i") {
                as_component["type"] = "current_probe";
            } else if (canonical_component_type(*kind) != "voltage_probe" &&
                       canonical_component_type(*kind) != "current_probe") {
                diag.error(kDiagUnsupportedComponent, "Unsupported probe type: " + *kind);
                continue;
            }
        }
        parse_component(as_component, path, sink, diag);
    }
}

void parse_subcircuits(const YAML::Node& list, Netlist& netlist, Diagnostics& diag) {
    if (!list.IsSequence()) {
        push_type_mismatch_error(diag, "subcircuits", "sequence", list);
        return;
    }

    for (std::size_t i = 0; i < list.size(); ++i) {
        const std::string path = "subcircuits[" + std::to_string(i) + "]";
        const YAML::Node node = list[i];
        if (!node.IsMap()) {
            push_type_mismatch_error(diag, path, "map", node);
            continue;
        }
        validate_keys(node, {"name", "ports", "components"}, path, diag);

        const auto name = parse_string_scalar(node["name"], path + ".name", diag);
        if (!name) {
            diag.error(kDiagMissingField, "Subcircuit at '" + path + "' is missing 'name'");
            continue;
        }
        std::vector<std::string> ports;
        if (is_set(node["ports"])) {
            auto parsed = parse_string_list(node["ports"], path + ".ports", diag);
            if (!parsed) continue;
            ports = *parsed;
        }
        if (!is_set(node["components"])) {
            diag.error(kDiagMissingField, "Subcircuit '" + *name + "' has no components");
            continue;
        }

        try {
            SubcircuitDefinition definition(*name, ports);
            DeviceSink sink{
                [&definition](const std::string& label) { return definition.node(label); },
                [&definition](std::string device_name, Device device) {
                    definition.add_device(std::move(device_name), std::move(device));
                },
            };
            parse_components(node["components"], path + ".components", sink, diag);
            netlist.add_subcircuit(std::move(definition));
        } catch (const SimulationError& e) {
            diag.error(kDiagSubcircuit, "Subcircuit '" + *name + "': " + e.what());
        }
    }
}

void parse_simulation(const YAML::Node& sim, SimulationOptions& options, Diagnostics& diag) {
    if (!sim.IsMap()) {
        push_type_mismatch_error(diag, "simulation", "map", sim);
        return;
    }
    validate_keys(sim, {"dt", "tmax", "max_iterations", "maxitr", "tolerance", "tol"},
                  "simulation", diag);

    if (auto v = parse_real(sim["dt"], "simulation.dt", diag)) options.dt = *v;
    if (auto v = parse_real(sim["tmax"], "simulation.tmax", diag)) options.tmax = *v;
    if (auto v = parse_int_scalar(sim["max_iterations"], "simulation.max_iterations", diag)) {
        options.max_iterations = *v;
    }
    if (auto v = parse_int_scalar(sim["maxitr"], "simulation.maxitr", diag)) {
        options.max_iterations = *v;
    }
    if (auto v = parse_real(sim["tolerance"], "simulation.tolerance", diag)) options.tolerance = *v;
    if (auto v = parse_real(sim["tol"], "simulation.tol", diag)) options.tolerance = *v;

    try {
        options.validate();
    } catch (const ParameterError& e) {
        diag.error(kDiagInvalidParameter, std::string("simulation: ") + e.what());
    }
}

}  // namespace

Real parse_spice_number(const std::string& text) {
    std::string raw = text;
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.front()))) raw.erase(raw.begin());
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.back()))) raw.pop_back();
    if (raw.empty()) {
        throw std::invalid_argument("empty numeric value");
    }

    char* end = nullptr;
    const double base = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str()) {
        throw std::invalid_argument("invalid numeric value '" + text + "'");
    }

    const std::string suffix = to_lower(raw.substr(static_cast<std::size_t>(end - raw.c_str())));
    if (suffix.empty()) return base;
    if (!std::isalpha(static_cast<unsigned char>(suffix.front()))) {
        throw std::invalid_argument("invalid numeric value '" + text + "'");
    }

    // SPICE scale factors are case-insensitive: M is milli, MEG is mega.
    // Trailing unit letters ("10uF", "1kOhm") are ignored.
    auto starts_with = [&](const char* prefix) { return suffix.rfind(prefix, 0) == 0; };
    double multiplier = 1.0;
    if (starts_with("meg")) {
        multiplier = 1e6;
    } else if (starts_with("mil")) {
        multiplier = 25.4e-6;
    } else {
        switch (suffix.front()) {
            case 't': multiplier = 1e12; break;
            case 'g': multiplier = 1e9; break;
            case 'k': multiplier = 1e3; break;
            case 'm': multiplier = 1e-3; break;
            case 'u': multiplier = 1e-6; break;
            case 'n': multiplier = 1e-9; break;
            case 'p': multiplier = 1e-12; break;
            case 'f': multiplier = 1e-15; break;
            default: break;
        }
    }
    return base * multiplier;
}

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

std::pair<Netlist, SimulationOptions> YamlParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        throw std::runtime_error(errors_.front());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

std::pair<Netlist, SimulationOptions> YamlParser::load_string(const std::string& content) {
    Netlist netlist;
    SimulationOptions options;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, netlist, options);

    if (!errors_.empty()) {
        std::string summary = "Netlist has " + std::to_string(errors_.size()) + " error(s):";
        for (const auto& error : errors_) {
            summary += "\n  " + error;
        }
        throw std::runtime_error(summary);
    }
    return {std::move(netlist), options};
}

void YamlParser::parse_yaml(const std::string& content, Netlist& netlist, SimulationOptions& options) {
    Diagnostics diag{errors_, warnings_, options_.strict};

    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root.IsMap()) {
        diag.error(kDiagSchema, "Netlist root must be a map");
        return;
    }

    validate_keys(root, {"schema", "title", "simulation", "subcircuits", "components", "probes"},
                  "root", diag);

    if (!root["schema"]) {
        diag.error(kDiagSchema, "Missing required field 'schema'");
        return;
    }
    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", diag);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        diag.error(kDiagSchema, "Unsupported schema: " + *schema);
        return;
    }

    if (auto title = parse_string_scalar(root["title"], "root.title", diag)) {
        netlist.set_title(*title);
    }

    // Simulation options
    if (is_set(root["simulation"])) {
        parse_simulation(root["simulation"], options, diag);
    }

    // Subcircuit definitions must exist before their instances
    if (is_set(root["subcircuits"])) {
        parse_subcircuits(root["subcircuits"], netlist, diag);
    }

    // Components
    if (!root["components"] || !root["components"].IsSequence()) {
        diag.error(kDiagMissingField, "Missing or invalid components list");
        return;
    }

    DeviceSink sink{
        [&netlist](const std::string& label) { return netlist.add_node(label); },
        [&netlist](std::string name, Device device) {
            netlist.add_device(std::move(name), std::move(device));
        },
    };
    parse_components(root["components"], "components", sink, diag);

    if (is_set(root["probes"])) {
        parse_probes(root["probes"], netlist, diag);
    }
}

}  // namespace schemasim::parser
