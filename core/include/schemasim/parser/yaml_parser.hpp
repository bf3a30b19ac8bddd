#pragma once

#include "schemasim/netlist.hpp"
#include "schemasim/types.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace schemasim::parser {

struct YamlParserOptions {
    bool strict = true;  // Unknown fields are errors (warnings otherwise)
};

/// Loader for `schema: schemasim-v1` netlists. Diagnostics are collected
/// as "[SCHEMASIM_YAML_*] message" strings; load() throws std::runtime_error
/// summarizing them when any error was found.
class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    std::pair<Netlist, SimulationOptions> load(const std::filesystem::path& path);

    // Parse from string
    std::pair<Netlist, SimulationOptions> load_string(const std::string& content);

    [[nodiscard]] const std::vector<std::string>& errors() const { return errors_; }
    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, Netlist& netlist, SimulationOptions& options);
};

/// Value with an optional SPICE scale suffix: "4.7k", "10u", "2meg", "1e-3"
[[nodiscard]] Real parse_spice_number(const std::string& text);

}  // namespace schemasim::parser
