#pragma once

// schemasim - schematic netlist extraction and transient circuit simulation
// Main include file

#include "schemasim/types.hpp"
#include "schemasim/errors.hpp"
#include "schemasim/stimulus.hpp"
#include "schemasim/node_table.hpp"
#include "schemasim/device.hpp"
#include "schemasim/subcircuit.hpp"
#include "schemasim/netlist.hpp"
#include "schemasim/topology.hpp"
#include "schemasim/mna.hpp"
#include "schemasim/solver.hpp"
#include "schemasim/simulation.hpp"
#include "schemasim/results.hpp"
#include "schemasim/export.hpp"
#include "schemasim/parser/yaml_parser.hpp"

namespace schemasim {

constexpr const char* version = "0.1.0";

}  // namespace schemasim
