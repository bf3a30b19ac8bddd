#pragma once

#include "schemasim/results.hpp"
#include "schemasim/simulation.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace schemasim {

// =============================================================================
// Result Export
// =============================================================================

/// time,<signal>,... rows in scientific notation
void write_csv(std::ostream& out, const SimulationHistory& history,
               const std::vector<Channel>& channels);

/// {"status", "state", "message", "time": [...], "signals": {name: [...]}}
void write_json(std::ostream& out, const SimulationResult& result,
                const std::vector<Channel>& channels);

/// Write to a file; throws std::runtime_error when it cannot be opened
void write_csv(const std::string& filename, const SimulationHistory& history,
               const std::vector<Channel>& channels);
void write_json(const std::string& filename, const SimulationResult& result,
                const std::vector<Channel>& channels);

}  // namespace schemasim
