#include "schemasim/export.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace schemasim {

namespace {

std::vector<Series> resolve_all(const SimulationHistory& history,
                                const std::vector<Channel>& channels) {
    std::vector<Series> series;
    series.reserve(channels.size());
    for (const auto& channel : channels) {
        series.push_back(resolve(history, channel));
    }
    return series;
}

std::ofstream open_output(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }
    return file;
}

}  // namespace

void write_csv(std::ostream& out, const SimulationHistory& history,
               const std::vector<Channel>& channels) {
    const auto series = resolve_all(history, channels);

    // Header
    out << "time";
    for (const auto& s : series) {
        out << "," << s.name;
    }
    out << "\n";

    // Data
    out << std::scientific << std::setprecision(9);
    for (std::size_t i = 0; i < history.size(); ++i) {
        out << history.time[i];
        for (const auto& s : series) {
            out << "," << s.values[i];
        }
        out << "\n";
    }
}

void write_json(std::ostream& out, const SimulationResult& result,
                const std::vector<Channel>& channels) {
    const auto series = resolve_all(result.history, channels);

    nlohmann::json j;
    j["status"] = to_string(result.final_status);
    j["state"] = to_string(result.state);
    j["message"] = result.message;
    if (result.has_stable_time) {
        j["last_stable_time"] = result.last_stable_time;
    }
    j["statistics"] = {
        {"total_steps", result.total_steps},
        {"newton_iterations", result.newton_iterations_total},
        {"min_iterations_per_step", result.min_iterations_per_step},
        {"max_iterations_per_step", result.max_iterations_per_step},
        {"wall_time_seconds", result.total_time_seconds},
    };
    j["time"] = result.history.time;

    nlohmann::json signals = nlohmann::json::object();
    for (const auto& s : series) {
        nlohmann::json values = nlohmann::json::array();
        for (Real v : s.values) {
            // JSON has no NaN/Inf
            values.push_back(std::isfinite(v) ? nlohmann::json(v) : nlohmann::json(nullptr));
        }
        signals[s.name] = std::move(values);
    }
    j["signals"] = std::move(signals);

    out << j.dump(2) << "\n";
}

void write_csv(const std::string& filename, const SimulationHistory& history,
               const std::vector<Channel>& channels) {
    auto file = open_output(filename);
    write_csv(file, history, channels);
}

void write_json(const std::string& filename, const SimulationResult& result,
                const std::vector<Channel>& channels) {
    auto file = open_output(filename);
    write_json(file, result, channels);
}

}  // namespace schemasim
