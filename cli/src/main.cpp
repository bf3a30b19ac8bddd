#include <CLI/CLI.hpp>
#include <schemasim/schemasim.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>

using namespace schemasim;

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitInvalid = 2;
constexpr int kExitSolverFailure = 3;

// Simulation settings given on the command line; unset fields keep the
// values from the netlist
struct SimulationOverrides {
    std::optional<double> dt;
    std::optional<double> tmax;
    std::optional<int> max_iterations;
    std::optional<double> tolerance;
};

struct LoadedNetlist {
    Netlist netlist;
    SimulationOptions options;
};

/// Load a YAML netlist. On failure the loader report is printed and
/// exit_code says whether the netlist was invalid or unreadable.
std::optional<LoadedNetlist> load_netlist(const std::string& netlist_file, bool lenient,
                                          bool quiet, int& exit_code) {
    parser::YamlParserOptions parser_opts;
    parser_opts.strict = !lenient;
    parser::YamlParser parser(parser_opts);

    std::optional<LoadedNetlist> loaded;
    try {
        auto [netlist, options] = parser.load(netlist_file);
        loaded = LoadedNetlist{std::move(netlist), options};
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = parser.errors().empty() ? kExitError : kExitInvalid;
        return std::nullopt;
    }

    if (!quiet) {
        for (const auto& warning : parser.warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }
    return loaded;
}

void print_progress(Real time, Real tmax) {
    static int last_percent = -1;
    int percent = tmax > 0.0 ? static_cast<int>(100.0 * time / tmax) : 100;
    if (percent == last_percent) return;
    last_percent = percent;
    std::cerr << "\rProgress: " << percent << "% (t=" << std::scientific
              << std::setprecision(3) << time << "s)" << std::flush;
}

bool wants_json(const std::string& format, const std::string& output_file) {
    if (!format.empty()) {
        return format == "json";
    }
    const auto dot = output_file.rfind('.');
    return dot != std::string::npos && output_file.substr(dot) == ".json";
}

int cmd_run(const std::string& netlist_file, const std::string& output_file,
            const std::string& format, const SimulationOverrides& overrides,
            const std::vector<std::string>& signals,
            bool lenient, bool verbose, bool quiet) {
    try {
        if (!quiet) {
            std::cerr << "Reading netlist: " << netlist_file << std::endl;
        }
        int exit_code = kExitError;
        auto loaded = load_netlist(netlist_file, lenient, quiet, exit_code);
        if (!loaded) return exit_code;
        Netlist& netlist = loaded->netlist;
        SimulationOptions opts = loaded->options;

        // Overrides are validated together with the netlist values
        if (overrides.dt) opts.dt = *overrides.dt;
        if (overrides.tmax) opts.tmax = *overrides.tmax;
        if (overrides.max_iterations) opts.max_iterations = *overrides.max_iterations;
        if (overrides.tolerance) opts.tolerance = *overrides.tolerance;
        opts.validate();

        std::vector<Channel> channels;
        for (const auto& signal : signals) {
            channels.push_back(parse_channel(signal));
        }

        if (!quiet) {
            std::cerr << "Running transient simulation..." << std::endl;
            std::cerr << "  dt: " << opts.dt << "s" << std::endl;
            std::cerr << "  tmax: " << opts.tmax << "s" << std::endl;
            std::cerr << "  max_iterations: " << opts.max_iterations << std::endl;
            std::cerr << "  tolerance: " << opts.tolerance << std::endl;
        }

        Simulator sim(netlist, opts);

        SimulationResult result;
        if (!quiet) {
            result = sim.run_transient([&opts](Real time, const Vector&) {
                print_progress(time, opts.tmax);
            });
            std::cerr << std::endl;  // Newline after progress
        } else {
            result = sim.run_transient();
        }

        if (verbose) {
            std::cerr << "Circuit:" << std::endl;
            std::cerr << "  Nodes: " << netlist.nodes().size() << std::endl;
            std::cerr << "  Devices: " << netlist.device_count() << std::endl;
            std::cerr << "  Unknowns: " << netlist.nodes().unknown_count() << std::endl;
        }

        const bool failed = result.state == SimulationState::Failed;
        if (failed) {
            std::cerr << "Simulation failed: " << result.message << std::endl;
            if (result.has_stable_time) {
                std::cerr << "  Last stable time: " << std::scientific << std::setprecision(6)
                          << result.last_stable_time << "s" << std::endl;
            }
        } else if (!quiet) {
            std::cerr << "Simulation completed:" << std::endl;
            std::cerr << "  Total steps: " << result.total_steps << std::endl;
            std::cerr << "  Newton iterations: " << result.newton_iterations_total << std::endl;
            if (verbose) {
                std::cerr << "  Iterations per step: min " << result.min_iterations_per_step
                          << ", max " << result.max_iterations_per_step << std::endl;
            }
            std::cerr << "  Wall time: " << std::fixed << std::setprecision(3)
                      << result.total_time_seconds << "s" << std::endl;
        }

        // Partial results are still written after a solver failure
        if (channels.empty()) {
            channels = default_channels(result.history);
        }
        const bool json = wants_json(format, output_file);
        if (!output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing results to: " << output_file << std::endl;
            }
            if (json) {
                write_json(output_file, result, channels);
            } else {
                write_csv(output_file, result.history, channels);
            }
        } else if (json) {
            write_json(std::cout, result, channels);
        } else {
            write_csv(std::cout, result.history, channels);
        }

        return failed ? kExitSolverFailure : kExitOk;

    } catch (const SimulationError& e) {
        // Bad overrides or signals, floating ports, non-physical parameters
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitInvalid;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}

int cmd_validate(const std::string& netlist_file, bool lenient, bool verbose) {
    int exit_code = kExitError;
    auto loaded = load_netlist(netlist_file, lenient, false, exit_code);
    if (!loaded) return exit_code;

    Netlist& netlist = loaded->netlist;
    try {
        // Connecting and seeding the devices surfaces floating ports, bad
        // references and nets without a path to ground
        loaded->options.validate();
        netlist.initialize(loaded->options.dt);
    } catch (const SimulationError& e) {
        std::cerr << "Validation failed: " << e.what() << std::endl;
        return kExitInvalid;
    }

    std::string error;
    if (!netlist.validate(error)) {
        std::cerr << "Validation failed: " << error << std::endl;
        return kExitInvalid;
    }

    if (verbose) {
        const NodeTable& nodes = netlist.nodes();
        std::cout << "Netlist is valid." << std::endl;
        std::cout << "  Nodes: " << nodes.size() << std::endl;
        std::cout << "  Devices: " << netlist.device_count() << std::endl;
        std::cout << "  Unknowns: " << nodes.unknown_count() << std::endl;

        std::cout << "\nUnknowns:" << std::endl;
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            std::cout << "  [" << (i - 1) << "] " << nodes.name(static_cast<NodeIndex>(i)) << std::endl;
        }
    } else {
        std::cout << "OK" << std::endl;
    }

    return kExitOk;
}

int cmd_info(const std::string& netlist_file, bool lenient) {
    try {
        int exit_code = kExitError;
        auto loaded = load_netlist(netlist_file, lenient, false, exit_code);
        if (!loaded) return exit_code;
        Netlist& netlist = loaded->netlist;
        const SimulationOptions& opts = loaded->options;
        netlist.build();

        const NodeTable& nodes = netlist.nodes();

        std::cout << "Circuit: " << netlist_file << std::endl;
        if (!netlist.title().empty()) {
            std::cout << "Title: " << netlist.title() << std::endl;
        }

        std::cout << "\nSimulation:" << std::endl;
        std::cout << "  dt: " << opts.dt << "s" << std::endl;
        std::cout << "  tmax: " << opts.tmax << "s" << std::endl;
        std::cout << "  max_iterations: " << opts.max_iterations << std::endl;
        std::cout << "  tolerance: " << opts.tolerance << std::endl;

        std::cout << "\nTopology:" << std::endl;
        std::cout << "  Nodes: " << nodes.external_nodes().size() << std::endl;
        std::cout << "  Total unknowns: " << nodes.unknown_count() << std::endl;

        std::cout << "\nDevices (" << netlist.device_count() << "):" << std::endl;
        for (std::size_t i = 0; i < netlist.device_count(); ++i) {
            const PrimitiveDevice& device = netlist.device(i);
            const DeviceBase& base = base_of(device);
            std::cout << "  " << netlist.device_name(i) << ": " << type_name_of(device) << " (";
            for (std::size_t p = 0; p < base.port_count(); ++p) {
                if (p > 0) std::cout << ", ";
                std::cout << nodes.name(base.port_node(p));
            }
            std::cout << ")";
            if (const auto* vsrc = std::get_if<VoltageSource>(&device)) {
                std::cout << " " << vsrc->stimulus().describe();
            } else if (const auto* isrc = std::get_if<CurrentSource>(&device)) {
                std::cout << " " << isrc->stimulus().describe();
            } else if (const auto* coupling = std::get_if<CoupledInductor>(&device)) {
                std::cout << " " << coupling->params().inductor1 << " <-> " << coupling->params().inductor2
                          << " k=" << coupling->params().coupling;
            } else if (const auto* vcvs = std::get_if<Vcvs>(&device)) {
                if (vcvs->params().gain_table.empty()) {
                    std::cout << " gain=" << vcvs->params().gain;
                } else {
                    std::cout << " table[" << vcvs->params().gain_table.size() << "]";
                }
                if (vcvs->params().limit) {
                    std::cout << " limit=" << *vcvs->params().limit;
                }
            } else if (const auto* sw = std::get_if<VoltageControlledSwitch>(&device)) {
                std::cout << " ron=" << sw->params().on_resistance
                          << " roff=" << sw->params().off_resistance
                          << " vt=" << sw->params().threshold;
            }
            std::cout << std::endl;
        }

        if (!netlist.instances().empty()) {
            std::cout << "\nSubcircuit instances:" << std::endl;
            for (const auto& [instance, definition] : netlist.instances()) {
                std::cout << "  " << instance << " -> " << definition << std::endl;
            }
        }

        std::cout << "\nNodes:" << std::endl;
        for (NodeIndex n : nodes.external_nodes()) {
            std::cout << "  " << nodes.name(n) << " -> index " << n << std::endl;
        }

        return kExitOk;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"schemasim - transient circuit simulator"};
    app.set_version_flag("-V,--version", std::string("schemasim ") + schemasim::version);

    // Global options
    bool verbose = false;
    bool quiet = false;
    bool lenient = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");
    app.add_flag("--lenient", lenient, "Report unknown netlist fields as warnings");

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Run transient simulation");
    std::string netlist_file;
    std::string output_file;
    std::string format;
    std::vector<std::string> signals;
    double cli_dt = 0.0;
    double cli_tmax = 0.0;
    int cli_maxiter = 0;
    double cli_tol = 0.0;

    run_cmd->add_option("netlist", netlist_file, "Netlist file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", output_file, "Output file (CSV or JSON)");
    run_cmd->add_option("--format", format, "Output format")
        ->check(CLI::IsMember({"csv", "json"}));
    auto* dt_opt = run_cmd->add_option("--dt", cli_dt, "Time step (overrides netlist)");
    auto* tmax_opt = run_cmd->add_option("--tmax", cli_tmax, "Stop time (overrides netlist)");
    auto* maxiter_opt = run_cmd->add_option("--maxiter", cli_maxiter,
                                            "Max Newton iterations (overrides netlist)");
    auto* tol_opt = run_cmd->add_option("--tol", cli_tol, "Newton tolerance (overrides netlist)");
    run_cmd->add_option("-s,--signal", signals, "Signal to export, e.g. V(out), V(a,b), I(R1)");

    run_cmd->callback([&]() {
        // Only options given explicitly override the netlist
        SimulationOverrides overrides;
        if (dt_opt->count() > 0) overrides.dt = cli_dt;
        if (tmax_opt->count() > 0) overrides.tmax = cli_tmax;
        if (maxiter_opt->count() > 0) overrides.max_iterations = cli_maxiter;
        if (tol_opt->count() > 0) overrides.tolerance = cli_tol;
        std::exit(cmd_run(netlist_file, output_file, format, overrides, signals,
                          lenient, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate netlist file");
    std::string validate_file;
    validate_cmd->add_option("netlist", validate_file, "Netlist file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, lenient, verbose));
    });

    // Info command
    auto* info_cmd = app.add_subcommand("info", "Show circuit information");
    std::string info_file;
    info_cmd->add_option("netlist", info_file, "Netlist file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    info_cmd->callback([&]() {
        std::exit(cmd_info(info_file, lenient));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
