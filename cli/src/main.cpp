#include <CLI/CLI.hpp>
#include <metercalc/v1/core.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

using namespace metercalc::v1;

namespace {

struct OutputOptions {
    bool verbose = false;
    bool quiet = false;
    bool json = false;
};

// Sentinel values to detect if CLI option was explicitly provided
constexpr double CLI_SENTINEL = -1e99;

std::string format_fixed(Real value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string format_sci(Real value) {
    std::ostringstream os;
    os << std::scientific << std::setprecision(4) << value;
    return os.str();
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

template<typename T>
int report_failure(const Result<T>& result, const OutputOptions& out) {
    if (out.json) {
        print_json(error_json(result.error, result.message));
    }
    std::cerr << "Error: " << result.error_string() << std::endl;
    return 1;
}

/// Parse a case file and print its diagnostics; nullopt when it has errors
std::optional<CaseFile> load_case(const std::string& case_file, bool lenient, const OutputOptions& out) {
    parser::YamlParser yaml_parser(parser::YamlParserOptions{.strict = !lenient});

    if (out.verbose) {
        std::cerr << "Reading case: " << case_file << std::endl;
    }
    CaseFile parsed = yaml_parser.load(case_file);

    if (!out.quiet) {
        for (const auto& warning : yaml_parser.warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }
    if (!yaml_parser.errors().empty()) {
        std::cerr << "Validation failed: " << case_file << std::endl;
        for (const auto& error : yaml_parser.errors()) {
            std::cerr << "  " << error << std::endl;
        }
        return std::nullopt;
    }
    return parsed;
}

void print_flow_state(const FlowState& state) {
    const auto m3h = from_si(state.flow_m3s, "m3h", QuantityKind::Flow);
    const auto gpm = from_si(state.flow_m3s, "gpm", QuantityKind::Flow);
    std::cout << "Diameter: " << format_fixed(state.diameter_m, 4) << " m" << std::endl;
    std::cout << "Area: " << format_sci(state.area_m2) << " m2" << std::endl;
    std::cout << "Velocity: " << format_fixed(state.velocity_mps, 4) << " m/s" << std::endl;
    std::cout << "Flow rate: " << format_fixed(*m3h, 4) << " m3/h ("
              << format_fixed(*gpm, 4) << " gpm)" << std::endl;
}

void print_pressure_drop(const PressureDropResult& result, bool verbose) {
    const auto bar = from_si(result.delta_p_pa, "bar", QuantityKind::Pressure);
    const auto psi = from_si(result.delta_p_pa, "psi", QuantityKind::Pressure);
    std::cout << "Pressure drop: " << format_fixed(result.delta_p_pa, 2) << " Pa ("
              << format_fixed(*bar, 5) << " bar, " << format_fixed(*psi, 4) << " psi)" << std::endl;
    std::cout << "Friction factor: " << format_fixed(result.friction_factor, 6) << std::endl;
    std::cout << "Reynolds number: " << format_fixed(result.reynolds_number, 0)
              << " (" << to_string(result.flow_regime) << ")" << std::endl;
    std::cout << "Velocity: " << format_fixed(result.velocity_mps, 4) << " m/s" << std::endl;
    if (verbose) {
        std::cout << "Relative roughness: " << format_sci(result.relative_roughness) << std::endl;
    }
}

void print_gas_report(const GasReport& report, bool verbose) {
    const auto bara = from_si(report.conditions.pressure_pa, "bar", QuantityKind::Pressure);
    const auto celsius = from_si(report.conditions.temperature_k, "c", QuantityKind::Temperature);
    std::cout << "Conditions: " << format_fixed(*bara, 4) << " bara, "
              << format_fixed(*celsius, 2) << " C" << std::endl;
    std::cout << "Composition (mol%):" << std::endl;
    for (const auto& f : report.composition) {
        std::cout << "  " << std::left << std::setw(18) << f.name << std::right
                  << format_fixed(f.mole_percent, 4) << std::endl;
    }
    std::cout << "Molecular weight: " << format_fixed(report.molecular_weight, 4) << " kg/kmol" << std::endl;
    std::cout << "Specific gravity: " << format_fixed(report.specific_gravity, 4) << std::endl;
    std::cout << "Compressibility Z: " << format_fixed(report.compressibility, 5)
              << " (standard: " << format_fixed(report.compressibility_std, 5) << ")" << std::endl;
    std::cout << "Density: " << format_fixed(report.density_kg_m3, 4) << " kg/m3"
              << " (standard: " << format_fixed(report.density_std_kg_m3, 4) << " kg/m3)" << std::endl;
    std::cout << "HHV: " << format_fixed(report.hhv_mj_m3, 3) << " MJ/m3" << std::endl;
    std::cout << "LHV: " << format_fixed(report.lhv_mj_m3, 3) << " MJ/m3" << std::endl;
    std::cout << "Wobbe index: " << format_fixed(report.wobbe_index_mj_m3, 3) << " MJ/m3" << std::endl;
    if (verbose) {
        std::cout << "Pseudo-critical: Tc " << format_fixed(report.critical.tc_k, 2) << " K, Pc "
                  << format_fixed(*from_si(report.critical.pc_pa, "bar", QuantityKind::Pressure), 3)
                  << " bar" << std::endl;
        std::cout << "Reduced: Tr " << format_fixed(report.reduced_temperature, 4) << ", Pr "
                  << format_fixed(report.reduced_pressure, 4) << std::endl;
        std::cout << "Volume factor: " << format_fixed(report.volume_factor, 5) << std::endl;
    }
}

std::string step_summary(const StepOutput& output) {
    return std::visit(
        [](const auto& o) -> std::string {
            using T = std::decay_t<decltype(o)>;
            std::ostringstream os;
            if constexpr (std::is_same_v<T, ConversionRecord>) {
                os << to_string(o);
            } else if constexpr (std::is_same_v<T, FlowState>) {
                os << "Q = " << format_sci(o.flow_m3s) << " m3/s, v = " << format_fixed(o.velocity_mps, 4) << " m/s";
            } else if constexpr (std::is_same_v<T, PressureDropResult>) {
                os << "dP = " << format_fixed(o.delta_p_pa, 2) << " Pa, f = " << format_fixed(o.friction_factor, 6)
                   << ", Re = " << format_fixed(o.reynolds_number, 0) << " (" << to_string(o.flow_regime) << ")";
            } else {
                os << "SG = " << format_fixed(o.specific_gravity, 4) << ", Z = " << format_fixed(o.compressibility, 5)
                   << ", rho = " << format_fixed(o.density_kg_m3, 4) << " kg/m3";
            }
            return os.str();
        },
        output);
}

int cmd_convert(double value, const std::string& from_unit, const std::string& to_unit,
                const std::string& kind_name, const OutputOptions& out) {
    const auto kind = parse_quantity_kind(kind_name);
    if (!kind) {
        return report_failure(Result<Real>::failure(CalcError::InvalidInput,
                                                    "Unknown quantity kind: " + kind_name),
                              out);
    }

    const auto converted = convert(value, from_unit, to_unit, *kind);
    if (!converted) {
        return report_failure(converted, out);
    }

    if (out.json) {
        print_json(ConversionRecord{value, from_unit, to_unit, *kind, *converted});
    } else {
        std::cout << to_string(ConversionRecord{value, from_unit, to_unit, *kind, *converted}) << std::endl;
    }
    return 0;
}

int cmd_flow(double diameter, const std::string& diameter_unit,
             double cli_velocity, double cli_flow_rate, const std::string& flow_unit,
             const OutputOptions& out) {
    const auto diameter_m = to_si(diameter, diameter_unit, QuantityKind::Length);
    if (!diameter_m) {
        return report_failure(diameter_m, out);
    }

    std::optional<Real> velocity;
    if (cli_velocity != CLI_SENTINEL) velocity = cli_velocity;

    std::optional<Real> flow;
    if (cli_flow_rate != CLI_SENTINEL) {
        const auto flow_m3s = to_si(cli_flow_rate, flow_unit, QuantityKind::Flow);
        if (!flow_m3s) {
            return report_failure(flow_m3s, out);
        }
        flow = *flow_m3s;
    }

    const auto state = solve_flow_state(*diameter_m, velocity, flow);
    if (!state) {
        return report_failure(state, out);
    }

    if (out.json) {
        print_json(*state);
    } else {
        print_flow_state(*state);
    }
    return 0;
}

struct PressureArgs {
    double flow = 0.0;
    double diameter = 0.0;
    double length = 0.0;
    std::string flow_unit = "m3h";
    std::string diameter_unit = "m";
    std::string length_unit = "m";
    double roughness_mm = CLI_SENTINEL;
    double density = CLI_SENTINEL;
    double viscosity = CLI_SENTINEL;
    std::string correlation;
    std::string config_file;
};

int cmd_pressure(const PressureArgs& args, const OutputOptions& out) {
    FluidSpec fluid;
    PipeSpec pipe;

    // Case file first, then explicit CLI values on top
    if (!args.config_file.empty()) {
        const auto loaded = load_case(args.config_file, false, out);
        if (!loaded) {
            return 2;
        }
        fluid = loaded->fluid;
        pipe = loaded->pipe;
    }

    if (args.density != CLI_SENTINEL) fluid.density_kg_m3 = args.density;
    if (args.viscosity != CLI_SENTINEL) fluid.set_kinematic_viscosity(args.viscosity);
    if (args.roughness_mm != CLI_SENTINEL) {
        const auto roughness_m = to_si(args.roughness_mm, "mm", QuantityKind::Length);
        if (!roughness_m) {
            return report_failure(roughness_m, out);
        }
        pipe.roughness_m = *roughness_m;
    }
    if (!args.correlation.empty()) {
        const auto correlation = parse_friction_correlation(args.correlation);
        if (!correlation) {
            return report_failure(
                Result<Real>::failure(CalcError::InvalidInput,
                                      "Unknown friction correlation: " + args.correlation),
                out);
        }
        pipe.correlation = *correlation;
    }

    const auto flow_m3s = to_si(args.flow, args.flow_unit, QuantityKind::Flow);
    if (!flow_m3s) {
        return report_failure(flow_m3s, out);
    }
    const auto diameter_m = to_si(args.diameter, args.diameter_unit, QuantityKind::Length);
    if (!diameter_m) {
        return report_failure(diameter_m, out);
    }
    const auto length_m = to_si(args.length, args.length_unit, QuantityKind::Length);
    if (!length_m) {
        return report_failure(length_m, out);
    }

    PressureDropStep step;
    step.flow_m3s = *flow_m3s;
    step.diameter_m = *diameter_m;
    step.length_m = *length_m;

    const auto inputs = resolve_pressure_drop(step, fluid, pipe);
    if (!inputs) {
        return report_failure(inputs, out);
    }

    if (out.verbose) {
        std::cerr << "Pressure drop inputs:" << std::endl;
        std::cerr << "  flow: " << format_sci(inputs->flow_m3s) << " m3/s" << std::endl;
        std::cerr << "  diameter: " << inputs->diameter_m << " m" << std::endl;
        std::cerr << "  length: " << inputs->length_m << " m" << std::endl;
        std::cerr << "  roughness: " << inputs->roughness_m << " m" << std::endl;
        std::cerr << "  density: " << inputs->density_kg_m3 << " kg/m3" << std::endl;
        std::cerr << "  kinematic viscosity: " << inputs->kinematic_viscosity_m2s << " m2/s" << std::endl;
        std::cerr << "  correlation: " << to_string(inputs->correlation) << std::endl;
    }

    const auto result = pressure_drop(*inputs);
    if (!result) {
        return report_failure(result, out);
    }

    if (out.json) {
        print_json(*result);
    } else {
        print_pressure_drop(*result, out.verbose);
    }
    return 0;
}

/// "name=percent" pairs from --component
Result<GasComposition> parse_components(const std::vector<std::string>& specs) {
    GasComposition composition;
    for (const auto& spec : specs) {
        const auto eq = spec.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
            return Result<GasComposition>::failure(
                CalcError::InvalidInput, "Component must be given as name=percent: " + spec);
        }
        const std::string name = spec.substr(0, eq);
        const std::string percent_text = spec.substr(eq + 1);

        Real percent = 0.0;
        std::istringstream is(percent_text);
        if (!(is >> percent) || !is.eof()) {
            return Result<GasComposition>::failure(
                CalcError::InvalidInput, "Invalid mole percent for '" + name + "': " + percent_text);
        }
        composition.push_back({name, percent});
    }
    return Result<GasComposition>::success(std::move(composition));
}

int cmd_gas(const std::vector<std::string>& component_specs,
            double pressure, const std::string& pressure_unit, bool absolute,
            double temperature, const std::string& temperature_unit,
            const OutputOptions& out) {
    const auto composition = parse_components(component_specs);
    if (!composition) {
        return report_failure(composition, out);
    }

    const auto pressure_pa = to_si(pressure, pressure_unit, QuantityKind::Pressure);
    if (!pressure_pa) {
        return report_failure(pressure_pa, out);
    }
    const auto temperature_k = to_si(temperature, temperature_unit, QuantityKind::Temperature);
    if (!temperature_k) {
        return report_failure(temperature_k, out);
    }

    const GasConditions conditions = absolute ? GasConditions{*pressure_pa, *temperature_k}
                                              : GasConditions::from_gauge(*pressure_pa, *temperature_k);

    const auto report = gas_report(*composition, conditions);
    if (!report) {
        return report_failure(report, out);
    }

    if (out.json) {
        print_json(*report);
    } else {
        print_gas_report(*report, out.verbose);
    }
    return 0;
}

int cmd_run(const std::string& case_file, bool lenient, const OutputOptions& out) {
    try {
        const auto loaded = load_case(case_file, lenient, out);
        if (!loaded) {
            return 2;
        }

        if (!out.quiet) {
            std::cerr << "Running case: " << (loaded->title.empty() ? case_file : loaded->title)
                      << " (" << loaded->steps.size() << " calculations)" << std::endl;
        }

        const CaseReport report = run_case(*loaded);

        if (out.json) {
            print_json(report);
        } else {
            for (const auto& step : report.steps) {
                std::cout << (step.success() ? "[ok]     " : "[FAILED] ") << step.name
                          << " (" << step.type << "): ";
                if (step.output) {
                    std::cout << step_summary(*step.output) << std::endl;
                } else {
                    std::cout << "Error: " << to_string(*step.error) << ": " << step.message << std::endl;
                }
            }
        }

        if (!report.success) {
            std::cerr << "Error: " << report.failed_count() << " of " << report.steps.size()
                      << " calculations failed" << std::endl;
            return 1;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& case_file, bool lenient, const OutputOptions& out) {
    try {
        const auto loaded = load_case(case_file, lenient, out);
        if (!loaded) {
            return 2;
        }

        if (out.verbose) {
            std::cout << "Case is valid." << std::endl;
            if (!loaded->title.empty()) {
                std::cout << "  Title: " << loaded->title << std::endl;
            }
            std::cout << "  Calculations: " << loaded->steps.size() << std::endl;
            for (const auto& step : loaded->steps) {
                std::cout << "    " << step.name << " (" << step_type_name(step.spec) << ")" << std::endl;
            }
        } else {
            std::cout << "OK" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_units(const std::string& kind_name, const OutputOptions& out) {
    std::vector<QuantityKind> kinds;
    if (kind_name.empty()) {
        kinds.assign(std::begin(kAllQuantityKinds), std::end(kAllQuantityKinds));
    } else if (const auto kind = parse_quantity_kind(kind_name)) {
        kinds.push_back(*kind);
    } else {
        std::cerr << "Error: Unknown quantity kind: " << kind_name << std::endl;
        return 1;
    }

    const UnitRegistry& registry = UnitRegistry::instance();
    if (out.json) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto kind : kinds) {
            nlohmann::json units = nlohmann::json::array();
            for (const UnitRule* rule : registry.rules_of(kind)) {
                units.push_back({{"symbol", std::string(rule->symbol)},
                                 {"description", std::string(rule->description)}});
            }
            j[to_string(kind)] = {{"si", std::string(UnitRegistry::si_symbol(kind))}, {"units", units}};
        }
        print_json(j);
        return 0;
    }

    for (const auto kind : kinds) {
        std::cout << to_string(kind) << " (SI: " << UnitRegistry::si_symbol(kind) << ")" << std::endl;
        for (const UnitRule* rule : registry.rules_of(kind)) {
            std::cout << "  " << std::left << std::setw(8) << rule->symbol << std::right
                      << rule->description << std::endl;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"MeterCalc - Metering engineering calculator"};
    app.set_version_flag("-V,--version", "MeterCalc 0.1.0");

    // Global options
    OutputOptions out;
    app.add_flag("-v,--verbose", out.verbose, "Verbose output");
    app.add_flag("-q,--quiet", out.quiet, "Quiet mode (errors only)");
    app.add_flag("--json", out.json, "Print results as JSON");

    // Convert command
    auto* convert_cmd = app.add_subcommand("convert", "Convert a value between units of one kind");
    double convert_value = 0.0;
    std::string convert_from;
    std::string convert_to;
    std::string convert_kind;
    convert_cmd->add_option("value", convert_value, "Value to convert")->required();
    convert_cmd->add_option("from", convert_from, "Source unit symbol")->required();
    convert_cmd->add_option("to", convert_to, "Target unit symbol")->required();
    convert_cmd->add_option("kind", convert_kind, "flow, pressure, temperature or length")->required();
    convert_cmd->callback([&]() {
        std::exit(cmd_convert(convert_value, convert_from, convert_to, convert_kind, out));
    });

    // Flow command
    auto* flow_cmd = app.add_subcommand("flow", "Solve pipe flow rate or velocity (Q = v * A)");
    double flow_diameter = 0.0;
    std::string flow_diameter_unit = "m";
    double flow_velocity = CLI_SENTINEL;
    double flow_rate = CLI_SENTINEL;
    std::string flow_unit = "m3h";
    flow_cmd->add_option("diameter", flow_diameter, "Pipe internal diameter")->required();
    flow_cmd->add_option("--diameter-unit", flow_diameter_unit, "Diameter unit")->capture_default_str();
    auto* velocity_opt = flow_cmd->add_option("--velocity", flow_velocity, "Mean velocity [m/s]");
    auto* flow_rate_opt = flow_cmd->add_option("--flow-rate", flow_rate, "Volumetric flow rate");
    velocity_opt->excludes(flow_rate_opt);
    flow_cmd->add_option("--flow-unit", flow_unit, "Flow rate unit")->capture_default_str();
    flow_cmd->callback([&]() {
        std::exit(cmd_flow(flow_diameter, flow_diameter_unit, flow_velocity, flow_rate, flow_unit, out));
    });

    // Pressure command
    auto* pressure_cmd = app.add_subcommand("pressure", "Darcy-Weisbach pressure drop");
    PressureArgs pressure_args;
    pressure_cmd->add_option("flow", pressure_args.flow, "Volumetric flow rate")->required();
    pressure_cmd->add_option("diameter", pressure_args.diameter, "Pipe internal diameter")->required();
    pressure_cmd->add_option("length", pressure_args.length, "Pipe length")->required();
    pressure_cmd->add_option("--flow-unit", pressure_args.flow_unit, "Flow rate unit")->capture_default_str();
    pressure_cmd->add_option("--diameter-unit", pressure_args.diameter_unit, "Diameter unit")->capture_default_str();
    pressure_cmd->add_option("--length-unit", pressure_args.length_unit, "Length unit")->capture_default_str();
    pressure_cmd->add_option("--roughness", pressure_args.roughness_mm,
                             "Absolute roughness [mm] (default 0.045, overrides case)");
    pressure_cmd->add_option("--density", pressure_args.density, "Fluid density [kg/m3] (overrides case)");
    pressure_cmd->add_option("--viscosity", pressure_args.viscosity,
                             "Kinematic viscosity [m2/s] (overrides case)");
    pressure_cmd->add_option("--correlation", pressure_args.correlation,
                             "Friction correlation: swamee-jain or haaland (overrides case)");
    pressure_cmd->add_option("--config", pressure_args.config_file, "Case file with fluid/pipe defaults")
        ->check(CLI::ExistingFile);
    pressure_cmd->callback([&]() {
        std::exit(cmd_pressure(pressure_args, out));
    });

    // Gas command
    auto* gas_cmd = app.add_subcommand("gas", "Natural gas property report");
    std::vector<std::string> gas_components;
    double gas_pressure = 0.0;
    std::string gas_pressure_unit = "bar";
    bool gas_absolute = false;
    double gas_temperature = 0.0;
    std::string gas_temperature_unit = "c";
    gas_cmd->add_option("-c,--component", gas_components, "Component as name=percent (repeatable)")
        ->required();
    gas_cmd->add_option("--pressure", gas_pressure, "Line pressure (gauge unless --absolute)")->required();
    gas_cmd->add_option("--pressure-unit", gas_pressure_unit, "Pressure unit")->capture_default_str();
    gas_cmd->add_flag("--absolute", gas_absolute, "Pressure is absolute");
    gas_cmd->add_option("--temperature", gas_temperature, "Line temperature")->required();
    gas_cmd->add_option("--temperature-unit", gas_temperature_unit, "Temperature unit")->capture_default_str();
    gas_cmd->callback([&]() {
        std::exit(cmd_gas(gas_components, gas_pressure, gas_pressure_unit, gas_absolute,
                          gas_temperature, gas_temperature_unit, out));
    });

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Run a calculation case file");
    std::string run_file;
    bool run_lenient = false;
    run_cmd->add_option("case", run_file, "Case file (YAML format)")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_flag("--lenient", run_lenient, "Warn on unknown fields instead of failing");
    run_cmd->callback([&]() {
        std::exit(cmd_run(run_file, run_lenient, out));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate a case file");
    std::string validate_file;
    bool validate_lenient = false;
    validate_cmd->add_option("case", validate_file, "Case file (YAML format)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->add_flag("--lenient", validate_lenient, "Warn on unknown fields instead of failing");
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, validate_lenient, out));
    });

    // Units command
    auto* units_cmd = app.add_subcommand("units", "List supported units");
    std::string units_kind;
    units_cmd->add_option("kind", units_kind, "Only list units of this kind");
    units_cmd->callback([&]() {
        std::exit(cmd_units(units_kind, out));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
