#include "metercalc/v1/parser/yaml_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace metercalc::v1::parser {

namespace {

constexpr const char* kSchemaId = "metercalc-v1";
constexpr const char* kDiagUnsupportedStep = "METERCALC_YAML_E_STEP_UNSUPPORTED";
constexpr const char* kDiagInvalidParameter = "METERCALC_YAML_E_PARAM_INVALID";
constexpr const char* kDiagUnknownUnit = "METERCALC_YAML_E_UNIT_UNKNOWN";
constexpr const char* kDiagMissingField = "METERCALC_YAML_E_FIELD_MISSING";
constexpr const char* kDiagUnknownField = "METERCALC_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "METERCALC_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagIgnoredField = "METERCALC_YAML_W_FIELD_IGNORED";
constexpr const char* kDiagNoCalculations = "METERCALC_YAML_W_NO_CALCULATIONS";

// Units assumed when a value has no companion *_unit key
constexpr std::string_view kDefaultLengthUnit = "m";
constexpr std::string_view kDefaultRoughnessUnit = "mm";
constexpr std::string_view kDefaultFlowUnit = "m3h";
constexpr std::string_view kDefaultPressureUnit = "bar";
constexpr std::string_view kDefaultTemperatureUnit = "c";

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

bool is_known_key(const std::string& key, const std::unordered_set<std::string>& allowed) {
    return allowed.find(key) != allowed.end();
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

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

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

void push_missing_field_error(std::vector<std::string>& errors, const std::string& path) {
    push_error(errors, kDiagMissingField, "Missing required field '" + path + "'");
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node,
                                      const std::string& path,
                                      std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
}

std::optional<Real> parse_real(const YAML::Node& node,
                               const std::string& path,
                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
    try {
        return node.as<Real>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
}

std::optional<std::string> require_string(const YAML::Node& map,
                                          const char* key,
                                          const std::string& context,
                                          std::vector<std::string>& errors) {
    const std::string path = context + "." + key;
    if (!map[key]) {
        push_missing_field_error(errors, path);
        return std::nullopt;
    }
    return parse_string_scalar(map[key], path, errors);
}

/// Read `value_key` expressed in `unit_key` (or the default unit) and return it in SI
std::optional<Real> parse_quantity(const YAML::Node& map,
                                   const char* value_key,
                                   const char* unit_key,
                                   std::string_view default_unit,
                                   QuantityKind kind,
                                   const std::string& context,
                                   std::vector<std::string>& errors) {
    const auto raw = parse_real(map[value_key], context + "." + value_key, errors);
    if (!raw) {
        return std::nullopt;
    }

    std::string unit(default_unit);
    if (map[unit_key]) {
        const auto parsed_unit = parse_string_scalar(map[unit_key], context + "." + unit_key, errors);
        if (!parsed_unit) {
            return std::nullopt;
        }
        unit = *parsed_unit;
    }

    const auto si = to_si(*raw, unit, kind);
    if (!si) {
        push_error(errors, kDiagUnknownUnit,
                   "Unknown " + std::string(to_string(kind)) + " unit '" + unit + "' at '" +
                       context + "." + unit_key + "'");
        return std::nullopt;
    }
    return *si;
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   std::vector<std::string>& warnings,
                   bool strict) {
    if (!node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (is_known_key(key, allowed)) {
            continue;
        }
        if (strict) {
            push_error(errors, kDiagUnknownField, "Unknown field at '" + context + "." + key + "'");
        } else {
            push_warning(warnings, kDiagIgnoredField, "Ignoring unknown field '" + context + "." + key + "'");
        }
    }
}

const std::unordered_map<std::string, std::string>& step_alias_map() {
    static const std::unordered_map<std::string, std::string> aliases = [] {
        std::unordered_map<std::string, std::string> map;

        auto add_aliases = [&](const std::string& canonical, std::initializer_list<const char*> names) {
            map.emplace(normalize_key(canonical), canonical);
            for (const char* name : names) {
                map.emplace(normalize_key(name), canonical);
            }
        };

        add_aliases("convert", {"conversion", "unit_conversion"});
        add_aliases("flow", {"flow_rate", "velocity", "continuity"});
        add_aliases("pressure_drop", {"pressure", "dp", "darcy_weisbach"});
        add_aliases("gas", {"gas_report", "gas_properties", "aga8"});

        return map;
    }();
    return aliases;
}

std::string canonical_step_type(const std::string& raw_type) {
    const auto& aliases = step_alias_map();
    const auto it = aliases.find(normalize_key(raw_type));
    return it == aliases.end() ? std::string{} : it->second;
}

void parse_fluid(const YAML::Node& node, FluidSpec& fluid,
                 std::vector<std::string>& errors, std::vector<std::string>& warnings, bool strict) {
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, "fluid", "map", node);
        return;
    }
    validate_keys(node, {"density", "kinematic_viscosity", "dynamic_viscosity"},
                  "fluid", errors, warnings, strict);

    if (const auto rho = parse_real(node["density"], "fluid.density", errors)) {
        fluid.density_kg_m3 = *rho;
    }
    if (const auto nu = parse_real(node["kinematic_viscosity"], "fluid.kinematic_viscosity", errors)) {
        fluid.kinematic_viscosity_m2s = *nu;
    }
    if (const auto mu = parse_real(node["dynamic_viscosity"], "fluid.dynamic_viscosity", errors)) {
        fluid.dynamic_viscosity_pa_s = *mu;
    }
}

void parse_pipe(const YAML::Node& node, PipeSpec& pipe,
                std::vector<std::string>& errors, std::vector<std::string>& warnings, bool strict) {
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, "pipe", "map", node);
        return;
    }
    validate_keys(node, {"diameter", "diameter_unit", "length", "length_unit",
                         "roughness", "roughness_unit", "correlation"},
                  "pipe", errors, warnings, strict);

    pipe.diameter_m = parse_quantity(node, "diameter", "diameter_unit", kDefaultLengthUnit,
                                     QuantityKind::Length, "pipe", errors);
    pipe.length_m = parse_quantity(node, "length", "length_unit", kDefaultLengthUnit,
                                   QuantityKind::Length, "pipe", errors);
    if (const auto roughness = parse_quantity(node, "roughness", "roughness_unit", kDefaultRoughnessUnit,
                                              QuantityKind::Length, "pipe", errors)) {
        pipe.roughness_m = *roughness;
    }
    if (const auto raw = parse_string_scalar(node["correlation"], "pipe.correlation", errors)) {
        if (const auto correlation = parse_friction_correlation(*raw)) {
            pipe.correlation = *correlation;
        } else {
            push_error(errors, kDiagInvalidParameter,
                       "Invalid pipe.correlation: " + *raw + " (expected 'swamee_jain' or 'haaland')");
        }
    }
}

std::optional<ConvertStep> parse_convert_step(const YAML::Node& node, const std::string& context,
                                              std::vector<std::string>& errors) {
    const auto value = parse_real(node["value"], context + ".value", errors);
    if (!node["value"]) push_missing_field_error(errors, context + ".value");
    const auto from = require_string(node, "from", context, errors);
    const auto to = require_string(node, "to", context, errors);
    const auto kind_raw = require_string(node, "kind", context, errors);
    if (!value || !from || !to || !kind_raw) {
        return std::nullopt;
    }

    const auto kind = parse_quantity_kind(*kind_raw);
    if (!kind) {
        push_error(errors, kDiagInvalidParameter,
                   "Invalid " + context + ".kind: " + *kind_raw +
                       " (expected flow, pressure, temperature or length)");
        return std::nullopt;
    }

    auto check_unit = [&](const std::string& symbol, const char* key) {
        if (UnitRegistry::instance().find(*kind, symbol)) {
            return true;
        }
        push_error(errors, kDiagUnknownUnit,
                   "Unknown " + std::string(to_string(*kind)) + " unit '" + symbol + "' at '" +
                       context + "." + key + "'");
        return false;
    };
    const bool from_ok = check_unit(*from, "from");
    const bool to_ok = check_unit(*to, "to");
    if (!from_ok || !to_ok) {
        return std::nullopt;
    }
    return ConvertStep{*value, *from, *to, *kind};
}

std::optional<FlowStep> parse_flow_step(const YAML::Node& node, const std::string& context,
                                        std::vector<std::string>& errors) {
    const std::size_t error_count = errors.size();
    FlowStep step;
    step.diameter_m = parse_quantity(node, "diameter", "diameter_unit", kDefaultLengthUnit,
                                     QuantityKind::Length, context, errors);
    step.velocity_mps = parse_real(node["velocity"], context + ".velocity", errors);
    step.flow_m3s = parse_quantity(node, "flow_rate", "flow_unit", kDefaultFlowUnit,
                                   QuantityKind::Flow, context, errors);
    if (!node["velocity"] && !node["flow_rate"]) {
        push_missing_field_error(errors, context + ".velocity|flow_rate");
    }
    if (errors.size() != error_count) {
        return std::nullopt;
    }
    return step;
}

std::optional<PressureDropStep> parse_pressure_drop_step(const YAML::Node& node, const std::string& context,
                                                         std::vector<std::string>& errors) {
    const std::size_t error_count = errors.size();
    PressureDropStep step;
    const auto flow = parse_quantity(node, "flow_rate", "flow_unit", kDefaultFlowUnit,
                                     QuantityKind::Flow, context, errors);
    if (!node["flow_rate"]) push_missing_field_error(errors, context + ".flow_rate");
    step.diameter_m = parse_quantity(node, "diameter", "diameter_unit", kDefaultLengthUnit,
                                     QuantityKind::Length, context, errors);
    step.length_m = parse_quantity(node, "length", "length_unit", kDefaultLengthUnit,
                                   QuantityKind::Length, context, errors);
    step.roughness_m = parse_quantity(node, "roughness", "roughness_unit", kDefaultRoughnessUnit,
                                      QuantityKind::Length, context, errors);
    if (!flow || errors.size() != error_count) {
        return std::nullopt;
    }
    step.flow_m3s = *flow;
    return step;
}

std::optional<GasStep> parse_gas_step(const YAML::Node& node, const std::string& context,
                                      std::vector<std::string>& errors) {
    const std::size_t error_count = errors.size();

    const auto pressure = parse_quantity(node, "pressure", "pressure_unit", kDefaultPressureUnit,
                                         QuantityKind::Pressure, context, errors);
    if (!node["pressure"]) push_missing_field_error(errors, context + ".pressure");
    const auto temperature = parse_quantity(node, "temperature", "temperature_unit", kDefaultTemperatureUnit,
                                            QuantityKind::Temperature, context, errors);
    if (!node["temperature"]) push_missing_field_error(errors, context + ".temperature");
    const bool gauge = parse_bool_scalar(node["gauge"], context + ".gauge", errors).value_or(true);

    GasStep step;
    const YAML::Node composition = node["composition"];
    if (!composition) {
        push_missing_field_error(errors, context + ".composition");
    } else if (!composition.IsMap()) {
        push_type_mismatch_error(errors, context + ".composition", "map", composition);
    } else {
        for (const auto& it : composition) {
            const std::string component = it.first.as<std::string>();
            const std::string path = context + ".composition." + component;
            if (!find_gas_component(component)) {
                push_error(errors, kDiagInvalidParameter, "Unknown gas component at '" + path + "'");
                continue;
            }
            if (const auto percent = parse_real(it.second, path, errors)) {
                step.composition.push_back({component, *percent});
            }
        }
    }

    if (!pressure || !temperature || errors.size() != error_count) {
        return std::nullopt;
    }
    step.conditions = gauge ? GasConditions::from_gauge(*pressure, *temperature)
                            : GasConditions{*pressure, *temperature};
    return step;
}

const std::unordered_map<std::string, std::unordered_set<std::string>>& step_allowed_keys() {
    static const std::unordered_map<std::string, std::unordered_set<std::string>> keys = {
        {"convert", {"type", "name", "value", "from", "to", "kind"}},
        {"flow", {"type", "name", "diameter", "diameter_unit", "velocity", "flow_rate", "flow_unit"}},
        {"pressure_drop", {"type", "name", "flow_rate", "flow_unit", "diameter", "diameter_unit",
                           "length", "length_unit", "roughness", "roughness_unit"}},
        {"gas", {"type", "name", "pressure", "pressure_unit", "gauge", "temperature",
                 "temperature_unit", "composition"}},
    };
    return keys;
}

}  // namespace

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

CaseFile YamlParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        return CaseFile();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

CaseFile YamlParser::load_string(const std::string& content) {
    CaseFile case_file;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, case_file);
    return case_file;
}

void YamlParser::parse_yaml(const std::string& content, CaseFile& case_file) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "title", "fluid", "pipe", "calculations"},
                  "root", errors_, warnings_, options_.strict);

    if (!root["schema"]) {
        errors_.push_back("Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        errors_.push_back("Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        errors_.push_back("Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        errors_.push_back("Unsupported schema version: " + std::to_string(*version));
        return;
    }

    if (const auto title = parse_string_scalar(root["title"], "root.title", errors_)) {
        case_file.title = *title;
    }

    if (root["fluid"]) {
        parse_fluid(root["fluid"], case_file.fluid, errors_, warnings_, options_.strict);
    }
    if (root["pipe"]) {
        parse_pipe(root["pipe"], case_file.pipe, errors_, warnings_, options_.strict);
    }

    const YAML::Node calculations = root["calculations"];
    if (!calculations || (calculations.IsSequence() && calculations.size() == 0)) {
        push_warning(warnings_, kDiagNoCalculations, "Case defines no calculations");
        return;
    }
    if (!calculations.IsSequence()) {
        push_type_mismatch_error(errors_, "calculations", "sequence", calculations);
        return;
    }

    for (std::size_t i = 0; i < calculations.size(); ++i) {
        const YAML::Node node = calculations[i];
        const std::string context = "calculations[" + std::to_string(i) + "]";
        if (!node.IsMap()) {
            push_type_mismatch_error(errors_, context, "map", node);
            continue;
        }

        const auto raw_type = require_string(node, "type", context, errors_);
        if (!raw_type) {
            continue;
        }
        const std::string type = canonical_step_type(*raw_type);
        if (type.empty()) {
            push_error(errors_, kDiagUnsupportedStep,
                       "Unsupported calculation type '" + *raw_type + "' at '" + context + ".type'");
            continue;
        }

        validate_keys(node, step_allowed_keys().at(type), context, errors_, warnings_, options_.strict);

        CalculationStep step;
        step.name = type + "_" + std::to_string(i + 1);
        if (const auto name = parse_string_scalar(node["name"], context + ".name", errors_)) {
            step.name = *name;
        }

        if (type == "convert") {
            if (auto spec = parse_convert_step(node, context, errors_)) step.spec = std::move(*spec);
            else continue;
        } else if (type == "flow") {
            if (auto spec = parse_flow_step(node, context, errors_)) step.spec = std::move(*spec);
            else continue;
        } else if (type == "pressure_drop") {
            if (auto spec = parse_pressure_drop_step(node, context, errors_)) step.spec = std::move(*spec);
            else continue;
        } else {
            if (auto spec = parse_gas_step(node, context, errors_)) step.spec = std::move(*spec);
            else continue;
        }
        case_file.steps.push_back(std::move(step));
    }
}

}  // namespace metercalc::v1::parser
