#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "metercalc/v1/parser/yaml_parser.hpp"

#include <algorithm>
#include <string>
#include <variant>

using namespace metercalc::v1;
using Catch::Approx;

namespace {

bool contains_diag(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& msg) {
        return msg.find(needle) != std::string::npos;
    });
}

const std::string kFullCase = R"(schema: metercalc-v1
version: 1
title: Water supply line
fluid:
  density: 998.2
  kinematic_viscosity: 1.004e-6
pipe:
  diameter: 6
  diameter_unit: in
  length: 100
  roughness: 0.045
  correlation: haaland
calculations:
  - type: convert
    name: gpm_to_lpm
    value: 100
    from: gpm
    to: lpm
    kind: flow
  - type: flow
    velocity: 2.5
  - type: pressure
    flow_rate: 50
    flow_unit: m3h
    length: 250
    length_unit: ft
  - type: gas
    pressure: 20
    temperature: 25
    composition:
      methane: 94.5
      ethane: 3.2
)";

}  // namespace

TEST_CASE("v1 YAML parser loads a full case", "[v1][yaml]") {
    parser::YamlParser yaml_parser;
    const CaseFile case_file = yaml_parser.load_string(kFullCase);

    INFO((yaml_parser.errors().empty() ? std::string{} : yaml_parser.errors().front()));
    REQUIRE(yaml_parser.errors().empty());
    CHECK(yaml_parser.warnings().empty());

    CHECK(case_file.title == "Water supply line");
    CHECK(case_file.fluid.density_kg_m3 == Approx(998.2));
    REQUIRE(case_file.pipe.diameter_m.has_value());
    CHECK(*case_file.pipe.diameter_m == Approx(0.1524));
    CHECK(*case_file.pipe.length_m == Approx(100.0));
    CHECK(case_file.pipe.roughness_m == Approx(0.045e-3));
    CHECK(case_file.pipe.correlation == FrictionCorrelation::Haaland);

    REQUIRE(case_file.steps.size() == 4);

    SECTION("convert step") {
        const auto& step = case_file.steps[0];
        CHECK(step.name == "gpm_to_lpm");
        const auto* spec = std::get_if<ConvertStep>(&step.spec);
        REQUIRE(spec != nullptr);
        CHECK(spec->value == Approx(100.0));
        CHECK(spec->from_unit == "gpm");
        CHECK(spec->kind == QuantityKind::Flow);
    }

    SECTION("flow step gets a default name") {
        const auto& step = case_file.steps[1];
        CHECK(step.name == "flow_2");
        const auto* spec = std::get_if<FlowStep>(&step.spec);
        REQUIRE(spec != nullptr);
        CHECK(*spec->velocity_mps == Approx(2.5));
        CHECK_FALSE(spec->diameter_m.has_value());
    }

    SECTION("pressure alias and unit conversion") {
        const auto& step = case_file.steps[2];
        CHECK(step_type_name(step.spec) == std::string("pressure_drop"));
        const auto* spec = std::get_if<PressureDropStep>(&step.spec);
        REQUIRE(spec != nullptr);
        CHECK(spec->flow_m3s == Approx(50.0 / 3600.0));
        CHECK(*spec->length_m == Approx(76.2));
        CHECK_FALSE(spec->diameter_m.has_value());
    }

    SECTION("gas step defaults to bar gauge and Celsius") {
        const auto* spec = std::get_if<GasStep>(&case_file.steps[3].spec);
        REQUIRE(spec != nullptr);
        CHECK(spec->conditions.pressure_pa == Approx(20.0e5 + 101325.0));
        CHECK(spec->conditions.temperature_k == Approx(298.15));
        REQUIRE(spec->composition.size() == 2);
        CHECK(spec->composition[0].name == "methane");
    }
}

TEST_CASE("v1 YAML parser schema checks", "[v1][yaml][validation]") {
    parser::YamlParser yaml_parser;

    SECTION("missing schema") {
        (void)yaml_parser.load_string("version: 1\n");
        CHECK(contains_diag(yaml_parser.errors(), "Missing required field 'schema'"));
    }

    SECTION("wrong schema") {
        (void)yaml_parser.load_string("schema: flowcalc-v2\nversion: 1\n");
        CHECK(contains_diag(yaml_parser.errors(), "Unsupported schema: flowcalc-v2"));
    }

    SECTION("wrong version") {
        (void)yaml_parser.load_string("schema: metercalc-v1\nversion: 3\n");
        CHECK(contains_diag(yaml_parser.errors(), "Unsupported schema version"));
    }

    SECTION("malformed YAML") {
        (void)yaml_parser.load_string("schema: [metercalc-v1\n");
        CHECK(contains_diag(yaml_parser.errors(), "YAML parse error"));
    }

    SECTION("missing file") {
        (void)yaml_parser.load("/nonexistent/case.yaml");
        CHECK(contains_diag(yaml_parser.errors(), "Cannot open file"));
    }

    SECTION("no calculations is only a warning") {
        (void)yaml_parser.load_string("schema: metercalc-v1\nversion: 1\n");
        CHECK(yaml_parser.errors().empty());
        CHECK(contains_diag(yaml_parser.warnings(), "METERCALC_YAML_W_NO_CALCULATIONS"));
    }
}

TEST_CASE("v1 YAML parser coded diagnostics", "[v1][yaml][validation]") {
    parser::YamlParser yaml_parser;

    SECTION("unknown field in strict mode") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
pipe:
  diameter: 0.1
  colour: blue
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_UNKNOWN_FIELD"));
        CHECK(contains_diag(yaml_parser.errors(), "pipe.colour"));
    }

    SECTION("type mismatch") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
fluid:
  density: [1, 2]
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_TYPE_MISMATCH"));
        CHECK(contains_diag(yaml_parser.errors(), "fluid.density"));
    }

    SECTION("unsupported calculation type") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
calculations:
  - type: orifice_sizing
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_STEP_UNSUPPORTED"));
    }

    SECTION("unknown unit") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
calculations:
  - type: pressure_drop
    flow_rate: 10
    flow_unit: furlongs_per_fortnight
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_UNIT_UNKNOWN"));
    }

    SECTION("unit of the wrong kind in a convert step") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
calculations:
  - type: convert
    value: 1
    from: psi
    to: bar
    kind: flow
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_UNIT_UNKNOWN"));
        CHECK(contains_diag(yaml_parser.errors(), "calculations[0].from"));
    }

    SECTION("missing required field") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
calculations:
  - type: gas
    pressure: 10
    composition: {methane: 100}
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_FIELD_MISSING"));
        CHECK(contains_diag(yaml_parser.errors(), "calculations[0].temperature"));
    }

    SECTION("invalid correlation") {
        (void)yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
pipe:
  correlation: colebrook
)");
        CHECK(contains_diag(yaml_parser.errors(), "METERCALC_YAML_E_PARAM_INVALID"));
    }
}

TEST_CASE("v1 YAML parser lenient mode downgrades unknown fields", "[v1][yaml]") {
    parser::YamlParser yaml_parser(parser::YamlParserOptions{.strict = false});
    const CaseFile case_file = yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
notes: field survey
calculations:
  - type: flow
    diameter: 100
    diameter_unit: mm
    flow_rate: 36
    comment: meter run A
)");

    CHECK(yaml_parser.errors().empty());
    CHECK(contains_diag(yaml_parser.warnings(), "METERCALC_YAML_W_FIELD_IGNORED"));
    CHECK(contains_diag(yaml_parser.warnings(), "root.notes"));
    REQUIRE(case_file.steps.size() == 1);

    const auto* spec = std::get_if<FlowStep>(&case_file.steps[0].spec);
    REQUIRE(spec != nullptr);
    CHECK(*spec->diameter_m == Approx(0.1));
    CHECK(*spec->flow_m3s == Approx(0.01));
}
