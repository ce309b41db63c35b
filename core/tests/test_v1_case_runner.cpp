#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "metercalc/v1/case_runner.hpp"
#include "metercalc/v1/parser/yaml_parser.hpp"

#include <variant>

using namespace metercalc::v1;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

CaseFile make_water_case() {
    CaseFile case_file;
    case_file.title = "test line";
    case_file.pipe.diameter_m = 0.1;
    case_file.pipe.length_m = 100.0;
    return case_file;
}

}  // namespace

TEST_CASE("v1 case runner executes every step kind", "[v1][case]") {
    CaseFile case_file = make_water_case();
    case_file.steps = {
        {"c", ConvertStep{100.0, "gpm", "lpm", QuantityKind::Flow}},
        {"f", FlowStep{std::nullopt, 2.0, std::nullopt}},
        {"dp", PressureDropStep{50.0 / 3600.0, std::nullopt, std::nullopt, std::nullopt}},
        {"g", GasStep{{{"methane", 100.0}}, GasConditions::from_gauge(10.0e5, 293.15)}},
    };

    const CaseReport report = run_case(case_file);
    CHECK(report.title == "test line");
    CHECK(report.success);
    CHECK(report.failed_count() == 0);
    REQUIRE(report.steps.size() == 4);

    CHECK(report.steps[0].type == "convert");
    const auto* record = std::get_if<ConversionRecord>(&*report.steps[0].output);
    REQUIRE(record != nullptr);
    CHECK_THAT(record->result, WithinAbs(378.5410, 1e-3));

    const auto* flow = std::get_if<FlowState>(&*report.steps[1].output);
    REQUIRE(flow != nullptr);
    CHECK(flow->diameter_m == Approx(0.1));
    CHECK(flow->flow_m3s == Approx(2.0 * constants::pi * 0.0025));

    const auto* dp = std::get_if<PressureDropResult>(&*report.steps[2].output);
    REQUIRE(dp != nullptr);
    CHECK(dp->delta_p_pa > 0.0);
    CHECK(dp->flow_regime == FlowRegime::Turbulent);

    CHECK(report.steps[3].type == "gas");
    CHECK(std::holds_alternative<GasReport>(*report.steps[3].output));
}

TEST_CASE("v1 case runner continues after a failed step", "[v1][case]") {
    CaseFile case_file = make_water_case();
    case_file.steps = {
        {"bad_units", ConvertStep{1.0, "gpm", "psi", QuantityKind::Flow}},
        {"good", FlowStep{std::nullopt, 1.0, std::nullopt}},
        {"bad_flow", FlowStep{std::nullopt, std::nullopt, std::nullopt}},
    };

    const CaseReport report = run_case(case_file);
    CHECK_FALSE(report.success);
    CHECK(report.failed_count() == 2);
    REQUIRE(report.steps.size() == 3);

    CHECK_FALSE(report.steps[0].success());
    CHECK(report.steps[0].error == CalcError::KindMismatch);
    CHECK_FALSE(report.steps[0].message.empty());
    CHECK(report.steps[1].success());
    CHECK(report.steps[2].error == CalcError::InvalidInput);
}

TEST_CASE("v1 pressure-drop steps inherit case defaults", "[v1][case]") {
    CaseFile case_file = make_water_case();
    case_file.fluid.density_kg_m3 = 850.0;
    case_file.pipe.roughness_m = 0.1e-3;
    case_file.pipe.correlation = FrictionCorrelation::Haaland;

    SECTION("values from pipe and fluid sections") {
        const PressureDropStep step{0.01, std::nullopt, std::nullopt, std::nullopt};
        const auto inputs = resolve_pressure_drop(step, case_file.fluid, case_file.pipe);
        REQUIRE(inputs);
        CHECK(inputs->diameter_m == Approx(0.1));
        CHECK(inputs->length_m == Approx(100.0));
        CHECK(inputs->roughness_m == Approx(0.1e-3));
        CHECK(inputs->density_kg_m3 == Approx(850.0));
        CHECK(inputs->correlation == FrictionCorrelation::Haaland);
    }

    SECTION("step values win") {
        const PressureDropStep step{0.01, 0.2, 50.0, 0.0};
        const auto inputs = resolve_pressure_drop(step, case_file.fluid, case_file.pipe);
        REQUIRE(inputs);
        CHECK(inputs->diameter_m == Approx(0.2));
        CHECK(inputs->length_m == Approx(50.0));
        CHECK(inputs->roughness_m == 0.0);
    }

    SECTION("missing diameter") {
        PipeSpec pipe;
        pipe.length_m = 10.0;
        const PressureDropStep step{0.01, std::nullopt, std::nullopt, std::nullopt};
        const auto inputs = resolve_pressure_drop(step, case_file.fluid, pipe);
        REQUIRE_FALSE(inputs);
        CHECK(inputs.error == CalcError::InvalidInput);
    }
}

TEST_CASE("v1 case runner zero diameter fails as invalid input", "[v1][case][validation]") {
    CaseFile case_file = make_water_case();
    case_file.steps = {
        {"dp", PressureDropStep{0.01, 0.0, std::nullopt, std::nullopt}},
    };

    const CaseReport report = run_case(case_file);
    REQUIRE(report.steps.size() == 1);
    CHECK(report.steps[0].error == CalcError::InvalidInput);
}

TEST_CASE("v1 case runner on a parsed case", "[v1][case][yaml]") {
    parser::YamlParser yaml_parser;
    const CaseFile case_file = yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
pipe: {diameter: 4, diameter_unit: in, length: 30}
calculations:
  - {type: convert, value: 150, from: psi, to: bar, kind: pressure}
  - {type: convert, value: 25, from: c, to: f, kind: temperature}
  - {type: dp, flow_rate: 100, flow_unit: gpm}
)");
    REQUIRE(yaml_parser.errors().empty());

    const CaseReport report = run_case(case_file);
    CHECK(report.success);
    REQUIRE(report.steps.size() == 3);
    CHECK_THAT(std::get<ConversionRecord>(*report.steps[0].output).result, WithinAbs(10.3421, 1e-3));
    CHECK_THAT(std::get<ConversionRecord>(*report.steps[1].output).result, WithinAbs(77.0, 1e-9));
    CHECK(std::get<PressureDropResult>(*report.steps[2].output).delta_p_pa > 0.0);
}

TEST_CASE("v1 kinematic viscosity override replaces a case dynamic viscosity", "[v1][case]") {
    parser::YamlParser yaml_parser;
    const CaseFile case_file = yaml_parser.load_string(R"(schema: metercalc-v1
version: 1
fluid: {density: 1000, dynamic_viscosity: 1.0e-3}
pipe: {diameter: 0.1, length: 100}
)");
    REQUIRE(yaml_parser.errors().empty());
    REQUIRE(case_file.fluid.dynamic_viscosity_pa_s.has_value());

    FluidSpec fluid = case_file.fluid;
    fluid.set_kinematic_viscosity(1e-4);
    CHECK(fluid.kinematic_viscosity_m2s == 1e-4);
    CHECK_FALSE(fluid.dynamic_viscosity_pa_s.has_value());

    const PressureDropStep step{50.0 / 3600.0, std::nullopt, std::nullopt, std::nullopt};
    const auto inputs = resolve_pressure_drop(step, fluid, case_file.pipe);
    REQUIRE(inputs);
    const auto r = pressure_drop(*inputs);
    REQUIRE(r);

    CHECK(r->reynolds_number == Approx(r->velocity_mps * 0.1 / 1e-4));
    CHECK(r->reynolds_number == Approx(1768.4).margin(0.1));
    CHECK(r->flow_regime == FlowRegime::Laminar);
}

TEST_CASE("v1 conversion record text echoes the input value", "[v1][case]") {
    CHECK(to_string(ConversionRecord{100.0, "gpm", "lpm", QuantityKind::Flow, 378.541178})
          == "100 gpm = 378.5412 lpm");
    CHECK(to_string(ConversionRecord{1234567.0, "lpm", "m3h", QuantityKind::Flow, 74074.02})
          == "1234567 lpm = 74074.0200 m3h");
    CHECK(to_string(ConversionRecord{0.1, "bar", "kpa", QuantityKind::Pressure, 10.0})
          == "0.1 bar = 10.0000 kpa");
}
