#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "metercalc/v1/json_report.hpp"

using namespace metercalc::v1;
using Catch::Approx;

TEST_CASE("v1 JSON conversion record", "[v1][json]") {
    const nlohmann::json j = ConversionRecord{100.0, "gpm", "lpm", QuantityKind::Flow, 378.541};
    CHECK(j.at("kind") == "flow");
    CHECK(j.at("from") == "gpm");
    CHECK(j.at("to") == "lpm");
    CHECK(j.at("result").get<double>() == Approx(378.541));
}

TEST_CASE("v1 JSON flow state lists field units", "[v1][json]") {
    const auto state = solve_flow_state(0.1, std::nullopt, 0.01);
    REQUIRE(state);

    const nlohmann::json j = *state;
    CHECK(j.at("flow_m3s").get<double>() == Approx(0.01));
    CHECK(j.at("flow_m3h").get<double>() == Approx(36.0));
    CHECK(j.at("flow_gpm").get<double>() == Approx(158.503).margin(1e-3));
    CHECK(j.contains("velocity_mps"));
    CHECK(j.contains("area_m2"));
}

TEST_CASE("v1 JSON pressure drop lists bar and psi", "[v1][json]") {
    PressureDropResult result;
    result.delta_p_pa = 1.0e5;
    result.reynolds_number = 1000.0;
    result.friction_factor = 0.064;

    const nlohmann::json j = result;
    CHECK(j.at("delta_p_bar").get<double>() == Approx(1.0));
    CHECK(j.at("delta_p_psi").get<double>() == Approx(14.5038).margin(1e-4));
    CHECK(j.at("flow_regime") == "laminar");
}

TEST_CASE("v1 JSON gas report", "[v1][json]") {
    const auto report = gas_report({{"methane", 90.0}, {"ethane", 10.0}},
                                   GasConditions::from_gauge(5.0e5, 288.15));
    REQUIRE(report);

    const nlohmann::json j = *report;
    CHECK(j.at("composition_mole_percent").at("methane").get<double>() == Approx(90.0));
    CHECK(j.at("conditions").at("temperature_c").get<double>() == Approx(15.0));
    CHECK(j.at("conditions").at("pressure_bara").get<double>() == Approx(6.01325));
    CHECK(j.at("pseudo_critical").contains("tc_k"));
    CHECK(j.at("specific_gravity").get<double>() == Approx(report->specific_gravity));
}

TEST_CASE("v1 JSON case report", "[v1][json]") {
    CaseReport report;
    report.title = "demo";

    StepResult ok;
    ok.name = "c1";
    ok.type = "convert";
    ok.output = StepOutput{ConversionRecord{1.0, "bar", "kpa", QuantityKind::Pressure, 100.0}};

    StepResult failed;
    failed.name = "f1";
    failed.type = "flow";
    failed.error = CalcError::InvalidInput;
    failed.message = "Pipe diameter must be positive";

    report.steps = {ok, failed};
    report.success = false;

    const nlohmann::json j = report;
    CHECK(j.at("title") == "demo");
    CHECK(j.at("success") == false);
    CHECK(j.at("failed") == 1);
    REQUIRE(j.at("steps").size() == 2);
    CHECK(j.at("steps")[0].at("result").at("result").get<double>() == Approx(100.0));
    CHECK(j.at("steps")[1].at("error") == "InvalidInput");
    CHECK_FALSE(j.at("steps")[1].contains("result"));
}

TEST_CASE("v1 JSON failed result", "[v1][json]") {
    const auto converted = convert(1.0, "gpm", "bar", QuantityKind::Flow);
    const nlohmann::json j = result_json(converted);
    CHECK(j.at("error") == "KindMismatch");
    CHECK_FALSE(j.at("message").get<std::string>().empty());
}
