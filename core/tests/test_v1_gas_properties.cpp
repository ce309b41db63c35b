#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "metercalc/v1/gas_properties.hpp"

#include <cmath>

using namespace metercalc::v1;
using Catch::Approx;
using Catch::Matchers::WithinRel;

namespace {

GasComposition pipeline_gas() {
    return {
        {"methane", 94.5},
        {"ethane", 3.2},
        {"propane", 0.6},
        {"n2", 1.0},
        {"co2", 0.7},
    };
}

GasConditions line_conditions() {
    // 20 barg, 25 C
    return GasConditions::from_gauge(20.0e5, 298.15);
}

}  // namespace

TEST_CASE("v1 gas component lookup", "[v1][gas]") {
    const GasComponent* c1 = find_gas_component("C1");
    REQUIRE(c1 != nullptr);
    CHECK(c1->name == "methane");
    CHECK(c1->has_critical_data());

    const GasComponent* co2 = find_gas_component("carbon dioxide");
    REQUIRE(co2 != nullptr);
    CHECK(co2->name == "carbon_dioxide");

    const GasComponent* he = find_gas_component("He");
    REQUIRE(he != nullptr);
    CHECK_FALSE(he->has_critical_data());

    CHECK(find_gas_component("unobtainium") == nullptr);
}

TEST_CASE("v1 gas composition normalization", "[v1][gas]") {
    SECTION("scales to 100 mol%") {
        const auto r = normalize_composition({{"methane", 45.0}, {"ethane", 5.0}});
        REQUIRE(r);
        REQUIRE(r->size() == 2);
        CHECK((*r)[0].mole_percent == Approx(90.0));
        CHECK((*r)[1].mole_percent == Approx(10.0));
    }

    SECTION("merges aliases under the canonical name") {
        const auto r = normalize_composition({{"c1", 50.0}, {"CH4", 30.0}, {"methane", 20.0}});
        REQUIRE(r);
        REQUIRE(r->size() == 1);
        CHECK((*r)[0].name == "methane");
        CHECK((*r)[0].mole_percent == Approx(100.0));
    }

    SECTION("rejects empty, unknown and negative entries") {
        CHECK(normalize_composition({}).error == CalcError::InvalidInput);
        CHECK_FALSE(normalize_composition({{"kryptonite", 10.0}}));
        CHECK_FALSE(normalize_composition({{"methane", -1.0}}));
        CHECK_FALSE(normalize_composition({{"methane", 0.0}}));
    }
}

TEST_CASE("v1 gas report for pipeline gas", "[v1][gas]") {
    const auto r = gas_report(pipeline_gas(), line_conditions());
    REQUIRE(r);

    CHECK(r->molecular_weight == Approx(16.98).margin(0.05));
    CHECK(r->specific_gravity > 0.58);
    CHECK(r->specific_gravity < 0.62);

    CHECK(r->compressibility < 1.0);
    CHECK(r->compressibility > 0.9);
    CHECK(r->compressibility_std > 0.99);
    CHECK(r->compressibility_std < 1.0);
    CHECK(r->volume_factor == Approx(1.0 / r->compressibility));

    const Real rho = r->conditions.pressure_pa * r->molecular_weight /
                     (r->compressibility * constants::gas_constant * r->conditions.temperature_k);
    CHECK_THAT(r->density_kg_m3, WithinRel(rho, 1e-12));
    CHECK(r->density_std_kg_m3 == Approx(0.72).margin(0.02));

    CHECK(r->hhv_mj_m3 > 38.0);
    CHECK(r->hhv_mj_m3 < 42.0);
    CHECK(r->lhv_mj_m3 < r->hhv_mj_m3);
    CHECK(r->wobbe_index_mj_m3 == Approx(r->hhv_mj_m3 / std::sqrt(r->specific_gravity)));

    CHECK(r->reduced_temperature == Approx(298.15 / r->critical.tc_k));
    CHECK(r->reduced_pressure == Approx(r->conditions.pressure_pa / r->critical.pc_pa));
}

TEST_CASE("v1 gas report gauge and absolute pressure", "[v1][gas]") {
    const auto gauge = GasConditions::from_gauge(0.0, 288.15);
    CHECK(gauge.pressure_pa == Approx(constants::standard_atmosphere_pa));

    const auto standard = GasConditions::standard();
    CHECK(standard.pressure_pa == Approx(101325.0));
    CHECK(standard.temperature_k == Approx(288.15));
}

TEST_CASE("v1 gas compressibility approaches ideal gas at low pressure", "[v1][gas]") {
    const auto normalized = normalize_composition({{"methane", 100.0}});
    REQUIRE(normalized);
    const auto critical = pseudo_critical(*normalized);
    REQUIRE(critical);

    const Real z_low = compressibility_factor(*critical, {1000.0, 300.0});
    const Real z_high = compressibility_factor(*critical, {50.0e5, 300.0});
    CHECK(z_low == Approx(1.0).margin(1e-3));
    CHECK(z_high < z_low);
}

TEST_CASE("v1 pseudo-critical uses components with critical data only", "[v1][gas]") {
    const auto normalized = normalize_composition({{"methane", 90.0}, {"helium", 10.0}});
    REQUIRE(normalized);

    const auto critical = pseudo_critical(*normalized);
    REQUIRE(critical);
    CHECK(critical->tc_k == Approx(190.564));
    CHECK(critical->pc_pa == Approx(4.5992e6));
}

TEST_CASE("v1 gas report input validation", "[v1][gas][validation]") {
    SECTION("no component with critical data") {
        const auto r = gas_report({{"helium", 100.0}}, line_conditions());
        REQUIRE_FALSE(r);
        CHECK(r.error == CalcError::InvalidInput);
    }

    SECTION("non-positive absolute pressure") {
        const auto r = gas_report(pipeline_gas(), GasConditions{0.0, 298.15});
        REQUIRE_FALSE(r);
        CHECK(r.error == CalcError::InvalidInput);
    }

    SECTION("absolute zero") {
        const auto r = gas_report(pipeline_gas(), GasConditions{1.0e5, 0.0});
        REQUIRE_FALSE(r);
        CHECK(r.error == CalcError::InvalidInput);
    }

    SECTION("unknown component") {
        const auto r = gas_report({{"methane", 90.0}, {"xenon", 10.0}}, line_conditions());
        REQUIRE_FALSE(r);
        CHECK(r.message.find("xenon") != std::string::npos);
    }
}
