#pragma once

// =============================================================================
// MeterCalc - Natural Gas Properties
// =============================================================================
// Mixture properties of a natural gas from its molar composition:
// - Molecular weight and specific gravity (air = 28.964 kg/kmol)
// - Pseudo-critical constants by Kay's rule
// - Compressibility factor Z from the Peng-Robinson cubic
//     Z^3 - (1 - B) Z^2 + (A - 3B^2 - 2B) Z - (AB - B^2 - B^3) = 0
//     A = a P / (R T)^2,  B = b P / (R T)
// - Density rho = P M / (Z R T) at line and standard conditions
// - Heating values, Wobbe index = HHV / sqrt(SG)
//
// This is a cubic-EOS estimate, not a certified AGA8 Detail calculation.
// =============================================================================

#include "metercalc/v1/numeric_types.hpp"
#include "metercalc/v1/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metercalc::v1 {

/// Pure-component data
struct GasComponent {
    std::string_view name;
    Real molar_mass;                   ///< kg/kmol
    std::optional<Real> tc_k;          ///< Critical temperature
    std::optional<Real> pc_pa;         ///< Critical pressure
    std::optional<Real> rhoc_kg_m3;    ///< Critical density
    std::optional<Real> omega;         ///< Acentric factor
    Real hhv_mj_m3 = 0.0;              ///< Higher heating value at standard conditions
    Real lhv_mj_m3 = 0.0;              ///< Lower heating value at standard conditions
    [[nodiscard]] bool has_critical_data() const { return tc_k && pc_pa && rhoc_kg_m3 && omega; }
};

/// Component lookup by canonical name or alias ("co2", "n2", "c1", ...)
[[nodiscard]] const GasComponent* find_gas_component(std::string_view name);

/// All known components in table order
[[nodiscard]] const std::vector<GasComponent>& gas_components();

struct ComponentFraction {
    std::string name;
    Real mole_percent = 0.0;
};

using GasComposition = std::vector<ComponentFraction>;

/// Absolute state of the gas
struct GasConditions {
    Real pressure_pa = constants::standard_atmosphere_pa;
    Real temperature_k = 288.15;

    static GasConditions from_gauge(Real gauge_pressure_pa, Real temperature_k) {
        return {gauge_pressure_pa + constants::standard_atmosphere_pa, temperature_k};
    }

    /// 15 C, 1.01325 bara
    static GasConditions standard() { return {}; }
};

struct PseudoCritical {
    Real tc_k = 0.0;
    Real pc_pa = 0.0;
    Real rhoc_kg_m3 = 0.0;
    Real omega = 0.0;
};

struct GasReport {
    GasConditions conditions;
    GasComposition composition;        ///< Normalized to 100 mol%, canonical names

    Real molecular_weight = 0.0;       ///< kg/kmol
    Real specific_gravity = 0.0;
    Real compressibility = 1.0;
    Real density_kg_m3 = 0.0;
    Real compressibility_std = 1.0;
    Real density_std_kg_m3 = 0.0;

    Real hhv_mj_m3 = 0.0;
    Real lhv_mj_m3 = 0.0;
    Real wobbe_index_mj_m3 = 0.0;

    PseudoCritical critical;
    Real reduced_temperature = 0.0;
    Real reduced_pressure = 0.0;
    Real volume_factor = 1.0;          ///< 1 / Z
};

/// Normalize to 100 mol% with canonical component names
[[nodiscard]] Result<GasComposition> normalize_composition(const GasComposition& composition);

/// Mixture molecular weight of a normalized composition
[[nodiscard]] Real molecular_weight(const GasComposition& normalized);

/// Kay's rule over components carrying critical data, renormalized over them
[[nodiscard]] Result<PseudoCritical> pseudo_critical(const GasComposition& normalized);

/// Peng-Robinson vapor-root compressibility factor
[[nodiscard]] Real compressibility_factor(const PseudoCritical& critical, const GasConditions& conditions);

/// Full property report
[[nodiscard]] Result<GasReport> gas_report(const GasComposition& composition,
                                           const GasConditions& conditions);

}  // namespace metercalc::v1
