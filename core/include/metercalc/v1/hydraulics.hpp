#pragma once

// =============================================================================
// MeterCalc - Hydraulic Calculation Engine
// =============================================================================
// Incompressible pipe flow in SI units:
// - Continuity: Q = V * A, A = pi * D^2 / 4               [m^3/s, m/s, m^2]
// - Reynolds number: Re = rho * V * D / mu
// - Darcy-Weisbach: dP = f * (L / D) * (rho * V^2 / 2)    [Pa]
//
// Friction factor:
// - Laminar (Re < 2300): f = 64 / Re
// - Transitional/turbulent: explicit Colebrook approximations
//     Swamee-Jain: f = 0.25 / [log10(e/(3.7 D) + 5.74 / Re^0.9)]^2
//     Haaland:     1/sqrt(f) = -1.8 log10[((e/D)/3.7)^1.11 + 6.9 / Re]
//
// Callers convert to SI at the boundary (see units.hpp).
// =============================================================================

#include "metercalc/v1/numeric_types.hpp"
#include "metercalc/v1/result.hpp"

#include <optional>
#include <string>

namespace metercalc::v1 {

// =============================================================================
// Geometry and continuity
// =============================================================================

struct PipeGeometry {
    Real diameter_m = 0.0;

    /// Cross-sectional area [m^2]
    [[nodiscard]] Real area() const {
        return constants::pi * diameter_m * diameter_m / 4.0;
    }
};

/// Flow rate / velocity pair satisfying Q = V * A
struct FlowState {
    Real flow_m3s = 0.0;
    Real velocity_mps = 0.0;
    Real diameter_m = 0.0;
    Real area_m2 = 0.0;
};

/// Derive the missing member of {velocity, flow}. Exactly one must be given.
[[nodiscard]] Result<FlowState> solve_flow_state(Real diameter_m,
                                                 std::optional<Real> velocity_mps,
                                                 std::optional<Real> flow_m3s);

// =============================================================================
// Flow regime and friction factor
// =============================================================================

enum class FlowRegime {
    Laminar,
    Transitional,
    Turbulent
};

[[nodiscard]] inline constexpr const char* to_string(FlowRegime regime) noexcept {
    switch (regime) {
        case FlowRegime::Laminar: return "laminar";
        case FlowRegime::Transitional: return "transitional";
        case FlowRegime::Turbulent: return "turbulent";
        default: return "unknown";
    }
}

/// Explicit approximation used outside the laminar range
enum class FrictionCorrelation {
    SwameeJain,
    Haaland
};

[[nodiscard]] inline constexpr const char* to_string(FrictionCorrelation c) noexcept {
    switch (c) {
        case FrictionCorrelation::SwameeJain: return "swamee-jain";
        case FrictionCorrelation::Haaland: return "haaland";
        default: return "unknown";
    }
}

/// Parse "swamee-jain", "swamee_jain", "haaland" (case-insensitive)
[[nodiscard]] std::optional<FrictionCorrelation> parse_friction_correlation(const std::string& name);

[[nodiscard]] FlowRegime classify_regime(Real reynolds);

/// Darcy friction factor. Re must be > 0, relative roughness >= 0.
[[nodiscard]] Real friction_factor(Real reynolds,
                                   Real relative_roughness,
                                   FrictionCorrelation correlation = FrictionCorrelation::SwameeJain);

// =============================================================================
// Darcy-Weisbach pressure drop
// =============================================================================

/// Per-call inputs. Fluid and wall defaults are water at 20 C in commercial steel.
struct PressureDropInputs {
    Real flow_m3s = 0.0;
    Real diameter_m = 0.0;
    Real length_m = 0.0;
    Real roughness_m = defaults::commercial_steel_roughness;
    Real density_kg_m3 = defaults::water_density;
    Real kinematic_viscosity_m2s = defaults::water_kinematic_viscosity;
    std::optional<Real> dynamic_viscosity_pa_s;  ///< Overrides rho * nu when set
    FrictionCorrelation correlation = FrictionCorrelation::SwameeJain;
};

struct PressureDropResult {
    Real delta_p_pa = 0.0;
    Real friction_factor = 0.0;
    Real reynolds_number = 0.0;
    FlowRegime flow_regime = FlowRegime::Laminar;
    Real velocity_mps = 0.0;
    Real relative_roughness = 0.0;
};

[[nodiscard]] Result<PressureDropResult> pressure_drop(const PressureDropInputs& inputs);

}  // namespace metercalc::v1
