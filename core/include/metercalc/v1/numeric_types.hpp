#pragma once

// =============================================================================
// MeterCalc - Numeric Types and Physical Constants
// =============================================================================
// Shared scalar type and the fixed reference constants used by the
// conversion, hydraulic and gas engines. All constants are SI.
// =============================================================================

namespace metercalc::v1 {

using Real = double;

namespace constants {

inline constexpr Real pi = 3.141592653589793238462643383279502884;

/// Absolute zero offset between Celsius and Kelvin
inline constexpr Real celsius_offset = 273.15;

/// Absolute zero offset between Fahrenheit and Rankine
inline constexpr Real rankine_offset = 459.67;

/// Standard atmosphere [Pa]
inline constexpr Real standard_atmosphere_pa = 101325.0;

/// Universal gas constant [J/(kmol K)]
inline constexpr Real gas_constant = 8314.462618;

/// Molar mass of dry air [kg/kmol]
inline constexpr Real air_molar_mass = 28.964;

// Laminar/transitional/turbulent thresholds on Reynolds number
inline constexpr Real laminar_reynolds_limit = 2300.0;
inline constexpr Real turbulent_reynolds_limit = 4000.0;

}  // namespace constants

namespace defaults {

/// Water at 20 C
inline constexpr Real water_density = 1000.0;             ///< kg/m^3
inline constexpr Real water_kinematic_viscosity = 1.004e-6;  ///< m^2/s

/// Commercial steel absolute roughness [m] (0.045 mm)
inline constexpr Real commercial_steel_roughness = 0.045e-3;

}  // namespace defaults

}  // namespace metercalc::v1
