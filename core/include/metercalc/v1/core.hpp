#pragma once

// =============================================================================
// MeterCalc v1 - Metering Engineering Calculations
// =============================================================================
// Main header for the v1 API. It provides:
// - Unit conversion for flow, pressure, temperature and length
// - Pipe continuity and Darcy-Weisbach pressure drop
// - Natural gas property reports
// - YAML calculation cases with JSON result serialization
// =============================================================================

#include "metercalc/v1/numeric_types.hpp"
#include "metercalc/v1/result.hpp"
#include "metercalc/v1/units.hpp"
#include "metercalc/v1/hydraulics.hpp"
#include "metercalc/v1/gas_properties.hpp"
#include "metercalc/v1/case_runner.hpp"
#include "metercalc/v1/json_report.hpp"
#include "metercalc/v1/parser/yaml_parser.hpp"

// Convenience namespace alias
namespace mcalc = metercalc::v1;
