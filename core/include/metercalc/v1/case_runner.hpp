#pragma once

// =============================================================================
// MeterCalc - Calculation Cases
// =============================================================================
// A case bundles fluid and pipe defaults with an ordered list of calculation
// steps. Step values are stored in SI; unit handling happens when the case is
// built (see parser/yaml_parser.hpp). Steps inherit pipe/fluid values they do
// not set themselves.
// =============================================================================

#include "metercalc/v1/gas_properties.hpp"
#include "metercalc/v1/hydraulics.hpp"
#include "metercalc/v1/units.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace metercalc::v1 {

// =============================================================================
// Case definition
// =============================================================================

struct FluidSpec {
    Real density_kg_m3 = defaults::water_density;
    Real kinematic_viscosity_m2s = defaults::water_kinematic_viscosity;
    std::optional<Real> dynamic_viscosity_pa_s;

    /// Replace the viscosity; an explicit nu supersedes any dynamic viscosity
    void set_kinematic_viscosity(Real nu_m2s) {
        kinematic_viscosity_m2s = nu_m2s;
        dynamic_viscosity_pa_s.reset();
    }
};

struct PipeSpec {
    std::optional<Real> diameter_m;
    std::optional<Real> length_m;
    Real roughness_m = defaults::commercial_steel_roughness;
    FrictionCorrelation correlation = FrictionCorrelation::SwameeJain;
};

struct ConvertStep {
    Real value = 0.0;
    std::string from_unit;
    std::string to_unit;
    QuantityKind kind = QuantityKind::Flow;
};

struct FlowStep {
    std::optional<Real> diameter_m;
    std::optional<Real> velocity_mps;
    std::optional<Real> flow_m3s;
};

struct PressureDropStep {
    Real flow_m3s = 0.0;
    std::optional<Real> diameter_m;
    std::optional<Real> length_m;
    std::optional<Real> roughness_m;
};

struct GasStep {
    GasComposition composition;
    GasConditions conditions;
};

using StepSpec = std::variant<ConvertStep, FlowStep, PressureDropStep, GasStep>;

struct CalculationStep {
    std::string name;
    StepSpec spec;
};

struct CaseFile {
    std::string title;
    FluidSpec fluid;
    PipeSpec pipe;
    std::vector<CalculationStep> steps;
};

[[nodiscard]] const char* step_type_name(const StepSpec& spec);

// =============================================================================
// Case results
// =============================================================================

struct ConversionRecord {
    Real value = 0.0;
    std::string from_unit;
    std::string to_unit;
    QuantityKind kind = QuantityKind::Flow;
    Real result = 0.0;
};

/// "<value> <from> = <result:.4f> <to>", echoing the input value as given
[[nodiscard]] std::string to_string(const ConversionRecord& record);

using StepOutput = std::variant<ConversionRecord, FlowState, PressureDropResult, GasReport>;

struct StepResult {
    std::string name;
    std::string type;
    std::optional<StepOutput> output;
    std::optional<CalcError> error;
    std::string message;

    [[nodiscard]] bool success() const { return output.has_value(); }
};

struct CaseReport {
    std::string title;
    std::vector<StepResult> steps;
    bool success = true;

    [[nodiscard]] std::size_t failed_count() const;
};

/// Build pressure-drop inputs from a step and the case defaults
[[nodiscard]] Result<PressureDropInputs> resolve_pressure_drop(const PressureDropStep& step,
                                                               const FluidSpec& fluid,
                                                               const PipeSpec& pipe);

/// Run one step against the case defaults
[[nodiscard]] StepResult run_step(const CalculationStep& step, const FluidSpec& fluid, const PipeSpec& pipe);

/// Run every step in order; a failed step does not stop the ones after it
[[nodiscard]] CaseReport run_case(const CaseFile& case_file);

}  // namespace metercalc::v1
