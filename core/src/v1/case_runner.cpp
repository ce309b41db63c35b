#include "metercalc/v1/case_runner.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace metercalc::v1 {

namespace {

template<typename T>
StepResult make_step_result(const CalculationStep& step, const Result<T>& result) {
    StepResult out;
    out.name = step.name;
    out.type = step_type_name(step.spec);
    if (result) {
        out.output = StepOutput{*result};
    } else {
        out.error = result.error;
        out.message = result.message;
    }
    return out;
}

Result<ConversionRecord> run_convert(const ConvertStep& step) {
    const auto converted = convert(step.value, step.from_unit, step.to_unit, step.kind);
    if (!converted) {
        return Result<ConversionRecord>::failure_from(converted);
    }
    return Result<ConversionRecord>::success(
        ConversionRecord{step.value, step.from_unit, step.to_unit, step.kind, *converted});
}

Result<FlowState> run_flow(const FlowStep& step, const PipeSpec& pipe) {
    const auto diameter = step.diameter_m ? step.diameter_m : pipe.diameter_m;
    if (!diameter) {
        return Result<FlowState>::failure(CalcError::InvalidInput,
                                          "Pipe diameter not set on step or in pipe section");
    }
    return solve_flow_state(*diameter, step.velocity_mps, step.flow_m3s);
}

}  // namespace

const char* step_type_name(const StepSpec& spec) {
    return std::visit(
        [](const auto& s) -> const char* {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, ConvertStep>) {
                return "convert";
            } else if constexpr (std::is_same_v<T, FlowStep>) {
                return "flow";
            } else if constexpr (std::is_same_v<T, PressureDropStep>) {
                return "pressure_drop";
            } else {
                return "gas";
            }
        },
        spec);
}

std::string to_string(const ConversionRecord& record) {
    std::ostringstream os;
    os << std::setprecision(15) << record.value << " " << record.from_unit << " = "
       << std::fixed << std::setprecision(4) << record.result << " " << record.to_unit;
    return os.str();
}

std::size_t CaseReport::failed_count() const {
    return static_cast<std::size_t>(
        std::count_if(steps.begin(), steps.end(), [](const StepResult& s) { return !s.success(); }));
}

Result<PressureDropInputs> resolve_pressure_drop(const PressureDropStep& step,
                                                 const FluidSpec& fluid,
                                                 const PipeSpec& pipe) {
    using R = Result<PressureDropInputs>;

    const auto diameter = step.diameter_m ? step.diameter_m : pipe.diameter_m;
    if (!diameter) {
        return R::failure(CalcError::InvalidInput, "Pipe diameter not set on step or in pipe section");
    }
    const auto length = step.length_m ? step.length_m : pipe.length_m;
    if (!length) {
        return R::failure(CalcError::InvalidInput, "Pipe length not set on step or in pipe section");
    }

    PressureDropInputs inputs;
    inputs.flow_m3s = step.flow_m3s;
    inputs.diameter_m = *diameter;
    inputs.length_m = *length;
    inputs.roughness_m = step.roughness_m.value_or(pipe.roughness_m);
    inputs.density_kg_m3 = fluid.density_kg_m3;
    inputs.kinematic_viscosity_m2s = fluid.kinematic_viscosity_m2s;
    inputs.dynamic_viscosity_pa_s = fluid.dynamic_viscosity_pa_s;
    inputs.correlation = pipe.correlation;
    return R::success(inputs);
}

StepResult run_step(const CalculationStep& step, const FluidSpec& fluid, const PipeSpec& pipe) {
    return std::visit(
        [&](const auto& spec) -> StepResult {
            using T = std::decay_t<decltype(spec)>;
            if constexpr (std::is_same_v<T, ConvertStep>) {
                return make_step_result(step, run_convert(spec));
            } else if constexpr (std::is_same_v<T, FlowStep>) {
                return make_step_result(step, run_flow(spec, pipe));
            } else if constexpr (std::is_same_v<T, PressureDropStep>) {
                const auto inputs = resolve_pressure_drop(spec, fluid, pipe);
                if (!inputs) {
                    return make_step_result(step, Result<PressureDropResult>::failure_from(inputs));
                }
                return make_step_result(step, pressure_drop(*inputs));
            } else {
                return make_step_result(step, gas_report(spec.composition, spec.conditions));
            }
        },
        step.spec);
}

CaseReport run_case(const CaseFile& case_file) {
    CaseReport report;
    report.title = case_file.title;
    report.steps.reserve(case_file.steps.size());

    for (const auto& step : case_file.steps) {
        report.steps.push_back(run_step(step, case_file.fluid, case_file.pipe));
        if (!report.steps.back().success()) {
            report.success = false;
        }
    }
    return report;
}

}  // namespace metercalc::v1
