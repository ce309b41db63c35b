#pragma once

// =============================================================================
// MeterCalc - JSON Result Serialization
// =============================================================================
// nlohmann::json adapters (found by ADL) for engine results and case reports.
// Every quantity is emitted in SI under a suffixed key (`delta_p_pa`); a few
// common field units are added next to it for convenience.
// =============================================================================

#include "metercalc/v1/case_runner.hpp"

#include <nlohmann/json.hpp>

namespace metercalc::v1 {

void to_json(nlohmann::json& j, const ConversionRecord& record);
void to_json(nlohmann::json& j, const FlowState& state);
void to_json(nlohmann::json& j, const PressureDropResult& result);
void to_json(nlohmann::json& j, const GasConditions& conditions);
void to_json(nlohmann::json& j, const PseudoCritical& critical);
void to_json(nlohmann::json& j, const GasReport& report);
void to_json(nlohmann::json& j, const StepResult& step);
void to_json(nlohmann::json& j, const CaseReport& report);

/// Error payload: {"error": kind, "message": text}
[[nodiscard]] nlohmann::json error_json(CalcError error, const std::string& message);

template<typename T>
[[nodiscard]] nlohmann::json result_json(const Result<T>& result) {
    if (!result) {
        return error_json(result.error, result.message);
    }
    return nlohmann::json(*result);
}

}  // namespace metercalc::v1
