#include "metercalc/v1/json_report.hpp"

namespace metercalc::v1 {

namespace {

// Field units only exist in the registry; a miss here is a programming error
Real si_to(Real value, std::string_view unit, QuantityKind kind) {
    const auto converted = from_si(value, unit, kind);
    return converted ? *converted : value;
}

}  // namespace

void to_json(nlohmann::json& j, const ConversionRecord& record) {
    j = nlohmann::json{
        {"kind", to_string(record.kind)},
        {"value", record.value},
        {"from", record.from_unit},
        {"to", record.to_unit},
        {"result", record.result},
    };
}

void to_json(nlohmann::json& j, const FlowState& state) {
    j = nlohmann::json{
        {"flow_m3s", state.flow_m3s},
        {"flow_m3h", si_to(state.flow_m3s, "m3h", QuantityKind::Flow)},
        {"flow_gpm", si_to(state.flow_m3s, "gpm", QuantityKind::Flow)},
        {"velocity_mps", state.velocity_mps},
        {"diameter_m", state.diameter_m},
        {"area_m2", state.area_m2},
    };
}

void to_json(nlohmann::json& j, const PressureDropResult& result) {
    j = nlohmann::json{
        {"delta_p_pa", result.delta_p_pa},
        {"delta_p_bar", si_to(result.delta_p_pa, "bar", QuantityKind::Pressure)},
        {"delta_p_psi", si_to(result.delta_p_pa, "psi", QuantityKind::Pressure)},
        {"friction_factor", result.friction_factor},
        {"reynolds_number", result.reynolds_number},
        {"flow_regime", to_string(result.flow_regime)},
        {"velocity_mps", result.velocity_mps},
        {"relative_roughness", result.relative_roughness},
    };
}

void to_json(nlohmann::json& j, const GasConditions& conditions) {
    j = nlohmann::json{
        {"pressure_pa", conditions.pressure_pa},
        {"pressure_bara", si_to(conditions.pressure_pa, "bar", QuantityKind::Pressure)},
        {"temperature_k", conditions.temperature_k},
        {"temperature_c", si_to(conditions.temperature_k, "c", QuantityKind::Temperature)},
    };
}

void to_json(nlohmann::json& j, const PseudoCritical& critical) {
    j = nlohmann::json{
        {"tc_k", critical.tc_k},
        {"pc_pa", critical.pc_pa},
        {"rhoc_kg_m3", critical.rhoc_kg_m3},
        {"omega", critical.omega},
    };
}

void to_json(nlohmann::json& j, const GasReport& report) {
    nlohmann::json composition = nlohmann::json::object();
    for (const auto& f : report.composition) {
        composition[f.name] = f.mole_percent;
    }

    j = nlohmann::json{
        {"conditions", report.conditions},
        {"composition_mole_percent", composition},
        {"molecular_weight", report.molecular_weight},
        {"specific_gravity", report.specific_gravity},
        {"compressibility", report.compressibility},
        {"density_kg_m3", report.density_kg_m3},
        {"compressibility_std", report.compressibility_std},
        {"density_std_kg_m3", report.density_std_kg_m3},
        {"hhv_mj_m3", report.hhv_mj_m3},
        {"lhv_mj_m3", report.lhv_mj_m3},
        {"wobbe_index_mj_m3", report.wobbe_index_mj_m3},
        {"pseudo_critical", report.critical},
        {"reduced_temperature", report.reduced_temperature},
        {"reduced_pressure", report.reduced_pressure},
        {"volume_factor", report.volume_factor},
    };
}

void to_json(nlohmann::json& j, const StepResult& step) {
    j = nlohmann::json{
        {"name", step.name},
        {"type", step.type},
        {"success", step.success()},
    };
    if (step.output) {
        std::visit([&](const auto& output) { j["result"] = output; }, *step.output);
    } else if (step.error) {
        j["error"] = to_string(*step.error);
        j["message"] = step.message;
    }
}

void to_json(nlohmann::json& j, const CaseReport& report) {
    j = nlohmann::json{
        {"title", report.title},
        {"success", report.success},
        {"failed", report.failed_count()},
        {"steps", report.steps},
    };
}

nlohmann::json error_json(CalcError error, const std::string& message) {
    return nlohmann::json{
        {"error", to_string(error)},
        {"message", message},
    };
}

}  // namespace metercalc::v1
