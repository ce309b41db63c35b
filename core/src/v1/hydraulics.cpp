#include "metercalc/v1/hydraulics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>

namespace metercalc::v1 {

namespace {

std::string normalize_key(std::string s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

bool all_finite(std::initializer_list<Real> values) {
    return std::all_of(values.begin(), values.end(), [](Real v) { return std::isfinite(v); });
}

Real swamee_jain(Real reynolds, Real relative_roughness) {
    const Real log_term = std::log10(relative_roughness / 3.7 + 5.74 / std::pow(reynolds, 0.9));
    return 0.25 / (log_term * log_term);
}

Real haaland(Real reynolds, Real relative_roughness) {
    const Real inv_sqrt_f =
        -1.8 * std::log10(std::pow(relative_roughness / 3.7, 1.11) + 6.9 / reynolds);
    return 1.0 / (inv_sqrt_f * inv_sqrt_f);
}

}  // namespace

Result<FlowState> solve_flow_state(Real diameter_m,
                                   std::optional<Real> velocity_mps,
                                   std::optional<Real> flow_m3s) {
    using R = Result<FlowState>;

    if (velocity_mps.has_value() == flow_m3s.has_value()) {
        return R::failure(CalcError::InvalidInput,
                          "Exactly one of velocity or flow rate must be specified");
    }
    if (!std::isfinite(diameter_m) || diameter_m <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Pipe diameter must be positive");
    }

    FlowState state;
    state.diameter_m = diameter_m;
    state.area_m2 = PipeGeometry{diameter_m}.area();

    if (velocity_mps) {
        if (!std::isfinite(*velocity_mps) || *velocity_mps < 0.0) {
            return R::failure(CalcError::InvalidInput, "Velocity must be non-negative");
        }
        state.velocity_mps = *velocity_mps;
        state.flow_m3s = state.velocity_mps * state.area_m2;
    } else {
        if (!std::isfinite(*flow_m3s) || *flow_m3s < 0.0) {
            return R::failure(CalcError::InvalidInput, "Flow rate must be non-negative");
        }
        state.flow_m3s = *flow_m3s;
        state.velocity_mps = state.flow_m3s / state.area_m2;
    }
    return R::success(state);
}

std::optional<FrictionCorrelation> parse_friction_correlation(const std::string& name) {
    const std::string key = normalize_key(name);
    if (key == "swameejain" || key == "sj") return FrictionCorrelation::SwameeJain;
    if (key == "haaland") return FrictionCorrelation::Haaland;
    return std::nullopt;
}

FlowRegime classify_regime(Real reynolds) {
    if (reynolds < constants::laminar_reynolds_limit) return FlowRegime::Laminar;
    if (reynolds < constants::turbulent_reynolds_limit) return FlowRegime::Transitional;
    return FlowRegime::Turbulent;
}

Real friction_factor(Real reynolds, Real relative_roughness, FrictionCorrelation correlation) {
    if (!(reynolds > 0.0)) {
        return 0.0;
    }
    if (classify_regime(reynolds) == FlowRegime::Laminar) {
        return 64.0 / reynolds;
    }
    // Transitional flow has no agreed closed form; the turbulent estimate is used
    const Real rr = std::max<Real>(relative_roughness, 0.0);
    switch (correlation) {
        case FrictionCorrelation::Haaland:
            return haaland(reynolds, rr);
        case FrictionCorrelation::SwameeJain:
        default:
            return swamee_jain(reynolds, rr);
    }
}

Result<PressureDropResult> pressure_drop(const PressureDropInputs& in) {
    using R = Result<PressureDropResult>;

    if (!all_finite({in.flow_m3s, in.diameter_m, in.length_m, in.roughness_m,
                     in.density_kg_m3, in.kinematic_viscosity_m2s})) {
        return R::failure(CalcError::InvalidInput, "Pressure drop inputs must be finite");
    }
    if (in.diameter_m <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Pipe diameter must be positive");
    }
    if (in.length_m <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Pipe length must be positive");
    }
    if (in.flow_m3s < 0.0) {
        return R::failure(CalcError::InvalidInput, "Flow rate must be non-negative");
    }
    if (in.roughness_m < 0.0) {
        return R::failure(CalcError::InvalidInput, "Pipe roughness must be non-negative");
    }
    if (in.density_kg_m3 <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Fluid density must be positive");
    }
    if (in.kinematic_viscosity_m2s <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Kinematic viscosity must be positive");
    }
    if (in.dynamic_viscosity_pa_s &&
        (!std::isfinite(*in.dynamic_viscosity_pa_s) || *in.dynamic_viscosity_pa_s <= 0.0)) {
        return R::failure(CalcError::InvalidInput, "Dynamic viscosity must be positive");
    }

    const auto state = solve_flow_state(in.diameter_m, std::nullopt, in.flow_m3s);
    if (!state) {
        return R::failure_from(state);
    }

    const Real mu = in.dynamic_viscosity_pa_s.value_or(in.density_kg_m3 * in.kinematic_viscosity_m2s);
    const Real v = state->velocity_mps;

    PressureDropResult result;
    result.velocity_mps = v;
    result.relative_roughness = in.roughness_m / in.diameter_m;
    result.reynolds_number = in.density_kg_m3 * v * in.diameter_m / mu;
    result.flow_regime = classify_regime(result.reynolds_number);

    // No flow, no friction loss
    if (result.reynolds_number <= 0.0) {
        return R::success(result);
    }

    result.friction_factor =
        friction_factor(result.reynolds_number, result.relative_roughness, in.correlation);
    // Re so small that 64/Re overflows: no measurable flow, no friction loss
    if (!std::isfinite(result.friction_factor)) {
        result.friction_factor = 0.0;
        return R::success(result);
    }
    result.delta_p_pa = result.friction_factor * (in.length_m / in.diameter_m) *
                        (in.density_kg_m3 * v * v / 2.0);
    return R::success(result);
}

}  // namespace metercalc::v1
