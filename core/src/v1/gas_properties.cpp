#include "metercalc/v1/gas_properties.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <string>
#include <unordered_map>

namespace metercalc::v1 {

namespace {

constexpr int kMaxNewtonIterations = 50;
constexpr Real kNewtonTolerance = 1e-10;
constexpr Real kMinCompressibility = 0.1;

// Per-mole gas constant [J/(mol K)]
constexpr Real kMolarGasConstant = constants::gas_constant / 1000.0;

std::string normalize_key(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

const std::unordered_map<std::string, std::string_view>& component_alias_map() {
    static const std::unordered_map<std::string, std::string_view> aliases = [] {
        std::unordered_map<std::string, std::string_view> map;

        auto add_aliases = [&](std::string_view canonical, std::initializer_list<const char*> names) {
            map.emplace(normalize_key(canonical), canonical);
            for (const char* name : names) {
                map.emplace(normalize_key(name), canonical);
            }
        };

        add_aliases("methane", {"c1", "ch4"});
        add_aliases("ethane", {"c2", "c2h6"});
        add_aliases("propane", {"c3", "c3h8"});
        add_aliases("n-butane", {"nc4", "butane"});
        add_aliases("i-butane", {"ic4", "isobutane"});
        add_aliases("n-pentane", {"nc5", "pentane"});
        add_aliases("i-pentane", {"ic5", "isopentane"});
        add_aliases("hexane", {"c6", "nc6", "n-hexane"});
        add_aliases("heptane", {"c7", "nc7", "n-heptane"});
        add_aliases("octane", {"c8", "nc8", "n-octane"});
        add_aliases("nonane", {"c9", "nc9", "n-nonane"});
        add_aliases("decane", {"c10", "nc10", "n-decane"});
        add_aliases("nitrogen", {"n2"});
        add_aliases("carbon_dioxide", {"co2"});
        add_aliases("hydrogen_sulfide", {"h2s"});
        add_aliases("water", {"h2o"});
        add_aliases("helium", {"he"});
        add_aliases("argon", {"ar"});
        add_aliases("hydrogen", {"h2"});
        add_aliases("carbon_monoxide", {"co"});
        add_aliases("oxygen", {"o2"});

        return map;
    }();
    return aliases;
}

}  // namespace

const std::vector<GasComponent>& gas_components() {
    constexpr auto none = std::nullopt;
    static const std::vector<GasComponent> table = {
        // name, M, Tc [K], Pc [Pa], rho_c [kg/m^3], omega, HHV, LHV [MJ/m^3]
        {"methane", 16.043, 190.564, 4.5992e6, 162.66, 0.0115, 39.82, 35.89},
        {"ethane", 30.070, 305.322, 4.8722e6, 206.18, 0.0995, 70.36, 64.36},
        {"propane", 44.097, 369.825, 4.2512e6, 220.48, 0.1523, 101.27, 93.15},
        {"n-butane", 58.123, 425.125, 3.7960e6, 227.96, 0.2002, 133.86, 123.64},
        {"i-butane", 58.123, none, none, none, none, 132.86, 122.77},
        {"n-pentane", 72.150, none, none, none, none, 166.04, 153.28},
        {"i-pentane", 72.150, none, none, none, none, 164.43, 151.83},
        {"hexane", 86.177, none, none, none, none, 198.67, 183.52},
        {"heptane", 100.204, none, none, none, none, 230.49, 213.50},
        {"octane", 114.231, none, none, none, none, 262.77, 243.58},
        {"nonane", 128.258, none, none, none, none, 0.0, 0.0},
        {"decane", 142.285, none, none, none, none, 0.0, 0.0},
        {"nitrogen", 28.014, 126.192, 3.3958e6, 313.30, 0.0372, 0.0, 0.0},
        {"carbon_dioxide", 44.010, 304.128, 7.3773e6, 467.60, 0.2276, 0.0, 0.0},
        {"hydrogen_sulfide", 34.082, none, none, none, none, 0.0, 0.0},
        {"water", 18.015, none, none, none, none, 0.0, 0.0},
        {"helium", 4.003, none, none, none, none, 0.0, 0.0},
        {"argon", 39.948, none, none, none, none, 0.0, 0.0},
        {"hydrogen", 2.016, none, none, none, none, 12.75, 10.79},
        {"carbon_monoxide", 28.010, none, none, none, none, 12.63, 12.63},
        {"oxygen", 31.999, none, none, none, none, 0.0, 0.0},
    };
    return table;
}

const GasComponent* find_gas_component(std::string_view name) {
    const auto& aliases = component_alias_map();
    const auto it = aliases.find(normalize_key(name));
    if (it == aliases.end()) {
        return nullptr;
    }
    const auto& table = gas_components();
    const auto comp = std::find_if(table.begin(), table.end(),
                                   [&](const GasComponent& c) { return c.name == it->second; });
    return comp == table.end() ? nullptr : &*comp;
}

Result<GasComposition> normalize_composition(const GasComposition& composition) {
    using R = Result<GasComposition>;

    if (composition.empty()) {
        return R::failure(CalcError::InvalidInput, "Gas composition cannot be empty");
    }

    // Merge aliases of the same component
    GasComposition merged;
    for (const auto& entry : composition) {
        const GasComponent* comp = find_gas_component(entry.name);
        if (!comp) {
            return R::failure(CalcError::InvalidInput, "Unknown component: " + entry.name);
        }
        if (!std::isfinite(entry.mole_percent) || entry.mole_percent < 0.0) {
            return R::failure(CalcError::InvalidInput,
                              "Mole percent of '" + entry.name + "' must be non-negative");
        }
        auto existing = std::find_if(merged.begin(), merged.end(),
                                     [&](const ComponentFraction& f) { return f.name == comp->name; });
        if (existing != merged.end()) {
            existing->mole_percent += entry.mole_percent;
        } else {
            merged.push_back({std::string(comp->name), entry.mole_percent});
        }
    }

    Real total = 0.0;
    for (const auto& f : merged) total += f.mole_percent;
    if (total <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Total composition cannot be zero");
    }

    for (auto& f : merged) {
        f.mole_percent = f.mole_percent / total * 100.0;
    }
    return R::success(std::move(merged));
}

Real molecular_weight(const GasComposition& normalized) {
    Real mw = 0.0;
    for (const auto& f : normalized) {
        if (const GasComponent* comp = find_gas_component(f.name)) {
            mw += f.mole_percent / 100.0 * comp->molar_mass;
        }
    }
    return mw;
}

Result<PseudoCritical> pseudo_critical(const GasComposition& normalized) {
    PseudoCritical pc;
    Real covered = 0.0;
    for (const auto& f : normalized) {
        const GasComponent* comp = find_gas_component(f.name);
        if (!comp || !comp->has_critical_data()) {
            continue;
        }
        const Real x = f.mole_percent / 100.0;
        pc.tc_k += x * *comp->tc_k;
        pc.pc_pa += x * *comp->pc_pa;
        pc.rhoc_kg_m3 += x * *comp->rhoc_kg_m3;
        pc.omega += x * *comp->omega;
        covered += x;
    }

    if (covered <= 0.0) {
        return Result<PseudoCritical>::failure(
            CalcError::InvalidInput, "Composition has no component with critical property data");
    }

    pc.tc_k /= covered;
    pc.pc_pa /= covered;
    pc.rhoc_kg_m3 /= covered;
    pc.omega /= covered;
    return Result<PseudoCritical>::success(pc);
}

Real compressibility_factor(const PseudoCritical& critical, const GasConditions& conditions) {
    const Real T = conditions.temperature_k;
    const Real P = conditions.pressure_pa;
    const Real RT = kMolarGasConstant * T;

    const Real w = critical.omega;
    const Real kappa = 0.37464 + 1.54226 * w - 0.26992 * w * w;
    const Real sqrt_alpha = 1.0 + kappa * (1.0 - std::sqrt(T / critical.tc_k));
    const Real alpha = sqrt_alpha * sqrt_alpha;

    const Real Rtc = kMolarGasConstant * critical.tc_k;
    const Real a = 0.45724 * Rtc * Rtc / critical.pc_pa * alpha;
    const Real b = 0.07780 * Rtc / critical.pc_pa;

    const Real A = a * P / (RT * RT);
    const Real B = b * P / RT;

    const Real c2 = -(1.0 - B);
    const Real c1 = A - 3.0 * B * B - 2.0 * B;
    const Real c0 = -(A * B - B * B - B * B * B);

    // Start from the ideal gas to land on the vapor root
    Real z = 1.0;
    for (int i = 0; i < kMaxNewtonIterations; ++i) {
        const Real f = ((z + c2) * z + c1) * z + c0;
        const Real df = (3.0 * z + 2.0 * c2) * z + c1;
        if (std::abs(df) < 1e-14) {
            break;
        }
        const Real z_new = z - f / df;
        if (std::abs(z_new - z) < kNewtonTolerance) {
            z = z_new;
            break;
        }
        z = z_new;
    }

    if (!std::isfinite(z)) {
        return 1.0;
    }
    return std::max(z, kMinCompressibility);
}

Result<GasReport> gas_report(const GasComposition& composition, const GasConditions& conditions) {
    using R = Result<GasReport>;

    if (!std::isfinite(conditions.pressure_pa) || conditions.pressure_pa <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Absolute pressure must be positive");
    }
    if (!std::isfinite(conditions.temperature_k) || conditions.temperature_k <= 0.0) {
        return R::failure(CalcError::InvalidInput, "Temperature cannot be at or below absolute zero");
    }

    auto normalized = normalize_composition(composition);
    if (!normalized) {
        return R::failure_from(normalized);
    }
    auto critical = pseudo_critical(*normalized);
    if (!critical) {
        return R::failure_from(critical);
    }

    GasReport report;
    report.conditions = conditions;
    report.composition = *normalized;
    report.critical = *critical;

    report.molecular_weight = molecular_weight(report.composition);
    report.specific_gravity = report.molecular_weight / constants::air_molar_mass;

    auto density = [&](const GasConditions& c, Real z) {
        return c.pressure_pa * report.molecular_weight / (z * constants::gas_constant * c.temperature_k);
    };

    report.compressibility = compressibility_factor(report.critical, conditions);
    report.density_kg_m3 = density(conditions, report.compressibility);

    const GasConditions std_conditions = GasConditions::standard();
    report.compressibility_std = compressibility_factor(report.critical, std_conditions);
    report.density_std_kg_m3 = density(std_conditions, report.compressibility_std);

    for (const auto& f : report.composition) {
        const GasComponent* comp = find_gas_component(f.name);
        const Real x = f.mole_percent / 100.0;
        report.hhv_mj_m3 += x * comp->hhv_mj_m3;
        report.lhv_mj_m3 += x * comp->lhv_mj_m3;
    }
    report.wobbe_index_mj_m3 = report.hhv_mj_m3 / std::sqrt(report.specific_gravity);

    report.reduced_temperature = conditions.temperature_k / report.critical.tc_k;
    report.reduced_pressure = conditions.pressure_pa / report.critical.pc_pa;
    report.volume_factor = 1.0 / report.compressibility;

    return R::success(std::move(report));
}

}  // namespace metercalc::v1
