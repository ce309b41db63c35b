#include "metercalc/v1/units.hpp"

#include <algorithm>
#include <cctype>

namespace metercalc::v1 {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool share_kind(const std::vector<QuantityKind>& a, const std::vector<QuantityKind>& b) {
    return std::any_of(a.begin(), a.end(), [&](QuantityKind k) {
        return std::find(b.begin(), b.end(), k) != b.end();
    });
}

}  // namespace

std::optional<QuantityKind> parse_quantity_kind(std::string_view name) {
    const std::string key = to_lower(name);
    for (QuantityKind kind : kAllQuantityKinds) {
        if (key == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

UnitRegistry::UnitRegistry() {
    using K = QuantityKind;
    constexpr Real five_ninths = 5.0 / 9.0;

    rules_ = {
        // Flow, base L/min
        {K::Flow, "gpm", "US gallons per minute", 3.785411784},
        {K::Flow, "lpm", "liters per minute", 1.0},
        {K::Flow, "cfm", "cubic feet per minute", 28.316846592},
        {K::Flow, "m3h", "cubic meters per hour", 1000.0 / 60.0},
        {K::Flow, "bpd", "oil barrels per day", 158.987294928 / 1440.0},
        {K::Flow, "m3s", "cubic meters per second", 60000.0},

        // Pressure, base Pa
        {K::Pressure, "psi", "pounds per square inch", 6894.757293168},
        {K::Pressure, "bar", "bar", 1.0e5},
        {K::Pressure, "kpa", "kilopascals", 1.0e3},
        {K::Pressure, "mpa", "megapascals", 1.0e6},
        {K::Pressure, "mmhg", "millimeters of mercury", 133.322387415},
        {K::Pressure, "pa", "pascals", 1.0},

        // Temperature, base K
        {K::Temperature, "c", "degrees Celsius", 1.0, constants::celsius_offset},
        {K::Temperature, "f", "degrees Fahrenheit", five_ninths, constants::rankine_offset},
        {K::Temperature, "k", "kelvin", 1.0, 0.0},
        {K::Temperature, "r", "degrees Rankine", five_ninths, 0.0},

        // Length, base m
        {K::Length, "ft", "feet", 0.3048},
        {K::Length, "m", "meters", 1.0},
        {K::Length, "in", "inches", 0.0254},
        {K::Length, "cm", "centimeters", 0.01},
        {K::Length, "mm", "millimeters", 0.001},
    };
}

const UnitRegistry& UnitRegistry::instance() {
    static const UnitRegistry registry;
    return registry;
}

const UnitRule* UnitRegistry::find(QuantityKind kind, std::string_view symbol) const {
    const std::string key = to_lower(symbol);
    for (const auto& rule : rules_) {
        if (rule.kind == kind && rule.symbol == key) {
            return &rule;
        }
    }
    return nullptr;
}

std::vector<QuantityKind> UnitRegistry::kinds_of(std::string_view symbol) const {
    const std::string key = to_lower(symbol);
    std::vector<QuantityKind> kinds;
    for (const auto& rule : rules_) {
        if (rule.symbol == key &&
            std::find(kinds.begin(), kinds.end(), rule.kind) == kinds.end()) {
            kinds.push_back(rule.kind);
        }
    }
    return kinds;
}

std::vector<const UnitRule*> UnitRegistry::rules_of(QuantityKind kind) const {
    std::vector<const UnitRule*> out;
    for (const auto& rule : rules_) {
        if (rule.kind == kind) out.push_back(&rule);
    }
    return out;
}

std::string_view UnitRegistry::si_symbol(QuantityKind kind) noexcept {
    switch (kind) {
        case QuantityKind::Flow: return "m3s";
        case QuantityKind::Pressure: return "pa";
        case QuantityKind::Temperature: return "k";
        case QuantityKind::Length: return "m";
        default: return "";
    }
}

Result<Real> convert(Real value,
                     std::string_view from_unit,
                     std::string_view to_unit,
                     QuantityKind kind) {
    const auto& registry = UnitRegistry::instance();

    // Cross-kind requests are rejected whatever kind the caller named
    const auto from_kinds = registry.kinds_of(from_unit);
    const auto to_kinds = registry.kinds_of(to_unit);
    if (!from_kinds.empty() && !to_kinds.empty() && !share_kind(from_kinds, to_kinds)) {
        return Result<Real>::failure(
            CalcError::KindMismatch,
            "Cannot convert '" + std::string(from_unit) + "' (" + to_string(from_kinds.front()) +
                ") to '" + std::string(to_unit) + "' (" + to_string(to_kinds.front()) + ")");
    }

    const UnitRule* from = registry.find(kind, from_unit);
    if (!from) {
        return Result<Real>::failure(
            CalcError::UnknownUnit,
            "Unit '" + std::string(from_unit) + "' not found in " + to_string(kind) + " units");
    }
    const UnitRule* to = registry.find(kind, to_unit);
    if (!to) {
        return Result<Real>::failure(
            CalcError::UnknownUnit,
            "Unit '" + std::string(to_unit) + "' not found in " + to_string(kind) + " units");
    }

    if (from == to) {
        return Result<Real>::success(value);
    }
    return Result<Real>::success(to->from_base(from->to_base(value)));
}

Result<Real> to_si(Real value, std::string_view unit, QuantityKind kind) {
    return convert(value, unit, UnitRegistry::si_symbol(kind), kind);
}

Result<Real> from_si(Real value, std::string_view unit, QuantityKind kind) {
    return convert(value, UnitRegistry::si_symbol(kind), unit, kind);
}

std::vector<std::string> units_of(QuantityKind kind) {
    std::vector<std::string> symbols;
    for (const UnitRule* rule : UnitRegistry::instance().rules_of(kind)) {
        symbols.emplace_back(rule->symbol);
    }
    return symbols;
}

}  // namespace metercalc::v1
