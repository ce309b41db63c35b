#pragma once

// =============================================================================
// MeterCalc - Unit Conversion Engine
// =============================================================================
// Per-kind unit tables and value translation between units of one kind.
//
// Every unit maps to its kind's base with one affine rule:
//   base  = (value + offset) * scale
//   value = base / scale - offset
// Linear kinds (flow, pressure, length) use offset = 0. Temperature is based
// on Kelvin:
//   K = C + 273.15,  K = (F + 459.67) * 5/9,  K = R * 5/9
//
// Units are keyed by (kind, symbol). The table is static and never mutated
// after first use, so concurrent readers need no locking.
// =============================================================================

#include "metercalc/v1/numeric_types.hpp"
#include "metercalc/v1/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metercalc::v1 {

enum class QuantityKind {
    Flow,
    Pressure,
    Temperature,
    Length
};

inline constexpr QuantityKind kAllQuantityKinds[] = {
    QuantityKind::Flow,
    QuantityKind::Pressure,
    QuantityKind::Temperature,
    QuantityKind::Length,
};

[[nodiscard]] inline constexpr const char* to_string(QuantityKind kind) noexcept {
    switch (kind) {
        case QuantityKind::Flow: return "flow";
        case QuantityKind::Pressure: return "pressure";
        case QuantityKind::Temperature: return "temperature";
        case QuantityKind::Length: return "length";
        default: return "unknown";
    }
}

/// Parse a kind name ("flow", "Pressure", ...); case-insensitive
[[nodiscard]] std::optional<QuantityKind> parse_quantity_kind(std::string_view name);

/// Conversion rule from one unit to its kind's base
struct UnitRule {
    QuantityKind kind;
    std::string_view symbol;       ///< Lower-case lookup key
    std::string_view description;
    Real scale = 1.0;              ///< Non-zero
    Real offset = 0.0;             ///< Applied before scaling (temperature only)

    [[nodiscard]] Real to_base(Real value) const { return (value + offset) * scale; }
    [[nodiscard]] Real from_base(Real base) const { return base / scale - offset; }
};

/// Read-only registry of every unit rule
class UnitRegistry {
public:
    /// Process-wide table, built on first use
    static const UnitRegistry& instance();

    /// Rule for (kind, symbol), nullptr when not registered
    [[nodiscard]] const UnitRule* find(QuantityKind kind, std::string_view symbol) const;

    /// Kinds under which a symbol is registered
    [[nodiscard]] std::vector<QuantityKind> kinds_of(std::string_view symbol) const;

    /// Registered rules of one kind, in declaration order
    [[nodiscard]] std::vector<const UnitRule*> rules_of(QuantityKind kind) const;

    /// Symbol of the unit the hydraulic/gas engines compute in
    [[nodiscard]] static std::string_view si_symbol(QuantityKind kind) noexcept;

    [[nodiscard]] const std::vector<UnitRule>& rules() const { return rules_; }

private:
    UnitRegistry();

    std::vector<UnitRule> rules_;
};

/// Convert value between two units of the same kind.
/// Fails with KindMismatch when both symbols are registered under different
/// kinds, UnknownUnit when either is not registered under `kind`.
[[nodiscard]] Result<Real> convert(Real value,
                                   std::string_view from_unit,
                                   std::string_view to_unit,
                                   QuantityKind kind);

/// Convert into the kind's SI unit (m^3/s, Pa, K, m)
[[nodiscard]] Result<Real> to_si(Real value, std::string_view unit, QuantityKind kind);

/// Convert from the kind's SI unit into `unit`
[[nodiscard]] Result<Real> from_si(Real value, std::string_view unit, QuantityKind kind);

/// Symbols registered for a kind
[[nodiscard]] std::vector<std::string> units_of(QuantityKind kind);

}  // namespace metercalc::v1
