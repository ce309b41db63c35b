#pragma once

// =============================================================================
// MeterCalc - Typed Calculation Results
// =============================================================================
// Every engine entry point returns Result<T>: either a value or a CalcError
// with a human-readable message. Engines never throw for bad input and never
// return partially filled values.
// =============================================================================

#include <optional>
#include <string>
#include <utility>

namespace metercalc::v1 {

/// Error taxonomy shared by all engines
enum class CalcError {
    UnknownUnit,   ///< Symbol not registered for the stated kind
    KindMismatch,  ///< Conversion attempted across quantity kinds
    InvalidInput   ///< Non-positive dimensions, negative flow, bad parameter combination
};

[[nodiscard]] inline constexpr const char* to_string(CalcError err) noexcept {
    switch (err) {
        case CalcError::UnknownUnit: return "UnknownUnit";
        case CalcError::KindMismatch: return "KindMismatch";
        case CalcError::InvalidInput: return "InvalidInput";
        default: return "Unknown";
    }
}

/// Result type for operations that can fail (portable alternative to std::expected)
template<typename T>
struct Result {
    std::optional<T> value;
    CalcError error = CalcError::InvalidInput;
    std::string message;

    [[nodiscard]] bool has_value() const { return value.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }
    [[nodiscard]] T& operator*() { return *value; }
    [[nodiscard]] const T& operator*() const { return *value; }
    [[nodiscard]] T* operator->() { return &*value; }
    [[nodiscard]] const T* operator->() const { return &*value; }

    /// "<ErrorKind>: <message>", for one-line diagnostics
    [[nodiscard]] std::string error_string() const {
        return std::string(to_string(error)) + ": " + message;
    }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(CalcError err, std::string msg) {
        Result r;
        r.error = err;
        r.message = std::move(msg);
        return r;
    }

    /// Forward the error of another result type
    template<typename U>
    static Result failure_from(const Result<U>& other) {
        return failure(other.error, other.message);
    }
};

}  // namespace metercalc::v1
