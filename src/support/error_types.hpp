// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <variant>

namespace kumquat {

/// Top-level error taxonomy surfaced to callers
enum class ErrorCategory {
    InvalidInput,
    InsufficientData
};

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidQuantity,
    InvalidGridSize,
    UnsortedStrikes,
    StrikeOrdering,
    InvalidMarketPrice
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array/grid errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error codes for historical volatility estimation
enum class VolatilityErrorCode {
    InsufficientData,
    InvalidPrice
};

/// Volatility estimation failure
struct VolatilityError {
    VolatilityErrorCode code;
    size_t count;   ///< Number of prices supplied
    size_t index;   ///< Offending element for InvalidPrice

    VolatilityError(VolatilityErrorCode code,
                    size_t count = 0,
                    size_t index = 0)
        : code(code), count(count), index(index) {}
};

/// IV solver error categories
enum class IVErrorCode {
    // Validation errors
    NegativeSpot,
    NegativeStrike,
    NegativeMaturity,
    NegativeMarketPrice,
    ArbitrageViolation,
    InvalidConfig,

    // Convergence errors
    MaxIterationsExceeded,
    BracketingFailed,
    NumericalInstability
};

/// Detailed IV solver error with diagnostics
struct IVError {
    IVErrorCode code;
    size_t iterations = 0;           ///< Iterations before failure
    double final_error = 0.0;        ///< Residual at failure
    std::optional<double> last_vol;  ///< Last volatility candidate tried
};

/// Combined error type that can hold any of our specific error types
using ErrorVariant = std::variant<
    ValidationError,
    VolatilityError,
    IVError
>;

inline ErrorCategory error_category(const ValidationError&) {
    return ErrorCategory::InvalidInput;
}

inline ErrorCategory error_category(const VolatilityError& err) {
    return err.code == VolatilityErrorCode::InsufficientData
        ? ErrorCategory::InsufficientData
        : ErrorCategory::InvalidInput;
}

inline ErrorCategory error_category(const IVError&) {
    return ErrorCategory::InvalidInput;
}

inline ErrorCategory error_category(const ErrorVariant& error) {
    return std::visit([](const auto& e) { return error_category(e); }, error);
}

/// Get error code as integer for diagnostics
inline int error_code(const ErrorVariant& error) {
    return std::visit([](const auto& e) -> int {
        return static_cast<int>(e.code);
    }, error);
}

/// Map a validation failure onto the IV solver's error space
inline IVError convert_to_iv_error(const ValidationError& err) {
    switch (err.code) {
        case ValidationErrorCode::InvalidSpotPrice:
            return IVError{.code = IVErrorCode::NegativeSpot};
        case ValidationErrorCode::InvalidStrike:
            return IVError{.code = IVErrorCode::NegativeStrike};
        case ValidationErrorCode::InvalidMaturity:
            return IVError{.code = IVErrorCode::NegativeMaturity};
        case ValidationErrorCode::InvalidMarketPrice:
            return IVError{.code = IVErrorCode::NegativeMarketPrice};
        default:
            return IVError{.code = IVErrorCode::InvalidConfig};
    }
}

inline std::string_view to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidSpotPrice:   return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidStrike:      return "InvalidStrike";
        case ValidationErrorCode::InvalidMaturity:    return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility:  return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate:        return "InvalidRate";
        case ValidationErrorCode::InvalidQuantity:    return "InvalidQuantity";
        case ValidationErrorCode::InvalidGridSize:    return "InvalidGridSize";
        case ValidationErrorCode::UnsortedStrikes:    return "UnsortedStrikes";
        case ValidationErrorCode::StrikeOrdering:     return "StrikeOrdering";
        case ValidationErrorCode::InvalidMarketPrice: return "InvalidMarketPrice";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for VolatilityError
inline std::ostream& operator<<(std::ostream& os, const VolatilityError& err) {
    os << "VolatilityError{code="
       << (err.code == VolatilityErrorCode::InsufficientData ? "InsufficientData" : "InvalidPrice")
       << ", count=" << err.count
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for IVError
inline std::ostream& operator<<(std::ostream& os, const IVError& err) {
    os << "IVError{code=" << static_cast<int>(err.code)
       << ", iterations=" << err.iterations
       << ", final_error=" << err.final_error << "}";
    return os;
}

} // namespace kumquat
