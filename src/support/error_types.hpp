// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace bsm {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidGridSize,
    InvalidBounds,
    OutOfRange,
    InvalidOptionType,
    InvalidPurchasePrice
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Grid index for sweep errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Short name of a validation error code
inline const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidSpotPrice:     return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidStrike:        return "InvalidStrike";
        case ValidationErrorCode::InvalidMaturity:      return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility:    return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate:          return "InvalidRate";
        case ValidationErrorCode::InvalidGridSize:      return "InvalidGridSize";
        case ValidationErrorCode::InvalidBounds:        return "InvalidBounds";
        case ValidationErrorCode::OutOfRange:           return "OutOfRange";
        case ValidationErrorCode::InvalidOptionType:    return "InvalidOptionType";
        case ValidationErrorCode::InvalidPurchasePrice: return "InvalidPurchasePrice";
    }
    return "Unknown";
}

/// Human-readable message for front ends
inline std::string describe(const ValidationError& err) {
    std::string msg;
    switch (err.code) {
        case ValidationErrorCode::InvalidSpotPrice:
            msg = "Spot price must be positive and finite"; break;
        case ValidationErrorCode::InvalidStrike:
            msg = "Strike price must be positive and finite"; break;
        case ValidationErrorCode::InvalidMaturity:
            msg = "Time to maturity must be non-negative and finite"; break;
        case ValidationErrorCode::InvalidVolatility:
            msg = "Volatility must be positive and finite"; break;
        case ValidationErrorCode::InvalidRate:
            msg = "Risk-free rate must be finite"; break;
        case ValidationErrorCode::InvalidGridSize:
            msg = "Sweep axis must have at least one point"; break;
        case ValidationErrorCode::InvalidBounds:
            msg = "Sweep axis bounds must be finite with min <= max"; break;
        case ValidationErrorCode::OutOfRange:
            msg = "Parameter outside the supported input range"; break;
        case ValidationErrorCode::InvalidOptionType:
            msg = "Option type must be 'call' or 'put'"; break;
        case ValidationErrorCode::InvalidPurchasePrice:
            msg = "Purchase price must be non-negative and finite"; break;
    }
    return msg + " (got " + std::to_string(err.value) + ")";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

} // namespace bsm
