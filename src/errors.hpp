#ifndef VALUCALC_ERRORS_HPP
#define VALUCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace valucalc {

/**
 * @brief Base exception for all engine errors
 */
class ValuCalcError : public std::runtime_error {
public:
    explicit ValuCalcError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when input is rejected before any computation
 *
 * Missing required field, negative monetary value, tax rate outside [0,1),
 * unknown parameter name, invalid configuration value.
 */
class ValidationError : public ValuCalcError {
public:
    explicit ValidationError(const std::string& message)
        : ValuCalcError("Validation error: " + message) {}
};

/**
 * @brief Raised when the model itself is degenerate for the given inputs
 *
 * WACC not exceeding terminal growth (perpetuity diverges), a non-finite
 * valuation. DCF evaluation fails closed with this instead of returning
 * infinity or NaN.
 */
class DomainError : public ValuCalcError {
public:
    explicit DomainError(const std::string& message)
        : ValuCalcError("Domain error: " + message) {}
};

/**
 * @brief Raised when an input file or document cannot be read or parsed
 */
class DataError : public ValuCalcError {
public:
    explicit DataError(const std::string& message)
        : ValuCalcError("Data error: " + message) {}
};

} // namespace valucalc

#endif // VALUCALC_ERRORS_HPP
