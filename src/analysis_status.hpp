/**
 * @file analysis_status.hpp
 * @brief Structured success/failure metadata shared by every analysis entry point
 */

#ifndef VALUCALC_ANALYSIS_STATUS_HPP
#define VALUCALC_ANALYSIS_STATUS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace valucalc {

/**
 * @brief Category of a failed analysis
 */
enum class ErrorKind : uint8_t {
    None = 0,        ///< Analysis succeeded
    Validation = 1,  ///< Input rejected before computation
    Domain = 2,      ///< Degenerate model (perpetuity diverges, non-finite value)
    Data = 3,        ///< Input document could not be read
    Internal = 4     ///< Unexpected failure inside the engine
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Domain: return "domain";
        case ErrorKind::Data: return "data";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

/**
 * @brief Execution metadata for one analysis call
 */
struct AnalysisStatus {
    bool success = true;                 ///< True if the analysis produced a value
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;           ///< Set when success == false
    std::vector<std::string> warnings;   ///< Non-fatal issues (skipped methods, capped iterations)
    double execution_time_ms = 0.0;
};

/**
 * @brief Analysis result or structured failure
 *
 * Entry points of ValuationEngine return this instead of throwing, so a
 * caller can never be crashed by an invalid company or a degenerate model.
 */
template <typename T>
struct AnalysisOutcome : AnalysisStatus {
    std::optional<T> value;

    bool ok() const { return success && value.has_value(); }

    static AnalysisOutcome succeeded(T result) {
        AnalysisOutcome outcome;
        outcome.value = std::move(result);
        return outcome;
    }

    static AnalysisOutcome failed(ErrorKind kind, std::string message) {
        AnalysisOutcome outcome;
        outcome.success = false;
        outcome.error_kind = kind;
        outcome.error_message = std::move(message);
        return outcome;
    }
};

} // namespace valucalc

#endif // VALUCALC_ANALYSIS_STATUS_HPP
