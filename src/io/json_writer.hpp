#ifndef VALUCALC_IO_JSON_WRITER_HPP
#define VALUCALC_IO_JSON_WRITER_HPP

#include "../analysis_status.hpp"
#include "../company.hpp"
#include "../monte_carlo.hpp"
#include "../multi_product.hpp"
#include "../relative_valuation.hpp"
#include "../scenario.hpp"
#include "../sensitivity.hpp"
#include "../stress_test.hpp"
#include "../valuation_engine.hpp"
#include "../valuation_result.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace valucalc {

// nlohmann/json serializers, found by argument-dependent lookup so that
// `nlohmann::json j = result;` works for every result type.
// Optional values serialize as null; enums as their lowercase names.
void to_json(nlohmann::json& j, const Company& company);
void to_json(nlohmann::json& j, const CashFlowForecast& forecast);
void to_json(nlohmann::json& j, const ValuationResult& result);
void to_json(nlohmann::json& j, const MultipleStatistics& statistics);
void to_json(nlohmann::json& j, const ScenarioConfig& scenario);
void to_json(nlohmann::json& j, const ScenarioComparison& comparison);
void to_json(nlohmann::json& j, const StressTestResult& result);
void to_json(nlohmann::json& j, const StressReport& report);
void to_json(nlohmann::json& j, const MonteCarloResult& result);
void to_json(nlohmann::json& j, const OneWayResult& result);
void to_json(nlohmann::json& j, const TwoWayResult& result);
void to_json(nlohmann::json& j, const TornadoBar& bar);
void to_json(nlohmann::json& j, const ComprehensiveSensitivity& result);
void to_json(nlohmann::json& j, const ProductValuation& product);
void to_json(nlohmann::json& j, const MultiProductValuation& valuation);
void to_json(nlohmann::json& j, const Recommendation& recommendation);
void to_json(nlohmann::json& j, const FullValuation& valuation);
void to_json(nlohmann::json& j, const AnalysisStatus& status);

namespace io {

// Method name -> result object, in method order
nlohmann::json relative_results_json(const RelativeResults& results);

// Method name -> statistics object
nlohmann::json comparable_statistics_json(
    const std::map<RelativeMethod, MultipleStatistics>& statistics);

// Iteration settings and distributions, recorded with stored bundles
nlohmann::json monte_carlo_config_json(const MonteCarloConfig& config);

// Status fields plus "result" (null for a failed outcome)
template <typename T>
nlohmann::json outcome_json(const AnalysisOutcome<T>& outcome) {
    nlohmann::json j = static_cast<const AnalysisStatus&>(outcome);
    j["result"] = outcome.value ? nlohmann::json(*outcome.value) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json outcome_json(const AnalysisOutcome<RelativeResults>& outcome) {
    nlohmann::json j = static_cast<const AnalysisStatus&>(outcome);
    j["result"] = outcome.value ? relative_results_json(*outcome.value) : nlohmann::json(nullptr);
    return j;
}

// Write a document; pretty printing indents by two spaces
void write_json(std::ostream& os, const nlohmann::json& document, bool pretty_print = true);

// Write a document to a file
// Throws DataError if the file cannot be opened.
void write_json(const std::string& filepath, const nlohmann::json& document,
                bool pretty_print = true);

} // namespace io
} // namespace valucalc

#endif // VALUCALC_IO_JSON_WRITER_HPP
