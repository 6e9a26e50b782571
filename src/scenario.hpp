#ifndef VALUCALC_SCENARIO_HPP
#define VALUCALC_SCENARIO_HPP

#include "company.hpp"
#include "dcf.hpp"
#include "valuation_result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

// Reserved for the aggregate entry in serialized comparisons
constexpr const char* STATISTICS_KEY = "statistics";

// Operating margin after a scenario adjustment is clamped into [0, MAX]
constexpr double MAX_SCENARIO_MARGIN = 0.99;

// Named bundle of additive adjustments to the base Company drivers
struct ScenarioConfig {
    std::string name;
    double revenue_growth_adj = 0.0;
    double margin_adj = 0.0;
    double wacc_adj = 0.0;
    double terminal_growth_adj = 0.0;
};

// base (no adjustment), bull, bear
std::vector<ScenarioConfig> default_scenarios();

// Kernel overrides for a scenario; the company itself is left untouched
DcfOverrides apply_scenario(const Company& company, const ScenarioConfig& scenario);

ValuationResult run_scenario(const Company& company,
                             const ScenarioConfig& scenario,
                             const DcfConfig& config = DcfConfig());

struct ScenarioOutcome {
    ScenarioConfig scenario;
    ValuationResult result;
};

struct ScenarioFailure {
    std::string name;
    std::string message;
};

// Distribution of the successful scenario values
struct ScenarioStatistics {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double std_dev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;    // max - min
};

// Scenario results in input order, with the statistics kept apart so that
// enumerating scenarios never yields the aggregate
struct ScenarioComparison {
    std::vector<ScenarioOutcome> scenarios;
    std::vector<ScenarioFailure> failures;
    ScenarioStatistics statistics;

    const ValuationResult* find(const std::string& name) const;
};

// Evaluate every scenario in order
// A scenario whose DCF hits a DomainError lands in failures. Scenario names
// must be unique and may not be "statistics" (ValidationError).
ScenarioComparison compare_scenarios(
    const Company& company,
    const std::vector<ScenarioConfig>& scenarios = default_scenarios(),
    const DcfConfig& config = DcfConfig());

struct WeightedScenario {
    ScenarioConfig scenario;
    double probability;
};

// bull 0.2, base 0.5, bear 0.3
std::vector<WeightedScenario> default_weighted_scenarios();

// Probability-weighted expected value over the scenarios
// Probabilities are normalized by their sum. value_low/value_high are the
// smallest and largest scenario values; details carry value_<name>,
// probability_<name> and contribution_<name> per scenario.
ValuationResult scenario_probability_analysis(
    const Company& company,
    const std::vector<WeightedScenario>& scenarios = default_weighted_scenarios(),
    const DcfConfig& config = DcfConfig());

} // namespace valucalc

#endif // VALUCALC_SCENARIO_HPP
