#include "scenario.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace valucalc {

std::vector<ScenarioConfig> default_scenarios() {
    return {
        {"base", 0.0, 0.0, 0.0, 0.0},
        {"bull", 0.20, 0.05, -0.01, 0.005},
        {"bear", -0.20, -0.05, 0.02, -0.005}
    };
}

std::vector<WeightedScenario> default_weighted_scenarios() {
    std::vector<ScenarioConfig> scenarios = default_scenarios();
    return {
        {scenarios[1], 0.2},
        {scenarios[0], 0.5},
        {scenarios[2], 0.3}
    };
}

namespace {

void validate_scenario(const ScenarioConfig& scenario) {
    if (scenario.name.empty()) {
        throw ValidationError("scenario name must not be empty");
    }
    if (scenario.name == STATISTICS_KEY) {
        throw ValidationError("scenario name 'statistics' is reserved");
    }
    if (!std::isfinite(scenario.revenue_growth_adj) || !std::isfinite(scenario.margin_adj) ||
        !std::isfinite(scenario.wacc_adj) || !std::isfinite(scenario.terminal_growth_adj)) {
        throw ValidationError("scenario '" + scenario.name + "' has a non-finite adjustment");
    }
}

void validate_unique_names(const std::vector<std::string>& names) {
    std::set<std::string> seen;
    for (const std::string& name : names) {
        if (!seen.insert(name).second) {
            throw ValidationError("duplicate scenario name '" + name + "'");
        }
    }
}

} // anonymous namespace

DcfOverrides apply_scenario(const Company& company, const ScenarioConfig& scenario) {
    validate_scenario(scenario);

    DcfOverrides overrides;
    overrides.growth_rate = company.growth_rate + scenario.revenue_growth_adj;
    overrides.operating_margin = std::clamp(
        company.operating_margin + scenario.margin_adj, 0.0, MAX_SCENARIO_MARGIN);
    overrides.terminal_growth_rate = company.terminal_growth_rate + scenario.terminal_growth_adj;
    overrides.wacc_adjustment = scenario.wacc_adj;
    return overrides;
}

ValuationResult run_scenario(const Company& company,
                             const ScenarioConfig& scenario,
                             const DcfConfig& config) {
    return dcf_valuation(company, apply_scenario(company, scenario), config);
}

const ValuationResult* ScenarioComparison::find(const std::string& name) const {
    for (const ScenarioOutcome& outcome : scenarios) {
        if (outcome.scenario.name == name) {
            return &outcome.result;
        }
    }
    return nullptr;
}

ScenarioComparison compare_scenarios(
    const Company& company,
    const std::vector<ScenarioConfig>& scenarios,
    const DcfConfig& config)
{
    validate_company(company);

    std::vector<std::string> names;
    names.reserve(scenarios.size());
    for (const ScenarioConfig& scenario : scenarios) {
        validate_scenario(scenario);
        names.push_back(scenario.name);
    }
    validate_unique_names(names);

    ScenarioComparison comparison;
    std::vector<double> values;

    for (const ScenarioConfig& scenario : scenarios) {
        try {
            ValuationResult result = run_scenario(company, scenario, config);
            values.push_back(result.value());
            comparison.scenarios.push_back(ScenarioOutcome{scenario, std::move(result)});
        } catch (const DomainError& e) {
            comparison.failures.push_back(ScenarioFailure{scenario.name, e.what()});
        }
    }

    ScenarioStatistics& statistics = comparison.statistics;
    statistics.count = values.size();
    if (!values.empty()) {
        auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
        statistics.mean = stats::mean(values);
        statistics.median = stats::median(values);
        statistics.std_dev = stats::std_dev(values, statistics.mean);
        statistics.min = *min_it;
        statistics.max = *max_it;
        statistics.range = statistics.max - statistics.min;
    }

    return comparison;
}

ValuationResult scenario_probability_analysis(
    const Company& company,
    const std::vector<WeightedScenario>& scenarios,
    const DcfConfig& config)
{
    validate_company(company);
    if (scenarios.empty()) {
        throw ValidationError("probability analysis needs at least one scenario");
    }

    std::vector<std::string> names;
    double total_probability = 0.0;
    for (const WeightedScenario& weighted : scenarios) {
        validate_scenario(weighted.scenario);
        if (!std::isfinite(weighted.probability) || weighted.probability < 0.0) {
            throw ValidationError("probability of scenario '" + weighted.scenario.name +
                                  "' must be finite and >= 0");
        }
        names.push_back(weighted.scenario.name);
        total_probability += weighted.probability;
    }
    validate_unique_names(names);
    if (total_probability <= 0.0) {
        throw ValidationError("scenario probabilities must sum to a positive number");
    }

    double expected_value = 0.0;
    double low = 0.0;
    double high = 0.0;
    bool first = true;
    std::map<std::string, double> details;

    for (const WeightedScenario& weighted : scenarios) {
        double value = run_scenario(company, weighted.scenario, config).value();
        double probability = weighted.probability / total_probability;
        double contribution = value * probability;

        expected_value += contribution;
        low = first ? value : std::min(low, value);
        high = first ? value : std::max(high, value);
        first = false;

        const std::string& name = weighted.scenario.name;
        details["value_" + name] = value;
        details["probability_" + name] = probability;
        details["contribution_" + name] = contribution;
    }
    details["total_probability"] = total_probability;

    return ValuationResult("Probability-weighted", expected_value, low, high,
                           std::move(details));
}

} // namespace valucalc
