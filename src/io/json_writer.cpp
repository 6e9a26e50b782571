#include "json_writer.hpp"
#include "../errors.hpp"
#include <fstream>

using json = nlohmann::json;

namespace valucalc {

namespace {

json optional_json(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

json histogram_json(const std::vector<stats::HistogramBin>& histogram) {
    json bins = json::array();
    for (const stats::HistogramBin& bin : histogram) {
        bins.push_back({
            {"bin_lower", bin.bin_lower},
            {"bin_upper", bin.bin_upper},
            {"count", bin.count}
        });
    }
    return bins;
}

json distribution_json(const ParameterDistribution& dist) {
    return {
        {"type", distribution_to_string(dist.type)},
        {"mean", dist.mean},
        {"std", dist.std_dev}
    };
}

} // anonymous namespace

void to_json(json& j, const Company& company) {
    j = json{
        {"name", company.name},
        {"industry", company.industry},
        {"stage", stage_to_string(company.stage)},
        {"revenue", company.revenue},
        {"net_income", company.net_income},
        {"ebitda", optional_json(company.ebitda)},
        {"net_assets", optional_json(company.net_assets)},
        {"total_debt", company.total_debt},
        {"cash_and_equivalents", company.cash_and_equivalents},
        {"growth_rate", company.growth_rate},
        {"operating_margin", company.operating_margin},
        {"tax_rate", company.tax_rate},
        {"beta", company.beta},
        {"risk_free_rate", company.risk_free_rate},
        {"market_risk_premium", company.market_risk_premium},
        {"cost_of_debt", company.cost_of_debt},
        {"target_debt_ratio", company.target_debt_ratio},
        {"terminal_growth_rate", company.terminal_growth_rate}
    };
}

void to_json(json& j, const CashFlowForecast& forecast) {
    j = json{
        {"year", forecast.year},
        {"revenue", forecast.revenue},
        {"operating_profit", forecast.operating_profit},
        {"nopat", forecast.nopat},
        {"reinvestment", forecast.reinvestment},
        {"fcf", forecast.fcf},
        {"growth_rate", forecast.growth_rate}
    };
}

void to_json(json& j, const ValuationResult& result) {
    j = json{
        {"method", result.method()},
        {"value", result.value()},
        {"value_low", optional_json(result.value_low())},
        {"value_high", optional_json(result.value_high())},
        {"details", result.details()}
    };
    if (!result.forecasts().empty()) {
        j["forecasts"] = result.forecasts();
    }
}

void to_json(json& j, const MultipleStatistics& statistics) {
    j = json{
        {"count", statistics.count},
        {"mean", statistics.mean},
        {"median", statistics.median},
        {"std", statistics.std_dev},
        {"min", statistics.min},
        {"max", statistics.max}
    };
}

void to_json(json& j, const ScenarioConfig& scenario) {
    j = json{
        {"name", scenario.name},
        {"revenue_growth_adj", scenario.revenue_growth_adj},
        {"margin_adj", scenario.margin_adj},
        {"wacc_adj", scenario.wacc_adj},
        {"terminal_growth_adj", scenario.terminal_growth_adj}
    };
}

void to_json(json& j, const ScenarioComparison& comparison) {
    json results = json::object();
    json order = json::array();
    for (const ScenarioOutcome& outcome : comparison.scenarios) {
        json entry = outcome.result;
        entry["scenario"] = outcome.scenario;
        results[outcome.scenario.name] = entry;
        order.push_back(outcome.scenario.name);
    }

    const ScenarioStatistics& statistics = comparison.statistics;
    results[STATISTICS_KEY] = {
        {"count", statistics.count},
        {"mean", statistics.mean},
        {"median", statistics.median},
        {"std", statistics.std_dev},
        {"min", statistics.min},
        {"max", statistics.max},
        {"range", statistics.range}
    };

    json failures = json::array();
    for (const ScenarioFailure& failure : comparison.failures) {
        failures.push_back({{"name", failure.name}, {"message", failure.message}});
    }

    j = json{
        {"results", results},
        {"order", order},
        {"failures", failures}
    };
}

void to_json(json& j, const StressTestResult& result) {
    j = json{
        {"test_name", result.test_name},
        {"scenario_description", result.scenario_description},
        {"base_value", result.base_value},
        {"stressed_value", result.stressed_value},
        {"change_pct", result.change_pct},
        {"details", result.details}
    };
}

void to_json(json& j, const StressReport& report) {
    j = json{
        {"company", report.company_name},
        {"base_value", report.base_value},
        {"tests", {
            {"revenue_shock", report.revenue_shock},
            {"margin_compression", report.margin_compression},
            {"wacc_shock", report.wacc_shock},
            {"growth_slowdown", report.growth_slowdown},
            {"market_crash", report.market_crash}
        }},
        {"monte_carlo", report.monte_carlo ? json(*report.monte_carlo) : json(nullptr)},
        {"max_downside", report.max_downside}
    };
}

void to_json(json& j, const MonteCarloResult& result) {
    j = json{
        {"iterations_requested", result.iterations_requested},
        {"iterations", result.iterations},
        {"valid_iterations", result.valid_iterations},
        {"failed_iterations", result.failed_iterations},
        {"statistics", {
            {"mean", result.mean},
            {"median", result.median},
            {"std", result.std_dev},
            {"min", result.min},
            {"max", result.max},
            {"cte_95", result.cte_95}
        }},
        {"percentiles", {
            {"p5", result.percentile_5},
            {"p10", result.percentile_10},
            {"p25", result.percentile_25},
            {"p75", result.percentile_75},
            {"p90", result.percentile_90},
            {"p95", result.percentile_95}
        }},
        {"histogram", histogram_json(result.histogram)},
        {"warning", result.warning ? json(*result.warning) : json(nullptr)},
        {"seed", result.seed ? json(*result.seed) : json(nullptr)},
        {"execution_time_ms", result.execution_time_ms}
    };
    if (!result.values.empty()) {
        j["values"] = result.values;
    }
}

void to_json(json& j, const OneWayResult& result) {
    json points = json::array();
    for (const SensitivityPoint& point : result.points) {
        points.push_back({
            {"parameter_value", point.parameter_value},
            {"value", optional_json(point.value)}
        });
    }

    j = json{
        {"parameter", parameter_to_string(result.parameter)},
        {"points", points},
        {"min_valuation", optional_json(result.min_valuation)},
        {"max_valuation", optional_json(result.max_valuation)},
        {"valuation_range", result.valuation_range},
        {"base_parameter_value", result.base_parameter_value},
        {"base_value", result.base_value},
        {"impact_percentage", result.impact_percentage},
        {"elasticity", optional_json(result.elasticity)},
        {"failed_points", result.failed_points}
    };
}

void to_json(json& j, const TwoWayResult& result) {
    json grid = json::array();
    for (const auto& row : result.grid) {
        json cells = json::array();
        for (const auto& cell : row) {
            cells.push_back(optional_json(cell));
        }
        grid.push_back(cells);
    }

    j = json{
        {"row_parameter", parameter_to_string(result.row_parameter)},
        {"column_parameter", parameter_to_string(result.column_parameter)},
        {"row_values", result.row_values},
        {"column_values", result.column_values},
        {"grid", grid},
        {"min_valuation", optional_json(result.min_valuation)},
        {"max_valuation", optional_json(result.max_valuation)},
        {"failed_cells", result.failed_cells}
    };
}

void to_json(json& j, const TornadoBar& bar) {
    j = json{
        {"parameter", parameter_to_string(bar.parameter)},
        {"low_parameter_value", bar.low_parameter_value},
        {"high_parameter_value", bar.high_parameter_value},
        {"value_at_low", optional_json(bar.value_at_low)},
        {"value_at_high", optional_json(bar.value_at_high)},
        {"valuation_range", bar.valuation_range},
        {"impact_percentage", bar.impact_percentage}
    };
}

void to_json(json& j, const ComprehensiveSensitivity& result) {
    json parameters = json::object();
    for (const OneWayResult& sweep : result.parameters) {
        parameters[parameter_to_string(sweep.parameter)] = sweep;
    }

    j = json{
        {"base_value", result.base_value},
        {"parameters", parameters},
        {"tornado", result.tornado}
    };
}

void to_json(json& j, const Recommendation& recommendation) {
    j = json{
        {"value", recommendation.value},
        {"value_low", recommendation.value_low},
        {"value_high", recommendation.value_high},
        {"confidence", confidence_to_string(recommendation.confidence)},
        {"coefficient_of_variation", recommendation.coefficient_of_variation},
        {"methods_used", recommendation.methods_used}
    };
}

void to_json(json& j, const ProductValuation& product) {
    j = json{
        {"name", product.name},
        {"revenue_weight", product.revenue_weight},
        {"pv_forecasts", product.pv_forecasts},
        {"terminal_value", product.terminal_value},
        {"pv_terminal", product.pv_terminal},
        {"enterprise_value", product.enterprise_value},
        {"current_revenue", product.current_revenue},
        {"terminal_revenue", product.terminal_revenue},
        {"revenue_cagr", product.revenue_cagr},
        {"beta_wacc", optional_json(product.beta_wacc)},
        {"forecasts", product.forecasts}
    };
}

void to_json(json& j, const MultiProductValuation& valuation) {
    json breakdown = json::object();
    for (const ProductValuation& product : valuation.products) {
        breakdown[product.name] = product.enterprise_value;
    }
    json contributions = json::array();
    for (const ProductContribution& entry : valuation.contributions) {
        contributions.push_back(json{
            {"product", entry.name},
            {"contribution", entry.contribution},
            {"contribution_pct", entry.contribution * 100.0}
        });
    }

    j = json{
        {"wacc", valuation.wacc},
        {"total_enterprise_value", valuation.total_enterprise_value},
        {"net_debt", valuation.net_debt},
        {"total_equity_value", valuation.total_equity_value},
        {"total_revenue", valuation.total_revenue},
        {"products", valuation.products},
        {"value_breakdown", breakdown},
        {"product_contribution", contributions},
        {"consolidated_forecasts", valuation.consolidated_forecasts}
    };
}

void to_json(json& j, const FullValuation& valuation) {
    j = json{
        {"company", valuation.company_name},
        {"industry", valuation.industry},
        {"stage", stage_to_string(valuation.stage)},
        {"primary_method", valuation.primary_method},
        {"suggested_methods", valuation.suggested_methods},
        {"relative", io::relative_results_json(valuation.relative)},
        {"weighted_relative",
            valuation.weighted_relative ? json(*valuation.weighted_relative) : json(nullptr)},
        {"dcf", valuation.dcf ? json(*valuation.dcf) : json(nullptr)},
        {"vc", valuation.vc ? json(*valuation.vc) : json(nullptr)},
        {"scenarios", valuation.scenarios ? json(*valuation.scenarios) : json(nullptr)},
        {"stress", valuation.stress ? json(*valuation.stress) : json(nullptr)},
        {"sensitivity", valuation.sensitivity ? json(*valuation.sensitivity) : json(nullptr)},
        {"recommendation",
            valuation.recommendation ? json(*valuation.recommendation) : json(nullptr)}
    };
}

void to_json(json& j, const AnalysisStatus& status) {
    j = json{
        {"success", status.success},
        {"error_kind", error_kind_to_string(status.error_kind)},
        {"error_message", status.error_message},
        {"warnings", status.warnings},
        {"execution_time_ms", status.execution_time_ms}
    };
}

namespace io {

json relative_results_json(const RelativeResults& results) {
    json j = json::object();
    for (const auto& [method, result] : results) {
        j[method_to_string(method)] = result;
    }
    return j;
}

json comparable_statistics_json(const std::map<RelativeMethod, MultipleStatistics>& statistics) {
    json j = json::object();
    for (const auto& [method, entry] : statistics) {
        j[method_to_string(method)] = entry;
    }
    return j;
}

json monte_carlo_config_json(const MonteCarloConfig& config) {
    return {
        {"iterations", config.iterations},
        {"max_iterations", config.max_iterations},
        {"histogram_bins", config.histogram_bins},
        {"distributions", {
            {"growth_rate", distribution_json(config.growth)},
            {"operating_margin", distribution_json(config.margin)},
            {"wacc", distribution_json(config.wacc)},
            {"terminal_growth", distribution_json(config.terminal_growth)}
        }}
    };
}

void write_json(std::ostream& os, const json& document, bool pretty_print) {
    os << document.dump(pretty_print ? 2 : -1) << "\n";
}

void write_json(const std::string& filepath, const json& document, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw DataError("Failed to open output file: " + filepath);
    }
    write_json(file, document, pretty_print);
}

} // namespace io
} // namespace valucalc
