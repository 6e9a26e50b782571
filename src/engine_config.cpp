#include "engine_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace valucalc {

namespace {

void require_object(const json& j, const std::string& section) {
    if (!j.is_object()) {
        throw ValidationError("'" + section + "' must be a JSON object");
    }
}

void check_keys(const json& j, const std::set<std::string>& allowed, const std::string& section) {
    require_object(j, section);
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            throw ValidationError("Unknown key '" + it.key() + "' in " + section);
        }
    }
}

template <typename T>
void read(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

std::vector<double> read_levels(const json& j, const char* key, const std::vector<double>& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return j.at(key).get<std::vector<double>>();
}

ScenarioConfig parse_scenario(const json& j, const std::set<std::string>& extra_keys = {}) {
    std::set<std::string> allowed = {
        "name", "revenue_growth_adj", "margin_adj", "wacc_adj", "terminal_growth_adj"
    };
    allowed.insert(extra_keys.begin(), extra_keys.end());
    check_keys(j, allowed, "scenario");

    if (!j.contains("name")) {
        throw ValidationError("Scenario missing required field: name");
    }

    ScenarioConfig scenario;
    scenario.name = j.at("name").get<std::string>();
    read(j, "revenue_growth_adj", scenario.revenue_growth_adj);
    read(j, "margin_adj", scenario.margin_adj);
    read(j, "wacc_adj", scenario.wacc_adj);
    read(j, "terminal_growth_adj", scenario.terminal_growth_adj);
    return scenario;
}

void parse_dcf(const json& j, DcfConfig& config) {
    check_keys(j, {"horizon_years", "terminal_method", "exit_multiple", "capex_ratio",
                   "working_capital_ratio", "depreciation_ratio"}, "dcf");

    if (j.contains("horizon_years")) {
        int years = j.at("horizon_years").get<int>();
        if (years < 1 || years > MAX_HORIZON_YEARS) {
            throw ValidationError("dcf.horizon_years must be between 1 and " +
                                  std::to_string(MAX_HORIZON_YEARS));
        }
        config.horizon_years = static_cast<uint8_t>(years);
    }
    if (j.contains("terminal_method")) {
        config.terminal_method = terminal_method_from_string(
            j.at("terminal_method").get<std::string>());
    }
    read(j, "exit_multiple", config.exit_multiple);
    read(j, "capex_ratio", config.capex_ratio);
    read(j, "working_capital_ratio", config.working_capital_ratio);
    read(j, "depreciation_ratio", config.depreciation_ratio);
}

void parse_relative(const json& j, EngineConfig& config) {
    check_keys(j, {"use_forward_metrics", "illiquidity_discount", "control_premium",
                   "weights", "methods"}, "relative");

    RelativeValuationConfig& relative = config.relative;
    read(j, "use_forward_metrics", relative.use_forward_metrics);
    read(j, "illiquidity_discount", relative.illiquidity_discount);
    read(j, "control_premium", relative.control_premium);

    if (j.contains("weights")) {
        const json& weights = j.at("weights");
        require_object(weights, "relative.weights");
        for (auto it = weights.begin(); it != weights.end(); ++it) {
            RelativeMethod method = method_from_string(it.key());
            relative.weights[static_cast<size_t>(method)] = it.value().get<double>();
        }
    }

    if (j.contains("methods")) {
        config.relative_methods.clear();
        for (const auto& name : j.at("methods")) {
            config.relative_methods.push_back(method_from_string(name.get<std::string>()));
        }
    }
}

ParameterDistribution parse_distribution(const json& j, ParameterDistribution dist,
                                         const std::string& name) {
    check_keys(j, {"type", "mean", "std"}, "monte_carlo.distributions." + name);
    if (j.contains("type")) {
        dist.type = distribution_from_string(j.at("type").get<std::string>());
    }
    read(j, "mean", dist.mean);
    read(j, "std", dist.std_dev);
    return dist;
}

void parse_monte_carlo(const json& j, MonteCarloConfig& config) {
    check_keys(j, {"iterations", "max_iterations", "seed", "histogram_bins",
                   "store_values", "distributions"}, "monte_carlo");

    read(j, "iterations", config.iterations);
    read(j, "max_iterations", config.max_iterations);
    read(j, "histogram_bins", config.histogram_bins);
    read(j, "store_values", config.store_values);
    if (j.contains("seed") && !j.at("seed").is_null()) {
        config.seed = j.at("seed").get<uint64_t>();
    }

    if (j.contains("distributions")) {
        const json& dists = j.at("distributions");
        check_keys(dists, {"growth_rate", "operating_margin", "wacc", "terminal_growth"},
                   "monte_carlo.distributions");
        if (dists.contains("growth_rate")) {
            config.growth = parse_distribution(dists.at("growth_rate"), config.growth, "growth_rate");
        }
        if (dists.contains("operating_margin")) {
            config.margin = parse_distribution(dists.at("operating_margin"), config.margin,
                                               "operating_margin");
        }
        if (dists.contains("wacc")) {
            config.wacc = parse_distribution(dists.at("wacc"), config.wacc, "wacc");
        }
        if (dists.contains("terminal_growth")) {
            config.terminal_growth = parse_distribution(dists.at("terminal_growth"),
                                                        config.terminal_growth, "terminal_growth");
        }
    }
}

void parse_stress(const json& j, StressConfig& config) {
    check_keys(j, {"revenue_shocks", "margin_compressions", "wacc_increases",
                   "growth_slowdown_factors", "crash", "run_monte_carlo"}, "stress");

    config.revenue_shocks = read_levels(j, "revenue_shocks", config.revenue_shocks);
    config.margin_compressions = read_levels(j, "margin_compressions", config.margin_compressions);
    config.wacc_increases = read_levels(j, "wacc_increases", config.wacc_increases);
    config.growth_slowdown_factors =
        read_levels(j, "growth_slowdown_factors", config.growth_slowdown_factors);
    read(j, "run_monte_carlo", config.run_monte_carlo);

    if (j.contains("crash")) {
        const json& crash = j.at("crash");
        check_keys(crash, {"revenue_change", "margin_compression", "wacc_increase"}, "stress.crash");
        read(crash, "revenue_change", config.crash.revenue_change);
        read(crash, "margin_compression", config.crash.margin_compression);
        read(crash, "wacc_increase", config.crash.wacc_increase);
    }
}

void parse_sensitivity(const json& j, SensitivityConfig& config) {
    check_keys(j, {"steps", "default_range_pct", "zero_base_range", "tornado_deltas"},
               "sensitivity");

    read(j, "steps", config.steps);
    read(j, "default_range_pct", config.default_range_pct);
    read(j, "zero_base_range", config.zero_base_range);

    if (j.contains("tornado_deltas")) {
        const json& deltas = j.at("tornado_deltas");
        require_object(deltas, "sensitivity.tornado_deltas");
        for (auto it = deltas.begin(); it != deltas.end(); ++it) {
            DcfParameter parameter = parameter_from_string(it.key());
            config.tornado_deltas[static_cast<size_t>(parameter)] = it.value().get<double>();
        }
    }
}

void parse_vc(const json& j, VcConfig& config) {
    check_keys(j, {"projection_years", "target_pe", "target_return_multiple",
                   "margin_improvement"}, "vc");

    if (j.contains("projection_years")) {
        int years = j.at("projection_years").get<int>();
        if (years < 1 || years > MAX_HORIZON_YEARS) {
            throw ValidationError("vc.projection_years must be between 1 and " +
                                  std::to_string(MAX_HORIZON_YEARS));
        }
        config.projection_years = static_cast<uint8_t>(years);
    }
    read(j, "target_pe", config.target_pe);
    read(j, "target_return_multiple", config.target_return_multiple);
    read(j, "margin_improvement", config.margin_improvement);
}

} // anonymous namespace

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);

        check_keys(j, {"dcf", "relative", "scenarios", "scenario_probabilities", "stress",
                       "monte_carlo", "sensitivity", "vc", "risk_analysis"}, "engine config");

        if (j.contains("dcf")) {
            parse_dcf(j.at("dcf"), config.dcf);
        }
        if (j.contains("relative")) {
            parse_relative(j.at("relative"), config);
        }

        if (j.contains("scenarios")) {
            config.scenarios.clear();
            for (const auto& scenario_json : j.at("scenarios")) {
                config.scenarios.push_back(parse_scenario(scenario_json));
            }
        }

        if (j.contains("scenario_probabilities")) {
            config.scenario_probabilities.clear();
            for (const auto& weighted_json : j.at("scenario_probabilities")) {
                if (!weighted_json.contains("probability")) {
                    throw ValidationError("Weighted scenario missing required field: probability");
                }
                WeightedScenario weighted{parse_scenario(weighted_json, {"probability"}),
                                          weighted_json.at("probability").get<double>()};
                config.scenario_probabilities.push_back(weighted);
            }
        }

        if (j.contains("stress")) {
            parse_stress(j.at("stress"), config.stress);
        }
        if (j.contains("monte_carlo")) {
            parse_monte_carlo(j.at("monte_carlo"), config.stress.monte_carlo);
        }
        if (j.contains("sensitivity")) {
            parse_sensitivity(j.at("sensitivity"), config.sensitivity);
        }
        if (j.contains("vc")) {
            parse_vc(j.at("vc"), config.vc);
        }
        read(j, "risk_analysis", config.risk_analysis);

    } catch (const json::parse_error& e) {
        throw DataError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ValidationError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ValidationError(std::string("JSON value out of range: ") + e.what());
    }

    return config;
}

EngineConfig load_engine_config(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_engine_config_from_string(buffer.str());
}

} // namespace valucalc
