#ifndef VALUCALC_ENGINE_CONFIG_HPP
#define VALUCALC_ENGINE_CONFIG_HPP

#include "dcf.hpp"
#include "other_methods.hpp"
#include "relative_valuation.hpp"
#include "scenario.hpp"
#include "sensitivity.hpp"
#include "stress_test.hpp"
#include <string>
#include <vector>

namespace valucalc {

/**
 * @brief Every analysis setting of one engine run
 *
 * Passed explicitly into the engine; nothing here is process-wide, so
 * concurrent runs with different assumptions cannot interfere.
 * The Monte Carlo settings live in stress.monte_carlo and are shared by the
 * standalone simulation and the stress report.
 */
struct EngineConfig {
    DcfConfig dcf;
    RelativeValuationConfig relative;
    std::vector<RelativeMethod> relative_methods =
        std::vector<RelativeMethod>(ALL_RELATIVE_METHODS.begin(), ALL_RELATIVE_METHODS.end());
    std::vector<ScenarioConfig> scenarios = default_scenarios();
    std::vector<WeightedScenario> scenario_probabilities = default_weighted_scenarios();
    StressConfig stress;
    SensitivityConfig sensitivity;
    VcConfig vc;                    ///< early-stage venture capital method
    bool risk_analysis = true;      ///< full valuation runs scenarios, stress and sensitivity
};

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * Every section and key is optional; missing values keep their defaults.
 * Unknown keys are rejected so that typos do not silently fall back.
 *
 * @throws DataError if the JSON is malformed
 * @throws ValidationError if a key is unknown or a value has the wrong type
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * @throws DataError if the file cannot be read or the JSON is malformed
 * @throws ValidationError if the configuration is invalid
 */
EngineConfig load_engine_config(const std::string& file_path);

} // namespace valucalc

#endif // VALUCALC_ENGINE_CONFIG_HPP
