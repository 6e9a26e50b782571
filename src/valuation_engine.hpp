/**
 * @file valuation_engine.hpp
 * @brief Facade over every analysis with structured outcomes
 *
 * Each entry point validates the company, runs one analysis with the
 * engine's configuration and returns an AnalysisOutcome. Validation, domain
 * and data errors become failed outcomes; nothing escapes to the caller.
 */

#ifndef VALUCALC_VALUATION_ENGINE_HPP
#define VALUCALC_VALUATION_ENGINE_HPP

#include "analysis_status.hpp"
#include "company.hpp"
#include "engine_config.hpp"
#include "monte_carlo.hpp"
#include "multi_product.hpp"
#include "other_methods.hpp"
#include "relative_valuation.hpp"
#include "scenario.hpp"
#include "sensitivity.hpp"
#include "stress_test.hpp"
#include "valuation_result.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace valucalc {

/**
 * @brief Agreement between the methods behind a recommendation
 */
enum class Confidence : uint8_t {
    High = 0,    ///< coefficient of variation < 0.1
    Medium = 1,  ///< coefficient of variation < 0.2
    Low = 2
};

std::string confidence_to_string(Confidence confidence);

/**
 * @brief Cross-method value recommendation
 */
struct Recommendation {
    double value;                           ///< median of the method values
    double value_low;                       ///< 0.9 * smallest method value
    double value_high;                      ///< 1.1 * largest method value
    Confidence confidence;
    double coefficient_of_variation;        ///< population std / mean
    std::vector<std::string> methods_used;  ///< methods with a positive value
};

/**
 * @brief Cross-validate method values into a recommendation
 *
 * Only positive values count. Returns nullopt when none is positive.
 */
std::optional<Recommendation> recommend(
    const std::vector<std::pair<std::string, double>>& method_values);

/**
 * @brief Preferred method for the company's development stage
 *
 * early: PS when loss-making with revenue, otherwise VC
 * growth: PS when loss-making, otherwise DCF
 * mature/listed: PE when profitable, otherwise DCF
 */
std::string select_primary_method(const Company& company);

/**
 * @brief Everything a full valuation produced
 *
 * Analyses that failed or were not requested are empty; their failure is
 * reported in the outcome's warnings.
 */
struct FullValuation {
    std::string company_name;
    std::string industry;
    CompanyStage stage = CompanyStage::Growth;
    std::string primary_method;
    std::vector<std::string> suggested_methods;   ///< stage_appropriate_methods(stage)
    RelativeResults relative;
    std::optional<ValuationResult> weighted_relative;
    std::optional<ValuationResult> dcf;
    std::optional<ValuationResult> vc;            ///< only when VC is the primary method
    std::optional<ScenarioComparison> scenarios;
    std::optional<StressReport> stress;
    std::optional<ComprehensiveSensitivity> sensitivity;
    std::optional<Recommendation> recommendation;
};

/**
 * @brief Entry point for every analysis of a company
 *
 * The engine holds only its configuration and a run identifier used as log
 * context; it is safe to share between threads. Randomized analyses take the
 * generator explicitly.
 */
class ValuationEngine {
public:
    explicit ValuationEngine(EngineConfig config = EngineConfig(),
                             std::string run_id = "valucalc");

    const EngineConfig& config() const { return config_; }
    const std::string& run_id() const { return run_id_; }

    /// Multiple-based valuation; skipped methods are reported as warnings
    AnalysisOutcome<RelativeResults> relative(
        const Company& company, const std::vector<Comparable>& comparables) const;

    AnalysisOutcome<ValuationResult> dcf(const Company& company) const;

    /// Venture capital method on projected earnings with the engine's VC settings
    AnalysisOutcome<ValuationResult> vc(const Company& company) const;

    /// Per-product DCF at the company WACC, consolidated into one value
    AnalysisOutcome<MultiProductValuation> multi_product(
        const Company& company, const std::vector<ProductSegment>& products) const;

    AnalysisOutcome<ScenarioComparison> scenarios(const Company& company) const;

    AnalysisOutcome<ValuationResult> scenario_probabilities(const Company& company) const;

    AnalysisOutcome<StressReport> stress(const Company& company, std::mt19937_64& rng) const;

    AnalysisOutcome<MonteCarloResult> monte_carlo(const Company& company,
                                                  std::mt19937_64& rng) const;

    AnalysisOutcome<ComprehensiveSensitivity> sensitivity(const Company& company) const;

    /**
     * @brief Relative (when comparables are given) + DCF + risk analysis
     *
     * An early-stage company whose primary method is VC also gets a VC value,
     * which joins the recommendation.
     * Individual analyses that fail are recorded as warnings and left empty.
     * Fails only when the company itself is invalid.
     */
    AnalysisOutcome<FullValuation> full_valuation(
        const Company& company,
        const std::vector<Comparable>& comparables,
        std::mt19937_64& rng) const;

    /// Full valuation of several companies without risk analysis
    std::vector<AnalysisOutcome<FullValuation>> batch_valuation(
        const std::vector<Company>& companies,
        const std::vector<Comparable>& comparables) const;

private:
    EngineConfig config_;
    std::string run_id_;
};

} // namespace valucalc

#endif // VALUCALC_VALUATION_ENGINE_HPP
