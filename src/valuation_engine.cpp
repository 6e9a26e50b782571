#include "valuation_engine.hpp"
#include "dcf.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <utility>

namespace valucalc {

std::string confidence_to_string(Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "high";
        case Confidence::Medium: return "medium";
        case Confidence::Low: return "low";
    }
    return "unknown";
}

std::optional<Recommendation> recommend(
    const std::vector<std::pair<std::string, double>>& method_values)
{
    std::vector<double> values;
    Recommendation recommendation;
    for (const auto& [method, value] : method_values) {
        if (std::isfinite(value) && value > 0.0) {
            values.push_back(value);
            recommendation.methods_used.push_back(method);
        }
    }
    if (values.empty()) {
        return std::nullopt;
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double mean = stats::mean(values);

    recommendation.value = stats::median(values);
    recommendation.value_low = *min_it * 0.9;
    recommendation.value_high = *max_it * 1.1;
    recommendation.coefficient_of_variation = stats::std_dev(values, mean) / mean;

    if (recommendation.coefficient_of_variation < 0.1) {
        recommendation.confidence = Confidence::High;
    } else if (recommendation.coefficient_of_variation < 0.2) {
        recommendation.confidence = Confidence::Medium;
    } else {
        recommendation.confidence = Confidence::Low;
    }
    return recommendation;
}

std::string select_primary_method(const Company& company) {
    switch (company.stage) {
        case CompanyStage::Early:
            return (company.revenue > 0.0 && company.net_income <= 0.0) ? "PS" : "VC";
        case CompanyStage::Growth:
            return company.net_income <= 0.0 ? "PS" : "DCF";
        case CompanyStage::Mature:
        case CompanyStage::Listed:
            return company.net_income > 0.0 ? "PE" : "DCF";
    }
    return "DCF";
}

namespace {

// Headline number reported in the completion event
std::optional<double> headline(const ValuationResult& result) { return result.value(); }
std::optional<double> headline(const RelativeResults&) { return std::nullopt; }
std::optional<double> headline(const StressReport& report) { return report.base_value; }
std::optional<double> headline(const MonteCarloResult& result) { return result.mean; }
std::optional<double> headline(const ComprehensiveSensitivity& result) { return result.base_value; }
std::optional<double> headline(const MultiProductValuation& result) {
    return result.total_equity_value;
}

std::optional<double> headline(const ScenarioComparison& comparison) {
    if (comparison.statistics.count == 0) {
        return std::nullopt;
    }
    return comparison.statistics.mean;
}

std::optional<double> headline(const FullValuation& valuation) {
    if (!valuation.recommendation) {
        return std::nullopt;
    }
    return valuation.recommendation->value;
}

AnalysisContext make_context(const std::string& run_id, const std::string& type,
                             const Company& company) {
    AnalysisContext ctx(run_id, type);
    ctx.company_name = company.name;
    ctx.industry = company.industry;
    return ctx;
}

// Run one analysis and turn engine errors into a failed outcome
template <typename T, typename Fn>
AnalysisOutcome<T> guarded(const AnalysisContext& ctx, Fn&& fn) {
    Logger& logger = Logger::get_instance();
    logger.log_analysis_start(ctx);

    auto start_time = std::chrono::high_resolution_clock::now();

    AnalysisOutcome<T> outcome;
    std::vector<std::string> warnings;
    try {
        outcome = AnalysisOutcome<T>::succeeded(fn(warnings));
    } catch (const ValidationError& e) {
        outcome = AnalysisOutcome<T>::failed(ErrorKind::Validation, e.what());
    } catch (const DomainError& e) {
        outcome = AnalysisOutcome<T>::failed(ErrorKind::Domain, e.what());
    } catch (const DataError& e) {
        outcome = AnalysisOutcome<T>::failed(ErrorKind::Data, e.what());
    } catch (const std::exception& e) {
        outcome = AnalysisOutcome<T>::failed(ErrorKind::Internal, e.what());
    }
    outcome.warnings = std::move(warnings);

    auto end_time = std::chrono::high_resolution_clock::now();
    outcome.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    if (!outcome.success) {
        logger.log_error(ctx, outcome.error_message, outcome.error_kind);
    }
    logger.log_analysis_complete(ctx, outcome,
                                 outcome.ok() ? headline(*outcome.value) : std::nullopt);
    return outcome;
}

std::string skip_reason(const Company& company, const std::vector<Comparable>& comparables,
                        RelativeMethod method) {
    switch (method) {
        case RelativeMethod::PE:
            if (company.net_income <= 0.0) return "company net_income <= 0";
            break;
        case RelativeMethod::PS:
            if (company.revenue <= 0.0) return "company revenue <= 0";
            break;
        case RelativeMethod::PB:
            if (!company.net_assets || *company.net_assets <= 0.0) {
                return "company net_assets unavailable or <= 0";
            }
            break;
        case RelativeMethod::EvEbitda:
            if (!company.ebitda || *company.ebitda <= 0.0) {
                return "company ebitda unavailable or <= 0";
            }
            break;
    }
    if (valid_multiples(comparables, method).empty()) {
        return "no comparable supplies a valid multiple";
    }
    return "not usable";
}

} // anonymous namespace

ValuationEngine::ValuationEngine(EngineConfig config, std::string run_id)
    : config_(std::move(config)), run_id_(std::move(run_id)) {}

AnalysisOutcome<RelativeResults> ValuationEngine::relative(
    const Company& company, const std::vector<Comparable>& comparables) const
{
    AnalysisContext ctx = make_context(run_id_, "relative", company);
    return guarded<RelativeResults>(ctx, [&](std::vector<std::string>& warnings) {
        RelativeResults all = auto_comparable_analysis(company, comparables, config_.relative);

        RelativeResults results;
        std::set<RelativeMethod> seen;
        for (RelativeMethod method : config_.relative_methods) {
            if (!seen.insert(method).second) {
                continue;
            }
            auto it = all.find(method);
            if (it != all.end()) {
                results.emplace(method, it->second);
                continue;
            }
            std::string reason = skip_reason(company, comparables, method);
            Logger::get_instance().log_method_skipped(ctx, method_to_string(method), reason);
            warnings.push_back(method_to_string(method) + " skipped: " + reason);
        }

        if (results.empty()) {
            warnings.push_back("relative valuation unavailable: no usable comparables");
        }
        return results;
    });
}

AnalysisOutcome<ValuationResult> ValuationEngine::dcf(const Company& company) const {
    AnalysisContext ctx = make_context(run_id_, "dcf", company);
    return guarded<ValuationResult>(ctx, [&](std::vector<std::string>&) {
        return dcf_valuation(company, DcfOverrides(), config_.dcf);
    });
}

AnalysisOutcome<ValuationResult> ValuationEngine::vc(const Company& company) const {
    AnalysisContext ctx = make_context(run_id_, "vc", company);
    return guarded<ValuationResult>(ctx, [&](std::vector<std::string>& warnings) {
        ValuationResult result = vc_method_with_future_projection(
            company, config_.vc.projection_years, config_.vc.target_pe,
            config_.vc.target_return_multiple, config_.vc.margin_improvement);
        if (company.net_income <= 0.0) {
            warnings.push_back("net_income <= 0; VC value is not positive");
        }
        return result;
    });
}

AnalysisOutcome<MultiProductValuation> ValuationEngine::multi_product(
    const Company& company, const std::vector<ProductSegment>& products) const
{
    AnalysisContext ctx = make_context(run_id_, "multi_product", company);
    return guarded<MultiProductValuation>(ctx, [&](std::vector<std::string>& warnings) {
        MultiProductValuation result = multi_product_dcf_valuation(company, products, config_.dcf);
        for (const ProductValuation& product : result.products) {
            if (product.enterprise_value <= 0.0) {
                warnings.push_back("product '" + product.name + "' has a non-positive value");
            }
        }
        return result;
    });
}

AnalysisOutcome<ScenarioComparison> ValuationEngine::scenarios(const Company& company) const {
    AnalysisContext ctx = make_context(run_id_, "scenario", company);
    return guarded<ScenarioComparison>(ctx, [&](std::vector<std::string>& warnings) {
        ScenarioComparison comparison = compare_scenarios(company, config_.scenarios, config_.dcf);
        for (const ScenarioFailure& failure : comparison.failures) {
            warnings.push_back("scenario '" + failure.name + "' failed: " + failure.message);
        }
        return comparison;
    });
}

AnalysisOutcome<ValuationResult> ValuationEngine::scenario_probabilities(
    const Company& company) const
{
    AnalysisContext ctx = make_context(run_id_, "scenario_probability", company);
    return guarded<ValuationResult>(ctx, [&](std::vector<std::string>&) {
        return scenario_probability_analysis(company, config_.scenario_probabilities, config_.dcf);
    });
}

AnalysisOutcome<StressReport> ValuationEngine::stress(const Company& company,
                                                      std::mt19937_64& rng) const {
    AnalysisContext ctx = make_context(run_id_, "stress", company);
    return guarded<StressReport>(ctx, [&](std::vector<std::string>& warnings) {
        StressReport report = generate_stress_report(company, config_.stress, rng, config_.dcf);
        if (report.monte_carlo && report.monte_carlo->warning) {
            warnings.push_back("monte carlo: " + *report.monte_carlo->warning);
        }
        return report;
    });
}

AnalysisOutcome<MonteCarloResult> ValuationEngine::monte_carlo(const Company& company,
                                                               std::mt19937_64& rng) const {
    AnalysisContext ctx = make_context(run_id_, "montecarlo", company);
    return guarded<MonteCarloResult>(ctx, [&](std::vector<std::string>& warnings) {
        MonteCarloResult result =
            monte_carlo_simulation(company, config_.stress.monte_carlo, rng, config_.dcf);
        if (result.warning) {
            warnings.push_back(*result.warning);
        }
        return result;
    });
}

AnalysisOutcome<ComprehensiveSensitivity> ValuationEngine::sensitivity(
    const Company& company) const
{
    AnalysisContext ctx = make_context(run_id_, "sensitivity", company);
    return guarded<ComprehensiveSensitivity>(ctx, [&](std::vector<std::string>& warnings) {
        ComprehensiveSensitivity result =
            comprehensive_sensitivity(company, config_.sensitivity, config_.dcf);
        for (const OneWayResult& sweep : result.parameters) {
            if (sweep.failed_points > 0) {
                warnings.push_back(parameter_to_string(sweep.parameter) + ": " +
                                   std::to_string(sweep.failed_points) +
                                   " sweep points failed closed");
            }
        }
        return result;
    });
}

AnalysisOutcome<FullValuation> ValuationEngine::full_valuation(
    const Company& company,
    const std::vector<Comparable>& comparables,
    std::mt19937_64& rng) const
{
    AnalysisContext ctx = make_context(run_id_, "full", company);
    return guarded<FullValuation>(ctx, [&](std::vector<std::string>& warnings) {
        validate_company(company);

        FullValuation valuation;
        valuation.company_name = company.name;
        valuation.industry = company.industry;
        valuation.stage = company.stage;
        valuation.primary_method = select_primary_method(company);
        valuation.suggested_methods = stage_appropriate_methods(company.stage);

        auto absorb = [&warnings](const std::string& analysis, const AnalysisStatus& status) {
            for (const std::string& warning : status.warnings) {
                warnings.push_back(analysis + ": " + warning);
            }
            if (!status.success) {
                warnings.push_back(analysis + " failed: " + status.error_message);
            }
        };

        std::vector<std::pair<std::string, double>> method_values;

        if (!comparables.empty()) {
            AnalysisOutcome<RelativeResults> relative_outcome = relative(company, comparables);
            absorb("relative", relative_outcome);
            if (relative_outcome.ok()) {
                valuation.relative = std::move(*relative_outcome.value);
                valuation.weighted_relative =
                    weighted_relative_value(valuation.relative, config_.relative);
                for (const auto& [method, result] : valuation.relative) {
                    method_values.emplace_back(method_to_string(method), result.value());
                }
            }
        }

        AnalysisOutcome<ValuationResult> dcf_outcome = dcf(company);
        absorb("dcf", dcf_outcome);
        if (dcf_outcome.ok()) {
            method_values.emplace_back("DCF", dcf_outcome.value->value());
            valuation.dcf = std::move(dcf_outcome.value);
        }

        if (valuation.primary_method == "VC") {
            AnalysisOutcome<ValuationResult> vc_outcome = vc(company);
            absorb("vc", vc_outcome);
            if (vc_outcome.ok()) {
                method_values.emplace_back("VC", vc_outcome.value->value());
                valuation.vc = std::move(vc_outcome.value);
            }
        }

        if (config_.risk_analysis) {
            AnalysisOutcome<ScenarioComparison> scenario_outcome = scenarios(company);
            absorb("scenario", scenario_outcome);
            valuation.scenarios = std::move(scenario_outcome.value);

            AnalysisOutcome<StressReport> stress_outcome = stress(company, rng);
            absorb("stress", stress_outcome);
            valuation.stress = std::move(stress_outcome.value);

            AnalysisOutcome<ComprehensiveSensitivity> sensitivity_outcome = sensitivity(company);
            absorb("sensitivity", sensitivity_outcome);
            valuation.sensitivity = std::move(sensitivity_outcome.value);
        }

        valuation.recommendation = recommend(method_values);
        if (!valuation.recommendation) {
            warnings.push_back("no method produced a positive value; no recommendation");
        }
        return valuation;
    });
}

std::vector<AnalysisOutcome<FullValuation>> ValuationEngine::batch_valuation(
    const std::vector<Company>& companies,
    const std::vector<Comparable>& comparables) const
{
    EngineConfig batch_config = config_;
    batch_config.risk_analysis = false;
    ValuationEngine batch_engine(batch_config, run_id_);

    // Unused without risk analysis, but full_valuation takes one
    std::mt19937_64 rng(config_.stress.monte_carlo.seed.value_or(0));

    std::vector<AnalysisOutcome<FullValuation>> outcomes;
    outcomes.reserve(companies.size());
    for (const Company& company : companies) {
        outcomes.push_back(batch_engine.full_valuation(company, comparables, rng));
    }
    return outcomes;
}

} // namespace valucalc
