#ifndef VALUCALC_OTHER_METHODS_HPP
#define VALUCALC_OTHER_METHODS_HPP

#include "company.hpp"
#include "valuation_result.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

// Share of the summed parts deducted for corporate overhead
constexpr double DEFAULT_CORPORATE_DISCOUNT = 0.1;

// Metric an exit multiple is applied to
enum class ExitMetric : uint8_t {
    Earnings = 0,   // P/E on projected net income
    Revenue = 1     // P/S on projected revenue
};

std::string exit_metric_to_string(ExitMetric metric);
ExitMetric exit_metric_from_string(const std::string& value);

// Venture capital method (backward induction)
//
// value = exit_valuation / target_return_multiple. When exit_multiple is
// given and the chosen metric is positive, exit_valuation is replaced by
// metric * (1 + growth)^investment_years * exit_multiple.
// details: exit_valuation, target_return_multiple, investment_years,
// implied_irr, exit_multiple (when given).
ValuationResult vc_method(
    const Company& company,
    double exit_valuation,
    double target_return_multiple = 10.0,
    uint8_t investment_years = 5,
    ExitMetric exit_metric = ExitMetric::Earnings,
    std::optional<double> exit_multiple = std::nullopt);

// Settings for the projected-earnings VC method used by the engine
struct VcConfig {
    uint8_t projection_years = 5;
    double target_pe = 20.0;
    double target_return_multiple = 10.0;
    double margin_improvement = 0.0;    // extra yearly earnings growth, applied when > 0
};

// Venture capital method on projected earnings
//
// Net income compounds at growth_rate (and 1 + margin_improvement when that
// is positive) for projection_years; the exit is future net income times
// target_pe, discounted back by target_return_multiple.
// details: future_net_income, target_pe, exit_valuation,
// target_return_multiple, projection_years, implied_irr.
ValuationResult vc_method_with_future_projection(
    const Company& company,
    uint8_t projection_years = 5,
    double target_pe = 20.0,
    double target_return_multiple = 10.0,
    double margin_improvement = 0.0);

// Cost (net asset) method: (net_assets + intangibles + goodwill) * factor
// Throws ValidationError when the company reports no net_assets.
ValuationResult cost_method(
    const Company& company,
    double intangible_asset_value = 0.0,
    double goodwill_value = 0.0,
    double adjustment_factor = 1.0);

// Net assets after fair-value adjustments to individual line items
// value = net_assets + sum(asset adjustments) - sum(liability adjustments)
ValuationResult adjusted_net_asset_method(
    const Company& company,
    const std::map<std::string, double>& asset_adjustments,
    const std::map<std::string, double>& liability_adjustments);

// A precedent private-market deal
struct Transaction {
    std::string company_name;
    std::string round;
    std::optional<double> deal_value;
    std::optional<double> metric_value;
    std::optional<double> multiple;
};

// Median precedent multiple applied to net income, or to revenue for a
// loss-making company. Deals without a positive multiple are ignored.
// Throws ValidationError without usable deals and DomainError when the
// company has neither positive net income nor revenue.
ValuationResult transaction_comparable(
    const Company& company,
    const std::vector<Transaction>& transactions);

// Probability-weighted success / failure outcome
ValuationResult first_chicago_method(
    double success_value,
    double failure_value,
    double probability_of_success = 0.3);

struct BusinessUnit {
    std::string name;
    std::optional<double> revenue;
    std::optional<double> multiple;
    std::optional<double> value;    // takes precedence over revenue * multiple
};

// Sum of the unit values less a corporate discount
// Units with neither a value nor both revenue and multiple are skipped.
// details: parts_value, corporate_discount, unit_count, and "unit:<name>" per
// unit that contributed.
ValuationResult sum_of_parts_valuation(
    const std::vector<BusinessUnit>& units,
    double corporate_discount = DEFAULT_CORPORATE_DISCOUNT);

// Methods suited to a development stage, most appropriate first
std::vector<std::string> stage_appropriate_methods(CompanyStage stage);

} // namespace valucalc

#endif // VALUCALC_OTHER_METHODS_HPP
