#include "other_methods.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>

namespace valucalc {

std::string exit_metric_to_string(ExitMetric metric) {
    switch (metric) {
        case ExitMetric::Earnings: return "PE";
        case ExitMetric::Revenue: return "PS";
    }
    return "unknown";
}

ExitMetric exit_metric_from_string(const std::string& value) {
    if (value == "PE" || value == "earnings") {
        return ExitMetric::Earnings;
    }
    if (value == "PS" || value == "revenue") {
        return ExitMetric::Revenue;
    }
    throw ValidationError("Unknown exit metric '" + value + "' (expected PE or PS)");
}

namespace {

void require_finite(const char* name, double value) {
    if (!std::isfinite(value)) {
        throw ValidationError(std::string(name) + " must be a finite number");
    }
}

void require_positive(const char* name, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ValidationError(std::string(name) + " must be a positive finite number");
    }
}

void require_years(const char* name, uint8_t years) {
    if (years == 0) {
        throw ValidationError(std::string(name) + " must be at least 1");
    }
}

double implied_irr(double return_multiple, uint8_t years) {
    return std::pow(return_multiple, 1.0 / static_cast<double>(years)) - 1.0;
}

void require_finite_value(const char* method, double value) {
    if (!std::isfinite(value)) {
        throw DomainError(std::string(method) + " produced a non-finite value");
    }
}

double net_assets_of(const Company& company, const char* method) {
    if (!company.net_assets) {
        throw ValidationError(std::string(method) + " requires net_assets");
    }
    return *company.net_assets;
}

} // anonymous namespace

// ============================================================================
// Venture capital method
// ============================================================================

ValuationResult vc_method(
    const Company& company,
    double exit_valuation,
    double target_return_multiple,
    uint8_t investment_years,
    ExitMetric exit_metric,
    std::optional<double> exit_multiple)
{
    validate_company(company);
    require_finite("exit_valuation", exit_valuation);
    require_positive("target_return_multiple", target_return_multiple);
    require_years("investment_years", investment_years);
    if (exit_multiple) {
        require_positive("exit_multiple", *exit_multiple);
    }

    if (exit_multiple) {
        double compounding = std::pow(1.0 + company.growth_rate,
                                      static_cast<double>(investment_years));
        if (exit_metric == ExitMetric::Earnings && company.net_income > 0.0) {
            exit_valuation = company.net_income * compounding * *exit_multiple;
        } else if (exit_metric == ExitMetric::Revenue && company.revenue > 0.0) {
            exit_valuation = company.revenue * compounding * *exit_multiple;
        }
    }

    double value = exit_valuation / target_return_multiple;
    require_finite_value("VC method", value);

    std::map<std::string, double> details;
    details["exit_valuation"] = exit_valuation;
    details["target_return_multiple"] = target_return_multiple;
    details["investment_years"] = static_cast<double>(investment_years);
    details["implied_irr"] = implied_irr(target_return_multiple, investment_years);
    if (exit_multiple) {
        details["exit_multiple"] = *exit_multiple;
    }

    return ValuationResult("VC", value, std::nullopt, std::nullopt, std::move(details));
}

ValuationResult vc_method_with_future_projection(
    const Company& company,
    uint8_t projection_years,
    double target_pe,
    double target_return_multiple,
    double margin_improvement)
{
    validate_company(company);
    require_years("projection_years", projection_years);
    require_positive("target_pe", target_pe);
    require_positive("target_return_multiple", target_return_multiple);
    require_finite("margin_improvement", margin_improvement);

    double yearly = 1.0 + company.growth_rate;
    if (margin_improvement > 0.0) {
        yearly *= 1.0 + margin_improvement;
    }

    double future_net_income = company.net_income;
    for (uint8_t year = 0; year < projection_years; ++year) {
        future_net_income *= yearly;
    }

    double exit_valuation = future_net_income * target_pe;
    double value = exit_valuation / target_return_multiple;
    require_finite_value("VC method", value);

    std::map<std::string, double> details;
    details["future_net_income"] = future_net_income;
    details["target_pe"] = target_pe;
    details["exit_valuation"] = exit_valuation;
    details["target_return_multiple"] = target_return_multiple;
    details["projection_years"] = static_cast<double>(projection_years);
    details["margin_improvement"] = margin_improvement;
    details["implied_irr"] = implied_irr(target_return_multiple, projection_years);

    return ValuationResult("VC", value, std::nullopt, std::nullopt, std::move(details));
}

// ============================================================================
// Asset-based methods
// ============================================================================

ValuationResult cost_method(
    const Company& company,
    double intangible_asset_value,
    double goodwill_value,
    double adjustment_factor)
{
    validate_company(company);
    double net_assets = net_assets_of(company, "cost method");
    require_finite("intangible_asset_value", intangible_asset_value);
    require_finite("goodwill_value", goodwill_value);
    if (!std::isfinite(adjustment_factor) || adjustment_factor < 0.0) {
        throw ValidationError("adjustment_factor must be a finite number >= 0");
    }

    double adjusted_net_assets = net_assets + intangible_asset_value + goodwill_value;
    double value = adjusted_net_assets * adjustment_factor;

    std::map<std::string, double> details;
    details["net_assets"] = net_assets;
    details["intangible_asset_value"] = intangible_asset_value;
    details["goodwill_value"] = goodwill_value;
    details["adjusted_net_assets"] = adjusted_net_assets;
    details["adjustment_factor"] = adjustment_factor;
    if (net_assets > 0.0) {
        details["price_to_book_ratio"] = value / net_assets;
    }

    return ValuationResult("Cost", value, std::nullopt, std::nullopt, std::move(details));
}

ValuationResult adjusted_net_asset_method(
    const Company& company,
    const std::map<std::string, double>& asset_adjustments,
    const std::map<std::string, double>& liability_adjustments)
{
    validate_company(company);
    double net_assets = net_assets_of(company, "adjusted net asset method");

    double total_assets = 0.0;
    for (const auto& [item, amount] : asset_adjustments) {
        if (!std::isfinite(amount)) {
            throw ValidationError("asset adjustment '" + item + "' must be finite");
        }
        total_assets += amount;
    }
    double total_liabilities = 0.0;
    for (const auto& [item, amount] : liability_adjustments) {
        if (!std::isfinite(amount)) {
            throw ValidationError("liability adjustment '" + item + "' must be finite");
        }
        total_liabilities += amount;
    }

    double value = net_assets + total_assets - total_liabilities;

    std::map<std::string, double> details;
    details["original_net_assets"] = net_assets;
    details["total_asset_adjustment"] = total_assets;
    details["total_liability_adjustment"] = total_liabilities;
    details["adjusted_net_assets"] = value;

    return ValuationResult("Adjusted net assets", value, std::nullopt, std::nullopt,
                           std::move(details));
}

// ============================================================================
// Precedent transactions
// ============================================================================

ValuationResult transaction_comparable(
    const Company& company,
    const std::vector<Transaction>& transactions)
{
    validate_company(company);

    std::vector<double> multiples;
    for (const Transaction& deal : transactions) {
        if (deal.multiple && std::isfinite(*deal.multiple) && *deal.multiple > 0.0) {
            multiples.push_back(*deal.multiple);
        }
    }
    if (multiples.empty()) {
        throw ValidationError("transaction method needs at least one deal with a positive multiple");
    }

    double metric_value = 0.0;
    bool revenue_based = false;
    if (company.net_income > 0.0) {
        metric_value = company.net_income;
    } else if (company.revenue > 0.0) {
        metric_value = company.revenue;
        revenue_based = true;
    } else {
        throw DomainError("transaction method needs positive net income or revenue");
    }

    auto [min_it, max_it] = std::minmax_element(multiples.begin(), multiples.end());
    double median_multiple = stats::median(multiples);
    double value = metric_value * median_multiple;

    std::map<std::string, double> details;
    details["transaction_count"] = static_cast<double>(transactions.size());
    details["usable_count"] = static_cast<double>(multiples.size());
    details["avg_multiple"] = stats::mean(multiples);
    details["median_multiple"] = median_multiple;
    details["min_multiple"] = *min_it;
    details["max_multiple"] = *max_it;
    details["metric_value"] = metric_value;
    details["revenue_based"] = revenue_based ? 1.0 : 0.0;

    return ValuationResult("Transaction", value, metric_value * *min_it,
                           metric_value * *max_it, std::move(details));
}

// ============================================================================
// Scenario-weighted and composite methods
// ============================================================================

ValuationResult first_chicago_method(
    double success_value,
    double failure_value,
    double probability_of_success)
{
    require_finite("success_value", success_value);
    require_finite("failure_value", failure_value);
    if (!std::isfinite(probability_of_success) ||
        probability_of_success < 0.0 || probability_of_success > 1.0) {
        throw ValidationError("probability_of_success must be in [0, 1]");
    }

    double value = success_value * probability_of_success +
                   failure_value * (1.0 - probability_of_success);

    std::map<std::string, double> details;
    details["success_value"] = success_value;
    details["failure_value"] = failure_value;
    details["probability_of_success"] = probability_of_success;

    return ValuationResult("First Chicago", value,
                           std::min(success_value, failure_value),
                           std::max(success_value, failure_value),
                           std::move(details));
}

ValuationResult sum_of_parts_valuation(
    const std::vector<BusinessUnit>& units,
    double corporate_discount)
{
    if (!std::isfinite(corporate_discount) || corporate_discount < 0.0 ||
        corporate_discount >= 1.0) {
        throw ValidationError("corporate_discount must be in [0, 1)");
    }

    std::map<std::string, double> details;
    double parts_value = 0.0;
    size_t unit_count = 0;

    for (const BusinessUnit& unit : units) {
        double unit_value = 0.0;
        if (unit.value) {
            unit_value = *unit.value;
        } else if (unit.revenue && unit.multiple) {
            unit_value = *unit.revenue * *unit.multiple;
        } else {
            continue;
        }
        if (!std::isfinite(unit_value)) {
            throw ValidationError("business unit '" + unit.name + "' has a non-finite value");
        }

        parts_value += unit_value;
        details["unit:" + unit.name] += unit_value;
        unit_count++;
    }

    if (unit_count == 0) {
        throw ValidationError("sum of parts needs a unit with a value or revenue and multiple");
    }

    double discount = parts_value * corporate_discount;
    details["parts_value"] = parts_value;
    details["corporate_discount"] = discount;
    details["unit_count"] = static_cast<double>(unit_count);

    return ValuationResult("Sum of parts", parts_value - discount, std::nullopt, std::nullopt,
                           std::move(details));
}

std::vector<std::string> stage_appropriate_methods(CompanyStage stage) {
    switch (stage) {
        case CompanyStage::Early: return {"VC", "Transaction"};
        case CompanyStage::Growth: return {"PS", "DCF", "VC"};
        case CompanyStage::Mature: return {"PE", "DCF", "EV/EBITDA"};
        case CompanyStage::Listed: return {"PE", "PB", "EV/EBITDA", "DCF"};
    }
    return {"DCF"};
}

} // namespace valucalc
