#ifndef VALUCALC_MULTI_PRODUCT_HPP
#define VALUCALC_MULTI_PRODUCT_HPP

#include "company.hpp"
#include "dcf.hpp"
#include "valuation_result.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

constexpr size_t MAX_PRODUCTS = 10;

// Revenue weights must sum to 1 within this tolerance
constexpr double PRODUCT_WEIGHT_TOLERANCE = 0.01;

// One product line or business segment valued on its own cash flows
//
// growth_rate_years[y - 1] is the revenue growth of forecast year y; years
// past the end of the list grow at terminal_growth_rate.
struct ProductSegment {
    std::string name;
    double current_revenue = 0.0;
    double revenue_weight = 0.0;

    std::vector<double> growth_rate_years = {0.15, 0.15, 0.15, 0.15, 0.15};
    double terminal_growth_rate = 0.025;

    double gross_margin = 0.5;
    double operating_margin = 0.2;

    double capex_ratio = 0.05;
    double wc_change_ratio = 0.02;
    double depreciation_ratio = 0.03;

    std::optional<double> beta;
};

// Throws ValidationError naming the first offending product or field:
// empty list, more than MAX_PRODUCTS, duplicate or empty names, weights not
// summing to 1, revenue <= 0, weight outside (0, 1], margins outside [0, 1],
// negative capital ratios or beta, empty growth list, growth outside
// [-0.5, 1].
void validate_products(const std::vector<ProductSegment>& products);

// Explicit-period forecast for one product: exactly horizon_years records
// reinvestment = revenue * (capex + wc_change - depreciation).
std::vector<CashFlowForecast> forecast_product_cash_flows(
    const ProductSegment& product,
    uint8_t horizon_years = DEFAULT_HORIZON_YEARS,
    double tax_rate = 0.25);

struct ProductValuation {
    std::string name;
    double revenue_weight;
    double pv_forecasts;
    double terminal_value;
    double pv_terminal;
    double enterprise_value;
    double current_revenue;
    double terminal_revenue;
    double revenue_cagr;
    std::optional<double> beta_wacc;   // reported only; the company rate discounts
    std::vector<CashFlowForecast> forecasts;
};

// DCF of one product at the given discount rate
// Throws DomainError when the perpetuity spread is below MIN_WACC_SPREAD.
ProductValuation calculate_product_valuation(
    const ProductSegment& product,
    double wacc,
    double tax_rate,
    const DcfConfig& config = DcfConfig());

struct ProductContribution {
    std::string name;
    double contribution;    // share of total enterprise value
};

struct MultiProductValuation {
    double wacc;
    double total_enterprise_value;
    double net_debt;
    double total_equity_value;
    double total_revenue;
    std::vector<ProductValuation> products;           // input order
    std::vector<ProductContribution> contributions;   // largest first
    std::vector<CashFlowForecast> consolidated_forecasts;

    // Enterprise value of one product; throws std::out_of_range if unknown
    double value_of(const std::string& product_name) const;
};

// Year-by-year sum of the product forecasts
// growth_rate is the consolidated revenue growth over the prior year.
std::vector<CashFlowForecast> consolidate_cash_flows(
    const std::vector<ProductValuation>& products,
    double total_current_revenue);

// Value every product at the company WACC and add them up
//
// equity = sum of product enterprise values - (total_debt - cash). The
// company supplies the tax rate, cost of capital inputs and balance sheet.
// Throws ValidationError for invalid inputs and DomainError for degenerate
// models.
MultiProductValuation multi_product_dcf_valuation(
    const Company& company,
    const std::vector<ProductSegment>& products,
    const DcfConfig& config = DcfConfig());

} // namespace valucalc

#endif // VALUCALC_MULTI_PRODUCT_HPP
