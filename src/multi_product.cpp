#include "multi_product.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace valucalc {

namespace {

void require_unit_range(const ProductSegment& product, const char* field, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ValidationError("product '" + product.name + "' " + field + " must be in [0, 1]");
    }
}

void require_non_negative(const ProductSegment& product, const char* field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError("product '" + product.name + "' " + field + " must be >= 0");
    }
}

void validate_product(const ProductSegment& product, size_t index) {
    if (product.name.empty()) {
        throw ValidationError("product " + std::to_string(index + 1) + " needs a name");
    }
    if (!std::isfinite(product.current_revenue) || product.current_revenue <= 0.0) {
        throw ValidationError("product '" + product.name + "' current_revenue must be > 0");
    }
    if (!std::isfinite(product.revenue_weight) || product.revenue_weight <= 0.0 ||
        product.revenue_weight > 1.0) {
        throw ValidationError("product '" + product.name + "' revenue_weight must be in (0, 1]");
    }
    require_unit_range(product, "gross_margin", product.gross_margin);
    require_unit_range(product, "operating_margin", product.operating_margin);
    require_non_negative(product, "capex_ratio", product.capex_ratio);
    require_non_negative(product, "wc_change_ratio", product.wc_change_ratio);
    require_non_negative(product, "depreciation_ratio", product.depreciation_ratio);
    if (product.beta) {
        require_non_negative(product, "beta", *product.beta);
    }
    if (!std::isfinite(product.terminal_growth_rate)) {
        throw ValidationError("product '" + product.name + "' terminal_growth_rate must be finite");
    }

    if (product.growth_rate_years.empty()) {
        throw ValidationError("product '" + product.name + "' needs at least one growth rate");
    }
    for (size_t year = 0; year < product.growth_rate_years.size(); ++year) {
        double growth = product.growth_rate_years[year];
        if (!std::isfinite(growth) || growth < -0.5 || growth > 1.0) {
            throw ValidationError("product '" + product.name + "' growth rate for year " +
                                  std::to_string(year + 1) + " must be in [-0.5, 1]");
        }
    }
}

} // anonymous namespace

void validate_products(const std::vector<ProductSegment>& products) {
    if (products.empty()) {
        throw ValidationError("at least one product is required");
    }
    if (products.size() > MAX_PRODUCTS) {
        throw ValidationError("at most " + std::to_string(MAX_PRODUCTS) +
                              " products are supported (got " +
                              std::to_string(products.size()) + ")");
    }

    std::set<std::string> names;
    double total_weight = 0.0;
    for (size_t i = 0; i < products.size(); ++i) {
        validate_product(products[i], i);
        if (!names.insert(products[i].name).second) {
            throw ValidationError("duplicate product name '" + products[i].name + "'");
        }
        total_weight += products[i].revenue_weight;
    }

    if (std::fabs(total_weight - 1.0) > PRODUCT_WEIGHT_TOLERANCE) {
        throw ValidationError("product revenue weights must sum to 1 (got " +
                              std::to_string(total_weight) + ")");
    }
}

// ============================================================================
// Per-product DCF
// ============================================================================

std::vector<CashFlowForecast> forecast_product_cash_flows(
    const ProductSegment& product,
    uint8_t horizon_years,
    double tax_rate)
{
    if (horizon_years == 0 || horizon_years > MAX_HORIZON_YEARS) {
        throw ValidationError("horizon_years must be between 1 and " +
                              std::to_string(MAX_HORIZON_YEARS));
    }
    double reinvestment_ratio =
        product.capex_ratio + product.wc_change_ratio - product.depreciation_ratio;

    std::vector<CashFlowForecast> forecasts;
    forecasts.reserve(horizon_years);

    double revenue = product.current_revenue;
    for (uint8_t year = 1; year <= horizon_years; ++year) {
        double growth = static_cast<size_t>(year) <= product.growth_rate_years.size()
                            ? product.growth_rate_years[year - 1]
                            : product.terminal_growth_rate;
        revenue *= (1.0 + growth);

        CashFlowForecast forecast;
        forecast.year = year;
        forecast.revenue = revenue;
        forecast.operating_profit = revenue * product.operating_margin;
        forecast.nopat = forecast.operating_profit * (1.0 - tax_rate);
        forecast.reinvestment = revenue * reinvestment_ratio;
        forecast.fcf = forecast.nopat - forecast.reinvestment;
        forecast.growth_rate = growth;

        forecasts.push_back(forecast);
    }
    return forecasts;
}

ProductValuation calculate_product_valuation(
    const ProductSegment& product,
    double wacc,
    double tax_rate,
    const DcfConfig& config)
{
    validate_dcf_config(config);
    if (!std::isfinite(wacc) || wacc <= -1.0) {
        throw DomainError("wacc must be a finite rate above -100%");
    }

    ProductValuation valuation;
    valuation.name = product.name;
    valuation.revenue_weight = product.revenue_weight;
    valuation.current_revenue = product.current_revenue;
    valuation.forecasts = forecast_product_cash_flows(product, config.horizon_years, tax_rate);

    double pv_forecasts = 0.0;
    double discount_factor = 1.0;
    for (const CashFlowForecast& forecast : valuation.forecasts) {
        discount_factor /= (1.0 + wacc);
        pv_forecasts += forecast.fcf * discount_factor;
    }

    valuation.terminal_value = calculate_terminal_value(
        valuation.forecasts.back().fcf, wacc, product.terminal_growth_rate,
        config.terminal_method, config.exit_multiple);

    valuation.pv_forecasts = pv_forecasts;
    valuation.pv_terminal = valuation.terminal_value * discount_factor;
    valuation.enterprise_value = pv_forecasts + valuation.pv_terminal;
    valuation.terminal_revenue = valuation.forecasts.back().revenue;
    valuation.revenue_cagr =
        std::pow(valuation.terminal_revenue / product.current_revenue,
                 1.0 / static_cast<double>(config.horizon_years)) - 1.0;

    if (!std::isfinite(valuation.enterprise_value)) {
        throw DomainError("product '" + product.name + "' produced a non-finite value");
    }
    return valuation;
}

// ============================================================================
// Consolidation
// ============================================================================

double MultiProductValuation::value_of(const std::string& product_name) const {
    for (const ProductValuation& product : products) {
        if (product.name == product_name) {
            return product.enterprise_value;
        }
    }
    throw std::out_of_range("unknown product: " + product_name);
}

std::vector<CashFlowForecast> consolidate_cash_flows(
    const std::vector<ProductValuation>& products,
    double total_current_revenue)
{
    size_t years = 0;
    for (const ProductValuation& product : products) {
        years = std::max(years, product.forecasts.size());
    }

    std::vector<CashFlowForecast> consolidated;
    consolidated.reserve(years);

    double previous_revenue = total_current_revenue;
    for (size_t y = 0; y < years; ++y) {
        CashFlowForecast total{};
        total.year = static_cast<uint8_t>(y + 1);
        for (const ProductValuation& product : products) {
            if (y >= product.forecasts.size()) {
                continue;
            }
            const CashFlowForecast& forecast = product.forecasts[y];
            total.revenue += forecast.revenue;
            total.operating_profit += forecast.operating_profit;
            total.nopat += forecast.nopat;
            total.reinvestment += forecast.reinvestment;
            total.fcf += forecast.fcf;
        }
        total.growth_rate = previous_revenue > 0.0 ? total.revenue / previous_revenue - 1.0 : 0.0;
        previous_revenue = total.revenue;
        consolidated.push_back(total);
    }
    return consolidated;
}

MultiProductValuation multi_product_dcf_valuation(
    const Company& company,
    const std::vector<ProductSegment>& products,
    const DcfConfig& config)
{
    validate_company(company);
    validate_products(products);
    validate_dcf_config(config);

    MultiProductValuation result;
    result.wacc = calculate_wacc(company);
    result.total_enterprise_value = 0.0;
    result.total_revenue = 0.0;
    result.products.reserve(products.size());

    for (const ProductSegment& product : products) {
        ProductValuation valuation =
            calculate_product_valuation(product, result.wacc, company.tax_rate, config);
        if (product.beta) {
            Company segment = company;
            segment.beta = *product.beta;
            valuation.beta_wacc = calculate_wacc(segment);
        }
        result.total_enterprise_value += valuation.enterprise_value;
        result.total_revenue += product.current_revenue;
        result.products.push_back(std::move(valuation));
    }

    result.net_debt = company.net_debt();
    result.total_equity_value = result.total_enterprise_value - result.net_debt;

    result.contributions.reserve(result.products.size());
    for (const ProductValuation& valuation : result.products) {
        double share = result.total_enterprise_value > 0.0
                           ? valuation.enterprise_value / result.total_enterprise_value
                           : 0.0;
        result.contributions.push_back(ProductContribution{valuation.name, share});
    }
    std::stable_sort(result.contributions.begin(), result.contributions.end(),
                     [](const ProductContribution& a, const ProductContribution& b) {
                         return a.contribution > b.contribution;
                     });

    result.consolidated_forecasts = consolidate_cash_flows(result.products, result.total_revenue);
    return result;
}

} // namespace valucalc
