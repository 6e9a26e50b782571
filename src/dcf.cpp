#include "dcf.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace valucalc {

std::string terminal_method_to_string(TerminalValueMethod method) {
    switch (method) {
        case TerminalValueMethod::PerpetuityGrowth: return "perpetuity";
        case TerminalValueMethod::ExitMultiple: return "exit_multiple";
    }
    return "unknown";
}

TerminalValueMethod terminal_method_from_string(const std::string& value) {
    if (value == "perpetuity" || value == "perpetuity_growth") {
        return TerminalValueMethod::PerpetuityGrowth;
    }
    if (value == "exit_multiple") {
        return TerminalValueMethod::ExitMultiple;
    }
    throw ValidationError("Unknown terminal value method '" + value +
                          "' (expected perpetuity or exit_multiple)");
}

std::string parameter_to_string(DcfParameter parameter) {
    switch (parameter) {
        case DcfParameter::GrowthRate: return "growth_rate";
        case DcfParameter::OperatingMargin: return "operating_margin";
        case DcfParameter::Wacc: return "wacc";
        case DcfParameter::TerminalGrowth: return "terminal_growth";
    }
    return "unknown";
}

DcfParameter parameter_from_string(const std::string& value) {
    for (DcfParameter parameter : STANDARD_PARAMETERS) {
        if (parameter_to_string(parameter) == value) {
            return parameter;
        }
    }
    if (value == "terminal_growth_rate") {
        return DcfParameter::TerminalGrowth;
    }
    throw ValidationError("Unsupported parameter '" + value +
                          "' (expected growth_rate, operating_margin, wacc or terminal_growth)");
}

// ============================================================================
// Cost of capital
// ============================================================================

double calculate_wacc(const Company& company) {
    double cost_of_equity = company.risk_free_rate + company.beta * company.market_risk_premium;
    double cost_of_debt_after_tax = company.cost_of_debt * (1.0 - company.tax_rate);

    double debt_ratio = company.target_debt_ratio;
    double equity_ratio = 1.0 - debt_ratio;

    return cost_of_equity * equity_ratio + cost_of_debt_after_tax * debt_ratio;
}

double resolve_wacc(const Company& company, const DcfOverrides& overrides) {
    double wacc = overrides.wacc ? *overrides.wacc : calculate_wacc(company);
    return wacc + overrides.wacc_adjustment;
}

// ============================================================================
// Forecast
// ============================================================================

void validate_dcf_config(const DcfConfig& config) {
    if (config.horizon_years < 1 || config.horizon_years > MAX_HORIZON_YEARS) {
        throw ValidationError("horizon_years must be between 1 and " +
                              std::to_string(MAX_HORIZON_YEARS));
    }
    if (config.terminal_method == TerminalValueMethod::ExitMultiple &&
        !(config.exit_multiple > 0.0 && std::isfinite(config.exit_multiple))) {
        throw ValidationError("exit_multiple must be a positive finite number");
    }
}

namespace {

void validate_override(const char* name, const std::optional<double>& value) {
    if (value && !std::isfinite(*value)) {
        throw ValidationError(std::string("override ") + name + " must be finite");
    }
}

void validate_overrides(const DcfOverrides& overrides) {
    validate_override("growth_rate", overrides.growth_rate);
    validate_override("operating_margin", overrides.operating_margin);
    validate_override("revenue", overrides.revenue);
    validate_override("wacc", overrides.wacc);
    validate_override("terminal_growth_rate", overrides.terminal_growth_rate);
    if (!std::isfinite(overrides.wacc_adjustment)) {
        throw ValidationError("override wacc_adjustment must be finite");
    }
    if (overrides.revenue && *overrides.revenue < 0.0) {
        throw ValidationError("override revenue must be >= 0");
    }
}

std::string format_rate(double rate) {
    std::ostringstream oss;
    oss.precision(4);
    oss << std::fixed << rate * 100.0 << "%";
    return oss.str();
}

} // anonymous namespace

std::vector<CashFlowForecast> forecast_free_cash_flows(
    const Company& company,
    const DcfOverrides& overrides,
    const DcfConfig& config)
{
    validate_dcf_config(config);
    validate_overrides(overrides);

    double start_growth = overrides.growth_rate.value_or(company.growth_rate);
    double terminal_growth = overrides.terminal_growth_rate.value_or(company.terminal_growth_rate);
    double margin = overrides.operating_margin.value_or(company.operating_margin);
    double reinvestment_ratio =
        config.capex_ratio + config.working_capital_ratio - config.depreciation_ratio;

    std::vector<CashFlowForecast> forecasts;
    forecasts.reserve(config.horizon_years);

    double revenue = overrides.revenue.value_or(company.revenue);
    const double n = static_cast<double>(config.horizon_years);

    for (uint8_t year = 1; year <= config.horizon_years; ++year) {
        double year_growth = start_growth;
        if (config.horizon_years > 1) {
            double progress = static_cast<double>(year - 1) / (n - 1.0);
            year_growth = start_growth + (terminal_growth - start_growth) * progress;
        }

        revenue *= (1.0 + year_growth);

        CashFlowForecast forecast;
        forecast.year = year;
        forecast.revenue = revenue;
        forecast.operating_profit = revenue * margin;
        forecast.nopat = forecast.operating_profit * (1.0 - company.tax_rate);
        forecast.reinvestment = revenue * reinvestment_ratio;
        forecast.fcf = forecast.nopat - forecast.reinvestment;
        forecast.growth_rate = year_growth;

        forecasts.push_back(forecast);
    }

    return forecasts;
}

// ============================================================================
// Terminal value
// ============================================================================

double calculate_terminal_value(
    double final_fcf,
    double wacc,
    double terminal_growth_rate,
    TerminalValueMethod method,
    double exit_multiple)
{
    if (method == TerminalValueMethod::ExitMultiple) {
        if (!(exit_multiple > 0.0)) {
            throw ValidationError("exit_multiple must be positive");
        }
        return final_fcf * exit_multiple;
    }

    if (wacc - terminal_growth_rate <= MIN_WACC_SPREAD) {
        throw DomainError("wacc (" + format_rate(wacc) +
                          ") must exceed terminal_growth_rate (" +
                          format_rate(terminal_growth_rate) + ") by more than " +
                          format_rate(MIN_WACC_SPREAD));
    }
    return final_fcf * (1.0 + terminal_growth_rate) / (wacc - terminal_growth_rate);
}

// ============================================================================
// Valuation
// ============================================================================

ValuationResult dcf_valuation(
    const Company& company,
    const DcfOverrides& overrides,
    const DcfConfig& config)
{
    validate_company(company);

    double wacc = resolve_wacc(company, overrides);
    double terminal_growth = overrides.terminal_growth_rate.value_or(company.terminal_growth_rate);

    if (!std::isfinite(wacc) || wacc <= -1.0) {
        throw DomainError("wacc must be a finite rate above -100% (got " + format_rate(wacc) + ")");
    }

    std::vector<CashFlowForecast> forecasts =
        forecast_free_cash_flows(company, overrides, config);

    double pv_forecasts = 0.0;
    double discount_factor = 1.0;
    for (const CashFlowForecast& forecast : forecasts) {
        discount_factor /= (1.0 + wacc);
        pv_forecasts += forecast.fcf * discount_factor;
    }

    double terminal_value = calculate_terminal_value(
        forecasts.back().fcf, wacc, terminal_growth,
        config.terminal_method, config.exit_multiple);

    // discount_factor now equals 1/(1+wacc)^horizon
    double pv_terminal = terminal_value * discount_factor;

    double enterprise_value = pv_forecasts + pv_terminal;
    double equity_value = enterprise_value - company.total_debt + company.cash_and_equivalents;

    if (!std::isfinite(equity_value)) {
        throw DomainError("DCF produced a non-finite equity value (wacc " +
                          format_rate(wacc) + ")");
    }

    std::map<std::string, double> details;
    details["wacc"] = wacc;
    details["pv_forecasts"] = pv_forecasts;
    details["pv_terminal"] = pv_terminal;
    details["enterprise_value"] = enterprise_value;
    details["terminal_value"] = terminal_value;
    details["terminal_growth_rate"] = terminal_growth;
    details["net_debt"] = company.net_debt();
    details["horizon_years"] = static_cast<double>(config.horizon_years);

    return ValuationResult("DCF", equity_value, std::nullopt, std::nullopt,
                           std::move(details), std::move(forecasts));
}

// ============================================================================
// Single-parameter helpers
// ============================================================================

double base_parameter_value(const Company& company, DcfParameter parameter) {
    switch (parameter) {
        case DcfParameter::GrowthRate: return company.growth_rate;
        case DcfParameter::OperatingMargin: return company.operating_margin;
        case DcfParameter::Wacc: return calculate_wacc(company);
        case DcfParameter::TerminalGrowth: return company.terminal_growth_rate;
    }
    throw ValidationError("Unsupported parameter");
}

DcfOverrides override_parameter(DcfParameter parameter, double value, DcfOverrides overrides) {
    switch (parameter) {
        case DcfParameter::GrowthRate:
            overrides.growth_rate = value;
            break;
        case DcfParameter::OperatingMargin:
            overrides.operating_margin = value;
            break;
        case DcfParameter::Wacc:
            overrides.wacc = value;
            overrides.wacc_adjustment = 0.0;
            break;
        case DcfParameter::TerminalGrowth:
            overrides.terminal_growth_rate = value;
            break;
    }
    return overrides;
}

ValuationResult dcf_sensitivity_analysis(
    const Company& company,
    DcfParameter parameter,
    double value,
    const DcfConfig& config)
{
    return dcf_valuation(company, override_parameter(parameter, value), config);
}

} // namespace valucalc
