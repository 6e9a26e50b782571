#ifndef VALUCALC_DCF_HPP
#define VALUCALC_DCF_HPP

#include "company.hpp"
#include "valuation_result.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

// WACC must exceed terminal growth by at least this much, otherwise the
// perpetuity formula is treated as divergent
constexpr double MIN_WACC_SPREAD = 0.001;

constexpr uint8_t DEFAULT_HORIZON_YEARS = 5;
constexpr uint8_t MAX_HORIZON_YEARS = 50;

enum class TerminalValueMethod : uint8_t {
    PerpetuityGrowth = 0,   // Gordon growth on the final-year FCF
    ExitMultiple = 1        // final-year FCF times a multiple
};

std::string terminal_method_to_string(TerminalValueMethod method);
TerminalValueMethod terminal_method_from_string(const std::string& value);

// Parameters that sensitivity sweeps and stress shocks can move
// Declaration order is the tornado tie-break order.
enum class DcfParameter : uint8_t {
    GrowthRate = 0,
    OperatingMargin = 1,
    Wacc = 2,
    TerminalGrowth = 3
};

constexpr std::array<DcfParameter, 4> STANDARD_PARAMETERS = {
    DcfParameter::GrowthRate,
    DcfParameter::OperatingMargin,
    DcfParameter::Wacc,
    DcfParameter::TerminalGrowth
};

std::string parameter_to_string(DcfParameter parameter);
DcfParameter parameter_from_string(const std::string& value);

// Model settings for one DCF evaluation
//
// Reinvestment per year = revenue * (capex_ratio + working_capital_ratio
// - depreciation_ratio). All three default to zero, so by default
// FCF = revenue * margin * (1 - tax).
struct DcfConfig {
    uint8_t horizon_years = DEFAULT_HORIZON_YEARS;
    TerminalValueMethod terminal_method = TerminalValueMethod::PerpetuityGrowth;
    double exit_multiple = 10.0;
    double capex_ratio = 0.0;
    double working_capital_ratio = 0.0;
    double depreciation_ratio = 0.0;
};

// Throws ValidationError for a horizon outside [1, MAX_HORIZON_YEARS] or a
// non-positive exit multiple when that terminal method is selected
void validate_dcf_config(const DcfConfig& config);

// Per-call replacements for Company inputs
//
// The Company passed to the kernel is never modified; an override simply
// takes precedence over the matching field. wacc replaces the CAPM-derived
// rate; wacc_adjustment is added on top of whichever rate is in effect.
struct DcfOverrides {
    std::optional<double> growth_rate;
    std::optional<double> operating_margin;
    std::optional<double> revenue;
    std::optional<double> wacc;
    std::optional<double> terminal_growth_rate;
    double wacc_adjustment = 0.0;
};

// CAPM cost of equity blended with after-tax cost of debt at the target
// capital structure
double calculate_wacc(const Company& company);

// The discount rate in effect after overrides are applied
double resolve_wacc(const Company& company, const DcfOverrides& overrides);

// Explicit-period forecast: exactly config.horizon_years records
// Growth decays linearly from the starting growth rate in year 1 to the
// terminal growth rate in the final year.
std::vector<CashFlowForecast> forecast_free_cash_flows(
    const Company& company,
    const DcfOverrides& overrides = DcfOverrides(),
    const DcfConfig& config = DcfConfig());

// Terminal value at the end of the forecast horizon (undiscounted)
// Throws DomainError when the perpetuity spread is below MIN_WACC_SPREAD.
double calculate_terminal_value(
    double final_fcf,
    double wacc,
    double terminal_growth_rate,
    TerminalValueMethod method = TerminalValueMethod::PerpetuityGrowth,
    double exit_multiple = 10.0);

// Full DCF: discounted explicit FCFs plus discounted terminal value gives
// enterprise value; equity = EV - total_debt + cash.
//
// details: wacc, pv_forecasts, pv_terminal, enterprise_value, terminal_value,
// terminal_growth_rate, net_debt, horizon_years.
// Throws ValidationError for invalid inputs and DomainError for degenerate
// models; never returns a non-finite value.
ValuationResult dcf_valuation(
    const Company& company,
    const DcfOverrides& overrides = DcfOverrides(),
    const DcfConfig& config = DcfConfig());

// Current value of a parameter for this company (WACC is the CAPM rate)
double base_parameter_value(const Company& company, DcfParameter parameter);

// Set one parameter on top of an existing override set
DcfOverrides override_parameter(DcfParameter parameter, double value,
                                DcfOverrides overrides = DcfOverrides());

// Re-run dcf_valuation with one named parameter moved to value
ValuationResult dcf_sensitivity_analysis(
    const Company& company,
    DcfParameter parameter,
    double value,
    const DcfConfig& config = DcfConfig());

} // namespace valucalc

#endif // VALUCALC_DCF_HPP
