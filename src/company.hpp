#ifndef VALUCALC_COMPANY_HPP
#define VALUCALC_COMPANY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

// Development stage of the valued company
enum class CompanyStage : uint8_t {
    Early = 0,    // angel / series A
    Growth = 1,   // series B / C
    Mature = 2,   // late stage, pre-IPO
    Listed = 3
};

std::string stage_to_string(CompanyStage stage);
CompanyStage stage_from_string(const std::string& value);

// Company: the subject of a valuation
//
// Monetary fields share one unit (whatever the caller feeds in, typically
// thousands of currency units). Rates are fractions, never percentages.
// ebitda and net_assets are genuinely optional: relative methods that need
// them are skipped when absent.
struct Company {
    std::string name;
    std::string industry;
    CompanyStage stage = CompanyStage::Growth;

    // Income statement (required)
    double revenue = 0.0;
    double net_income = 0.0;
    std::optional<double> ebitda;

    // Balance sheet
    std::optional<double> net_assets;
    double total_debt = 0.0;
    double cash_and_equivalents = 0.0;

    // Forecast drivers
    double growth_rate = 0.15;
    double operating_margin = 0.20;
    double tax_rate = 0.25;

    // Cost of capital inputs
    double beta = 1.0;
    double risk_free_rate = 0.03;
    double market_risk_premium = 0.07;
    double cost_of_debt = 0.05;
    double target_debt_ratio = 0.3;

    double terminal_growth_rate = 0.025;

    double net_debt() const { return total_debt - cash_and_equivalents; }
};

// Comparable: a peer company with observed valuation multiples
//
// Any multiple may be missing (negative earnings, no quote, partial feed).
struct Comparable {
    std::string name;
    std::string ts_code;
    std::string industry;

    std::optional<double> market_cap;
    std::optional<double> revenue;
    std::optional<double> net_income;
    std::optional<double> net_assets;
    std::optional<double> ebitda;
    std::optional<double> growth_rate;

    std::optional<double> pe_ratio;
    std::optional<double> ps_ratio;
    std::optional<double> pb_ratio;
    std::optional<double> ev_ebitda;
};

// Check every Company invariant; throws ValidationError naming the first
// offending field.
void validate_company(const Company& company);

} // namespace valucalc

#endif // VALUCALC_COMPANY_HPP
