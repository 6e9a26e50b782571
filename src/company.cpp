#include "company.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace valucalc {

std::string stage_to_string(CompanyStage stage) {
    switch (stage) {
        case CompanyStage::Early: return "early";
        case CompanyStage::Growth: return "growth";
        case CompanyStage::Mature: return "mature";
        case CompanyStage::Listed: return "listed";
    }
    return "unknown";
}

CompanyStage stage_from_string(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "early") return CompanyStage::Early;
    if (lowered == "growth") return CompanyStage::Growth;
    if (lowered == "mature") return CompanyStage::Mature;
    if (lowered == "listed" || lowered == "public") return CompanyStage::Listed;

    throw ValidationError("Unknown company stage '" + value +
                          "' (expected early, growth, mature or listed)");
}

namespace {

void require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        throw ValidationError(std::string(field) + " must be a finite number");
    }
}

void require_non_negative(const char* field, double value) {
    require_finite(field, value);
    if (value < 0.0) {
        throw ValidationError(std::string(field) + " must be >= 0 (got " +
                              std::to_string(value) + ")");
    }
}

} // anonymous namespace

void validate_company(const Company& company) {
    if (company.industry.empty()) {
        throw ValidationError("industry is required");
    }

    require_non_negative("revenue", company.revenue);
    require_finite("net_income", company.net_income);
    if (company.ebitda) {
        require_finite("ebitda", *company.ebitda);
    }
    if (company.net_assets) {
        require_non_negative("net_assets", *company.net_assets);
    }
    require_non_negative("total_debt", company.total_debt);
    require_non_negative("cash_and_equivalents", company.cash_and_equivalents);

    require_finite("growth_rate", company.growth_rate);
    require_finite("operating_margin", company.operating_margin);
    require_finite("terminal_growth_rate", company.terminal_growth_rate);
    require_finite("risk_free_rate", company.risk_free_rate);
    require_finite("market_risk_premium", company.market_risk_premium);

    require_finite("tax_rate", company.tax_rate);
    if (company.tax_rate < 0.0 || company.tax_rate >= 1.0) {
        throw ValidationError("tax_rate must be in [0, 1) (got " +
                              std::to_string(company.tax_rate) + ")");
    }

    require_finite("target_debt_ratio", company.target_debt_ratio);
    if (company.target_debt_ratio < 0.0 || company.target_debt_ratio > 1.0) {
        throw ValidationError("target_debt_ratio must be in [0, 1] (got " +
                              std::to_string(company.target_debt_ratio) + ")");
    }

    require_non_negative("beta", company.beta);
    require_non_negative("cost_of_debt", company.cost_of_debt);
}

} // namespace valucalc
