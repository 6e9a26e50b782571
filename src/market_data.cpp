#include "market_data.hpp"
#include "errors.hpp"
#include "io/company_loader.hpp"
#include <algorithm>
#include <cctype>

namespace valucalc {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

CsvMarketDataSource::CsvMarketDataSource(const std::string& filepath)
    : records_(io::load_comparables_from_csv(filepath)) {}

CsvMarketDataSource::CsvMarketDataSource(std::vector<Comparable> records)
    : records_(std::move(records)) {}

std::vector<Comparable> CsvMarketDataSource::comparables_for_industry(
    const std::string& industry) const
{
    std::string wanted = to_lower(industry);
    std::vector<Comparable> matches;
    for (const Comparable& record : records_) {
        if (to_lower(record.industry) == wanted) {
            matches.push_back(record);
        }
    }
    return matches;
}

Company CsvMarketDataSource::company_financials(const std::string& ts_code) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&ts_code](const Comparable& record) {
                               return record.ts_code == ts_code;
                           });
    if (it == records_.end()) {
        throw DataError("Unknown company identifier: " + ts_code);
    }

    Company company;
    company.name = it->name;
    company.industry = it->industry;
    company.stage = CompanyStage::Listed;
    company.revenue = it->revenue.value_or(0.0);
    company.net_income = it->net_income.value_or(0.0);
    company.ebitda = it->ebitda;
    company.net_assets = it->net_assets;
    if (it->growth_rate) {
        company.growth_rate = *it->growth_rate;
    }
    return company;
}

} // namespace valucalc
