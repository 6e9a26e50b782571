#ifndef VALUCALC_IO_COMPANY_LOADER_HPP
#define VALUCALC_IO_COMPANY_LOADER_HPP

#include "../company.hpp"
#include "../multi_product.hpp"
#include <istream>
#include <string>
#include <vector>

namespace valucalc {
namespace io {

// Company from a JSON object
// industry, revenue and net_income are required; every other field falls
// back to its default. ebitda and net_assets may be null. The result is
// checked with validate_company.
// Throws DataError for malformed JSON, ValidationError for missing or
// invalid fields.
Company parse_company_from_string(const std::string& json_string);
Company load_company_from_json(const std::string& filepath);

// Comparables from CSV with a header row
// Recognized columns: name, ts_code, industry, market_cap, revenue,
// net_income, net_assets, ebitda, growth_rate, pe_ratio, ps_ratio, pb_ratio,
// ev_ebitda. Only name is required; other columns are ignored. Empty cells
// and "null"/"NA"/"-" are missing values.
std::vector<Comparable> read_comparables_csv(std::istream& is);
std::vector<Comparable> load_comparables_from_csv(const std::string& filepath);

// Comparables from a JSON array of objects with the same field names
std::vector<Comparable> parse_comparables_from_string(const std::string& json_string);
std::vector<Comparable> load_comparables_from_json(const std::string& filepath);

// Dispatch on the file extension (.json, otherwise CSV)
std::vector<Comparable> load_comparables(const std::string& filepath);

// Product segments from a JSON array, or an object holding one under
// "products". name, current_revenue and revenue_weight are required. The
// list is checked with validate_products.
std::vector<ProductSegment> parse_products_from_string(const std::string& json_string);
std::vector<ProductSegment> load_products_from_json(const std::string& filepath);

} // namespace io
} // namespace valucalc

#endif // VALUCALC_IO_COMPANY_LOADER_HPP
