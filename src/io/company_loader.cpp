#include "company_loader.hpp"
#include "csv_reader.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace valucalc {
namespace io {

namespace {

std::string read_file(const std::string& filepath, const char* what) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DataError(std::string("Cannot open ") + what + " file: " + filepath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json parse_json(const std::string& json_string) {
    try {
        return json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw DataError(std::string("JSON parse error: ") + e.what());
    }
}

double required_number(const json& j, const char* key, const char* record) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw ValidationError(std::string(record) + " missing required field: " + key);
    }
    if (!j.at(key).is_number()) {
        throw ValidationError(std::string(record) + " field '" + key + "' must be a number");
    }
    return j.at(key).get<double>();
}

void optional_number(const json& j, const char* key, double& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        if (!j.at(key).is_number()) {
            throw ValidationError(std::string("field '") + key + "' must be a number");
        }
        target = j.at(key).get<double>();
    }
}

void optional_number(const json& j, const char* key, std::optional<double>& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        if (!j.at(key).is_number()) {
            throw ValidationError(std::string("field '") + key + "' must be a number");
        }
        target = j.at(key).get<double>();
    }
}

void optional_string(const json& j, const char* key, std::string& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<std::string>();
    }
}

Company company_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Company must be a JSON object");
    }

    Company company;
    optional_string(j, "name", company.name);
    if (!j.contains("industry") || !j.at("industry").is_string()) {
        throw ValidationError("Company missing required field: industry");
    }
    company.industry = j.at("industry").get<std::string>();
    if (j.contains("stage") && !j.at("stage").is_null()) {
        company.stage = stage_from_string(j.at("stage").get<std::string>());
    }

    company.revenue = required_number(j, "revenue", "Company");
    company.net_income = required_number(j, "net_income", "Company");
    optional_number(j, "ebitda", company.ebitda);
    optional_number(j, "net_assets", company.net_assets);
    optional_number(j, "total_debt", company.total_debt);
    optional_number(j, "cash_and_equivalents", company.cash_and_equivalents);
    optional_number(j, "growth_rate", company.growth_rate);
    optional_number(j, "operating_margin", company.operating_margin);
    optional_number(j, "tax_rate", company.tax_rate);
    optional_number(j, "beta", company.beta);
    optional_number(j, "risk_free_rate", company.risk_free_rate);
    optional_number(j, "market_risk_premium", company.market_risk_premium);
    optional_number(j, "cost_of_debt", company.cost_of_debt);
    optional_number(j, "target_debt_ratio", company.target_debt_ratio);
    optional_number(j, "terminal_growth_rate", company.terminal_growth_rate);

    validate_company(company);
    return company;
}

Comparable comparable_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Comparable must be a JSON object");
    }

    Comparable comparable;
    if (!j.contains("name") || !j.at("name").is_string()) {
        throw ValidationError("Comparable missing required field: name");
    }
    comparable.name = j.at("name").get<std::string>();
    optional_string(j, "ts_code", comparable.ts_code);
    optional_string(j, "industry", comparable.industry);

    optional_number(j, "market_cap", comparable.market_cap);
    optional_number(j, "revenue", comparable.revenue);
    optional_number(j, "net_income", comparable.net_income);
    optional_number(j, "net_assets", comparable.net_assets);
    optional_number(j, "ebitda", comparable.ebitda);
    optional_number(j, "growth_rate", comparable.growth_rate);
    optional_number(j, "pe_ratio", comparable.pe_ratio);
    optional_number(j, "ps_ratio", comparable.ps_ratio);
    optional_number(j, "pb_ratio", comparable.pb_ratio);
    optional_number(j, "ev_ebitda", comparable.ev_ebitda);
    return comparable;
}

ProductSegment product_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Product must be a JSON object");
    }

    ProductSegment product;
    if (!j.contains("name") || !j.at("name").is_string()) {
        throw ValidationError("Product missing required field: name");
    }
    product.name = j.at("name").get<std::string>();
    product.current_revenue = required_number(j, "current_revenue", "Product");
    product.revenue_weight = required_number(j, "revenue_weight", "Product");
    if (j.contains("growth_rate_years") && !j.at("growth_rate_years").is_null()) {
        product.growth_rate_years = j.at("growth_rate_years").get<std::vector<double>>();
    }
    optional_number(j, "terminal_growth_rate", product.terminal_growth_rate);
    optional_number(j, "gross_margin", product.gross_margin);
    optional_number(j, "operating_margin", product.operating_margin);
    optional_number(j, "capex_ratio", product.capex_ratio);
    optional_number(j, "wc_change_ratio", product.wc_change_ratio);
    optional_number(j, "depreciation_ratio", product.depreciation_ratio);
    optional_number(j, "beta", product.beta);
    return product;
}

bool is_missing(const std::string& cell) {
    if (cell.empty() || cell == "-") {
        return true;
    }
    std::string lower = cell;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "null" || lower == "na" || lower == "n/a" || lower == "nan" || lower == "none";
}

std::optional<double> parse_cell(const std::string& cell, const std::string& column, size_t line) {
    if (is_missing(cell)) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw DataError("line " + std::to_string(line) + ": column '" + column +
                        "' is not a number ('" + cell + "')");
    } catch (const std::out_of_range&) {
        throw DataError("line " + std::to_string(line) + ": column '" + column +
                        "' is out of range ('" + cell + "')");
    }
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

} // anonymous namespace

Company parse_company_from_string(const std::string& json_string) {
    json j = parse_json(json_string);
    try {
        return company_from_json(j);
    } catch (const json::type_error& e) {
        throw ValidationError(std::string("Company JSON type error: ") + e.what());
    }
}

Company load_company_from_json(const std::string& filepath) {
    return parse_company_from_string(read_file(filepath, "company"));
}

std::vector<Comparable> read_comparables_csv(std::istream& is) {
    CsvReader reader(is);

    std::vector<std::string> header = reader.read_row();
    if (header.empty()) {
        throw DataError("Comparables CSV is empty (header row required)");
    }

    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    if (columns.count("name") == 0) {
        throw DataError("Comparables CSV requires a 'name' column");
    }

    using NumericField = std::optional<double> Comparable::*;
    const std::vector<std::pair<std::string, NumericField>> numeric_fields = {
        {"market_cap", &Comparable::market_cap},
        {"revenue", &Comparable::revenue},
        {"net_income", &Comparable::net_income},
        {"net_assets", &Comparable::net_assets},
        {"ebitda", &Comparable::ebitda},
        {"growth_rate", &Comparable::growth_rate},
        {"pe_ratio", &Comparable::pe_ratio},
        {"ps_ratio", &Comparable::ps_ratio},
        {"pb_ratio", &Comparable::pb_ratio},
        {"ev_ebitda", &Comparable::ev_ebitda}
    };

    std::vector<Comparable> comparables;
    while (reader.has_more()) {
        std::vector<std::string> row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        size_t line = reader.line_number();
        if (row.size() > header.size()) {
            throw DataError("line " + std::to_string(line) + ": expected at most " +
                            std::to_string(header.size()) + " cells, got " +
                            std::to_string(row.size()));
        }
        row.resize(header.size());

        Comparable comparable;
        comparable.name = row[columns["name"]];
        if (comparable.name.empty()) {
            throw DataError("line " + std::to_string(line) + ": comparable name is empty");
        }
        if (columns.count("ts_code")) {
            comparable.ts_code = row[columns["ts_code"]];
        }
        if (columns.count("industry")) {
            comparable.industry = row[columns["industry"]];
        }

        for (const auto& [column, field] : numeric_fields) {
            auto it = columns.find(column);
            if (it != columns.end()) {
                comparable.*field = parse_cell(row[it->second], column, line);
            }
        }

        comparables.push_back(std::move(comparable));
    }

    return comparables;
}

std::vector<Comparable> load_comparables_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DataError("Cannot open comparables file: " + filepath);
    }
    return read_comparables_csv(file);
}

std::vector<Comparable> parse_comparables_from_string(const std::string& json_string) {
    json j = parse_json(json_string);
    if (!j.is_array()) {
        throw ValidationError("Comparables JSON must be an array of objects");
    }

    std::vector<Comparable> comparables;
    comparables.reserve(j.size());
    try {
        for (const auto& item : j) {
            comparables.push_back(comparable_from_json(item));
        }
    } catch (const json::type_error& e) {
        throw ValidationError(std::string("Comparable JSON type error: ") + e.what());
    }
    return comparables;
}

std::vector<Comparable> load_comparables_from_json(const std::string& filepath) {
    return parse_comparables_from_string(read_file(filepath, "comparables"));
}

std::vector<Comparable> load_comparables(const std::string& filepath) {
    if (ends_with(filepath, ".json")) {
        return load_comparables_from_json(filepath);
    }
    return load_comparables_from_csv(filepath);
}

std::vector<ProductSegment> parse_products_from_string(const std::string& json_string) {
    json j = parse_json(json_string);
    if (j.is_object() && j.contains("products")) {
        j = j.at("products");
    }
    if (!j.is_array()) {
        throw ValidationError("Products JSON must be an array of objects");
    }

    std::vector<ProductSegment> products;
    products.reserve(j.size());
    try {
        for (const auto& item : j) {
            products.push_back(product_from_json(item));
        }
    } catch (const json::type_error& e) {
        throw ValidationError(std::string("Product JSON type error: ") + e.what());
    }
    validate_products(products);
    return products;
}

std::vector<ProductSegment> load_products_from_json(const std::string& filepath) {
    return parse_products_from_string(read_file(filepath, "products"));
}

} // namespace io
} // namespace valucalc
