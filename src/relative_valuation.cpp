#include "relative_valuation.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace valucalc {

std::string method_to_string(RelativeMethod method) {
    switch (method) {
        case RelativeMethod::PE: return "PE";
        case RelativeMethod::PS: return "PS";
        case RelativeMethod::PB: return "PB";
        case RelativeMethod::EvEbitda: return "EV/EBITDA";
    }
    return "unknown";
}

RelativeMethod method_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "pe") return RelativeMethod::PE;
    if (lower == "ps") return RelativeMethod::PS;
    if (lower == "pb") return RelativeMethod::PB;
    if (lower == "ev/ebitda" || lower == "ev_ebitda" || lower == "evebitda") {
        return RelativeMethod::EvEbitda;
    }
    throw ValidationError("Unknown relative valuation method '" + value +
                          "' (expected PE, PS, PB or EV/EBITDA)");
}

namespace {

bool usable(const std::optional<double>& value) {
    return value && std::isfinite(*value) && *value > 0.0;
}

// A reported denominator that is zero or negative invalidates the multiple
bool denominator_ok(const std::optional<double>& denominator) {
    return !denominator || (std::isfinite(*denominator) && *denominator > 0.0);
}

std::optional<double> reported_or_derived(
    const std::optional<double>& reported,
    const std::optional<double>& market_cap,
    const std::optional<double>& denominator)
{
    if (!denominator_ok(denominator)) {
        return std::nullopt;
    }
    if (reported) {
        return usable(reported) ? reported : std::nullopt;
    }
    if (usable(market_cap) && usable(denominator)) {
        double derived = *market_cap / *denominator;
        if (std::isfinite(derived) && derived > 0.0) {
            return derived;
        }
    }
    return std::nullopt;
}

// Company base metric for a method, nullopt when absent or <= 0
std::optional<double> company_metric(const Company& company, RelativeMethod method,
                                     const RelativeValuationConfig& config) {
    std::optional<double> metric;
    switch (method) {
        case RelativeMethod::PE: metric = company.net_income; break;
        case RelativeMethod::PS: metric = company.revenue; break;
        case RelativeMethod::PB: metric = company.net_assets; break;
        case RelativeMethod::EvEbitda: metric = company.ebitda; break;
    }
    if (!usable(metric)) {
        return std::nullopt;
    }
    if (config.use_forward_metrics &&
        (method == RelativeMethod::PE || method == RelativeMethod::PS)) {
        return *metric * (1.0 + company.growth_rate);
    }
    return metric;
}

void validate_config(const RelativeValuationConfig& config) {
    if (!std::isfinite(config.illiquidity_discount) ||
        config.illiquidity_discount < 0.0 || config.illiquidity_discount >= 1.0) {
        throw ValidationError("illiquidity_discount must be in [0, 1)");
    }
    if (!std::isfinite(config.control_premium) || config.control_premium < 0.0) {
        throw ValidationError("control_premium must be >= 0");
    }
    for (double weight : config.weights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            throw ValidationError("relative method weights must be finite and >= 0");
        }
    }
}

// Multiple -> equity value, including the EV bridge and private-company adjustment
double implied_equity(double metric, double multiple, RelativeMethod method,
                      const Company& company, double adjustment) {
    double value = metric * multiple;
    if (method == RelativeMethod::EvEbitda) {
        value -= company.net_debt();
    }
    return value * adjustment;
}

std::optional<ValuationResult> value_method(
    const Company& company,
    const std::vector<Comparable>& comparables,
    RelativeMethod method,
    const RelativeValuationConfig& config,
    bool with_range)
{
    std::optional<double> metric = company_metric(company, method, config);
    if (!metric) {
        return std::nullopt;
    }

    std::vector<double> multiples = valid_multiples(comparables, method);
    if (multiples.empty()) {
        return std::nullopt;
    }

    std::sort(multiples.begin(), multiples.end());
    double multiple_median = stats::median(multiples);
    double multiple_mean = stats::mean(multiples);
    double adjustment = 1.0 - config.illiquidity_discount + config.control_premium;

    double value = implied_equity(*metric, multiple_median, method, company, adjustment);

    std::optional<double> low;
    std::optional<double> high;
    if (with_range) {
        low = implied_equity(*metric, multiples.front(), method, company, adjustment);
        high = implied_equity(*metric, multiples.back(), method, company, adjustment);
    }

    std::map<std::string, double> details;
    details["multiple_median"] = multiple_median;
    details["multiple_mean"] = multiple_mean;
    details["multiple_std"] = stats::std_dev(multiples, multiple_mean);
    details["multiple_min"] = multiples.front();
    details["multiple_max"] = multiples.back();
    details["metric_used"] = *metric;
    details["comparable_count"] = static_cast<double>(multiples.size());
    details["adjustment_factor"] = adjustment;
    if (method == RelativeMethod::EvEbitda) {
        details["enterprise_value"] = *metric * multiple_median;
        details["net_debt"] = company.net_debt();
    }

    return ValuationResult(method_to_string(method), value, low, high, std::move(details));
}

} // anonymous namespace

std::optional<double> comparable_multiple(const Comparable& comparable, RelativeMethod method) {
    switch (method) {
        case RelativeMethod::PE:
            return reported_or_derived(comparable.pe_ratio, comparable.market_cap,
                                       comparable.net_income);
        case RelativeMethod::PS:
            return reported_or_derived(comparable.ps_ratio, comparable.market_cap,
                                       comparable.revenue);
        case RelativeMethod::PB:
            return reported_or_derived(comparable.pb_ratio, comparable.market_cap,
                                       comparable.net_assets);
        case RelativeMethod::EvEbitda:
            // No enterprise value on the record, so this one is never derived
            if (!denominator_ok(comparable.ebitda)) {
                return std::nullopt;
            }
            return usable(comparable.ev_ebitda) ? comparable.ev_ebitda : std::nullopt;
    }
    return std::nullopt;
}

std::vector<double> valid_multiples(const std::vector<Comparable>& comparables,
                                    RelativeMethod method) {
    std::vector<double> multiples;
    multiples.reserve(comparables.size());
    for (const Comparable& comparable : comparables) {
        std::optional<double> multiple = comparable_multiple(comparable, method);
        if (multiple) {
            multiples.push_back(*multiple);
        }
    }
    return multiples;
}

RelativeResults relative_valuation(
    const Company& company,
    const std::vector<Comparable>& comparables,
    const std::vector<RelativeMethod>& methods,
    const RelativeValuationConfig& config)
{
    validate_company(company);
    validate_config(config);

    RelativeResults results;
    for (RelativeMethod method : methods) {
        if (results.count(method) > 0) {
            continue;
        }
        std::optional<ValuationResult> result =
            value_method(company, comparables, method, config, false);
        if (result) {
            results.emplace(method, std::move(*result));
        }
    }
    return results;
}

RelativeResults auto_comparable_analysis(
    const Company& company,
    const std::vector<Comparable>& comparables,
    const RelativeValuationConfig& config)
{
    validate_company(company);
    validate_config(config);

    RelativeResults results;
    for (RelativeMethod method : ALL_RELATIVE_METHODS) {
        std::optional<ValuationResult> result =
            value_method(company, comparables, method, config, true);
        if (result) {
            results.emplace(method, std::move(*result));
        }
    }
    return results;
}

std::optional<ValuationResult> weighted_relative_value(
    const RelativeResults& results,
    const RelativeValuationConfig& config)
{
    validate_config(config);
    if (results.size() < 2) {
        return std::nullopt;
    }

    double total_weight = 0.0;
    for (const auto& [method, result] : results) {
        total_weight += config.weights[static_cast<size_t>(method)];
    }
    if (total_weight <= 0.0) {
        return std::nullopt;
    }

    double value = 0.0;
    double low = 0.0;
    double high = 0.0;
    std::map<std::string, double> details;

    for (const auto& [method, result] : results) {
        double weight = config.weights[static_cast<size_t>(method)] / total_weight;
        value += weight * result.value();
        low += weight * result.value_low().value_or(result.value());
        high += weight * result.value_high().value_or(result.value());
        details["weight_" + method_to_string(method)] = weight;
    }
    details["methods_used"] = static_cast<double>(results.size());

    return ValuationResult("Relative (weighted)", value, low, high, std::move(details));
}

std::map<RelativeMethod, MultipleStatistics> comparable_statistics(
    const std::vector<Comparable>& comparables)
{
    std::map<RelativeMethod, MultipleStatistics> result;
    for (RelativeMethod method : ALL_RELATIVE_METHODS) {
        std::vector<double> multiples = valid_multiples(comparables, method);
        if (multiples.empty()) {
            continue;
        }
        auto [min_it, max_it] = std::minmax_element(multiples.begin(), multiples.end());

        MultipleStatistics entry;
        entry.count = multiples.size();
        entry.mean = stats::mean(multiples);
        entry.median = stats::median(multiples);
        entry.std_dev = stats::std_dev(multiples, entry.mean);
        entry.min = *min_it;
        entry.max = *max_it;
        result.emplace(method, entry);
    }
    return result;
}

} // namespace valucalc
