#ifndef VALUCALC_RELATIVE_VALUATION_HPP
#define VALUCALC_RELATIVE_VALUATION_HPP

#include "company.hpp"
#include "valuation_result.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

// Multiple-based methods, in reporting order
enum class RelativeMethod : uint8_t {
    PE = 0,         // price / earnings, base metric net_income
    PS = 1,         // price / sales, base metric revenue
    PB = 2,         // price / book, base metric net_assets
    EvEbitda = 3    // enterprise value / EBITDA, base metric ebitda
};

constexpr std::array<RelativeMethod, 4> ALL_RELATIVE_METHODS = {
    RelativeMethod::PE,
    RelativeMethod::PS,
    RelativeMethod::PB,
    RelativeMethod::EvEbitda
};

std::string method_to_string(RelativeMethod method);
RelativeMethod method_from_string(const std::string& value);

// Settings for multiple-based valuation
struct RelativeValuationConfig {
    // PE and PS apply the multiple to next-year metric (metric * (1 + growth))
    bool use_forward_metrics = false;
    // Value is scaled by (1 - illiquidity_discount + control_premium)
    double illiquidity_discount = 0.0;
    double control_premium = 0.0;
    // Weights for weighted_relative_value, indexed by RelativeMethod
    std::array<double, 4> weights = {0.3, 0.3, 0.2, 0.2};
};

// Ordered mapping method -> result. A method missing from the map was
// skipped (company metric <= 0 or no usable comparable multiple).
using RelativeResults = std::map<RelativeMethod, ValuationResult>;

// The comparable's multiple for a method, or nullopt when it is unusable
//
// A reported multiple is used when it is finite, positive, and the
// comparable's own denominator (when reported) is positive. A missing P/E,
// P/S or P/B is derived from market_cap / metric when both are positive.
std::optional<double> comparable_multiple(const Comparable& comparable, RelativeMethod method);

// All valid multiples for a method across the comparable set
std::vector<double> valid_multiples(const std::vector<Comparable>& comparables,
                                    RelativeMethod method);

// Implied value per requested method: company metric * median multiple
// EV/EBITDA implies enterprise value; the equity value subtracts net debt.
RelativeResults relative_valuation(
    const Company& company,
    const std::vector<Comparable>& comparables,
    const std::vector<RelativeMethod>& methods =
        std::vector<RelativeMethod>(ALL_RELATIVE_METHODS.begin(), ALL_RELATIVE_METHODS.end()),
    const RelativeValuationConfig& config = RelativeValuationConfig());

// All four methods, each with a low/high range from the min/max multiple
RelativeResults auto_comparable_analysis(
    const Company& company,
    const std::vector<Comparable>& comparables,
    const RelativeValuationConfig& config = RelativeValuationConfig());

// Weighted average of the available methods with the widest combined range
// nullopt when fewer than two methods are available.
std::optional<ValuationResult> weighted_relative_value(
    const RelativeResults& results,
    const RelativeValuationConfig& config = RelativeValuationConfig());

// Descriptive statistics of one multiple across the comparable set
struct MultipleStatistics {
    size_t count;
    double mean;
    double median;
    double std_dev;
    double min;
    double max;
};

// Statistics per method; methods without any valid multiple are omitted
std::map<RelativeMethod, MultipleStatistics> comparable_statistics(
    const std::vector<Comparable>& comparables);

} // namespace valucalc

#endif // VALUCALC_RELATIVE_VALUATION_HPP
