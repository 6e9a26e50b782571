#include "valuation_result.hpp"
#include <stdexcept>
#include <utility>

namespace valucalc {

ValuationResult::ValuationResult(std::string method, double value,
                                 std::optional<double> value_low,
                                 std::optional<double> value_high,
                                 std::map<std::string, double> details,
                                 std::vector<CashFlowForecast> forecasts)
    : method_(std::move(method)),
      value_(value),
      value_low_(value_low),
      value_high_(value_high),
      details_(std::move(details)),
      forecasts_(std::move(forecasts)) {}

double ValuationResult::detail(const std::string& key) const {
    auto it = details_.find(key);
    if (it == details_.end()) {
        throw std::out_of_range("No detail '" + key + "' in " + method_ + " result");
    }
    return it->second;
}

std::optional<double> ValuationResult::find_detail(const std::string& key) const {
    auto it = details_.find(key);
    if (it == details_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double ValuationResult::value_mid() const {
    if (has_range()) {
        return (*value_low_ + *value_high_) / 2.0;
    }
    return value_;
}

std::optional<double> ValuationResult::range_width_pct() const {
    if (!has_range()) {
        return std::nullopt;
    }
    double mid = value_mid();
    if (mid <= 0.0) {
        return std::nullopt;
    }
    return (*value_high_ - *value_low_) / mid;
}

} // namespace valucalc
