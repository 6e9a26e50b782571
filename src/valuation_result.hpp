#ifndef VALUCALC_VALUATION_RESULT_HPP
#define VALUCALC_VALUATION_RESULT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

// One explicit-period forecast year produced by the DCF kernel
struct CashFlowForecast {
    uint8_t year;               // 1-based forecast year
    double revenue;
    double operating_profit;    // revenue * operating margin
    double nopat;               // operating profit after tax
    double reinvestment;        // capex + working capital - depreciation
    double fcf;                 // free cash flow to the firm
    double growth_rate;         // revenue growth applied in this year
};

// Result of one valuation method evaluation
//
// Built once per evaluation and not modified afterwards. details carries the
// method-specific diagnostics (wacc, pv_forecasts, multiple_median, ...).
class ValuationResult {
public:
    ValuationResult(std::string method, double value,
                    std::optional<double> value_low = std::nullopt,
                    std::optional<double> value_high = std::nullopt,
                    std::map<std::string, double> details = {},
                    std::vector<CashFlowForecast> forecasts = {});

    const std::string& method() const { return method_; }
    double value() const { return value_; }
    const std::optional<double>& value_low() const { return value_low_; }
    const std::optional<double>& value_high() const { return value_high_; }
    const std::map<std::string, double>& details() const { return details_; }
    const std::vector<CashFlowForecast>& forecasts() const { return forecasts_; }

    bool has_range() const { return value_low_.has_value() && value_high_.has_value(); }

    // Look up a details entry; throws std::out_of_range if absent
    double detail(const std::string& key) const;
    std::optional<double> find_detail(const std::string& key) const;

    // Midpoint of the range, or value when no range is reported
    double value_mid() const;

    // (high - low) / mid, nullopt without a range or with a non-positive mid
    std::optional<double> range_width_pct() const;

private:
    std::string method_;
    double value_;
    std::optional<double> value_low_;
    std::optional<double> value_high_;
    std::map<std::string, double> details_;
    std::vector<CashFlowForecast> forecasts_;
};

} // namespace valucalc

#endif // VALUCALC_VALUATION_RESULT_HPP
