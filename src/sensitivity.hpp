#ifndef VALUCALC_SENSITIVITY_HPP
#define VALUCALC_SENSITIVITY_HPP

#include "company.hpp"
#include "dcf.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace valucalc {

struct SensitivityConfig {
    size_t steps = 11;                  // sweep points per parameter, >= 2
    double default_range_pct = 0.20;    // default sweep is base * (1 -/+ pct)
    double zero_base_range = 0.01;      // absolute half-width when the base is 0

    // Half-width of each tornado sweep, indexed by DcfParameter
    std::array<double, 4> tornado_deltas = {0.10, 0.05, 0.01, 0.005};
};

// Closed sweep interval [low, high]
struct ParameterRange {
    double low;
    double high;
};

// base +/- default_range_pct * |base|, or +/- zero_base_range when base is 0
ParameterRange default_range(const Company& company, DcfParameter parameter,
                             const SensitivityConfig& config = SensitivityConfig());

// Evenly spaced points from low to high inclusive
std::vector<double> sweep_points(const ParameterRange& range, size_t steps);

struct SensitivityPoint {
    double parameter_value;
    std::optional<double> value;    // empty when the DCF failed closed
};

struct OneWayResult {
    DcfParameter parameter;
    std::vector<SensitivityPoint> points;
    std::optional<double> min_valuation;
    std::optional<double> max_valuation;
    double valuation_range = 0.0;       // max - min over valid points
    double base_parameter_value = 0.0;
    double base_value = 0.0;            // unperturbed DCF value
    double impact_percentage = 0.0;     // range / |base_value|, 0 when base is 0
    std::optional<double> elasticity;   // % value change per % parameter change
    size_t failed_points = 0;
};

// Sweep one parameter; range defaults to default_range()
OneWayResult one_way_sensitivity(
    const Company& company,
    DcfParameter parameter,
    const std::optional<ParameterRange>& range = std::nullopt,
    const SensitivityConfig& config = SensitivityConfig(),
    const DcfConfig& dcf_config = DcfConfig());

// Heat-map grid: rows follow the first parameter, columns the second
struct TwoWayResult {
    DcfParameter row_parameter;
    DcfParameter column_parameter;
    std::vector<double> row_values;
    std::vector<double> column_values;
    std::vector<std::vector<std::optional<double>>> grid;
    std::optional<double> min_valuation;
    std::optional<double> max_valuation;
    size_t failed_cells = 0;
};

// Throws ValidationError when both parameters are the same
TwoWayResult two_way_sensitivity(
    const Company& company,
    DcfParameter row_parameter,
    DcfParameter column_parameter,
    const std::optional<ParameterRange>& row_range = std::nullopt,
    const std::optional<ParameterRange>& column_range = std::nullopt,
    const SensitivityConfig& config = SensitivityConfig(),
    const DcfConfig& dcf_config = DcfConfig());

struct TornadoBar {
    DcfParameter parameter;
    double low_parameter_value;
    double high_parameter_value;
    std::optional<double> value_at_low;
    std::optional<double> value_at_high;
    double valuation_range;
    double impact_percentage;
};

// One bar per standard parameter, widest range first; ties keep
// declaration order
std::vector<TornadoBar> tornado_chart_data(
    const Company& company,
    const SensitivityConfig& config = SensitivityConfig(),
    const DcfConfig& dcf_config = DcfConfig());

struct ComprehensiveSensitivity {
    double base_value = 0.0;
    std::vector<OneWayResult> parameters;   // declaration order
    std::vector<TornadoBar> tornado;
};

ComprehensiveSensitivity comprehensive_sensitivity(
    const Company& company,
    const SensitivityConfig& config = SensitivityConfig(),
    const DcfConfig& dcf_config = DcfConfig());

} // namespace valucalc

#endif // VALUCALC_SENSITIVITY_HPP
