#include "sensitivity.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace valucalc {

namespace {

void validate_config(const SensitivityConfig& config) {
    if (config.steps < 2) {
        throw ValidationError("sensitivity steps must be >= 2");
    }
    if (!std::isfinite(config.default_range_pct) || config.default_range_pct <= 0.0) {
        throw ValidationError("default_range_pct must be a positive number");
    }
    if (!std::isfinite(config.zero_base_range) || config.zero_base_range <= 0.0) {
        throw ValidationError("zero_base_range must be a positive number");
    }
    for (double delta : config.tornado_deltas) {
        if (!std::isfinite(delta) || delta <= 0.0) {
            throw ValidationError("tornado deltas must be positive numbers");
        }
    }
}

void validate_range(const ParameterRange& range) {
    if (!std::isfinite(range.low) || !std::isfinite(range.high) || range.low > range.high) {
        throw ValidationError("parameter range needs finite bounds with low <= high");
    }
}

std::optional<double> evaluate(const Company& company, DcfParameter parameter, double value,
                               const DcfConfig& dcf_config) {
    try {
        return dcf_sensitivity_analysis(company, parameter, value, dcf_config).value();
    } catch (const DomainError&) {
        return std::nullopt;
    }
}

} // anonymous namespace

ParameterRange default_range(const Company& company, DcfParameter parameter,
                             const SensitivityConfig& config) {
    double base = base_parameter_value(company, parameter);
    double half_width = base == 0.0 ? config.zero_base_range
                                    : std::fabs(base) * config.default_range_pct;
    return ParameterRange{base - half_width, base + half_width};
}

std::vector<double> sweep_points(const ParameterRange& range, size_t steps) {
    std::vector<double> points;
    if (steps == 0) {
        return points;
    }
    if (steps == 1) {
        points.push_back(range.low);
        return points;
    }
    points.reserve(steps);
    double span = range.high - range.low;
    for (size_t i = 0; i < steps; ++i) {
        if (i + 1 == steps) {
            points.push_back(range.high);
        } else {
            points.push_back(range.low + span * static_cast<double>(i) /
                                         static_cast<double>(steps - 1));
        }
    }
    return points;
}

// ============================================================================
// One-way
// ============================================================================

OneWayResult one_way_sensitivity(
    const Company& company,
    DcfParameter parameter,
    const std::optional<ParameterRange>& range,
    const SensitivityConfig& config,
    const DcfConfig& dcf_config)
{
    validate_config(config);
    validate_dcf_config(dcf_config);
    ParameterRange sweep = range ? *range : default_range(company, parameter, config);
    validate_range(sweep);

    OneWayResult result;
    result.parameter = parameter;
    result.base_parameter_value = base_parameter_value(company, parameter);
    result.base_value = dcf_valuation(company, DcfOverrides(), dcf_config).value();

    std::vector<double> values = sweep_points(sweep, config.steps);
    result.points.reserve(values.size());

    const SensitivityPoint* first_valid = nullptr;
    const SensitivityPoint* last_valid = nullptr;

    for (double x : values) {
        result.points.push_back(SensitivityPoint{x, evaluate(company, parameter, x, dcf_config)});
    }

    for (const SensitivityPoint& point : result.points) {
        if (!point.value) {
            result.failed_points++;
            continue;
        }
        if (!first_valid) {
            first_valid = &point;
        }
        last_valid = &point;
        double v = *point.value;
        result.min_valuation = result.min_valuation ? std::min(*result.min_valuation, v) : v;
        result.max_valuation = result.max_valuation ? std::max(*result.max_valuation, v) : v;
    }

    if (result.min_valuation) {
        result.valuation_range = *result.max_valuation - *result.min_valuation;
    }
    if (result.base_value != 0.0) {
        result.impact_percentage = result.valuation_range / std::fabs(result.base_value);
    }

    // Elasticity needs two distinct valid points and non-zero bases
    if (first_valid && last_valid && first_valid != last_valid &&
        result.base_value != 0.0 && result.base_parameter_value != 0.0) {
        double value_change = (*last_valid->value - *first_valid->value) / result.base_value;
        double parameter_change = (last_valid->parameter_value - first_valid->parameter_value) /
                                  result.base_parameter_value;
        if (parameter_change != 0.0) {
            result.elasticity = value_change / parameter_change;
        }
    }

    return result;
}

// ============================================================================
// Two-way
// ============================================================================

TwoWayResult two_way_sensitivity(
    const Company& company,
    DcfParameter row_parameter,
    DcfParameter column_parameter,
    const std::optional<ParameterRange>& row_range,
    const std::optional<ParameterRange>& column_range,
    const SensitivityConfig& config,
    const DcfConfig& dcf_config)
{
    if (row_parameter == column_parameter) {
        throw ValidationError("two-way sensitivity needs two different parameters (got " +
                              parameter_to_string(row_parameter) + " twice)");
    }
    validate_config(config);
    validate_company(company);
    validate_dcf_config(dcf_config);

    ParameterRange rows = row_range ? *row_range : default_range(company, row_parameter, config);
    ParameterRange cols = column_range ? *column_range
                                       : default_range(company, column_parameter, config);
    validate_range(rows);
    validate_range(cols);

    TwoWayResult result;
    result.row_parameter = row_parameter;
    result.column_parameter = column_parameter;
    result.row_values = sweep_points(rows, config.steps);
    result.column_values = sweep_points(cols, config.steps);

    const size_t n_rows = result.row_values.size();
    const size_t n_cols = result.column_values.size();
    const size_t n_cells = n_rows * n_cols;

    // Pre-sized, indexed by cell; each cell is written by exactly one thread
    std::vector<double> cell_values(n_cells, 0.0);
    std::vector<uint8_t> cell_ok(n_cells, 0);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 8)
#endif
    for (long long cell = 0; cell < static_cast<long long>(n_cells); ++cell) {
        size_t idx = static_cast<size_t>(cell);
        size_t r = idx / n_cols;
        size_t c = idx % n_cols;

        DcfOverrides overrides = override_parameter(row_parameter, result.row_values[r]);
        overrides = override_parameter(column_parameter, result.column_values[c], overrides);
        try {
            cell_values[idx] = dcf_valuation(company, overrides, dcf_config).value();
            cell_ok[idx] = 1;
        } catch (const DomainError&) {
            cell_ok[idx] = 0;
        }
    }

    result.grid.assign(n_rows, std::vector<std::optional<double>>(n_cols));
    for (size_t r = 0; r < n_rows; ++r) {
        for (size_t c = 0; c < n_cols; ++c) {
            size_t idx = r * n_cols + c;
            if (!cell_ok[idx]) {
                result.failed_cells++;
                continue;
            }
            double v = cell_values[idx];
            result.grid[r][c] = v;
            result.min_valuation = result.min_valuation ? std::min(*result.min_valuation, v) : v;
            result.max_valuation = result.max_valuation ? std::max(*result.max_valuation, v) : v;
        }
    }

    return result;
}

// ============================================================================
// Tornado
// ============================================================================

std::vector<TornadoBar> tornado_chart_data(
    const Company& company,
    const SensitivityConfig& config,
    const DcfConfig& dcf_config)
{
    validate_config(config);

    std::vector<TornadoBar> bars;
    bars.reserve(STANDARD_PARAMETERS.size());

    for (DcfParameter parameter : STANDARD_PARAMETERS) {
        double base = base_parameter_value(company, parameter);
        double delta = config.tornado_deltas[static_cast<size_t>(parameter)];
        ParameterRange range{base - delta, base + delta};

        OneWayResult sweep = one_way_sensitivity(company, parameter, range, config, dcf_config);

        TornadoBar bar;
        bar.parameter = parameter;
        bar.low_parameter_value = range.low;
        bar.high_parameter_value = range.high;
        bar.value_at_low = sweep.points.front().value;
        bar.value_at_high = sweep.points.back().value;
        bar.valuation_range = sweep.valuation_range;
        bar.impact_percentage = sweep.impact_percentage;
        bars.push_back(bar);
    }

    std::stable_sort(bars.begin(), bars.end(),
        [](const TornadoBar& a, const TornadoBar& b) {
            return a.valuation_range > b.valuation_range;
        });

    return bars;
}

ComprehensiveSensitivity comprehensive_sensitivity(
    const Company& company,
    const SensitivityConfig& config,
    const DcfConfig& dcf_config)
{
    ComprehensiveSensitivity result;
    result.base_value = dcf_valuation(company, DcfOverrides(), dcf_config).value();

    result.parameters.reserve(STANDARD_PARAMETERS.size());
    for (DcfParameter parameter : STANDARD_PARAMETERS) {
        result.parameters.push_back(
            one_way_sensitivity(company, parameter, std::nullopt, config, dcf_config));
    }
    result.tornado = tornado_chart_data(company, config, dcf_config);

    return result;
}

} // namespace valucalc
