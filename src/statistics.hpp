#ifndef VALUCALC_STATISTICS_HPP
#define VALUCALC_STATISTICS_HPP

#include <cstddef>
#include <vector>

namespace valucalc {
namespace stats {

// Arithmetic mean; 0 for an empty input
double mean(const std::vector<double>& values);

// Population standard deviation (divides by N); 0 for fewer than 2 values
double std_dev(const std::vector<double>& values, double mean);
double std_dev(const std::vector<double>& values);

// Percentile by linear interpolation between closest ranks
// sorted_values must be ascending; p is in [0, 100]
double percentile(const std::vector<double>& sorted_values, double p);

// Median; even counts average the two middle values. Input need not be sorted.
double median(std::vector<double> values);

// Conditional tail expectation: mean of the lowest (100 - p)% of values
// sorted_values must be ascending
double cte(const std::vector<double>& sorted_values, double p);

struct HistogramBin {
    double bin_lower;
    double bin_upper;
    size_t count;
};

// Equal-width histogram over [min, max]
// The maximum lands in the last bin. A zero-width range is widened to
// [v - pad, v + pad] with pad = max(0.5, |v| * 1e-9). Empty input or zero
// bins gives an empty histogram.
std::vector<HistogramBin> histogram(const std::vector<double>& values, size_t bins);

} // namespace stats
} // namespace valucalc

#endif // VALUCALC_STATISTICS_HPP
