#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace valucalc {
namespace stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double std_dev(const std::vector<double>& values) {
    return std_dev(values, mean(values));
}

double percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[std::min(lower_idx, sorted_values.size() - 1)];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

double cte(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }

    double tail_proportion = (100.0 - p) / 100.0;
    size_t tail_count = static_cast<size_t>(
        std::ceil(static_cast<double>(sorted_values.size()) * tail_proportion));

    if (tail_count == 0) {
        tail_count = 1;
    }
    tail_count = std::min(tail_count, sorted_values.size());

    double sum = 0.0;
    for (size_t i = 0; i < tail_count; ++i) {
        sum += sorted_values[i];
    }
    return sum / static_cast<double>(tail_count);
}

std::vector<HistogramBin> histogram(const std::vector<double>& values, size_t bins) {
    std::vector<HistogramBin> result;
    if (values.empty() || bins == 0) {
        return result;
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double lower = *min_it;
    double upper = *max_it;
    if (upper == lower) {
        // Padding scales with the value so large constants still get a non-zero width
        double pad = std::max(0.5, std::fabs(lower) * 1e-9);
        lower -= pad;
        upper += pad;
    }

    double width = (upper - lower) / static_cast<double>(bins);
    result.reserve(bins);
    for (size_t b = 0; b < bins; ++b) {
        double bin_lower = lower + width * static_cast<double>(b);
        double bin_upper = (b + 1 == bins) ? upper : lower + width * static_cast<double>(b + 1);
        result.push_back(HistogramBin{bin_lower, bin_upper, 0});
    }

    for (double v : values) {
        double position = (v - lower) / width;
        size_t idx = 0;
        if (!(position < static_cast<double>(bins))) {
            idx = bins - 1;
        } else if (position > 0.0) {
            idx = static_cast<size_t>(position);
        }
        result[idx].count++;
    }

    return result;
}

} // namespace stats
} // namespace valucalc
