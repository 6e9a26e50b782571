#include "monte_carlo.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace valucalc {

std::string distribution_to_string(DistributionType type) {
    switch (type) {
        case DistributionType::Normal: return "normal";
        case DistributionType::Uniform: return "uniform";
    }
    return "unknown";
}

DistributionType distribution_from_string(const std::string& value) {
    if (value == "normal") return DistributionType::Normal;
    if (value == "uniform") return DistributionType::Uniform;
    throw ValidationError("Unknown distribution '" + value + "' (expected normal or uniform)");
}

namespace {

struct Sample {
    double growth;
    double margin;
    double wacc;
    double terminal_growth;
};

void validate_distribution(const char* name, const ParameterDistribution& dist) {
    if (!std::isfinite(dist.mean) || !std::isfinite(dist.std_dev) || dist.std_dev < 0.0) {
        throw ValidationError(std::string("distribution for ") + name +
                              " needs a finite mean and a finite std >= 0");
    }
}

void validate_config(const MonteCarloConfig& config) {
    if (config.iterations == 0) {
        throw ValidationError("iterations must be >= 1");
    }
    if (config.max_iterations == 0) {
        throw ValidationError("max_iterations must be >= 1");
    }
    if (config.histogram_bins == 0) {
        throw ValidationError("histogram_bins must be >= 1");
    }
    validate_distribution("growth_rate", config.growth);
    validate_distribution("operating_margin", config.margin);
    validate_distribution("wacc", config.wacc);
    validate_distribution("terminal_growth", config.terminal_growth);
}

double draw(const ParameterDistribution& dist, std::mt19937_64& rng) {
    if (dist.std_dev == 0.0) {
        return dist.mean;
    }
    if (dist.type == DistributionType::Uniform) {
        double half_width = dist.std_dev * std::sqrt(3.0);
        std::uniform_real_distribution<double> uniform(dist.mean - half_width,
                                                       dist.mean + half_width);
        return uniform(rng);
    }
    std::normal_distribution<double> normal(dist.mean, dist.std_dev);
    return normal(rng);
}

} // anonymous namespace

MonteCarloResult monte_carlo_simulation(
    const Company& company,
    const MonteCarloConfig& config,
    std::mt19937_64& rng,
    const DcfConfig& dcf_config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    validate_company(company);
    validate_config(config);
    validate_dcf_config(dcf_config);

    MonteCarloResult result;
    result.iterations_requested = config.iterations;
    result.iterations = std::min(config.iterations, config.max_iterations);

    std::vector<std::string> warnings;
    if (result.iterations < config.iterations) {
        warnings.push_back("iterations capped at " + std::to_string(config.max_iterations));
    }

    const double base_wacc = calculate_wacc(company);
    const size_t n = result.iterations;

    // Draw every sample up front so the random stream is consumed in order
    std::vector<Sample> samples(n);
    for (size_t i = 0; i < n; ++i) {
        Sample& s = samples[i];
        s.growth = std::clamp(company.growth_rate + draw(config.growth, rng),
                              MC_GROWTH_MIN, MC_GROWTH_MAX);
        s.margin = std::clamp(company.operating_margin + draw(config.margin, rng),
                              MC_MARGIN_MIN, MC_MARGIN_MAX);
        s.wacc = std::clamp(base_wacc + draw(config.wacc, rng),
                            MC_WACC_MIN, MC_WACC_MAX);
        s.terminal_growth = std::clamp(company.terminal_growth_rate +
                                       draw(config.terminal_growth, rng),
                                       MC_TERMINAL_GROWTH_MIN, MC_TERMINAL_GROWTH_MAX);
    }

    // Pre-sized outputs indexed by iteration; no shared mutable state
    std::vector<double> values(n, 0.0);
    std::vector<uint8_t> succeeded(n, 0);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 64)
#endif
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const Sample& s = samples[static_cast<size_t>(i)];
        DcfOverrides overrides;
        overrides.growth_rate = s.growth;
        overrides.operating_margin = s.margin;
        overrides.wacc = s.wacc;
        overrides.terminal_growth_rate = s.terminal_growth;
        try {
            values[static_cast<size_t>(i)] = dcf_valuation(company, overrides, dcf_config).value();
            succeeded[static_cast<size_t>(i)] = 1;
        } catch (const DomainError&) {
            // Counted as a failed iteration below
            succeeded[static_cast<size_t>(i)] = 0;
        }
    }

    std::vector<double> valid;
    valid.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (succeeded[i]) {
            valid.push_back(values[i]);
        }
    }
    result.valid_iterations = valid.size();
    result.failed_iterations = n - valid.size();

    if (valid.empty()) {
        warnings.push_back("no valid iterations: every sample produced a degenerate DCF");
    } else {
        if (result.failed_iterations > 0) {
            warnings.push_back(std::to_string(result.failed_iterations) +
                               " iterations produced a degenerate DCF and were excluded");
        }
        result.mean = stats::mean(valid);
        result.std_dev = stats::std_dev(valid, result.mean);

        std::vector<double> sorted = valid;
        std::sort(sorted.begin(), sorted.end());

        result.min = sorted.front();
        result.max = sorted.back();
        result.median = stats::percentile(sorted, 50.0);
        result.percentile_5 = stats::percentile(sorted, 5.0);
        result.percentile_10 = stats::percentile(sorted, 10.0);
        result.percentile_25 = stats::percentile(sorted, 25.0);
        result.percentile_75 = stats::percentile(sorted, 75.0);
        result.percentile_90 = stats::percentile(sorted, 90.0);
        result.percentile_95 = stats::percentile(sorted, 95.0);
        result.cte_95 = stats::cte(sorted, 95.0);
        result.histogram = stats::histogram(sorted, config.histogram_bins);

        if (config.store_values) {
            result.values = std::move(valid);
        }
    }

    if (!warnings.empty()) {
        std::string joined = warnings.front();
        for (size_t i = 1; i < warnings.size(); ++i) {
            joined += "; " + warnings[i];
        }
        result.warning = joined;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

MonteCarloResult monte_carlo_simulation(
    const Company& company,
    const MonteCarloConfig& config,
    const DcfConfig& dcf_config)
{
    uint64_t seed = 0;
    if (config.seed) {
        seed = *config.seed;
    } else {
        std::random_device device;
        seed = (static_cast<uint64_t>(device()) << 32) | static_cast<uint64_t>(device());
    }

    std::mt19937_64 rng(seed);
    MonteCarloResult result = monte_carlo_simulation(company, config, rng, dcf_config);
    result.seed = seed;
    return result;
}

} // namespace valucalc
