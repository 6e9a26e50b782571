#ifndef VALUCALC_MONTE_CARLO_HPP
#define VALUCALC_MONTE_CARLO_HPP

#include "company.hpp"
#include "dcf.hpp"
#include "statistics.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace valucalc {

// Sampled parameters are clamped into these domains before evaluation
constexpr double MC_GROWTH_MIN = -0.5;
constexpr double MC_GROWTH_MAX = 1.0;
constexpr double MC_MARGIN_MIN = 0.0;
constexpr double MC_MARGIN_MAX = 0.95;
constexpr double MC_WACC_MIN = 0.01;
constexpr double MC_WACC_MAX = 0.5;
constexpr double MC_TERMINAL_GROWTH_MIN = -0.02;
constexpr double MC_TERMINAL_GROWTH_MAX = 0.06;

enum class DistributionType : uint8_t {
    Normal = 0,
    Uniform = 1     // symmetric, half-width std * sqrt(3) so that it has the given std
};

std::string distribution_to_string(DistributionType type);
DistributionType distribution_from_string(const std::string& value);

// Perturbation added to a base parameter each iteration
struct ParameterDistribution {
    DistributionType type = DistributionType::Normal;
    double mean = 0.0;      // mean shift, 0 for a symmetric perturbation
    double std_dev = 0.0;   // 0 disables sampling for this parameter
};

struct MonteCarloConfig {
    size_t iterations = 1000;
    size_t max_iterations = 1000000;    // hard cap on iterations
    std::optional<uint64_t> seed;       // used only by the self-seeding overload
    size_t histogram_bins = 30;
    bool store_values = false;          // keep every valid iteration value

    ParameterDistribution growth{DistributionType::Normal, 0.0, 0.05};
    ParameterDistribution margin{DistributionType::Normal, 0.0, 0.03};
    ParameterDistribution wacc{DistributionType::Normal, 0.0, 0.01};
    ParameterDistribution terminal_growth{DistributionType::Normal, 0.0, 0.005};
};

// Empirical distribution of equity value over the simulation
// Statistics cover valid iterations only; all are 0 when none succeeded.
struct MonteCarloResult {
    size_t iterations_requested = 0;
    size_t iterations = 0;              // after the max_iterations cap
    size_t valid_iterations = 0;
    size_t failed_iterations = 0;       // DCF failed closed for the sample

    double mean = 0.0;
    double median = 0.0;
    double std_dev = 0.0;               // population
    double min = 0.0;
    double max = 0.0;
    double percentile_5 = 0.0;
    double percentile_10 = 0.0;
    double percentile_25 = 0.0;
    double percentile_75 = 0.0;
    double percentile_90 = 0.0;
    double percentile_95 = 0.0;
    double cte_95 = 0.0;                // mean of the worst 5%

    std::vector<stats::HistogramBin> histogram;
    std::vector<double> values;         // only with store_values

    std::optional<std::string> warning;
    std::optional<uint64_t> seed;       // set by the self-seeding overload
    double execution_time_ms = 0.0;
};

// Run the simulation with an injected generator
//
// Samples are drawn sequentially from rng (growth, margin, wacc, terminal
// growth per iteration), then the DCF evaluations run in parallel when
// OpenMP is available. The same generator state therefore always yields the
// same result, independent of thread count.
MonteCarloResult monte_carlo_simulation(
    const Company& company,
    const MonteCarloConfig& config,
    std::mt19937_64& rng,
    const DcfConfig& dcf_config = DcfConfig());

// Seeds a generator from config.seed, or from std::random_device when unset
MonteCarloResult monte_carlo_simulation(
    const Company& company,
    const MonteCarloConfig& config = MonteCarloConfig(),
    const DcfConfig& dcf_config = DcfConfig());

} // namespace valucalc

#endif // VALUCALC_MONTE_CARLO_HPP
