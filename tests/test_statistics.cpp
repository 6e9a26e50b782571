#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <numeric>
#include <vector>
#include "statistics.hpp"

using namespace valucalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Mean and standard deviation", "[statistics]") {
    std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    REQUIRE_THAT(stats::mean(values), WithinAbs(5.0, 1e-12));
    // Population std of the textbook example
    REQUIRE_THAT(stats::std_dev(values), WithinAbs(2.0, 1e-12));

    SECTION("Empty and single inputs") {
        REQUIRE(stats::mean({}) == 0.0);
        REQUIRE(stats::std_dev({}) == 0.0);
        REQUIRE(stats::std_dev({3.0}) == 0.0);
    }
}

TEST_CASE("Median", "[statistics]") {
    REQUIRE_THAT(stats::median({3.0, 1.0, 2.0}), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(stats::median({4.0, 1.0, 3.0, 2.0}), WithinAbs(2.5, 1e-12));
    REQUIRE(stats::median({}) == 0.0);
}

TEST_CASE("Percentile interpolation", "[statistics]") {
    std::vector<double> sorted(101);
    std::iota(sorted.begin(), sorted.end(), 0.0);

    REQUIRE_THAT(stats::percentile(sorted, 0.0), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(stats::percentile(sorted, 50.0), WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(stats::percentile(sorted, 95.0), WithinAbs(95.0, 1e-12));
    REQUIRE_THAT(stats::percentile(sorted, 100.0), WithinAbs(100.0, 1e-12));

    SECTION("Between ranks") {
        std::vector<double> two = {10.0, 20.0};
        REQUIRE_THAT(stats::percentile(two, 25.0), WithinAbs(12.5, 1e-12));
    }

    SECTION("Degenerate inputs") {
        REQUIRE(stats::percentile({}, 50.0) == 0.0);
        REQUIRE(stats::percentile({7.0}, 90.0) == 7.0);
    }
}

TEST_CASE("Conditional tail expectation", "[statistics]") {
    std::vector<double> sorted(100);
    std::iota(sorted.begin(), sorted.end(), 1.0);

    // Worst 5 of 1..100 average to 3
    REQUIRE_THAT(stats::cte(sorted, 95.0), WithinAbs(3.0, 1e-12));

    SECTION("Tail never empty") {
        std::vector<double> small = {5.0, 6.0};
        REQUIRE_THAT(stats::cte(small, 99.9), WithinAbs(5.0, 1e-12));
    }
}

TEST_CASE("Histogram", "[statistics]") {
    std::vector<double> values = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 10.0};
    auto bins = stats::histogram(values, 5);

    REQUIRE(bins.size() == 5);
    REQUIRE_THAT(bins.front().bin_lower, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(bins.back().bin_upper, WithinAbs(10.0, 1e-12));

    size_t total = 0;
    for (const auto& bin : bins) {
        total += bin.count;
    }
    REQUIRE(total == values.size());
    // The maximum falls in the last bin
    REQUIRE(bins.back().count == 2);

    SECTION("Constant values widen the range") {
        auto flat = stats::histogram({3.0, 3.0, 3.0}, 4);
        REQUIRE(flat.size() == 4);
        REQUIRE_THAT(flat.front().bin_lower, WithinAbs(2.5, 1e-12));
        REQUIRE_THAT(flat.back().bin_upper, WithinAbs(3.5, 1e-12));
    }

    SECTION("Large constant values keep non-zero bin widths") {
        std::vector<double> huge(6, 1e17);
        auto flat = stats::histogram(huge, 4);
        REQUIRE(flat.size() == 4);

        size_t filled = 0;
        size_t counted = 0;
        for (const auto& bin : flat) {
            REQUIRE(bin.bin_upper > bin.bin_lower);
            counted += bin.count;
            if (bin.count > 0) {
                REQUIRE(bin.count == huge.size());
                filled++;
            }
        }
        REQUIRE(counted == huge.size());
        REQUIRE(filled == 1);
        REQUIRE(flat.front().bin_lower < 1e17);
        REQUIRE(flat.back().bin_upper > 1e17);
    }

    SECTION("Empty input") {
        REQUIRE(stats::histogram({}, 10).empty());
        REQUIRE(stats::histogram(values, 0).empty());
    }
}
