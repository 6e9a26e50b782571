#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <limits>
#include "relative_valuation.hpp"
#include "errors.hpp"

using namespace valucalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

Company create_company() {
    Company company;
    company.name = "Target Co";
    company.industry = "Software";
    company.revenue = 1000.0;
    company.net_income = 100.0;
    company.net_assets = 500.0;
    company.ebitda = 200.0;
    company.total_debt = 300.0;
    company.cash_and_equivalents = 100.0;
    return company;
}

Comparable create_comparable(const std::string& name, double pe, double ps, double pb, double ev_ebitda) {
    Comparable comparable;
    comparable.name = name;
    comparable.industry = "Software";
    comparable.pe_ratio = pe;
    comparable.ps_ratio = ps;
    comparable.pb_ratio = pb;
    comparable.ev_ebitda = ev_ebitda;
    return comparable;
}

std::vector<Comparable> create_peers() {
    return {
        create_comparable("Peer A", 10.0, 1.0, 2.0, 8.0),
        create_comparable("Peer B", 20.0, 2.0, 3.0, 10.0),
        create_comparable("Peer C", 30.0, 3.0, 4.0, 12.0)
    };
}

} // anonymous namespace

TEST_CASE("Relative valuation applies the median multiple", "[relative]") {
    Company company = create_company();
    RelativeResults results = relative_valuation(company, create_peers());

    REQUIRE(results.size() == 4);

    SECTION("P/E") {
        const ValuationResult& pe = results.at(RelativeMethod::PE);
        REQUIRE(pe.method() == "PE");
        REQUIRE_THAT(pe.value(), WithinRel(2000.0, 1e-12));
        REQUIRE_THAT(pe.detail("multiple_median"), WithinAbs(20.0, 1e-12));
        REQUIRE_THAT(pe.detail("multiple_min"), WithinAbs(10.0, 1e-12));
        REQUIRE_THAT(pe.detail("multiple_max"), WithinAbs(30.0, 1e-12));
        REQUIRE(pe.detail("comparable_count") == 3.0);
        REQUIRE_FALSE(pe.has_range());
    }

    SECTION("P/S and P/B") {
        REQUIRE_THAT(results.at(RelativeMethod::PS).value(), WithinRel(2000.0, 1e-12));
        REQUIRE_THAT(results.at(RelativeMethod::PB).value(), WithinRel(1500.0, 1e-12));
    }

    SECTION("EV/EBITDA bridges to equity with net debt") {
        const ValuationResult& ev = results.at(RelativeMethod::EvEbitda);
        REQUIRE(ev.method() == "EV/EBITDA");
        REQUIRE_THAT(ev.detail("enterprise_value"), WithinRel(2000.0, 1e-12));
        REQUIRE_THAT(ev.detail("net_debt"), WithinAbs(200.0, 1e-12));
        REQUIRE_THAT(ev.value(), WithinRel(1800.0, 1e-12));
    }
}

TEST_CASE("Relative valuation skips unusable methods", "[relative][edge]") {
    Company company = create_company();

    SECTION("Empty comparables give an empty mapping") {
        REQUIRE(relative_valuation(company, {}).empty());
        REQUIRE(auto_comparable_analysis(company, {}).empty());
    }

    SECTION("Loss-making company has no P/E") {
        company.net_income = -50.0;
        RelativeResults results = relative_valuation(company, create_peers());
        REQUIRE(results.count(RelativeMethod::PE) == 0);
        REQUIRE(results.count(RelativeMethod::PS) == 1);
    }

    SECTION("Missing EBITDA and net assets") {
        company.ebitda.reset();
        company.net_assets.reset();
        RelativeResults results = relative_valuation(company, create_peers());
        REQUIRE(results.size() == 2);
        REQUIRE(results.count(RelativeMethod::PB) == 0);
        REQUIRE(results.count(RelativeMethod::EvEbitda) == 0);
    }

    SECTION("Non-positive and non-finite multiples are ignored") {
        std::vector<Comparable> peers = create_peers();
        peers[0].pe_ratio = -5.0;
        peers[1].pe_ratio = std::numeric_limits<double>::infinity();
        RelativeResults results = relative_valuation(company, peers, {RelativeMethod::PE});
        REQUIRE(results.at(RelativeMethod::PE).detail("comparable_count") == 1.0);
        REQUIRE_THAT(results.at(RelativeMethod::PE).value(), WithinRel(3000.0, 1e-12));
    }

    SECTION("Only requested methods are valued") {
        RelativeResults results = relative_valuation(
            company, create_peers(), {RelativeMethod::PS, RelativeMethod::PS});
        REQUIRE(results.size() == 1);
        REQUIRE(results.count(RelativeMethod::PS) == 1);
    }

    SECTION("Invalid company is rejected") {
        company.industry.clear();
        REQUIRE_THROWS_AS(relative_valuation(company, create_peers()), ValidationError);
    }
}

TEST_CASE("Comparable multiples", "[relative]") {
    Comparable comparable;
    comparable.name = "Derived";

    SECTION("Derived from market cap when not reported") {
        comparable.market_cap = 1500.0;
        comparable.net_income = 100.0;
        comparable.revenue = 500.0;
        REQUIRE_THAT(*comparable_multiple(comparable, RelativeMethod::PE), WithinAbs(15.0, 1e-12));
        REQUIRE_THAT(*comparable_multiple(comparable, RelativeMethod::PS), WithinAbs(3.0, 1e-12));
        REQUIRE_FALSE(comparable_multiple(comparable, RelativeMethod::PB).has_value());
    }

    SECTION("Negative denominator invalidates a reported multiple") {
        comparable.pe_ratio = 12.0;
        comparable.net_income = -10.0;
        REQUIRE_FALSE(comparable_multiple(comparable, RelativeMethod::PE).has_value());
    }

    SECTION("EV/EBITDA is never derived") {
        comparable.market_cap = 1000.0;
        comparable.ebitda = 100.0;
        REQUIRE_FALSE(comparable_multiple(comparable, RelativeMethod::EvEbitda).has_value());
        comparable.ev_ebitda = 9.0;
        REQUIRE_THAT(*comparable_multiple(comparable, RelativeMethod::EvEbitda), WithinAbs(9.0, 1e-12));
    }
}

TEST_CASE("Relative valuation configuration", "[relative][config]") {
    Company company = create_company();

    SECTION("Illiquidity discount and control premium") {
        RelativeValuationConfig config;
        config.illiquidity_discount = 0.25;
        config.control_premium = 0.05;
        RelativeResults results = relative_valuation(company, create_peers(), {RelativeMethod::PE}, config);
        REQUIRE_THAT(results.at(RelativeMethod::PE).value(), WithinRel(1600.0, 1e-12));
        REQUIRE_THAT(results.at(RelativeMethod::PE).detail("adjustment_factor"), WithinAbs(0.8, 1e-12));
    }

    SECTION("Forward metrics grow P/E and P/S bases") {
        RelativeValuationConfig config;
        config.use_forward_metrics = true;
        company.growth_rate = 0.10;
        RelativeResults results = relative_valuation(company, create_peers(), {RelativeMethod::PE, RelativeMethod::PB}, config);
        REQUIRE_THAT(results.at(RelativeMethod::PE).detail("metric_used"), WithinRel(110.0, 1e-12));
        REQUIRE_THAT(results.at(RelativeMethod::PB).detail("metric_used"), WithinRel(500.0, 1e-12));
    }

    SECTION("Invalid discount is rejected") {
        RelativeValuationConfig config;
        config.illiquidity_discount = 1.0;
        REQUIRE_THROWS_AS(relative_valuation(company, create_peers(), {RelativeMethod::PE}, config),
                          ValidationError);
    }

    SECTION("Method names") {
        REQUIRE(method_from_string("ev_ebitda") == RelativeMethod::EvEbitda);
        REQUIRE(method_from_string("pe") == RelativeMethod::PE);
        REQUIRE_THROWS_AS(method_from_string("VC"), ValidationError);
    }
}

TEST_CASE("Auto comparable analysis ranges", "[relative]") {
    RelativeResults results = auto_comparable_analysis(create_company(), create_peers());
    const ValuationResult& pe = results.at(RelativeMethod::PE);

    REQUIRE(pe.has_range());
    REQUIRE_THAT(*pe.value_low(), WithinRel(1000.0, 1e-12));
    REQUIRE_THAT(*pe.value_high(), WithinRel(3000.0, 1e-12));
    REQUIRE_THAT(pe.value(), WithinRel(2000.0, 1e-12));
}

TEST_CASE("Weighted relative value", "[relative]") {
    RelativeResults results = auto_comparable_analysis(create_company(), create_peers());

    auto weighted = weighted_relative_value(results);
    REQUIRE(weighted.has_value());
    // 0.3 * 2000 + 0.3 * 2000 + 0.2 * 1500 + 0.2 * 1800
    REQUIRE_THAT(weighted->value(), WithinRel(1860.0, 1e-12));
    REQUIRE(weighted->has_range());
    REQUIRE(weighted->detail("methods_used") == 4.0);

    SECTION("Weights renormalize over available methods") {
        RelativeResults partial;
        partial.emplace(RelativeMethod::PE, results.at(RelativeMethod::PE));
        partial.emplace(RelativeMethod::PB, results.at(RelativeMethod::PB));
        auto renormalized = weighted_relative_value(partial);
        REQUIRE_THAT(renormalized->value(), WithinRel(0.6 * 2000.0 + 0.4 * 1500.0, 1e-12));
        REQUIRE_THAT(renormalized->detail("weight_PE"), WithinAbs(0.6, 1e-12));
    }

    SECTION("A single method is not enough") {
        RelativeResults single;
        single.emplace(RelativeMethod::PE, results.at(RelativeMethod::PE));
        REQUIRE_FALSE(weighted_relative_value(single).has_value());
    }
}

TEST_CASE("Comparable statistics", "[relative]") {
    auto statistics = comparable_statistics(create_peers());
    REQUIRE(statistics.size() == 4);

    const MultipleStatistics& pe = statistics.at(RelativeMethod::PE);
    REQUIRE(pe.count == 3);
    REQUIRE_THAT(pe.mean, WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(pe.median, WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(pe.min, WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(pe.max, WithinAbs(30.0, 1e-12));

    REQUIRE(comparable_statistics({}).empty());
}
