#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <limits>
#include "company.hpp"
#include "errors.hpp"
#include "valuation_result.hpp"

using namespace valucalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {

Company make_company() {
    Company company;
    company.name = "Acme Robotics";
    company.industry = "Machinery";
    company.revenue = 1000.0;
    company.net_income = 100.0;
    company.total_debt = 200.0;
    company.cash_and_equivalents = 50.0;
    return company;
}

} // anonymous namespace

TEST_CASE("Company defaults", "[company]") {
    Company company;
    REQUIRE(company.stage == CompanyStage::Growth);
    REQUIRE_THAT(company.growth_rate, WithinAbs(0.15, 1e-12));
    REQUIRE_THAT(company.operating_margin, WithinAbs(0.20, 1e-12));
    REQUIRE_THAT(company.tax_rate, WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(company.terminal_growth_rate, WithinAbs(0.025, 1e-12));
    REQUIRE_FALSE(company.ebitda.has_value());
    REQUIRE_FALSE(company.net_assets.has_value());
}

TEST_CASE("Company net debt", "[company]") {
    Company company = make_company();
    REQUIRE_THAT(company.net_debt(), WithinAbs(150.0, 1e-12));

    company.cash_and_equivalents = 500.0;
    REQUIRE_THAT(company.net_debt(), WithinAbs(-300.0, 1e-12));
}

TEST_CASE("Company stage names", "[company]") {
    SECTION("Round trip through names") {
        for (CompanyStage stage : {CompanyStage::Early, CompanyStage::Growth,
                                   CompanyStage::Mature, CompanyStage::Listed}) {
            REQUIRE(stage_from_string(stage_to_string(stage)) == stage);
        }
    }

    SECTION("Parsing is case-insensitive") {
        REQUIRE(stage_from_string("MATURE") == CompanyStage::Mature);
        REQUIRE(stage_from_string("Public") == CompanyStage::Listed);
    }

    SECTION("Unknown stage is rejected") {
        REQUIRE_THROWS_AS(stage_from_string("seed"), ValidationError);
    }
}

TEST_CASE("Company validation", "[company]") {
    Company company = make_company();

    SECTION("Valid company passes") {
        REQUIRE_NOTHROW(validate_company(company));
    }

    SECTION("Industry is required") {
        company.industry.clear();
        REQUIRE_THROWS_WITH(validate_company(company), ContainsSubstring("industry"));
    }

    SECTION("Negative revenue is rejected") {
        company.revenue = -1.0;
        REQUIRE_THROWS_AS(validate_company(company), ValidationError);
    }

    SECTION("Negative net income is allowed") {
        company.net_income = -500.0;
        REQUIRE_NOTHROW(validate_company(company));
    }

    SECTION("Tax rate must lie in [0, 1)") {
        company.tax_rate = 1.0;
        REQUIRE_THROWS_WITH(validate_company(company), ContainsSubstring("tax_rate"));
        company.tax_rate = -0.1;
        REQUIRE_THROWS_AS(validate_company(company), ValidationError);
        company.tax_rate = 0.0;
        REQUIRE_NOTHROW(validate_company(company));
    }

    SECTION("Negative optional net assets are rejected") {
        company.net_assets = -10.0;
        REQUIRE_THROWS_WITH(validate_company(company), ContainsSubstring("net_assets"));
    }

    SECTION("Non-finite values are rejected") {
        company.growth_rate = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_WITH(validate_company(company), ContainsSubstring("growth_rate"));
    }

    SECTION("Target debt ratio must lie in [0, 1]") {
        company.target_debt_ratio = 1.5;
        REQUIRE_THROWS_AS(validate_company(company), ValidationError);
    }

    SECTION("Validation errors carry their category prefix") {
        company.beta = -1.0;
        REQUIRE_THROWS_WITH(validate_company(company), ContainsSubstring("Validation error: beta"));
    }
}

TEST_CASE("ValuationResult accessors", "[company][result]") {
    SECTION("Point estimate") {
        ValuationResult result("DCF", 1200.0, std::nullopt, std::nullopt, {{"wacc", 0.09}}, {});
        REQUIRE(result.method() == "DCF");
        REQUIRE_FALSE(result.has_range());
        REQUIRE_THAT(result.value_mid(), WithinAbs(1200.0, 1e-12));
        REQUIRE_FALSE(result.range_width_pct().has_value());
        REQUIRE_THAT(result.detail("wacc"), WithinAbs(0.09, 1e-12));
        REQUIRE_FALSE(result.find_detail("missing").has_value());
        REQUIRE_THROWS_AS(result.detail("missing"), std::out_of_range);
    }

    SECTION("Range estimate") {
        ValuationResult result("PE", 1000.0, 800.0, 1400.0, {}, {});
        REQUIRE(result.has_range());
        REQUIRE_THAT(result.value_mid(), WithinAbs(1100.0, 1e-12));
        REQUIRE_THAT(*result.range_width_pct(), WithinAbs(600.0 / 1100.0, 1e-12));
    }
}
