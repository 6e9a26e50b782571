#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include "multi_product.hpp"
#include "errors.hpp"

using namespace valucalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

// WACC 0.10, net debt 50
Company create_company() {
    Company company;
    company.name = "Segmented Co";
    company.industry = "Industrials";
    company.revenue = 1500.0;
    company.net_income = 150.0;
    company.beta = 1.0;
    company.risk_free_rate = 0.03;
    company.market_risk_premium = 0.07;
    company.target_debt_ratio = 0.0;
    company.tax_rate = 0.25;
    company.total_debt = 100.0;
    company.cash_and_equivalents = 50.0;
    return company;
}

// FCF is 11% of revenue: 0.2 margin after 25% tax less 4% net reinvestment
ProductSegment create_core_product() {
    ProductSegment product;
    product.name = "Core";
    product.current_revenue = 1000.0;
    product.revenue_weight = 0.6;
    product.growth_rate_years = {0.10};
    product.terminal_growth_rate = 0.02;
    return product;
}

ProductSegment create_new_product() {
    ProductSegment product;
    product.name = "New";
    product.current_revenue = 500.0;
    product.revenue_weight = 0.4;
    product.growth_rate_years = {0.20, 0.10};
    return product;
}

DcfConfig one_year() {
    DcfConfig config;
    config.horizon_years = 1;
    return config;
}

} // anonymous namespace

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Product list validation", "[multiproduct][validation]") {
    std::vector<ProductSegment> products = {create_core_product(), create_new_product()};
    REQUIRE_NOTHROW(validate_products(products));

    SECTION("Empty and oversized lists") {
        REQUIRE_THROWS_AS(validate_products({}), ValidationError);

        std::vector<ProductSegment> many(MAX_PRODUCTS + 1, create_core_product());
        for (size_t i = 0; i < many.size(); ++i) {
            many[i].name = "P" + std::to_string(i);
            many[i].revenue_weight = 1.0 / static_cast<double>(many.size());
        }
        REQUIRE_THROWS_WITH(validate_products(many), ContainsSubstring("at most 10"));
    }

    SECTION("Weights must sum to one within tolerance") {
        products[1].revenue_weight = 0.395;
        REQUIRE_NOTHROW(validate_products(products));
        products[1].revenue_weight = 0.3;
        REQUIRE_THROWS_WITH(validate_products(products), ContainsSubstring("sum to 1"));
    }

    SECTION("Names must be present and unique") {
        products[1].name = "Core";
        REQUIRE_THROWS_WITH(validate_products(products), ContainsSubstring("duplicate"));
        products[1].name = "";
        REQUIRE_THROWS_AS(validate_products(products), ValidationError);
    }

    SECTION("Per-product ranges") {
        SECTION("Revenue") { products[0].current_revenue = 0.0; }
        SECTION("Weight") { products[0].revenue_weight = 1.2; }
        SECTION("Gross margin") { products[0].gross_margin = -0.1; }
        SECTION("Operating margin") { products[0].operating_margin = 1.5; }
        SECTION("Capex ratio") { products[0].capex_ratio = -0.01; }
        SECTION("Beta") { products[0].beta = -1.0; }
        SECTION("Empty growth list") { products[0].growth_rate_years.clear(); }
        SECTION("Growth above 100%") { products[0].growth_rate_years = {0.1, 1.5}; }
        SECTION("Growth below -50%") { products[0].growth_rate_years = {-0.6}; }
        REQUIRE_THROWS_AS(validate_products(products), ValidationError);
    }
}

// ============================================================================
// Per-product DCF
// ============================================================================

TEST_CASE("Product cash flow forecast", "[multiproduct]") {
    ProductSegment product = create_core_product();
    std::vector<CashFlowForecast> forecasts = forecast_product_cash_flows(product, 3, 0.25);

    REQUIRE(forecasts.size() == 3);
    REQUIRE(forecasts[0].year == 1);
    REQUIRE_THAT(forecasts[0].revenue, WithinAbs(1100.0, 1e-9));
    REQUIRE_THAT(forecasts[0].operating_profit, WithinAbs(220.0, 1e-9));
    REQUIRE_THAT(forecasts[0].nopat, WithinAbs(165.0, 1e-9));
    REQUIRE_THAT(forecasts[0].reinvestment, WithinAbs(44.0, 1e-9));
    REQUIRE_THAT(forecasts[0].fcf, WithinAbs(121.0, 1e-9));

    // Past the end of the growth list revenue grows at the terminal rate
    REQUIRE(forecasts[1].growth_rate == 0.02);
    REQUIRE_THAT(forecasts[2].revenue, WithinRel(1100.0 * 1.02 * 1.02, 1e-12));

    REQUIRE_THROWS_AS(forecast_product_cash_flows(product, 0), ValidationError);
}

TEST_CASE("Single product valuation", "[multiproduct]") {
    ProductSegment product = create_core_product();

    SECTION("Perpetuity growth") {
        ProductValuation valuation = calculate_product_valuation(product, 0.10, 0.25, one_year());
        // FCF 121: PV 110, TV 121 * 1.02 / 0.08 = 1542.75, PV 1402.5
        REQUIRE_THAT(valuation.pv_forecasts, WithinAbs(110.0, 1e-9));
        REQUIRE_THAT(valuation.terminal_value, WithinAbs(1542.75, 1e-9));
        REQUIRE_THAT(valuation.pv_terminal, WithinAbs(1402.5, 1e-9));
        REQUIRE_THAT(valuation.enterprise_value, WithinAbs(1512.5, 1e-9));
        REQUIRE_THAT(valuation.revenue_cagr, WithinAbs(0.10, 1e-12));
        REQUIRE(valuation.forecasts.size() == 1);
    }

    SECTION("Exit multiple") {
        DcfConfig config = one_year();
        config.terminal_method = TerminalValueMethod::ExitMultiple;
        config.exit_multiple = 8.0;
        ProductValuation valuation = calculate_product_valuation(product, 0.10, 0.25, config);
        REQUIRE_THAT(valuation.terminal_value, WithinAbs(968.0, 1e-9));
        REQUIRE_THAT(valuation.enterprise_value, WithinAbs(110.0 + 880.0, 1e-9));
    }

    SECTION("Revenue CAGR over a longer horizon") {
        ProductValuation valuation = calculate_product_valuation(product, 0.10, 0.25);
        double expected = std::pow(valuation.terminal_revenue / 1000.0, 1.0 / 5.0) - 1.0;
        REQUIRE_THAT(valuation.revenue_cagr, WithinRel(expected, 1e-12));
    }

    SECTION("Terminal growth at or above the WACC fails closed") {
        product.terminal_growth_rate = 0.0995;
        REQUIRE_THROWS_AS(calculate_product_valuation(product, 0.10, 0.25), DomainError);
    }
}

// ============================================================================
// Consolidation
// ============================================================================

TEST_CASE("Multi-product DCF valuation", "[multiproduct]") {
    Company company = create_company();
    std::vector<ProductSegment> products = {create_core_product(), create_new_product()};

    MultiProductValuation result = multi_product_dcf_valuation(company, products, one_year());

    REQUIRE_THAT(result.wacc, WithinAbs(0.10, 1e-12));
    // New: FCF 66, PV 60, TV 66 * 1.025 / 0.075 = 902, PV 820
    REQUIRE_THAT(result.value_of("Core"), WithinAbs(1512.5, 1e-9));
    REQUIRE_THAT(result.value_of("New"), WithinAbs(880.0, 1e-9));
    REQUIRE_THAT(result.total_enterprise_value, WithinAbs(2392.5, 1e-9));
    REQUIRE_THAT(result.net_debt, WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(result.total_equity_value, WithinAbs(2342.5, 1e-9));
    REQUIRE_THAT(result.total_revenue, WithinAbs(1500.0, 1e-12));
    REQUIRE_THROWS_AS(result.value_of("Missing"), std::out_of_range);

    SECTION("Products keep input order, contributions are largest first") {
        REQUIRE(result.products[0].name == "Core");
        REQUIRE(result.products[1].name == "New");

        REQUIRE(result.contributions.size() == 2);
        REQUIRE(result.contributions[0].name == "Core");
        REQUIRE_THAT(result.contributions[0].contribution, WithinRel(1512.5 / 2392.5, 1e-12));
        REQUIRE_THAT(result.contributions[0].contribution + result.contributions[1].contribution,
                     WithinAbs(1.0, 1e-12));
    }

    SECTION("Consolidated forecast sums the products") {
        REQUIRE(result.consolidated_forecasts.size() == 1);
        const CashFlowForecast& year = result.consolidated_forecasts[0];
        REQUIRE_THAT(year.revenue, WithinAbs(1700.0, 1e-9));
        REQUIRE_THAT(year.fcf, WithinAbs(187.0, 1e-9));
        REQUIRE_THAT(year.growth_rate, WithinRel(1700.0 / 1500.0 - 1.0, 1e-12));
    }

    SECTION("Product beta is reported but the company rate discounts") {
        products[1].beta = 1.5;
        MultiProductValuation with_beta = multi_product_dcf_valuation(company, products, one_year());
        REQUIRE(with_beta.products[1].beta_wacc.has_value());
        REQUIRE_THAT(*with_beta.products[1].beta_wacc, WithinAbs(0.135, 1e-12));
        REQUIRE_FALSE(with_beta.products[0].beta_wacc.has_value());
        REQUIRE(with_beta.total_enterprise_value == result.total_enterprise_value);
    }

    SECTION("Invalid inputs are rejected before valuing") {
        products[0].revenue_weight = 0.1;
        REQUIRE_THROWS_AS(multi_product_dcf_valuation(company, products), ValidationError);

        DcfConfig config;
        config.horizon_years = 0;
        REQUIRE_THROWS_AS(multi_product_dcf_valuation(
                              company, {create_core_product(), create_new_product()}, config),
                          ValidationError);
    }

    SECTION("A degenerate product fails the whole valuation") {
        products[0].terminal_growth_rate = 0.12;
        REQUIRE_THROWS_AS(multi_product_dcf_valuation(company, products), DomainError);
    }
}
