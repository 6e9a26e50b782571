#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>
#include "market_data.hpp"
#include "errors.hpp"

using namespace valucalc;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<Comparable> create_records() {
    std::vector<Comparable> records(3);
    records[0].name = "Alpha Soft";
    records[0].ts_code = "600001.SH";
    records[0].industry = "Software";
    records[0].revenue = 5000.0;
    records[0].net_income = 600.0;
    records[0].net_assets = 2000.0;
    records[0].growth_rate = 0.14;
    records[0].pe_ratio = 22.0;

    records[1].name = "Beta Systems";
    records[1].ts_code = "600002.SH";
    records[1].industry = "software";
    records[1].pe_ratio = 18.0;

    records[2].name = "Gamma Foods";
    records[2].ts_code = "000003.SZ";
    records[2].industry = "Food";
    records[2].ps_ratio = 1.2;
    return records;
}

} // anonymous namespace

TEST_CASE("Comparables by industry", "[market_data]") {
    CsvMarketDataSource source(create_records());
    REQUIRE(source.size() == 3);

    auto software = source.comparables_for_industry("SOFTWARE");
    REQUIRE(software.size() == 2);
    REQUIRE(software[0].name == "Alpha Soft");
    REQUIRE(software[1].name == "Beta Systems");

    REQUIRE(source.comparables_for_industry("Food").size() == 1);
    REQUIRE(source.comparables_for_industry("Mining").empty());
}

TEST_CASE("Company financials", "[market_data]") {
    CsvMarketDataSource source(create_records());

    SECTION("Reported fields are mapped onto a company") {
        Company company = source.company_financials("600001.SH");
        REQUIRE(company.name == "Alpha Soft");
        REQUIRE(company.industry == "Software");
        REQUIRE(company.stage == CompanyStage::Listed);
        REQUIRE_THAT(company.revenue, WithinAbs(5000.0, 1e-12));
        REQUIRE_THAT(company.net_income, WithinAbs(600.0, 1e-12));
        REQUIRE(company.net_assets == 2000.0);
        REQUIRE_FALSE(company.ebitda.has_value());
        REQUIRE_THAT(company.growth_rate, WithinAbs(0.14, 1e-12));
    }

    SECTION("Missing fields fall back to defaults") {
        Company company = source.company_financials("600002.SH");
        REQUIRE(company.revenue == 0.0);
        REQUIRE_THAT(company.growth_rate, WithinAbs(Company().growth_rate, 1e-12));
    }

    SECTION("Unknown identifier") {
        REQUIRE_THROWS_AS(source.company_financials("999999.SH"), DataError);
    }
}

TEST_CASE("Market data from CSV file", "[market_data]") {
    std::string path = (std::filesystem::temp_directory_path() / "valucalc_test_market.csv").string();
    {
        std::ofstream file(path);
        file << "name,ts_code,industry,revenue,net_income,pe_ratio\n";
        file << "Alpha Soft,600001.SH,Software,5000,600,22\n";
        file << "Gamma Foods,000003.SZ,Food,800,40,NA\n";
    }

    CsvMarketDataSource source(path);
    REQUIRE(source.size() == 2);
    REQUIRE(source.comparables_for_industry("food").size() == 1);
    REQUIRE_THAT(source.company_financials("000003.SZ").net_income, WithinAbs(40.0, 1e-12));
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(CsvMarketDataSource("/nonexistent/market.csv"), DataError);
}
