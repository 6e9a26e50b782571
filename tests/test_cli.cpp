#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#ifndef VALUCALC_CLI_PATH
#define VALUCALC_CLI_PATH "./valucalc"
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = temp_path("valucalc_test_stdout.txt");
    std::string stderr_file = temp_path("valucalc_test_stderr.txt");

    std::string full_cmd = std::string("\"") + VALUCALC_CLI_PATH + "\" " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    result.exit_code = WEXITSTATUS(status);
    return result;
}

// Company and peer files shared by the end-to-end runs
struct InputFiles {
    std::string company = temp_path("valucalc_cli_company.json");
    std::string comparables = temp_path("valucalc_cli_peers.csv");

    InputFiles() {
        std::ofstream(company) << R"({
            "name": "CLI Co",
            "industry": "Software",
            "stage": "growth",
            "revenue": 1000.0,
            "net_income": 120.0,
            "net_assets": 500.0,
            "growth_rate": 0.12,
            "operating_margin": 0.2
        })";
        std::ofstream(comparables) << "name,industry,pe_ratio,ps_ratio,pb_ratio\n"
                                      "Alpha,Software,14,2.0,2.5\n"
                                      "Beta,Software,18,2.4,3.0\n"
                                      "Gamma,Software,22,2.8,NA\n";
    }

    ~InputFiles() {
        std::filesystem::remove(company);
        std::filesystem::remove(comparables);
    }
};

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--company") != std::string::npos);
    REQUIRE(result.stderr_output.find("--comparables") != std::string::npos);
    REQUIRE(result.stderr_output.find("--analysis") != std::string::npos);
    REQUIRE(result.stderr_output.find("--iterations") != std::string::npos);
    REQUIRE(result.stderr_output.find("--seed") != std::string::npos);
    REQUIRE(result.stderr_output.find("--store-dir") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI argument errors", "[cli]") {
    InputFiles files;

    SECTION("Missing company") {
        auto result = run_command("--analysis dcf");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--company is required") != std::string::npos);
    }

    SECTION("Company file not found") {
        auto result = run_command("--company /nonexistent/company.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Company file not found") != std::string::npos);
    }

    SECTION("Unknown option") {
        auto result = run_command("--company " + files.company + " --turbo");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Unknown analysis") {
        auto result = run_command("--company " + files.company + " --analysis lbo");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown analysis: lbo") != std::string::npos);
    }

    SECTION("Invalid iteration count") {
        auto result = run_command("--company " + files.company + " --iterations many");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value") != std::string::npos);

        auto zero = run_command("--company " + files.company + " --iterations 0");
        REQUIRE(zero.exit_code == 1);
        REQUIRE(zero.stderr_output.find("greater than 0") != std::string::npos);
    }

    SECTION("Negative counts and seeds are rejected") {
        auto iterations = run_command("--company " + files.company + " --iterations -5");
        REQUIRE(iterations.exit_code == 1);
        REQUIRE(iterations.stderr_output.find("Invalid value for --iterations") !=
                std::string::npos);

        auto seed = run_command("--company " + files.company + " --seed -1");
        REQUIRE(seed.exit_code == 1);
        REQUIRE(seed.stderr_output.find("Invalid value for --seed") != std::string::npos);

        auto signed_count = run_command("--company " + files.company + " --iterations +20");
        REQUIRE(signed_count.exit_code == 1);
    }
}

TEST_CASE("CLI runs analyses", "[cli]") {
    InputFiles files;

    SECTION("DCF to stdout") {
        auto result = run_command("--company " + files.company + " --analysis dcf");
        REQUIRE(result.exit_code == 0);
        auto document = nlohmann::json::parse(result.stdout_output);
        REQUIRE(document["analysis"] == "dcf");
        REQUIRE(document["success"] == true);
        REQUIRE(document["result"]["method"] == "DCF");
        REQUIRE(document["company"]["name"] == "CLI Co");
    }

    SECTION("Full valuation to a file with a fixed seed") {
        std::string output = temp_path("valucalc_cli_output.json");
        auto result = run_command("--company " + files.company + " --comparables " +
                                  files.comparables + " --iterations 200 --seed 42 --output " +
                                  output);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stderr_output.find("Output written to:") != std::string::npos);

        std::ifstream file(output);
        auto document = nlohmann::json::parse(file);
        REQUIRE(document["seed"] == 42);
        REQUIRE(document["monte_carlo_config"]["iterations"] == 200);
        const auto& valuation = document["result"];
        REQUIRE(valuation["relative"].contains("PE"));
        REQUIRE(valuation["stress"]["monte_carlo"]["iterations"] == 200);
        REQUIRE(valuation["recommendation"]["value"].get<double>() > 0.0);
        std::filesystem::remove(output);
    }

    SECTION("Same seed gives the same Monte Carlo result") {
        std::string args = "--company " + files.company +
                           " --analysis montecarlo --iterations 300 --seed 7";
        auto first = nlohmann::json::parse(run_command(args).stdout_output);
        auto second = nlohmann::json::parse(run_command(args).stdout_output);
        REQUIRE(first["result"]["statistics"] == second["result"]["statistics"]);
    }

    SECTION("Degenerate company exits with failure") {
        std::string company = temp_path("valucalc_cli_degenerate.json");
        std::ofstream(company) << R"({"industry": "Software", "revenue": 1000, "net_income": 50,
                                      "terminal_growth_rate": 0.5})";
        auto result = run_command("--company " + company + " --analysis dcf");
        REQUIRE(result.exit_code == 1);
        auto document = nlohmann::json::parse(result.stdout_output);
        REQUIRE(document["success"] == false);
        REQUIRE(document["result"].is_null());
        std::filesystem::remove(company);
    }

    SECTION("Peers picked from market data by industry") {
        std::string market = temp_path("valucalc_cli_market.csv");
        std::ofstream(market) << "name,ts_code,industry,pe_ratio,ps_ratio\n"
                                 "Alpha,600001.SH,software,15,2.0\n"
                                 "Beta,600002.SH,Software,20,2.5\n"
                                 "Feed,000003.SZ,Food,8,0.5\n";
        auto result = run_command("--company " + files.company + " --market-data " + market +
                                  " --analysis relative");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stderr_output.find("Selected 2 of 3") != std::string::npos);
        auto document = nlohmann::json::parse(result.stdout_output);
        REQUIRE(document["result"]["PE"]["details"]["comparable_count"] == 2);
        std::filesystem::remove(market);
    }

    SECTION("VC method") {
        auto result = run_command("--company " + files.company + " --analysis vc");
        REQUIRE(result.exit_code == 0);
        auto document = nlohmann::json::parse(result.stdout_output);
        REQUIRE(document["result"]["method"] == "VC");
        REQUIRE(document["result"]["details"].contains("implied_irr"));
    }

    SECTION("Multi-product valuation") {
        std::string products = temp_path("valucalc_cli_products.json");
        std::ofstream(products) << R"([
            {"name": "Cloud", "current_revenue": 700, "revenue_weight": 0.7},
            {"name": "Support", "current_revenue": 300, "revenue_weight": 0.3,
             "growth_rate_years": [0.05]}
        ])";
        auto result = run_command("--company " + files.company + " --analysis multiproduct" +
                                  " --products " + products);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stderr_output.find("Loaded 2 product segments") != std::string::npos);
        auto document = nlohmann::json::parse(result.stdout_output);
        REQUIRE(document["result"]["products"].size() == 2);
        REQUIRE(document["result"]["value_breakdown"].contains("Support"));

        auto missing = run_command("--company " + files.company + " --analysis multiproduct");
        REQUIRE(missing.exit_code == 1);
        REQUIRE(missing.stderr_output.find("requires --products") != std::string::npos);
        std::filesystem::remove(products);
    }

    SECTION("Result bundle stored") {
        std::filesystem::path store = std::filesystem::temp_directory_path() / "valucalc_cli_store";
        std::filesystem::remove_all(store);
        auto result = run_command("--company " + files.company + " --analysis scenario --store-dir " +
                                  store.string());
        REQUIRE(result.exit_code == 0);
        REQUIRE(std::filesystem::is_directory(store));
        REQUIRE(std::distance(std::filesystem::directory_iterator(store),
                              std::filesystem::directory_iterator()) == 1);
        std::filesystem::remove_all(store);
    }
}
