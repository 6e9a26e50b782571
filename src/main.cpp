#include <algorithm>
#include <cctype>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <random>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include "company.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "market_data.hpp"
#include "result_store.hpp"
#include "valuation_engine.hpp"
#include "io/company_loader.hpp"
#include "io/json_writer.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

const std::vector<std::string> ANALYSES = {
    "full", "relative", "dcf", "vc", "multiproduct", "scenario", "stress", "montecarlo",
    "sensitivity"
};

struct CLIArgs {
    std::string company_path;
    std::string comparables_path;
    std::string market_data_path;
    std::string products_path;
    std::string config_path;
    std::string analysis = "full";
    std::optional<size_t> iterations;
    std::optional<uint64_t> seed;
    std::string output_path;
    std::string store_dir;
    std::string log_level = "info";
    bool log_json = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "ValuCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --company <path>            JSON file with the company to value (required)\n";
    std::cerr << "  --comparables <path>        CSV or JSON file with comparable companies\n";
    std::cerr << "  --market-data <path>        CSV market data; peers are picked by industry\n";
    std::cerr << "  --products <path>           JSON product segments (multiproduct analysis)\n";
    std::cerr << "  --config <path>             JSON engine configuration\n\n";
    std::cerr << "Analysis options:\n";
    std::cerr << "  --analysis <name>           full, relative, dcf, vc, multiproduct, scenario,\n";
    std::cerr << "                              stress, montecarlo or sensitivity\n";
    std::cerr << "                              (default: full)\n";
    std::cerr << "  --iterations <count>        Monte Carlo iterations (default: 1000)\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --store-dir <path>          Also save the result bundle in this directory\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         debug, info, warn or error (default: info)\n";
    std::cerr << "  --log-json                  JSON log lines on stderr\n";
    std::cerr << "  --log-text                  Plain text log lines on stderr (default)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Full valuation against peers:\n";
    std::cerr << "     " << program_name << " --company data/company.json \\\n";
    std::cerr << "         --comparables data/comparables.csv \\\n";
    std::cerr << "         --seed 42 --output valuation.json\n\n";
    std::cerr << "  2. Monte Carlo only, with a custom configuration:\n";
    std::cerr << "     " << program_name << " --company data/company.json \\\n";
    std::cerr << "         --config data/engine.json --analysis montecarlo --iterations 10000\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Digits only; std::stoull alone accepts "-5" and wraps it
unsigned long long parse_unsigned(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("not a non-negative integer");
    }
    return std::stoull(text);
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--company" && i + 1 < argc) {
                args.company_path = argv[++i];
            } else if (arg == "--comparables" && i + 1 < argc) {
                args.comparables_path = argv[++i];
            } else if (arg == "--market-data" && i + 1 < argc) {
                args.market_data_path = argv[++i];
            } else if (arg == "--products" && i + 1 < argc) {
                args.products_path = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--analysis" && i + 1 < argc) {
                args.analysis = argv[++i];
            } else if (arg == "--iterations" && i + 1 < argc) {
                args.iterations = static_cast<size_t>(parse_unsigned(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = parse_unsigned(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--store-dir" && i + 1 < argc) {
                args.store_dir = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-json") {
                args.log_json = true;
            } else if (arg == "--log-text") {
                args.log_json = false;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.company_path.empty()) {
        std::cerr << "Error: --company is required\n";
        valid = false;
    } else if (!file_exists(args.company_path)) {
        std::cerr << "Error: Company file not found: " << args.company_path << "\n";
        valid = false;
    }

    if (!args.comparables_path.empty() && !file_exists(args.comparables_path)) {
        std::cerr << "Error: Comparables file not found: " << args.comparables_path << "\n";
        valid = false;
    }

    if (!args.market_data_path.empty() && !file_exists(args.market_data_path)) {
        std::cerr << "Error: Market data file not found: " << args.market_data_path << "\n";
        valid = false;
    }

    if (!args.comparables_path.empty() && !args.market_data_path.empty()) {
        std::cerr << "Error: --comparables and --market-data are mutually exclusive\n";
        valid = false;
    }

    if (!args.products_path.empty() && !file_exists(args.products_path)) {
        std::cerr << "Error: Products file not found: " << args.products_path << "\n";
        valid = false;
    }

    if (args.analysis == "multiproduct" && args.products_path.empty()) {
        std::cerr << "Error: --analysis multiproduct requires --products\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    bool known_analysis = false;
    for (const std::string& name : ANALYSES) {
        known_analysis = known_analysis || name == args.analysis;
    }
    if (!known_analysis) {
        std::cerr << "Error: Unknown analysis: " << args.analysis << "\n";
        valid = false;
    }

    if (args.iterations && *args.iterations == 0) {
        std::cerr << "Error: --iterations must be greater than 0\n";
        valid = false;
    }

    try {
        valucalc::string_to_level(args.log_level);
    } catch (const valucalc::ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        valid = false;
    }

    return valid;
}

// Runs the requested analysis; returns the document and whether it succeeded
std::pair<json, bool> run_analysis(
    const std::string& analysis,
    const valucalc::ValuationEngine& engine,
    const valucalc::Company& company,
    const std::vector<valucalc::Comparable>& comparables,
    const std::vector<valucalc::ProductSegment>& products,
    std::mt19937_64& rng)
{
    using valucalc::io::outcome_json;

    if (analysis == "relative") {
        auto outcome = engine.relative(company, comparables);
        return {outcome_json(outcome), outcome.success};
    }
    if (analysis == "dcf") {
        auto outcome = engine.dcf(company);
        return {outcome_json(outcome), outcome.success};
    }
    if (analysis == "vc") {
        auto outcome = engine.vc(company);
        return {outcome_json(outcome), outcome.success};
    }
    if (analysis == "multiproduct") {
        auto outcome = engine.multi_product(company, products);
        return {outcome_json(outcome), outcome.success};
    }
    if (analysis == "scenario") {
        auto comparison = engine.scenarios(company);
        auto weighted = engine.scenario_probabilities(company);
        json document = {
            {"scenarios", outcome_json(comparison)},
            {"probability_weighted", outcome_json(weighted)}
        };
        return {document, comparison.success && weighted.success};
    }
    if (analysis == "stress") {
        auto outcome = engine.stress(company, rng);
        return {outcome_json(outcome), outcome.success};
    }
    if (analysis == "montecarlo") {
        auto outcome = engine.monte_carlo(company, rng);
        return {outcome_json(outcome), outcome.success};
    }
    if (analysis == "sensitivity") {
        auto outcome = engine.sensitivity(company);
        return {outcome_json(outcome), outcome.success};
    }
    auto outcome = engine.full_valuation(company, comparables, rng);
    return {outcome_json(outcome), outcome.success};
}

void print_summary(const json& document) {
    std::cerr << "\nResults:\n";
    std::cerr << "  Success:   " << (document.value("success", true) ? "yes" : "no") << "\n";
    if (document.contains("error_message") && !document["error_message"].get<std::string>().empty()) {
        std::cerr << "  Error:     " << document["error_message"].get<std::string>() << "\n";
    }
    if (document.contains("result") && document["result"].is_object()) {
        const json& result = document["result"];
        if (result.contains("value") && result["value"].is_number()) {
            std::cerr << "  Value:     " << result["value"].get<double>() << "\n";
        }
        if (result.contains("recommendation") && result["recommendation"].is_object()) {
            const json& rec = result["recommendation"];
            std::cerr << "  Value:     " << rec["value"].get<double>() << "\n";
            std::cerr << "  Range:     " << rec["value_low"].get<double>()
                      << " - " << rec["value_high"].get<double>() << "\n";
            std::cerr << "  Confidence: " << rec["confidence"].get<std::string>() << "\n";
        }
        if (result.contains("total_equity_value") && result["total_equity_value"].is_number()) {
            std::cerr << "  Equity:    " << result["total_equity_value"].get<double>() << "\n";
            std::cerr << "  EV:        " << result["total_enterprise_value"].get<double>() << "\n";
        }
        if (result.contains("statistics") && result["statistics"].is_object()) {
            const json& stats = result["statistics"];
            std::cerr << "  Mean:      " << stats["mean"].get<double>() << "\n";
            std::cerr << "  CTE_95:    " << stats["cte_95"].get<double>() << "\n";
        }
    }
    if (document.contains("warnings")) {
        for (const auto& warning : document["warnings"]) {
            std::cerr << "  Warning:   " << warning.get<std::string>() << "\n";
        }
    }
    if (document.contains("execution_time_ms")) {
        std::cerr << "  Execution: " << document["execution_time_ms"].get<double>() << " ms\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    valucalc::LoggerConfig log_config;
    log_config.min_level = valucalc::string_to_level(args.log_level);
    log_config.enable_json = args.log_json;
    valucalc::Logger& logger = valucalc::Logger::get_instance();
    logger.configure(log_config);

    std::cerr << "ValuCalc v1.0.0\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  Company:     " << args.company_path << "\n";
    if (!args.comparables_path.empty()) {
        std::cerr << "  Comparables: " << args.comparables_path << "\n";
    }
    if (!args.market_data_path.empty()) {
        std::cerr << "  Market data: " << args.market_data_path << "\n";
    }
    if (!args.products_path.empty()) {
        std::cerr << "  Products:    " << args.products_path << "\n";
    }
    if (!args.config_path.empty()) {
        std::cerr << "  Config:      " << args.config_path << "\n";
    }
    std::cerr << "  Analysis:    " << args.analysis << "\n";
    std::cerr << "\n";

    try {
        valucalc::EngineConfig config;
        if (!args.config_path.empty()) {
            config = valucalc::load_engine_config(args.config_path);
        }
        if (args.iterations) {
            config.stress.monte_carlo.iterations = *args.iterations;
        }
        if (args.seed) {
            config.stress.monte_carlo.seed = args.seed;
        }

        uint64_t seed = config.stress.monte_carlo.seed
            ? *config.stress.monte_carlo.seed
            : static_cast<uint64_t>(std::random_device{}());
        std::mt19937_64 rng(seed);

        valucalc::Company company = valucalc::io::load_company_from_json(args.company_path);
        std::vector<valucalc::Comparable> comparables;
        if (!args.comparables_path.empty()) {
            comparables = valucalc::io::load_comparables(args.comparables_path);
            std::cerr << "Loaded " << comparables.size() << " comparables\n";
        } else if (!args.market_data_path.empty()) {
            valucalc::CsvMarketDataSource market_data(args.market_data_path);
            comparables = market_data.comparables_for_industry(company.industry);
            std::cerr << "Selected " << comparables.size() << " of " << market_data.size()
                      << " market data records for industry " << company.industry << "\n";
        }

        std::vector<valucalc::ProductSegment> products;
        if (!args.products_path.empty()) {
            products = valucalc::io::load_products_from_json(args.products_path);
            std::cerr << "Loaded " << products.size() << " product segments\n";
        }

        valucalc::ValuationEngine engine(config, "valucalc-" + std::to_string(seed));
        auto [document, success] =
            run_analysis(args.analysis, engine, company, comparables, products, rng);
        document["analysis"] = args.analysis;
        document["company"] = company;
        document["seed"] = seed;
        if (args.analysis == "montecarlo" || args.analysis == "stress" || args.analysis == "full") {
            document["monte_carlo_config"] =
                valucalc::io::monte_carlo_config_json(config.stress.monte_carlo);
        }

        print_summary(args.analysis == "scenario" ? document["scenarios"] : document);

        if (args.output_path.empty()) {
            valucalc::io::write_json(std::cout, document);
        } else {
            valucalc::io::write_json(args.output_path, document);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        if (!args.store_dir.empty()) {
            valucalc::AnalysisContext ctx(engine.run_id(), args.analysis);
            ctx.company_name = company.name;
            ctx.industry = company.industry;
            valucalc::JsonFileResultStore store(args.store_dir);
            try {
                std::string id = store.save(document);
                logger.log_result_stored(ctx, id, store.path_for(id));
            } catch (const valucalc::DataError& e) {
                logger.log_warning(ctx, std::string("result not stored: ") + e.what());
            }
        }

        logger.flush();
        return success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
