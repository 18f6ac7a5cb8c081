#include <algorithm>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include "config.hpp"
#include "wealth_engine.hpp"
#include "cashflow_projector.hpp"
#include "statistics.hpp"
#include "logger.hpp"
#include "io/config_reader.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::optional<int> num_paths;       // Overrides the config file when set
    std::optional<uint64_t> seed;
    std::optional<int> years;
    int cashflow_years = 10;
    bool real_terms = false;
    std::string output_path;
    std::string paths_parquet_path;
    std::string log_level = "INFO";
    bool log_json = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "WealthSim v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON household configuration (required)\n\n";
    std::cerr << "Simulation options (override the configuration file):\n";
    std::cerr << "  --paths <count>             Number of Monte Carlo paths\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility\n";
    std::cerr << "  --years <count>             Projection horizon in years\n";
    std::cerr << "  --cashflow-years <count>    Rows in the cash-flow table (default: 10, max: 10)\n";
    std::cerr << "  --real                      Report statistics in real (inflation-adjusted) terms\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --paths-parquet <path>      Write every path to a Parquet file\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  Emit log records as JSON\n";
    std::cerr << "  --help, -h                  Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config data/sample_household.json \\\n";
    std::cerr << "         --paths 5000 --seed 7 --real \\\n";
    std::cerr << "         --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--paths" && i + 1 < argc) {
                args.num_paths = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
            } else if (arg == "--years" && i + 1 < argc) {
                args.years = std::stoi(argv[++i]);
            } else if (arg == "--cashflow-years" && i + 1 < argc) {
                args.cashflow_years = std::stoi(argv[++i]);
            } else if (arg == "--real") {
                args.real_terms = true;
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--paths-parquet" && i + 1 < argc) {
                args.paths_parquet_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-json") {
                args.log_json = true;
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

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.num_paths && *args.num_paths < 1) {
        std::cerr << "Error: --paths must be at least 1\n";
        valid = false;
    }

    if (args.years && *args.years < 1) {
        std::cerr << "Error: --years must be at least 1\n";
        valid = false;
    }

    if (args.cashflow_years < 0) {
        std::cerr << "Error: --cashflow-years cannot be negative\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be one of DEBUG, INFO, WARN, ERROR\n";
        valid = false;
    }

    return valid;
}

void print_cashflow_table(const wealthsim::CashFlowTable& table) {
    wealthsim::RenderedTable rendered =
        wealthsim::render_cashflow_table(table, wealthsim::format_amount);

    std::vector<size_t> widths(rendered.header.size(), 0);
    for (size_t c = 0; c < rendered.header.size(); ++c) {
        widths[c] = rendered.header[c].size();
        for (const auto& row : rendered.rows) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < cells.size(); ++c) {
            std::cerr << "  " << std::setw(static_cast<int>(widths[c]));
            if (c + 1 == cells.size()) {
                std::cerr << std::left << cells[c] << std::right;
            } else {
                std::cerr << cells[c];
            }
        }
        std::cerr << "\n";
    };

    print_row(rendered.header);
    for (const auto& row : rendered.rows) {
        print_row(row);
    }

    std::cerr << "\nYear 1 breakdown:\n";
    for (const auto& [label, amount] :
         wealthsim::render_year1_breakdown(table.year1, wealthsim::format_amount)) {
        std::cerr << "  " << std::left << std::setw(28) << label << std::right
                  << std::setw(12) << amount << "\n";
    }
    std::cerr << "  Status: " << table.year1.status << "\n";
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

    wealthsim::LoggerConfig log_config;
    log_config.min_level = wealthsim::string_to_level(args.log_level);
    log_config.enable_json = args.log_json;
    wealthsim::Logger& logger = wealthsim::Logger::get_instance();
    logger.configure(log_config);

    const std::string run_id = std::filesystem::path(args.config_path).stem().string();
    const wealthsim::RunContext cli_ctx(run_id, "cli");

    try {
        wealthsim::SimulationConfig config = wealthsim::io::load_config_from_file(args.config_path);
        logger.log_config_loaded(cli_ctx, args.config_path, config.events.size(),
                                 config.passive_income_streams.size());

        if (args.num_paths) config.num_paths = *args.num_paths;
        if (args.seed) config.random_seed = *args.seed;
        if (args.years) config.years = *args.years;

        // Log configuration
        std::cerr << "WealthSim v1.0.0\n";
        std::cerr << "Configuration:\n";
        std::cerr << "  Config:      " << args.config_path << "\n";
        std::cerr << "  Paths:       " << config.num_paths << "\n";
        std::cerr << "  Years:       " << config.years << "\n";
        std::cerr << "  Seed:        " << config.random_seed << "\n";
        std::cerr << "  Events:      " << config.events.size() << "\n";
        std::cerr << "  Spouse:      " << (config.spouse ? "yes" : "no") << "\n";
        std::cerr << "\n";

        wealthsim::SimulationResult result = wealthsim::run_stochastic_simulation(
            config, wealthsim::RunContext(run_id, "stochastic"));
        wealthsim::PathSummary summary = wealthsim::summarize_paths(result, args.real_terms);
        wealthsim::CashFlowTable table = wealthsim::build_cashflow_table(
            config, args.cashflow_years, wealthsim::RunContext(run_id, "cashflow"));

        // Report summary to stderr
        std::cerr << "\nResults" << (summary.real_terms ? " (real terms)" : "") << ":\n";
        std::cerr << "  Initial net worth:  " << wealthsim::format_amount(summary.initial_net_worth) << "\n";
        std::cerr << "  Final P10:          " << wealthsim::format_amount(summary.final_p10()) << "\n";
        std::cerr << "  Final median:       " << wealthsim::format_amount(summary.final_median) << "\n";
        std::cerr << "  Final P90:          " << wealthsim::format_amount(summary.final_p90()) << "\n";
        std::cerr << "  P(growth):          " << summary.probability_of_growth * 100.0 << "%\n";
        std::cerr << "  P(2x):              " << summary.probability_of_doubling * 100.0 << "%\n";
        std::cerr << "  P(insolvency):      " << summary.insolvency_probability * 100.0 << "%\n";
        std::cerr << "  Execution:          " << result.execution_time_ms << " ms\n\n";

        print_cashflow_table(table);

        // Write JSON output
        if (args.output_path.empty()) {
            wealthsim::io::write_simulation_summary_json(std::cout, result, summary, table);
        } else {
            wealthsim::io::write_simulation_summary_json(args.output_path, result, summary, table);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        if (!args.paths_parquet_path.empty()) {
            wealthsim::ParquetWriter::write_paths(result, args.paths_parquet_path);
            std::cerr << "Paths written to: " << args.paths_parquet_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(cli_ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
