#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include "debt.hpp"
#include "strategy.hpp"
#include "payoff.hpp"
#include "comparison.hpp"
#include "planning.hpp"
#include "plan_config.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string debts_path;
    std::string config_path;
    std::string output_path;
    std::optional<double> budget;
    std::optional<std::string> strategy;
    std::optional<double> epsilon;
    std::optional<int> max_months;
    std::optional<std::string> log_level;
    bool compare = false;
    bool schedule = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "DebtFree Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --debts <path>              CSV file: id,balance,interest_rate,minimum_payment[,name,category]\n";
    std::cerr << "  --config <path>             JSON plan configuration (command line options take precedence)\n\n";
    std::cerr << "Plan options:\n";
    std::cerr << "  --budget <amount>           Monthly payment budget (default: recommended payment)\n";
    std::cerr << "  --strategy <name>           snowball, avalanche, highest-balance, lowest-balance,\n";
    std::cerr << "                              highest-interest or custom (default: recommended)\n";
    std::cerr << "  --compare                   Rank all strategies at the same budget\n";
    std::cerr << "  --schedule                  Include the month-by-month schedule\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --epsilon <amount>          Balance treated as paid off (default: 0.1)\n";
    std::cerr << "  --max-months <n>            Month cap for the simulation (default: 600)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --debts data/sample_debts.csv --budget 900 --compare \\\n";
    std::cerr << "      --output plan.json\n";
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
            } else if (arg == "--debts" && i + 1 < argc) {
                args.debts_path = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--budget" && i + 1 < argc) {
                args.budget = std::stod(argv[++i]);
            } else if (arg == "--strategy" && i + 1 < argc) {
                args.strategy = std::string(argv[++i]);
            } else if (arg == "--epsilon" && i + 1 < argc) {
                args.epsilon = std::stod(argv[++i]);
            } else if (arg == "--max-months" && i + 1 < argc) {
                args.max_months = std::stoi(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = std::string(argv[++i]);
            } else if (arg == "--compare") {
                args.compare = true;
            } else if (arg == "--schedule") {
                args.schedule = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.debts_path.empty() && args.config_path.empty()) {
        std::cerr << "Error: --debts is required (or use --config with debts.source)\n";
        valid = false;
    } else if (!args.debts_path.empty() && !file_exists(args.debts_path)) {
        std::cerr << "Error: Debts file not found: " << args.debts_path << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.budget && *args.budget < 0) {
        std::cerr << "Error: --budget must be non-negative\n";
        valid = false;
    }

    if (args.strategy) {
        try {
            debtfree::strategy_from_string(*args.strategy);
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: Unknown strategy: " << *args.strategy << "\n";
            valid = false;
        }
    }

    if (args.epsilon && *args.epsilon < 0) {
        std::cerr << "Error: --epsilon must be non-negative\n";
        valid = false;
    }

    if (args.max_months && *args.max_months <= 0) {
        std::cerr << "Error: --max-months must be positive\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    debtfree::Logger& logger = debtfree::Logger::get_instance();

    try {
        debtfree::PlanConfig config;
        if (!args.config_path.empty()) {
            config = debtfree::parse_plan_config_from_file(args.config_path);
        }

        // Command line wins over the config file
        if (!args.debts_path.empty()) config.debts_path = args.debts_path;
        if (args.budget) config.monthly_budget = args.budget;
        if (args.strategy) config.strategy = debtfree::strategy_from_string(*args.strategy);
        if (args.epsilon) config.simulation.paid_off_epsilon = *args.epsilon;
        if (args.max_months) config.simulation.max_months = *args.max_months;
        if (args.log_level) config.logging.min_level = debtfree::string_to_level(*args.log_level);
        if (args.compare) config.compare = true;
        if (args.schedule) config.simulation.detailed_schedule = true;

        logger.configure(config.logging);

        if (config.debts_path.empty()) {
            throw std::runtime_error("No debts file given in --debts or config debts.source");
        }

        debtfree::Portfolio loaded = debtfree::Portfolio::load_from_csv(config.debts_path);
        debtfree::Portfolio portfolio = loaded.outstanding();
        logger.log_info("Debts loaded", {
            {"event", "debts_loaded"},
            {"path", config.debts_path},
            {"rows", std::to_string(loaded.size())},
            {"outstanding", std::to_string(portfolio.size())}
        });

        const std::vector<debtfree::DebtRecord>& debts = portfolio.debts();

        debtfree::io::PlanReport report;
        report.budget_range = debtfree::budget_range(debts);
        report.total_monthly_interest = debtfree::total_monthly_interest(debts);
        report.monthly_budget = config.monthly_budget ? *config.monthly_budget
                                                      : report.budget_range.recommended;
        report.recommended_strategy = debtfree::recommend_strategy(debts);

        const debtfree::StrategyTag strategy = config.strategy ? *config.strategy
                                                               : report.recommended_strategy;
        report.plan = debtfree::plan_with_strategy(debts, strategy, report.monthly_budget,
                                                   config.simulation);

        if (config.compare) {
            report.comparison = debtfree::compare_strategies(debts, report.monthly_budget,
                                                             config.simulation);
        }

        logger.log_info("Plan computed", {
            {"event", "plan_computed"},
            {"strategy", debtfree::strategy_to_string(strategy)},
            {"monthly_budget", std::to_string(report.monthly_budget)},
            {"months_to_payoff", std::to_string(report.plan.result.months_to_payoff)},
            {"converged", report.plan.result.converged ? "true" : "false"}
        });

        if (args.output_path.empty()) {
            debtfree::io::write_plan_report_json(std::cout, report);
        } else {
            debtfree::io::write_plan_report_json(args.output_path, report);
            logger.log_info("Output written", {{"event", "output_written"}, {"path", args.output_path}});
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
