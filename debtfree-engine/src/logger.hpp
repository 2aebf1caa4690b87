/**
 * @file logger.hpp
 * @brief Structured logging for the payoff engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Simulation context (label, debt count, monthly budget)
 * - Engine events (recommendation, simulation, comparison, validation)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef DEBTFREE_LOGGER_HPP
#define DEBTFREE_LOGGER_HPP

#include "strategy.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace debtfree {

struct SimulationResult;
struct StrategyComparison;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-call engine detail (recommendations, simulation summaries)
    INFO,    ///< Informational messages (run start/end, comparisons)
    WARN,    ///< Non-fatal issues (simulation hit the month cap)
    ERROR    ///< Failures (invalid debts, unreadable input)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Identifies one simulation call in log output
 */
struct SimulationContext {
    std::string label;               ///< Free text, e.g. the strategy key
    size_t debt_count;               ///< Debts handed to the simulator
    double monthly_budget;           ///< Budget for the run

    SimulationContext()
        : label(""), debt_count(0), monthly_budget(0.0) {}

    SimulationContext(const std::string& l, size_t count, double budget)
        : label(l), debt_count(count), monthly_budget(budget) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("debtfree.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "debtfree.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   SimulationContext ctx("avalanche", debts.size(), 900.0);
 *   logger.log_simulation_complete(ctx, result, elapsed_ms);
 *   @endcode
 *
 * Writes are serialized, so engine calls made from several threads can
 * share the instance.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Opens (or closes) the log file according to the new settings.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the outcome of a strategy recommendation
     */
    void log_strategy_recommended(
        StrategyTag strategy,
        size_t debt_count,
        double total_balance,
        double mean_rate
    );

    /**
     * @brief Log a finished simulation
     *
     * @param ctx Simulation context
     * @param result Simulation result
     * @param elapsed_ms Wall time of the call
     */
    void log_simulation_complete(
        const SimulationContext& ctx,
        const SimulationResult& result,
        double elapsed_ms
    );

    /**
     * @brief Log a simulation stopped by the month cap with debts outstanding
     */
    void log_simulation_capped(
        const SimulationContext& ctx,
        const SimulationResult& result,
        double remaining_balance
    );

    /**
     * @brief Log the ranking produced by a strategy comparison
     */
    void log_comparison(
        const std::vector<StrategyComparison>& ranking,
        double monthly_budget
    );

    /**
     * @brief Log a rejected debt record
     *
     * @param debt_id Offending debt identifier (may be empty)
     * @param error_message Validation message
     */
    void log_validation_error(
        const std::string& debt_id,
        const std::string& error_message
    );

    /**
     * @brief Log free-form messages with optional fields
     */
    void log_info(
        const std::string& message,
        const std::map<std::string, std::string>& fields = {}
    );

    void log_warning(const std::string& warning_message);

    void log_error(const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    bool is_enabled(LogLevel level) const { return level >= get_min_level(); }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace debtfree

#endif // DEBTFREE_LOGGER_HPP
