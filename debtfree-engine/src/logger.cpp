/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "comparison.hpp"
#include "payoff.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace debtfree {

namespace {

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_strategy_recommended(
    StrategyTag strategy,
    size_t debt_count,
    double total_balance,
    double mean_rate
) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "strategy_recommended";
    fields["strategy"] = strategy_to_string(strategy);
    fields["debt_count"] = std::to_string(debt_count);
    fields["total_balance"] = format_amount(total_balance);
    fields["mean_rate_percent"] = format_amount(mean_rate);

    log(LogLevel::DEBUG, "Strategy recommended", fields);
}

void Logger::log_simulation_complete(
    const SimulationContext& ctx,
    const SimulationResult& result,
    double elapsed_ms
) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["label"] = ctx.label;
    fields["debt_count"] = std::to_string(ctx.debt_count);
    fields["monthly_budget"] = format_amount(ctx.monthly_budget);
    fields["months_to_payoff"] = std::to_string(result.months_to_payoff);
    fields["interest_saved"] = format_amount(result.interest_saved);
    fields["total_interest_paid"] = format_amount(result.total_interest_paid);
    fields["converged"] = result.converged ? "true" : "false";
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::DEBUG, "Simulation completed", fields);
}

void Logger::log_simulation_capped(
    const SimulationContext& ctx,
    const SimulationResult& result,
    double remaining_balance
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_capped";
    fields["label"] = ctx.label;
    fields["debt_count"] = std::to_string(ctx.debt_count);
    fields["monthly_budget"] = format_amount(ctx.monthly_budget);
    fields["months"] = std::to_string(result.months_to_payoff);
    fields["remaining_balance"] = format_amount(remaining_balance);

    log(LogLevel::WARN, "Debts not paid off within the month cap", fields);
}

void Logger::log_comparison(
    const std::vector<StrategyComparison>& ranking,
    double monthly_budget
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "strategies_compared";
    fields["monthly_budget"] = format_amount(monthly_budget);
    fields["strategy_count"] = std::to_string(ranking.size());
    for (size_t i = 0; i < ranking.size(); ++i) {
        fields["rank_" + std::to_string(i + 1)] =
            strategy_to_string(ranking[i].strategy) + ":" +
            std::to_string(ranking[i].result.months_to_payoff);
    }

    log(LogLevel::INFO, "Strategies compared", fields);
}

void Logger::log_validation_error(
    const std::string& debt_id,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "validation_error";
    fields["debt_id"] = debt_id;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Invalid debt record", fields);
}

void Logger::log_info(
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> all_fields = fields;
    if (all_fields.find("event") == all_fields.end()) {
        all_fields["event"] = "info";
    }
    log(LogLevel::INFO, message, all_fields);
}

void Logger::log_warning(const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace debtfree
