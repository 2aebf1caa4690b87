#ifndef DEBTFREE_PLAN_CONFIG_HPP
#define DEBTFREE_PLAN_CONFIG_HPP

#include "logger.hpp"
#include "payoff.hpp"
#include "strategy.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace debtfree {

/**
 * @brief Exception thrown when a plan config cannot be read or is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Settings for one engine run, usually read from a JSON file
 *
 * Every field is optional in the file; command line options take
 * precedence over values found here.
 */
struct PlanConfig {
    std::string debts_path;                   ///< "debts.source", local:// prefix stripped
    std::optional<double> monthly_budget;     ///< "budget"
    std::optional<StrategyTag> strategy;      ///< "strategy", recommended when absent
    bool compare;                             ///< "compare"
    SimulationConfig simulation;              ///< "simulation" block
    LoggerConfig logging;                     ///< "logging" block

    PlanConfig() : compare(false) {}
};

/**
 * @brief Parses a plan configuration from a JSON string
 *
 * @throws ConfigParseError if the JSON is malformed or a value is out of range
 */
PlanConfig parse_plan_config_from_string(const std::string& json_string);

/**
 * @brief Parses a plan configuration from a JSON file
 *
 * A relative debts path is resolved against the directory of the file.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
PlanConfig parse_plan_config_from_file(const std::string& file_path);

/**
 * @brief Expands ${VAR} and $VAR references from the environment
 *
 * Unset variables expand to an empty string.
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace debtfree

#endif // DEBTFREE_PLAN_CONFIG_HPP
