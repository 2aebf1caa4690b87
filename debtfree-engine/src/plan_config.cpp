#include "plan_config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace debtfree {

namespace {

const std::string LOCAL_PREFIX = "local://";

std::string strip_source_prefix(const std::string& source) {
    if (source.rfind(LOCAL_PREFIX, 0) == 0) {
        return source.substr(LOCAL_PREFIX.size());
    }
    if (source.find("://") != std::string::npos) {
        throw ConfigParseError("Unsupported debts source: " + source + ". Use local:// paths.");
    }
    return source;
}

// Reads a whole positive month count without overflowing int
int read_month_count(const json& value) {
    const double months = value.get<double>();
    if (!std::isfinite(months) || months < 1.0 ||
        months > static_cast<double>(std::numeric_limits<int>::max()) ||
        std::floor(months) != months) {
        throw ConfigParseError("simulation.max_months must be a positive whole number");
    }
    return static_cast<int>(months);
}

void validate_plan_config(const PlanConfig& config) {
    if (config.monthly_budget && *config.monthly_budget < 0.0) {
        throw ConfigParseError("budget must be non-negative");
    }
    if (config.simulation.paid_off_epsilon < 0.0) {
        throw ConfigParseError("simulation.paid_off_epsilon must be non-negative");
    }
    if (config.simulation.max_months <= 0) {
        throw ConfigParseError("simulation.max_months must be positive");
    }
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        if (var_name.empty()) {
            // Lone '$', keep it
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

PlanConfig parse_plan_config_from_string(const std::string& json_string) {
    PlanConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("debts") && j["debts"].contains("source")) {
            config.debts_path = strip_source_prefix(
                expand_environment_variables(j["debts"]["source"].get<std::string>()));
        }

        if (j.contains("budget")) {
            config.monthly_budget = j["budget"].get<double>();
        }

        if (j.contains("strategy")) {
            try {
                config.strategy = strategy_from_string(j["strategy"].get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw ConfigParseError(e.what());
            }
        }

        if (j.contains("compare")) {
            config.compare = j["compare"].get<bool>();
        }

        if (j.contains("simulation")) {
            const auto& sim = j["simulation"];
            if (sim.contains("paid_off_epsilon")) {
                config.simulation.paid_off_epsilon = sim["paid_off_epsilon"].get<double>();
            }
            if (sim.contains("max_months")) {
                config.simulation.max_months = read_month_count(sim["max_months"]);
            }
            if (sim.contains("detailed_schedule")) {
                config.simulation.detailed_schedule = sim["detailed_schedule"].get<bool>();
            }
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                std::string file = expand_environment_variables(logging["file"].get<std::string>());
                config.logging.enable_file = !file.empty();
                if (!file.empty()) {
                    config.logging.log_file_path = file;
                }
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_plan_config(config);

    return config;
}

PlanConfig parse_plan_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    PlanConfig config = parse_plan_config_from_string(buffer.str());

    if (!config.debts_path.empty()) {
        config.debts_path = resolve_relative_path(config.debts_path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace debtfree
