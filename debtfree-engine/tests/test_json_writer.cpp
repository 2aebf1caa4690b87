#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "io/json_writer.hpp"
#include "logger.hpp"

using namespace debtfree;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

std::vector<DebtRecord> interest_heavy_portfolio() {
    DebtRecord small("small", 2000.0, 3.0, 50.0);
    small.name = "Credit \"Union\" Loan";
    small.category = DebtCategory::PersonalLoan;
    DebtRecord large("large", 12000.0, 24.0, 300.0);
    large.category = DebtCategory::CreditCard;
    return {small, large};
}

io::PlanReport make_report(bool with_comparison, bool with_schedule) {
    auto debts = interest_heavy_portfolio();
    SimulationConfig config;
    config.detailed_schedule = with_schedule;

    io::PlanReport report;
    report.recommended_strategy = recommend_strategy(debts);
    report.monthly_budget = 800.0;
    report.budget_range = budget_range(debts);
    report.total_monthly_interest = total_monthly_interest(debts);
    report.plan = plan_with_strategy(debts, StrategyTag::Avalanche, 800.0, config);
    if (with_comparison) {
        report.comparison = compare_strategies(debts, 800.0, config);
    }
    return report;
}

json to_json(const io::PlanReport& report) {
    std::ostringstream out;
    io::write_plan_report_json(out, report);
    return json::parse(out.str());
}

} // anonymous namespace

TEST_CASE("Plan report has the expected layout", "[json_writer]") {
    quiet_logger();
    json j = to_json(make_report(false, false));

    REQUIRE(j["strategy"] == "avalanche");
    REQUIRE(j["strategy_description"].get<std::string>().find("interest") != std::string::npos);
    REQUIRE(j["monthly_budget"].get<double>() == 800.0);
    REQUIRE(j.contains("recommended_strategy"));

    REQUIRE(j["budget_range"]["minimum"].get<double>() == 350.0);
    REQUIRE(j["budget_range"]["maximum"].get<double>() == 5000.0);
    REQUIRE_THAT(j["total_monthly_interest"].get<double>(), WithinAbs(245.0, 0.001));

    REQUIRE(j["ordered_debts"].size() == 2);
    REQUIRE(j["ordered_debts"][0]["id"] == "large");
    REQUIRE(j["ordered_debts"][0]["category"] == "CreditCard");
    REQUIRE_FALSE(j["ordered_debts"][0].contains("name"));
    REQUIRE(j["ordered_debts"][1]["name"] == "Credit \"Union\" Loan");

    const json& result = j["result"];
    REQUIRE(result["months_to_payoff"] == 22);
    REQUIRE(result["converged"] == true);
    REQUIRE_THAT(result["interest_saved"].get<double>(), WithinAbs(7109.96, 0.011));
    REQUIRE(result["payoff_order"].size() == 2);
    REQUIRE(result["payoff_order"][0]["debt_id"] == "large");
    REQUIRE(result["payoff_order"][0]["month"] == 20);
    REQUIRE(result["payoff_order"][1]["debt_id"] == "small");
    REQUIRE(result["payoff_order"][1]["month"] == 22);

    REQUIRE_FALSE(result.contains("schedule"));
    REQUIRE_FALSE(j.contains("comparison"));
}

TEST_CASE("Plan report carries schedule and comparison on request", "[json_writer]") {
    quiet_logger();
    json j = to_json(make_report(true, true));

    const json& schedule = j["result"]["schedule"];
    REQUIRE(schedule.size() == 22);
    REQUIRE(schedule[0]["month"] == 1);
    REQUIRE(schedule[0]["debts_remaining"] == 2);
    REQUIRE(schedule.back()["debts_remaining"] == 0);
    REQUIRE(schedule.back()["remaining_balance"].get<double>() == 0.0);

    const json& comparison = j["comparison"];
    REQUIRE(comparison.size() == 5);
    REQUIRE(comparison[0]["rank"] == 1);
    REQUIRE(comparison[0]["strategy"] == "avalanche");
    REQUIRE(comparison[0]["display_name"] == "Avalanche Method");
    REQUIRE(comparison[0]["months_to_payoff"] == 22);
    REQUIRE(comparison[4]["rank"] == 5);
    REQUIRE(comparison[4]["months_to_payoff"] == 23);
}

TEST_CASE("Simulation result and ranking writers", "[json_writer]") {
    quiet_logger();

    SECTION("Capped result reports converged false") {
        SimulationConfig config;
        config.max_months = 12;
        SimulationResult result = simulate_payoff({DebtRecord("big", 10000.0, 24.0, 150.0)}, 150.0, config);

        std::ostringstream out;
        io::write_simulation_result_json(out, result, false);
        json j = json::parse(out.str());

        REQUIRE(j["months_to_payoff"] == 12);
        REQUIRE(j["converged"] == false);
        REQUIRE(j["payoff_order"].empty());
        REQUIRE(out.str().find('\n') == out.str().size() - 1);
    }

    SECTION("Empty ranking is an empty array") {
        std::ostringstream out;
        io::write_comparison_json(out, {});
        REQUIRE(json::parse(out.str()).is_array());
        REQUIRE(json::parse(out.str()).empty());
    }
}

TEST_CASE("Plan report written to file", "[json_writer]") {
    quiet_logger();
    std::string path = "test_plan_report.json";

    io::write_plan_report_json(path, make_report(false, false));

    std::ifstream in(path);
    REQUIRE(in.good());
    json j = json::parse(in);
    REQUIRE(j["result"]["months_to_payoff"] == 22);

    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(io::write_plan_report_json("/nonexistent/dir/report.json", make_report(false, false)),
                      std::runtime_error);
}
