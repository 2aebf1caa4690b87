#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace debtfree {
namespace io {

namespace {

// Money is reported to the cent
double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

json debt_to_json(const DebtRecord& debt) {
    json j;
    j["id"] = debt.id;
    j["balance"] = debt.balance;
    j["interest_rate"] = debt.annual_interest_rate_percent;
    j["minimum_payment"] = debt.minimum_payment;
    if (!debt.name.empty()) {
        j["name"] = debt.name;
    }
    j["category"] = category_to_string(debt.category);
    return j;
}

json simulation_result_to_json(const SimulationResult& result) {
    json j;
    j["months_to_payoff"] = result.months_to_payoff;
    j["interest_saved"] = round_cents(result.interest_saved);
    j["baseline_interest"] = round_cents(result.baseline_interest);
    j["total_interest_paid"] = round_cents(result.total_interest_paid);
    j["total_paid"] = round_cents(result.total_paid);
    j["converged"] = result.converged;

    json payoffs = json::array();
    for (const auto& event : result.payoff_order) {
        payoffs.push_back({{"debt_id", event.debt_id}, {"month", event.month}});
    }
    j["payoff_order"] = payoffs;

    if (!result.schedule.empty()) {
        json schedule = json::array();
        for (const auto& s : result.schedule) {
            schedule.push_back({
                {"month", s.month},
                {"interest_accrued", round_cents(s.interest_accrued)},
                {"minimum_paid", round_cents(s.minimum_paid)},
                {"extra_paid", round_cents(s.extra_paid)},
                {"remaining_balance", round_cents(s.remaining_balance)},
                {"debts_remaining", s.debts_remaining}
            });
        }
        j["schedule"] = schedule;
    }
    return j;
}

json comparison_to_json(const std::vector<StrategyComparison>& ranking) {
    json arr = json::array();
    for (size_t i = 0; i < ranking.size(); ++i) {
        const auto& entry = ranking[i];
        arr.push_back({
            {"rank", i + 1},
            {"strategy", strategy_to_string(entry.strategy)},
            {"display_name", strategy_info(entry.strategy).display_name},
            {"months_to_payoff", entry.result.months_to_payoff},
            {"interest_saved", round_cents(entry.result.interest_saved)},
            {"converged", entry.result.converged}
        });
    }
    return arr;
}

void write_json(std::ostream& os, const json& j, bool pretty_print) {
    os << j.dump(pretty_print ? 2 : -1) << "\n";
    if (!os) {
        throw std::runtime_error("Failed to write JSON output");
    }
}

} // anonymous namespace

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print) {
    write_json(os, simulation_result_to_json(result), pretty_print);
}

void write_comparison_json(std::ostream& os, const std::vector<StrategyComparison>& ranking,
                           bool pretty_print) {
    write_json(os, comparison_to_json(ranking), pretty_print);
}

void write_plan_report_json(std::ostream& os, const PlanReport& report, bool pretty_print) {
    json j;
    j["recommended_strategy"] = strategy_to_string(report.recommended_strategy);
    j["strategy"] = strategy_to_string(report.plan.strategy);
    j["strategy_description"] = strategy_info(report.plan.strategy).description;
    j["monthly_budget"] = report.monthly_budget;

    j["budget_range"] = {
        {"minimum", round_cents(report.budget_range.minimum)},
        {"recommended", round_cents(report.budget_range.recommended)},
        {"maximum", round_cents(report.budget_range.maximum)}
    };
    j["total_monthly_interest"] = round_cents(report.total_monthly_interest);

    json ordered = json::array();
    for (const auto& debt : report.plan.ordered_debts) {
        ordered.push_back(debt_to_json(debt));
    }
    j["ordered_debts"] = ordered;

    j["result"] = simulation_result_to_json(report.plan.result);

    if (!report.comparison.empty()) {
        j["comparison"] = comparison_to_json(report.comparison);
    }

    write_json(os, j, pretty_print);
}

void write_plan_report_json(const std::string& filepath, const PlanReport& report,
                            bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_plan_report_json(file, report, pretty_print);
}

} // namespace io
} // namespace debtfree
