#include "strategy.hpp"
#include "logger.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace debtfree {

namespace {

const std::array<StrategyInfo, 6> STRATEGY_TABLE = {{
    {StrategyTag::Snowball, "snowball", "Snowball Method",
     "Pay minimum on all debts, then put extra money toward the smallest debt first. "
     "When it's paid off, apply that payment to the next smallest debt."},
    {StrategyTag::Avalanche, "avalanche", "Avalanche Method",
     "Pay minimum on all debts, then put extra money toward the highest interest debt first. "
     "This saves the most money in interest over time."},
    {StrategyTag::HighestBalance, "highest-balance", "Highest Balance First",
     "Focus on paying off the debt with the highest balance first. "
     "Good for eliminating large debts quickly."},
    {StrategyTag::LowestBalance, "lowest-balance", "Lowest Balance First",
     "Similar to the snowball method, but doesn't necessarily consider interest rates. "
     "Just focuses on eliminating small debts first."},
    {StrategyTag::HighestInterest, "highest-interest", "Highest Interest First",
     "Similar to the avalanche method, prioritizing the highest interest debt regardless of balance."},
    {StrategyTag::Custom, "custom", "Custom Order",
     "Create your own custom repayment order based on your preferences."}
}};

constexpr double HIGH_INTEREST_RATE = 15.0;
constexpr double LARGE_TOTAL_BALANCE = 10000.0;
constexpr double SMALL_BALANCE = 1000.0;
constexpr size_t MANY_DEBTS = 3;
constexpr double DOMINANT_SHARE = 0.5;
constexpr double HIGH_MEAN_RATE = 10.0;

// Sum after sorting so the floating result is the same for any input order
double order_independent_sum(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return std::accumulate(values.begin(), values.end(), 0.0);
}

} // anonymous namespace

const StrategyInfo& strategy_info(StrategyTag tag) {
    for (const auto& info : STRATEGY_TABLE) {
        if (info.tag == tag) {
            return info;
        }
    }
    throw std::invalid_argument("Unknown strategy tag: " +
                                std::to_string(static_cast<int>(tag)));
}

std::string strategy_to_string(StrategyTag tag) {
    return strategy_info(tag).key;
}

StrategyTag strategy_from_string(const std::string& text) {
    for (const auto& info : STRATEGY_TABLE) {
        if (text == info.key || text == info.display_name) {
            return info.tag;
        }
    }
    throw std::invalid_argument("Unknown strategy: " + text);
}

const std::array<StrategyTag, 5>& comparable_strategies() {
    static const std::array<StrategyTag, 5> tags = {
        StrategyTag::Snowball,
        StrategyTag::Avalanche,
        StrategyTag::HighestBalance,
        StrategyTag::LowestBalance,
        StrategyTag::HighestInterest
    };
    return tags;
}

StrategyTag recommend_strategy(const std::vector<DebtRecord>& debts) {
    if (debts.empty()) {
        return StrategyTag::Snowball;
    }

    std::vector<double> balances;
    std::vector<double> rates;
    balances.reserve(debts.size());
    rates.reserve(debts.size());
    for (const auto& d : debts) {
        balances.push_back(d.balance);
        rates.push_back(d.annual_interest_rate_percent);
    }

    const double total_balance = order_independent_sum(balances);
    const double mean_rate = order_independent_sum(rates) / static_cast<double>(debts.size());

    const bool has_high_interest = std::any_of(debts.begin(), debts.end(), [](const DebtRecord& d) {
        return d.annual_interest_rate_percent > HIGH_INTEREST_RATE;
    });
    const bool has_small_balance = std::any_of(debts.begin(), debts.end(), [](const DebtRecord& d) {
        return d.balance < SMALL_BALANCE;
    });
    const bool has_dominant_balance = std::any_of(debts.begin(), debts.end(),
        [total_balance](const DebtRecord& d) {
            return d.balance > total_balance * DOMINANT_SHARE;
        });

    StrategyTag tag;
    if (has_high_interest && total_balance > LARGE_TOTAL_BALANCE) {
        tag = StrategyTag::Avalanche;
    } else if (has_small_balance && debts.size() >= MANY_DEBTS) {
        tag = StrategyTag::Snowball;
    } else if (has_dominant_balance) {
        tag = StrategyTag::HighestBalance;
    } else if (mean_rate > HIGH_MEAN_RATE) {
        tag = StrategyTag::HighestInterest;
    } else {
        tag = StrategyTag::Snowball;
    }

    Logger::get_instance().log_strategy_recommended(tag, debts.size(), total_balance, mean_rate);
    return tag;
}

StrategyTag recommend_strategy(const Portfolio& portfolio) {
    return recommend_strategy(portfolio.debts());
}

std::vector<DebtRecord> order_debts(const std::vector<DebtRecord>& debts, StrategyTag strategy) {
    std::vector<DebtRecord> ordered = debts;

    switch (strategy) {
        case StrategyTag::Snowball:
        case StrategyTag::LowestBalance:
            std::stable_sort(ordered.begin(), ordered.end(),
                             [](const DebtRecord& a, const DebtRecord& b) {
                                 return a.balance < b.balance;
                             });
            break;
        case StrategyTag::Avalanche:
        case StrategyTag::HighestInterest:
            std::stable_sort(ordered.begin(), ordered.end(),
                             [](const DebtRecord& a, const DebtRecord& b) {
                                 return a.annual_interest_rate_percent >
                                        b.annual_interest_rate_percent;
                             });
            break;
        case StrategyTag::HighestBalance:
            std::stable_sort(ordered.begin(), ordered.end(),
                             [](const DebtRecord& a, const DebtRecord& b) {
                                 return a.balance > b.balance;
                             });
            break;
        case StrategyTag::Custom:
            break;
    }

    return ordered;
}

std::vector<DebtRecord> order_debts(const Portfolio& portfolio, StrategyTag strategy) {
    return order_debts(portfolio.debts(), strategy);
}

} // namespace debtfree
