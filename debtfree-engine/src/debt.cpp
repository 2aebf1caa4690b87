#include "debt.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace debtfree {

std::string category_to_string(DebtCategory category) {
    switch (category) {
        case DebtCategory::CreditCard: return "CreditCard";
        case DebtCategory::StudentLoan: return "StudentLoan";
        case DebtCategory::Mortgage: return "Mortgage";
        case DebtCategory::CarLoan: return "CarLoan";
        case DebtCategory::PersonalLoan: return "PersonalLoan";
        case DebtCategory::Medical: return "Medical";
        case DebtCategory::Other: return "Other";
        default: return "Other";
    }
}

DebtCategory category_from_string(const std::string& text) {
    if (text == "CreditCard" || text == "Credit Card" || text == "0") {
        return DebtCategory::CreditCard;
    } else if (text == "StudentLoan" || text == "Student Loan" || text == "1") {
        return DebtCategory::StudentLoan;
    } else if (text == "Mortgage" || text == "2") {
        return DebtCategory::Mortgage;
    } else if (text == "CarLoan" || text == "Car Loan" || text == "3") {
        return DebtCategory::CarLoan;
    } else if (text == "PersonalLoan" || text == "Personal Loan" || text == "4") {
        return DebtCategory::PersonalLoan;
    } else if (text == "Medical" || text == "5") {
        return DebtCategory::Medical;
    }
    return DebtCategory::Other;
}

DebtRecord::DebtRecord()
    : balance(0.0),
      annual_interest_rate_percent(0.0),
      minimum_payment(0.0),
      category(DebtCategory::Other) {}

DebtRecord::DebtRecord(std::string debt_id, double bal, double rate_percent, double min_payment)
    : id(std::move(debt_id)),
      balance(bal),
      annual_interest_rate_percent(rate_percent),
      minimum_payment(min_payment),
      category(DebtCategory::Other) {}

bool DebtRecord::operator==(const DebtRecord& other) const {
    return id == other.id &&
           balance == other.balance &&
           annual_interest_rate_percent == other.annual_interest_rate_percent &&
           minimum_payment == other.minimum_payment &&
           name == other.name &&
           category == other.category;
}

InvalidMinimumPaymentError::InvalidMinimumPaymentError(const std::string& debt_id)
    : std::invalid_argument("Debt '" + debt_id +
                            "' has an outstanding balance but no positive minimum payment"),
      debt_id_(debt_id) {}

void validate_debt(const DebtRecord& debt) {
    if (debt.balance < 0.0) {
        throw std::invalid_argument("Debt '" + debt.id + "' has a negative balance");
    }
    if (debt.annual_interest_rate_percent < 0.0) {
        throw std::invalid_argument("Debt '" + debt.id + "' has a negative interest rate");
    }
    if (debt.minimum_payment < 0.0) {
        throw std::invalid_argument("Debt '" + debt.id + "' has a negative minimum payment");
    }
    if (debt.balance > 0.0 && debt.minimum_payment <= 0.0) {
        throw InvalidMinimumPaymentError(debt.id);
    }
}

void validate_debts(const std::vector<DebtRecord>& debts) {
    for (const auto& debt : debts) {
        validate_debt(debt);
    }
}

int minimum_only_payoff_months(const DebtRecord& debt) {
    if (debt.balance <= 0.0) {
        return 0;
    }
    if (debt.minimum_payment <= 0.0) {
        throw InvalidMinimumPaymentError(debt.id);
    }
    const double months = std::ceil(debt.balance / debt.minimum_payment);
    if (months >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(months);
}

double remaining_balance(const DebtRecord& debt, double total_paid) {
    return std::max(debt.balance - total_paid, 0.0);
}

double payment_progress(const DebtRecord& debt, double total_paid) {
    if (debt.balance <= 0.0) {
        return 0.0;
    }
    return std::clamp(total_paid / debt.balance, 0.0, 1.0);
}

// ============================================================================
// Portfolio
// ============================================================================

Portfolio::Portfolio(std::vector<DebtRecord> debts) : debts_(std::move(debts)) {}

void Portfolio::add(const DebtRecord& debt) {
    debts_.push_back(debt);
}

void Portfolio::add(DebtRecord&& debt) {
    debts_.push_back(std::move(debt));
}

const DebtRecord& Portfolio::get(size_t index) const {
    if (index >= debts_.size()) {
        throw std::out_of_range("Debt index out of range");
    }
    return debts_[index];
}

size_t Portfolio::size() const {
    return debts_.size();
}

bool Portfolio::empty() const {
    return debts_.empty();
}

void Portfolio::reserve(size_t count) {
    debts_.reserve(count);
}

void Portfolio::clear() {
    debts_.clear();
}

double Portfolio::total_balance() const {
    double total = 0.0;
    for (const auto& d : debts_) {
        total += d.balance;
    }
    return total;
}

double Portfolio::total_minimum_payment() const {
    double total = 0.0;
    for (const auto& d : debts_) {
        total += d.minimum_payment;
    }
    return total;
}

Portfolio Portfolio::outstanding() const {
    Portfolio result;
    for (const auto& d : debts_) {
        if (d.balance > 0.0) {
            result.add(d);
        }
    }
    return result;
}

Portfolio Portfolio::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

Portfolio Portfolio::load_from_csv(std::istream& is) {
    Portfolio portfolio;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return portfolio;
    }

    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.size() < 4) {
            continue;
        }

        DebtRecord d;
        d.id = row[0];
        try {
            d.balance = std::stod(row[1]);
            d.annual_interest_rate_percent = std::stod(row[2]);
            d.minimum_payment = std::stod(row[3]);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid numeric value in debts CSV at line " +
                                     std::to_string(line));
        }

        if (row.size() > 4) {
            d.name = row[4];
        }
        if (row.size() > 5) {
            d.category = category_from_string(row[5]);
        }

        portfolio.add(std::move(d));
    }

    return portfolio;
}

} // namespace debtfree
