#ifndef DEBTFREE_DEBT_HPP
#define DEBTFREE_DEBT_HPP

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace debtfree {

enum class DebtCategory : uint8_t {
    CreditCard = 0,
    StudentLoan = 1,
    Mortgage = 2,
    CarLoan = 3,
    PersonalLoan = 4,
    Medical = 5,
    Other = 6
};

std::string category_to_string(DebtCategory category);

// Accepts the enum name ("CreditCard"), the display text ("Credit Card") or
// the numeric value. Anything else is Other.
DebtCategory category_from_string(const std::string& text);

struct DebtRecord {
    std::string id;
    double balance;                       // Outstanding amount
    double annual_interest_rate_percent;  // 18.99 means 18.99% per year
    double minimum_payment;               // Due every month
    std::string name;                     // Display label, not used in calculations
    DebtCategory category;

    DebtRecord();
    DebtRecord(std::string debt_id, double bal, double rate_percent, double min_payment);

    double monthly_rate() const { return annual_interest_rate_percent / 100.0 / 12.0; }

    bool operator==(const DebtRecord& other) const;
    bool operator!=(const DebtRecord& other) const { return !(*this == other); }
};

// Thrown when a debt with an outstanding balance has no positive minimum
// payment. Such a debt can never be amortized at its own pace.
class InvalidMinimumPaymentError : public std::invalid_argument {
public:
    explicit InvalidMinimumPaymentError(const std::string& debt_id);

    const std::string& debt_id() const { return debt_id_; }

private:
    std::string debt_id_;
};

// Throws std::invalid_argument for negative amounts and
// InvalidMinimumPaymentError for a non-positive minimum on a live balance
void validate_debt(const DebtRecord& debt);
void validate_debts(const std::vector<DebtRecord>& debts);

// Months to clear the balance paying only the minimum, ignoring interest:
// ceil(balance / minimum_payment). Zero for a zero balance. Ratios beyond
// the int range saturate at std::numeric_limits<int>::max().
int minimum_only_payoff_months(const DebtRecord& debt);

// Remaining balance after the given total of recorded payments (never negative)
double remaining_balance(const DebtRecord& debt, double total_paid);

// Fraction of the original balance already paid, clamped to [0, 1]
double payment_progress(const DebtRecord& debt, double total_paid);

class Portfolio {
public:
    Portfolio() = default;
    explicit Portfolio(std::vector<DebtRecord> debts);

    void add(const DebtRecord& debt);
    void add(DebtRecord&& debt);

    const DebtRecord& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<DebtRecord>& debts() const { return debts_; }

    void reserve(size_t count);
    void clear();

    double total_balance() const;
    double total_minimum_payment() const;

    // Debts with a balance above zero, in their current order
    Portfolio outstanding() const;

    // CSV columns: id,balance,interest_rate,minimum_payment[,name,category]
    static Portfolio load_from_csv(const std::string& filepath);
    static Portfolio load_from_csv(std::istream& is);

private:
    std::vector<DebtRecord> debts_;
};

} // namespace debtfree

#endif // DEBTFREE_DEBT_HPP
