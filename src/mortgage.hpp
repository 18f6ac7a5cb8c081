#ifndef WEALTHSIM_MORTGAGE_HPP
#define WEALTHSIM_MORTGAGE_HPP

namespace wealthsim {

// Balances at or below this are treated as paid off
constexpr double MORTGAGE_BALANCE_EPSILON = 1e-6;

// Level monthly payment for a repayment mortgage (standard annuity formula).
// - annual_rate == 0: principal / term_months
// - term_months <= 0 or principal <= 0: 0 (nothing to amortize)
double monthly_payment(double principal, double annual_rate, int term_months);

// Split of one amortization period
struct AmortizationStep {
    double interest;        // balance × period rate
    double principal_paid;  // max(payment - interest, 0)
    double balance;         // max(balance - principal_paid, 0)
};

// Advance a balance by one period. The engines use annual periods:
// period_rate is the annual rate and payment the annual payment. A balance
// that is already (numerically) zero stays at exactly zero.
AmortizationStep amortize(double balance, double period_rate, double payment);

} // namespace wealthsim

#endif // WEALTHSIM_MORTGAGE_HPP
