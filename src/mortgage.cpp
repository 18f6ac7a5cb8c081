#include "mortgage.hpp"
#include <algorithm>
#include <cmath>

namespace wealthsim {

double monthly_payment(double principal, double annual_rate, int term_months) {
    if (principal <= 0.0 || term_months <= 0) {
        return 0.0;
    }

    double n = static_cast<double>(term_months);
    if (annual_rate == 0.0) {
        return principal / n;
    }

    // P × r(1+r)^n / ((1+r)^n - 1)
    double r = annual_rate / 12.0;
    double growth = std::pow(1.0 + r, n);
    return principal * (r * growth) / (growth - 1.0);
}

AmortizationStep amortize(double balance, double period_rate, double payment) {
    AmortizationStep step{0.0, 0.0, 0.0};
    if (balance <= MORTGAGE_BALANCE_EPSILON) {
        return step;
    }

    step.interest = balance * period_rate;
    step.principal_paid = std::max(payment - step.interest, 0.0);
    step.balance = std::max(balance - step.principal_paid, 0.0);
    return step;
}

} // namespace wealthsim
