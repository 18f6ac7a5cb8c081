#include "passive_income.hpp"
#include <cmath>

namespace wealthsim {

bool PassiveIncomeStream::is_active(int year) const {
    if (year < start_year) {
        return false;
    }
    return !end_year.has_value() || year <= *end_year;
}

double PassiveIncomeStream::annual_amount(int year, double household_tax_rate) const {
    if (!is_active(year)) {
        return 0.0;
    }

    int years_active = year - start_year;
    double growth = std::pow(1.0 + annual_growth_rate, years_active);
    double amount = monthly_amount * 12.0 * growth;

    if (is_taxable) {
        amount *= 1.0 - tax_rate.value_or(household_tax_rate);
    }
    return amount;
}

double total_passive_income(const std::vector<PassiveIncomeStream>& streams,
                            int year, double household_tax_rate) {
    double total = 0.0;
    for (const auto& stream : streams) {
        total += stream.annual_amount(year, household_tax_rate);
    }
    return total;
}

} // namespace wealthsim
