#ifndef WEALTHSIM_PASSIVE_INCOME_HPP
#define WEALTHSIM_PASSIVE_INCOME_HPP

#include <optional>
#include <string>
#include <vector>

namespace wealthsim {

// A growing income source outside employment (dividends, annuity, royalties).
// Active in year Y iff start_year <= Y and (no end_year or Y <= end_year).
struct PassiveIncomeStream {
    std::string name;
    int start_year = 0;
    std::optional<int> end_year;        // nullopt = indefinite
    double monthly_amount = 0.0;        // At start_year, before growth
    double annual_growth_rate = 0.0;
    bool is_taxable = true;
    std::optional<double> tax_rate;     // nullopt = household effective rate

    bool is_active(int year) const;

    // Annual amount for `year`, grown from start_year and net of tax.
    // Returns 0 when the stream is not active.
    double annual_amount(int year, double household_tax_rate) const;
};

// Sum of annual_amount over all streams for one year
double total_passive_income(const std::vector<PassiveIncomeStream>& streams,
                            int year, double household_tax_rate);

} // namespace wealthsim

#endif // WEALTHSIM_PASSIVE_INCOME_HPP
