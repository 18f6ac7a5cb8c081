#ifndef WEALTHSIM_HOUSEHOLD_INCOME_HPP
#define WEALTHSIM_HOUSEHOLD_INCOME_HPP

#include "config.hpp"
#include <optional>

namespace wealthsim {

// One earner's employment and retirement terms
struct EarnerProfile {
    int starting_age;
    int retirement_age;
    double gross_income;       // Year-0 gross salary
    double tax_rate;
    double pension_rate;
    double pension_income;     // Fixed nominal annual income once retired

    // First simulation year in which the earner counts as retired
    int retirement_year() const { return retirement_age - starting_age; }
};

// One earner's income for one year
struct MemberIncome {
    bool retired;
    double gross;                  // Salary before deductions (0 once retired)
    double take_home;
    double pension_contribution;   // Paid into the pension pot (0 once retired)
};

// Household total for one year
struct HouseholdIncome {
    MemberIncome primary;
    std::optional<MemberIncome> spouse;

    double gross() const;
    double take_home() const;
    double pension_contribution() const;
};

EarnerProfile primary_profile(const SimulationConfig& config);
std::optional<EarnerProfile> spouse_profile(const SimulationConfig& config);

// An earner is retired from the year their age reaches retirement_age
bool is_retired(int starting_age, int retirement_age, int year);

// Income for one earner in `year`.
// Working: gross = base × (1+g)^year, take-home = gross × (1 - tax - pension).
// Retired: take-home = pension_income × pension_inflation, no contribution.
// pension_inflation re-inflates the fixed pension from the retirement year;
// pass 1.0 for nominal figures.
MemberIncome member_income(const EarnerProfile& earner, int year,
                           double salary_growth_rate,
                           double pension_inflation = 1.0);

// Primary and optional spouse computed independently and summed
HouseholdIncome household_income(const EarnerProfile& primary,
                                 const std::optional<EarnerProfile>& spouse,
                                 int year,
                                 double salary_growth_rate,
                                 double primary_pension_inflation = 1.0,
                                 double spouse_pension_inflation = 1.0);

} // namespace wealthsim

#endif // WEALTHSIM_HOUSEHOLD_INCOME_HPP
