#include "household_income.hpp"
#include <cmath>

namespace wealthsim {

double HouseholdIncome::gross() const {
    return primary.gross + (spouse ? spouse->gross : 0.0);
}

double HouseholdIncome::take_home() const {
    return primary.take_home + (spouse ? spouse->take_home : 0.0);
}

double HouseholdIncome::pension_contribution() const {
    return primary.pension_contribution + (spouse ? spouse->pension_contribution : 0.0);
}

EarnerProfile primary_profile(const SimulationConfig& config) {
    return EarnerProfile{
        config.starting_age,
        config.retirement_age,
        config.gross_annual_income,
        config.effective_tax_rate,
        config.pension_contribution_rate,
        config.pension_income
    };
}

std::optional<EarnerProfile> spouse_profile(const SimulationConfig& config) {
    if (!config.spouse) {
        return std::nullopt;
    }
    const SpouseConfig& spouse = *config.spouse;
    return EarnerProfile{
        spouse.age,
        spouse.retirement_age,
        spouse.gross_income,
        spouse.tax_rate.value_or(config.effective_tax_rate),
        spouse.pension_rate.value_or(config.pension_contribution_rate),
        spouse.pension_income
    };
}

bool is_retired(int starting_age, int retirement_age, int year) {
    return starting_age + year >= retirement_age;
}

MemberIncome member_income(const EarnerProfile& earner, int year,
                           double salary_growth_rate,
                           double pension_inflation) {
    MemberIncome income{false, 0.0, 0.0, 0.0};
    income.retired = is_retired(earner.starting_age, earner.retirement_age, year);

    if (income.retired) {
        income.take_home = earner.pension_income * pension_inflation;
        return income;
    }

    income.gross = earner.gross_income * std::pow(1.0 + salary_growth_rate, year);
    income.pension_contribution = income.gross * earner.pension_rate;
    income.take_home = income.gross * (1.0 - earner.tax_rate - earner.pension_rate);
    return income;
}

HouseholdIncome household_income(const EarnerProfile& primary,
                                 const std::optional<EarnerProfile>& spouse,
                                 int year,
                                 double salary_growth_rate,
                                 double primary_pension_inflation,
                                 double spouse_pension_inflation) {
    HouseholdIncome household{
        member_income(primary, year, salary_growth_rate, primary_pension_inflation),
        std::nullopt
    };
    if (spouse) {
        household.spouse = member_income(*spouse, year, salary_growth_rate,
                                         spouse_pension_inflation);
    }
    return household;
}

} // namespace wealthsim
