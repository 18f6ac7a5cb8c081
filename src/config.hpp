/**
 * @file config.hpp
 * @brief Household simulation inputs and their validation
 *
 * All monetary fields are in one canonical unit of account. Rates are
 * decimals (0.25 = 25%). A SimulationConfig is a plain value: the engines
 * copy nothing out of it beyond the call that receives it.
 */

#ifndef WEALTHSIM_CONFIG_HPP
#define WEALTHSIM_CONFIG_HPP

#include "events.hpp"
#include "passive_income.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wealthsim {

/**
 * @brief Exception thrown when a configuration fails validation
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Optional second earner, modelled in parallel with the primary
 */
struct SpouseConfig {
    int age = 30;
    int retirement_age = 65;
    double gross_income = 0.0;
    double pension_income = 0.0;           ///< Fixed nominal income once retired
    std::optional<double> tax_rate;        ///< Falls back to household rate
    std::optional<double> pension_rate;    ///< Falls back to household rate
};

/**
 * @brief Complete input to one simulation call
 */
struct SimulationConfig {
    // Balance sheet at year 0
    double initial_liquid_wealth = 0.0;
    double initial_property_value = 0.0;
    double initial_mortgage = 0.0;

    // Employment and spending
    double gross_annual_income = 0.0;
    double effective_tax_rate = 0.25;
    double pension_contribution_rate = 0.05;
    double monthly_expenses = 0.0;
    double monthly_mortgage_payment = 0.0;

    // Property
    double property_appreciation = 0.03;
    double mortgage_interest_rate = 0.04;

    // Capital markets
    double expected_return = 0.07;
    double return_volatility = 0.15;
    double expected_inflation = 0.02;
    double inflation_volatility = 0.01;
    double salary_inflation = 0.025;

    // Horizon
    int years = 30;
    int num_paths = 1000;
    uint64_t random_seed = 42;

    // Life cycle
    int starting_age = 30;
    int retirement_age = 65;
    double pension_income = 0.0;   ///< Annual, drawn from the pension pot once retired

    std::vector<Event> events;
    std::vector<PassiveIncomeStream> passive_income_streams;
    std::optional<SpouseConfig> spouse;
};

/**
 * @brief Reject configurations the engines cannot simulate meaningfully
 *
 * @param config Configuration to check
 * @throws ConfigError naming the first offending field
 */
void validate_config(const SimulationConfig& config);

} // namespace wealthsim

#endif // WEALTHSIM_CONFIG_HPP
