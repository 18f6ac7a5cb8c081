#ifndef WEALTHSIM_WEALTH_ENGINE_HPP
#define WEALTHSIM_WEALTH_ENGINE_HPP

#include "config.hpp"
#include "logger.hpp"
#include "path_matrix.hpp"
#include <vector>

namespace wealthsim {

// Inflation draws below this are clamped (no runaway deflation)
constexpr double INFLATION_FLOOR = -0.05;

// Result of one stochastic run. Wealth matrices are paths × (years + 1),
// column 0 being the initial balance sheet; inflation_rates is paths × years
// (column y-1 holds the rate realised during year y).
struct SimulationResult {
    PathMatrix net_worth;
    PathMatrix real_net_worth;        // net_worth / cumulative_inflation
    PathMatrix liquid_wealth;
    PathMatrix pension_wealth;
    PathMatrix property_value;
    PathMatrix mortgage_balance;
    PathMatrix inflation_rates;
    PathMatrix cumulative_inflation;  // Product of (1 + inflation) to year y; 1 at year 0

    // Forward schedules as they stand after all events (monthly amounts, index = year)
    std::vector<double> monthly_expense_schedule;
    std::vector<double> monthly_mortgage_schedule;
    std::vector<double> monthly_rental_schedule;

    size_t non_finite_values;         // NaN/Inf cells across all matrices
    double execution_time_ms;

    SimulationResult();

    size_t num_paths() const { return net_worth.num_paths(); }
    size_t num_years() const { return net_worth.num_years() == 0 ? 0 : net_worth.num_years() - 1; }

    size_t memory_footprint() const;
};

// Run the Monte Carlo wealth projection.
//
// Random draws (portfolio returns, pension returns, inflation) are made once,
// up front, from config.random_seed, so a given config always reproduces the
// same matrices. Then for each year 1..N, per path:
//   1. Cumulative inflation advances by this year's draw
//   2. Schedules are read as they stand entering the year (index year-1)
//   3. Passive income (nominal, identical across paths) is inflated per path
//   4. Household take-home and pension contribution per retirement state
//   5. available = take_home + rental + passive - expenses - mortgage
//   6. Pension pot grows; once retired the pension income is withdrawn,
//      capped at the post-growth balance
//   7. Liquid wealth grows and absorbs the year's surplus or deficit
//   8. Property appreciates deterministically; mortgage amortizes annually
//   9. Events dated this year are applied on top of the organic update
//  10. Net worth and real net worth are aggregated
//
// Years run strictly in order; the path dimension is parallelised with
// OpenMP when available. Events dated year 0 precede the first simulated
// year and are not applied (a warning is logged).
//
// Throws ConfigError if the configuration is invalid.
SimulationResult run_stochastic_simulation(
    const SimulationConfig& config,
    const RunContext& ctx = RunContext("", "stochastic")
);

} // namespace wealthsim

#endif // WEALTHSIM_WEALTH_ENGINE_HPP
