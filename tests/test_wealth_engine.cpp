#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "wealth_engine.hpp"
#include "mortgage.hpp"
#include "statistics.hpp"

using namespace wealthsim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

SimulationConfig basic_config() {
    SimulationConfig config;
    config.initial_liquid_wealth = 100000.0;
    config.initial_property_value = 500000.0;
    config.initial_mortgage = 400000.0;
    config.gross_annual_income = 75000.0;
    config.effective_tax_rate = 0.25;
    config.pension_contribution_rate = 0.10;
    config.monthly_expenses = 3000.0;
    config.monthly_mortgage_payment = 2000.0;
    config.years = 10;
    config.num_paths = 100;
    config.random_seed = 42;
    return config;
}

// No randomness: every path follows the mean returns and mean inflation
SimulationConfig deterministic_config() {
    SimulationConfig config = basic_config();
    config.return_volatility = 0.0;
    config.inflation_volatility = 0.0;
    config.num_paths = 3;
    return config;
}

} // anonymous namespace

// ============================================================================
// Shape and Initial Conditions
// ============================================================================

TEST_CASE("Result matrices have one column per year plus year 0", "[engine]") {
    SimulationResult result = run_stochastic_simulation(basic_config());

    REQUIRE(result.num_paths() == 100);
    REQUIRE(result.num_years() == 10);
    REQUIRE(result.net_worth.num_years() == 11);
    REQUIRE(result.pension_wealth.num_years() == 11);
    REQUIRE(result.cumulative_inflation.num_years() == 11);
    REQUIRE(result.inflation_rates.num_years() == 10);
    REQUIRE(result.monthly_expense_schedule.size() == 11);
    REQUIRE(result.non_finite_values == 0);
}

TEST_CASE("Every path starts from the initial balance sheet", "[engine]") {
    SimulationResult result = run_stochastic_simulation(basic_config());

    for (size_t p = 0; p < result.num_paths(); ++p) {
        REQUIRE(result.net_worth(p, 0) == 200000.0);
        REQUIRE(result.real_net_worth(p, 0) == 200000.0);
        REQUIRE(result.liquid_wealth(p, 0) == 100000.0);
        REQUIRE(result.pension_wealth(p, 0) == 0.0);
        REQUIRE(result.cumulative_inflation(p, 0) == 1.0);
    }
}

TEST_CASE("Basic growth scenario ends above its starting net worth", "[engine][scenario]") {
    SimulationResult result = run_stochastic_simulation(basic_config());

    double median_final = percentile_of(result.net_worth.column(10), 50.0);
    REQUIRE(median_final > 200000.0);
}

// ============================================================================
// Determinism
// ============================================================================

TEST_CASE("Same seed reproduces every matrix exactly", "[engine]") {
    SimulationResult a = run_stochastic_simulation(basic_config());
    SimulationResult b = run_stochastic_simulation(basic_config());

    REQUIRE(a.net_worth.data() == b.net_worth.data());
    REQUIRE(a.real_net_worth.data() == b.real_net_worth.data());
    REQUIRE(a.liquid_wealth.data() == b.liquid_wealth.data());
    REQUIRE(a.pension_wealth.data() == b.pension_wealth.data());
    REQUIRE(a.mortgage_balance.data() == b.mortgage_balance.data());
    REQUIRE(a.inflation_rates.data() == b.inflation_rates.data());
}

TEST_CASE("Different seeds give different paths", "[engine]") {
    SimulationConfig other = basic_config();
    other.random_seed = 7;

    SimulationResult a = run_stochastic_simulation(basic_config());
    SimulationResult b = run_stochastic_simulation(other);

    REQUIRE(a.net_worth.data() != b.net_worth.data());
}

TEST_CASE("Zero volatility makes all paths identical", "[engine]") {
    SimulationResult result = run_stochastic_simulation(deterministic_config());

    for (size_t y = 0; y <= result.num_years(); ++y) {
        REQUIRE(result.net_worth(1, y) == result.net_worth(0, y));
        REQUIRE(result.net_worth(2, y) == result.net_worth(0, y));
    }
}

// ============================================================================
// Organic Recurrence
// ============================================================================

TEST_CASE("First year follows the recurrence with mean returns", "[engine]") {
    SimulationConfig config = deterministic_config();
    SimulationResult result = run_stochastic_simulation(config);

    const double inflation = 1.02;
    const double gross = 75000.0 * 1.025;
    const double take_home = gross * 0.65;
    const double available = take_home - 3000.0 * 12.0 * inflation - 2000.0 * 12.0;

    REQUIRE_THAT(result.cumulative_inflation(0, 1), WithinRel(inflation, 1e-12));
    REQUIRE_THAT(result.liquid_wealth(0, 1), WithinRel(100000.0 * 1.07 + available, 1e-12));
    REQUIRE_THAT(result.pension_wealth(0, 1), WithinRel(gross * 0.10, 1e-12));
    REQUIRE_THAT(result.property_value(0, 1), WithinRel(500000.0 * 1.03, 1e-12));
    REQUIRE_THAT(result.mortgage_balance(0, 1),
                 WithinRel(amortize(400000.0, 0.04, 24000.0).balance, 1e-12));
    REQUIRE_THAT(result.real_net_worth(0, 1),
                 WithinRel(result.net_worth(0, 1) / inflation, 1e-12));
}

TEST_CASE("Net worth aggregates the four balances", "[engine]") {
    SimulationResult result = run_stochastic_simulation(basic_config());

    for (size_t p = 0; p < result.num_paths(); p += 17) {
        for (size_t y = 0; y <= result.num_years(); ++y) {
            double expected = result.liquid_wealth(p, y) + result.pension_wealth(p, y) +
                              result.property_value(p, y) - result.mortgage_balance(p, y);
            REQUIRE_THAT(result.net_worth(p, y), WithinAbs(expected, 1e-6));
            REQUIRE_THAT(result.real_net_worth(p, y),
                         WithinRel(result.net_worth(p, y) / result.cumulative_inflation(p, y), 1e-12));
        }
    }
}

TEST_CASE("Inflation draws are floored", "[engine][boundary]") {
    SimulationConfig config = basic_config();
    config.expected_inflation = -0.20;
    config.inflation_volatility = 0.01;

    SimulationResult result = run_stochastic_simulation(config);

    for (double rate : result.inflation_rates.data()) {
        REQUIRE(rate >= INFLATION_FLOOR);
    }
}

TEST_CASE("Passive income is added to liquid wealth", "[engine][passive]") {
    SimulationConfig with_stream = deterministic_config();
    PassiveIncomeStream stream;
    stream.name = "Dividends";
    stream.monthly_amount = 500.0;
    stream.is_taxable = false;
    with_stream.passive_income_streams.push_back(stream);

    SimulationResult base = run_stochastic_simulation(deterministic_config());
    SimulationResult result = run_stochastic_simulation(with_stream);

    REQUIRE_THAT(result.liquid_wealth(0, 1) - base.liquid_wealth(0, 1),
                 WithinRel(6000.0 * 1.02, 1e-9));
}

// ============================================================================
// Retirement and Pension
// ============================================================================

TEST_CASE("Retirement transition keeps the pension pot positive", "[engine][scenario]") {
    SimulationConfig config = basic_config();
    config.starting_age = 50;
    config.retirement_age = 65;
    config.years = 20;
    config.pension_income = 40000.0;

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(percentile_of(result.pension_wealth.column(14), 50.0) > 0.0);
    REQUIRE(percentile_of(result.pension_wealth.column(15), 50.0) > 0.0);
}

TEST_CASE("Year when age equals retirement age is the first drawdown year", "[engine][boundary]") {
    SimulationConfig config = deterministic_config();
    config.starting_age = 50;
    config.retirement_age = 65;
    config.years = 20;
    config.pension_income = 40000.0;

    SimulationResult result = run_stochastic_simulation(config);

    // Year 14 (age 64) still contributes
    double contribution_14 = 75000.0 * std::pow(1.025, 14) * 0.10;
    REQUIRE_THAT(result.pension_wealth(0, 14),
                 WithinRel(result.pension_wealth(0, 13) * 1.07 + contribution_14, 1e-12));

    // Year 15 (age 65) withdraws the un-inflated pension and contributes nothing
    REQUIRE_THAT(result.pension_wealth(0, 15),
                 WithinRel(result.pension_wealth(0, 14) * 1.07 - 40000.0, 1e-12));

    // Year 16 withdraws the pension re-inflated by one year
    REQUIRE_THAT(result.pension_wealth(0, 16),
                 WithinRel(result.pension_wealth(0, 15) * 1.07 - 40000.0 * 1.02, 1e-12));
}

TEST_CASE("Pension pot never goes negative", "[engine][boundary]") {
    SimulationConfig config = basic_config();
    config.starting_age = 60;
    config.retirement_age = 62;
    config.years = 15;
    config.pension_income = 250000.0;
    config.return_volatility = 0.40;

    SimulationResult result = run_stochastic_simulation(config);

    for (double value : result.pension_wealth.data()) {
        REQUIRE(value >= 0.0);
    }
}

TEST_CASE("Zero pension income leaves the pot untouched after retirement", "[engine]") {
    SimulationConfig config = deterministic_config();
    config.starting_age = 60;
    config.retirement_age = 62;
    config.pension_income = 0.0;

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE_THAT(result.pension_wealth(0, 5),
                 WithinRel(result.pension_wealth(0, 4) * 1.07, 1e-12));
}

TEST_CASE("Spouse contributions go into the household pot", "[engine][income]") {
    SimulationConfig config = deterministic_config();
    config.spouse = SpouseConfig{};
    config.spouse->age = 32;
    config.spouse->retirement_age = 67;
    config.spouse->gross_income = 40000.0;

    SimulationResult base = run_stochastic_simulation(deterministic_config());
    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE_THAT(result.pension_wealth(0, 1) - base.pension_wealth(0, 1),
                 WithinRel(40000.0 * 1.025 * 0.10, 1e-9));
}

// ============================================================================
// Events
// ============================================================================

TEST_CASE("Windfall raises liquid wealth by exactly its amount", "[engine][events]") {
    SimulationConfig with_windfall = basic_config();
    with_windfall.events.push_back(Windfall{5, "Inheritance", 50000.0});

    SimulationResult base = run_stochastic_simulation(basic_config());
    SimulationResult result = run_stochastic_simulation(with_windfall);

    for (size_t p = 0; p < result.num_paths(); ++p) {
        REQUIRE(result.liquid_wealth(p, 4) == base.liquid_wealth(p, 4));
        REQUIRE_THAT(result.liquid_wealth(p, 5) - base.liquid_wealth(p, 5), WithinAbs(50000.0, 1e-6));
    }
}

TEST_CASE("One-time expense lowers liquid wealth in its year", "[engine][events]") {
    SimulationConfig with_expense = basic_config();
    with_expense.events.push_back(OneTimeExpense{3, "Roof", 15000.0});

    SimulationResult base = run_stochastic_simulation(basic_config());
    SimulationResult result = run_stochastic_simulation(with_expense);

    for (size_t p = 0; p < result.num_paths(); ++p) {
        REQUIRE_THAT(base.liquid_wealth(p, 3) - result.liquid_wealth(p, 3), WithinAbs(15000.0, 1e-6));
    }
}

TEST_CASE("Expense change updates the schedule from its year onward", "[engine][events][schedule]") {
    SimulationConfig config = basic_config();
    config.events.push_back(ExpenseChange{3, "Kids", 500.0});
    config.events.push_back(ExpenseChange{6, "Car", 200.0});

    SimulationResult result = run_stochastic_simulation(config);

    for (size_t y = 0; y < 3; ++y) {
        REQUIRE(result.monthly_expense_schedule[y] == 3000.0);
    }
    for (size_t y = 3; y < 6; ++y) {
        REQUIRE(result.monthly_expense_schedule[y] == 3500.0);
    }
    for (size_t y = 6; y <= 10; ++y) {
        REQUIRE(result.monthly_expense_schedule[y] == 3700.0);
    }
}

TEST_CASE("Expense change is first paid the year after it takes effect", "[engine][events]") {
    SimulationConfig config = deterministic_config();
    config.events.push_back(ExpenseChange{3, "Kids", 500.0});

    SimulationResult base = run_stochastic_simulation(deterministic_config());
    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.liquid_wealth(0, 3) == base.liquid_wealth(0, 3));
    REQUIRE_THAT(base.liquid_wealth(0, 4) - result.liquid_wealth(0, 4),
                 WithinRel(500.0 * 12.0 * result.cumulative_inflation(0, 4), 1e-9));
}

TEST_CASE("Rental income adds to the rental schedule", "[engine][events]") {
    SimulationConfig config = deterministic_config();
    config.events.push_back(RentalIncome{2, "Lodger", 600.0});
    config.events.push_back(RentalIncome{4, "Second lodger", 400.0});

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.monthly_rental_schedule[1] == 0.0);
    REQUIRE(result.monthly_rental_schedule[2] == 600.0);
    REQUIRE(result.monthly_rental_schedule[4] == 1000.0);
}

TEST_CASE("Property purchase adds assets, debt and payment", "[engine][events][mortgage]") {
    SimulationConfig config = basic_config();
    PropertyPurchase purchase;
    purchase.year = 4;
    purchase.name = "Flat";
    purchase.property_price = 300000.0;
    purchase.down_payment = 60000.0;
    purchase.mortgage_amount = 240000.0;
    purchase.mortgage_term = 25;
    config.events.push_back(purchase);

    SimulationResult base = run_stochastic_simulation(basic_config());
    SimulationResult result = run_stochastic_simulation(config);

    double payment = monthly_payment(240000.0, config.mortgage_interest_rate, 300);
    REQUIRE(result.monthly_mortgage_schedule[3] == 2000.0);
    REQUIRE_THAT(result.monthly_mortgage_schedule[4], WithinRel(2000.0 + payment, 1e-12));
    REQUIRE_THAT(result.monthly_mortgage_schedule[10], WithinRel(2000.0 + payment, 1e-12));

    for (size_t p = 0; p < result.num_paths(); p += 10) {
        REQUIRE_THAT(base.liquid_wealth(p, 4) - result.liquid_wealth(p, 4), WithinAbs(60000.0, 1e-6));
        REQUIRE_THAT(result.property_value(p, 4) - base.property_value(p, 4), WithinAbs(300000.0, 1e-6));
        REQUIRE_THAT(result.mortgage_balance(p, 4) - base.mortgage_balance(p, 4), WithinAbs(240000.0, 1e-6));
    }
}

TEST_CASE("Purchases in the same year stack their payments", "[engine][events][mortgage]") {
    SimulationConfig config = basic_config();
    PropertyPurchase first;
    first.year = 2;
    first.new_mortgage_payment = 800.0;
    PropertyPurchase second;
    second.year = 2;
    second.new_mortgage_payment = 700.0;
    config.events.push_back(first);
    config.events.push_back(second);

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.monthly_mortgage_schedule[1] == 2000.0);
    REQUIRE(result.monthly_mortgage_schedule[2] == 3500.0);
}

TEST_CASE("Sale that clears the mortgage stops the payments", "[engine][events][mortgage]") {
    SimulationConfig config = basic_config();
    PropertySale sale;
    sale.year = 3;
    sale.name = "Downsize";
    sale.sale_price = 650000.0;
    sale.mortgage_payoff = 400000.0;
    sale.selling_costs = 10000.0;
    config.events.push_back(sale);

    SimulationResult base = run_stochastic_simulation(basic_config());
    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.monthly_mortgage_schedule[2] == 2000.0);
    for (size_t y = 3; y <= 10; ++y) {
        REQUIRE(result.monthly_mortgage_schedule[y] == 0.0);
    }
    for (size_t p = 0; p < result.num_paths(); ++p) {
        REQUIRE(result.property_value(p, 3) == 0.0);
        REQUIRE(result.mortgage_balance(p, 3) == 0.0);
        REQUIRE(result.property_value(p, 10) == 0.0);
        REQUIRE_THAT(result.liquid_wealth(p, 3) - base.liquid_wealth(p, 3), WithinAbs(240000.0, 1e-6));
    }
}

TEST_CASE("Partial payoff keeps the payment schedule", "[engine][events][mortgage]") {
    SimulationConfig config = basic_config();
    PropertySale sale;
    sale.year = 3;
    sale.sale_price = 200000.0;
    sale.mortgage_payoff = 100000.0;
    config.events.push_back(sale);

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.monthly_mortgage_schedule[3] == 2000.0);
    REQUIRE(result.mortgage_balance(0, 3) > 0.0);
}

TEST_CASE("Year-0 events precede the simulation and are not applied", "[engine][events][boundary]") {
    SimulationConfig config = basic_config();
    config.events.push_back(Windfall{0, "Bonus", 10000.0});

    SimulationResult base = run_stochastic_simulation(basic_config());
    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.net_worth(0, 0) == 200000.0);
    REQUIRE(result.liquid_wealth.data() == base.liquid_wealth.data());
}

TEST_CASE("Events past the horizon are ignored", "[engine][events][boundary]") {
    SimulationConfig config = basic_config();
    config.events.push_back(Windfall{25, "Late", 10000.0});

    SimulationResult base = run_stochastic_simulation(basic_config());
    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.net_worth.data() == base.net_worth.data());
}

// ============================================================================
// Errors and Degenerate Inputs
// ============================================================================

TEST_CASE("Invalid configuration is rejected before running", "[engine][error]") {
    SimulationConfig config = basic_config();
    config.retirement_age = config.starting_age;

    REQUIRE_THROWS_AS(run_stochastic_simulation(config), ConfigError);
}

TEST_CASE("Persistent deficit drives liquid wealth negative without failing", "[engine]") {
    SimulationConfig config = deterministic_config();
    config.gross_annual_income = 0.0;
    config.initial_liquid_wealth = 10000.0;

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.liquid_wealth(0, 10) < 0.0);
    REQUIRE(result.non_finite_values == 0);
}

TEST_CASE("Overflowing returns are counted, not fatal", "[engine][boundary]") {
    SimulationConfig config = basic_config();
    config.return_volatility = 1e200;
    config.num_paths = 20;

    SimulationResult result;
    REQUIRE_NOTHROW(result = run_stochastic_simulation(config));

    REQUIRE(result.num_paths() == 20);
    REQUIRE(result.num_years() == 10);
    REQUIRE(result.liquid_wealth.num_years() == 11);
    REQUIRE(result.non_finite_values > 0);
    REQUIRE(result.non_finite_values == count_non_finite(result));
    REQUIRE(std::isfinite(result.net_worth(0, 0)));
}

// ============================================================================
// Benchmarks (hidden)
// ============================================================================

TEST_CASE("Large run: 10,000 paths x 50 years", "[engine][.benchmark]") {
    SimulationConfig config = basic_config();
    config.num_paths = 10000;
    config.years = 50;
    config.starting_age = 30;

    SimulationResult result = run_stochastic_simulation(config);

    REQUIRE(result.num_paths() == 10000);
    REQUIRE(result.non_finite_values == 0);
}
