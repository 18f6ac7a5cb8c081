#include "wealth_engine.hpp"
#include "household_income.hpp"
#include "mortgage.hpp"
#include "schedule.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <chrono>
#include <random>
#include <string>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace wealthsim {

// ============================================================================
// SimulationResult Implementation
// ============================================================================

SimulationResult::SimulationResult()
    : non_finite_values(0),
      execution_time_ms(0.0) {}

size_t SimulationResult::memory_footprint() const {
    return sizeof(SimulationResult) +
           net_worth.memory_footprint() + real_net_worth.memory_footprint() +
           liquid_wealth.memory_footprint() + pension_wealth.memory_footprint() +
           property_value.memory_footprint() + mortgage_balance.memory_footprint() +
           inflation_rates.memory_footprint() + cumulative_inflation.memory_footprint();
}

namespace {

// Fill a paths × years matrix with N(mean, sd) draws, path by path
PathMatrix draw_normal(std::mt19937_64& rng, size_t paths, size_t years,
                       double mean, double sd) {
    std::normal_distribution<double> normal(0.0, 1.0);
    PathMatrix draws(paths, years);
    for (size_t p = 0; p < paths; ++p) {
        for (size_t y = 0; y < years; ++y) {
            draws(p, y) = mean + sd * normal(rng);
        }
    }
    return draws;
}

double column_mean(const PathMatrix& matrix, size_t year) {
    double sum = 0.0;
    for (size_t p = 0; p < matrix.num_paths(); ++p) {
        sum += matrix(p, year);
    }
    return sum / static_cast<double>(matrix.num_paths());
}

// Applies one event to every path at the end of `year`
class EventApplier {
public:
    EventApplier(SimulationResult& result, int year, double mortgage_rate,
                 ForwardSchedule& expenses, ForwardSchedule& mortgage, ForwardSchedule& rental)
        : result_(result), year_(static_cast<size_t>(year)), mortgage_rate_(mortgage_rate),
          expenses_(expenses), mortgage_(mortgage), rental_(rental) {}

    void operator()(const PropertyPurchase& e) {
        for (size_t p = 0; p < result_.num_paths(); ++p) {
            result_.liquid_wealth(p, year_) -= e.down_payment;
            result_.property_value(p, year_) += e.property_price;
            result_.mortgage_balance(p, year_) += e.mortgage_amount;
        }
        // Additive so a second property layers on top of the first loan
        mortgage_.add_from(e.year, resolved_mortgage_payment(e, mortgage_rate_));
    }

    void operator()(const PropertySale& e) {
        double balance_before = column_mean(result_.mortgage_balance, year_);
        double net_proceeds = e.sale_price - e.mortgage_payoff - e.selling_costs;
        for (size_t p = 0; p < result_.num_paths(); ++p) {
            result_.liquid_wealth(p, year_) += net_proceeds;
            result_.property_value(p, year_) = 0.0;
            result_.mortgage_balance(p, year_) =
                std::max(result_.mortgage_balance(p, year_) - e.mortgage_payoff, 0.0);
        }
        if (e.mortgage_payoff >= balance_before) {
            mortgage_.set_from(e.year, 0.0);
        }
    }

    void operator()(const OneTimeExpense& e) {
        for (size_t p = 0; p < result_.num_paths(); ++p) {
            result_.liquid_wealth(p, year_) -= e.amount;
        }
    }

    void operator()(const ExpenseChange& e) {
        expenses_.add_from(e.year, e.monthly_change);
    }

    void operator()(const RentalIncome& e) {
        rental_.add_from(e.year, e.monthly_rental);
    }

    void operator()(const Windfall& e) {
        for (size_t p = 0; p < result_.num_paths(); ++p) {
            result_.liquid_wealth(p, year_) += e.amount;
        }
    }

private:
    SimulationResult& result_;
    size_t year_;
    double mortgage_rate_;
    ForwardSchedule& expenses_;
    ForwardSchedule& mortgage_;
    ForwardSchedule& rental_;
};

} // anonymous namespace

// ============================================================================
// Stochastic Simulation
// ============================================================================

SimulationResult run_stochastic_simulation(const SimulationConfig& config, const RunContext& ctx) {
    validate_config(config);

    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    logger.log_simulation_start(ctx, static_cast<size_t>(config.num_paths),
                                static_cast<size_t>(config.years), config.events.size(),
                                config.passive_income_streams.size(), config.random_seed);

    const size_t paths = static_cast<size_t>(config.num_paths);
    const size_t years = static_cast<size_t>(config.years);

    SimulationResult result;
    result.net_worth = PathMatrix(paths, years + 1);
    result.real_net_worth = PathMatrix(paths, years + 1);
    result.liquid_wealth = PathMatrix(paths, years + 1);
    result.pension_wealth = PathMatrix(paths, years + 1);
    result.property_value = PathMatrix(paths, years + 1);
    result.mortgage_balance = PathMatrix(paths, years + 1);
    result.cumulative_inflation = PathMatrix(paths, years + 1, 1.0);

    const double initial_net_worth =
        config.initial_liquid_wealth + config.initial_property_value - config.initial_mortgage;
    for (size_t p = 0; p < paths; ++p) {
        result.liquid_wealth(p, 0) = config.initial_liquid_wealth;
        result.property_value(p, 0) = config.initial_property_value;
        result.mortgage_balance(p, 0) = config.initial_mortgage;
        result.net_worth(p, 0) = initial_net_worth;
        result.real_net_worth(p, 0) = initial_net_worth;
    }

    // All randomness is drawn before the year loop, in a fixed order
    std::mt19937_64 rng(config.random_seed);
    PathMatrix portfolio_returns = draw_normal(rng, paths, years,
                                               config.expected_return, config.return_volatility);
    PathMatrix pension_returns = draw_normal(rng, paths, years,
                                             config.expected_return, config.return_volatility);
    result.inflation_rates = draw_normal(rng, paths, years,
                                         config.expected_inflation, config.inflation_volatility);
    for (size_t p = 0; p < paths; ++p) {
        for (size_t y = 0; y < years; ++y) {
            result.inflation_rates(p, y) = std::max(result.inflation_rates(p, y), INFLATION_FLOOR);
        }
    }

    ForwardSchedule expense_schedule(years, config.monthly_expenses);
    ForwardSchedule mortgage_schedule(years, config.monthly_mortgage_payment);
    ForwardSchedule rental_schedule(years, 0.0);

    const EventsByYear events_by_year = group_events_by_year(config.events);
    auto year_zero = events_by_year.find(0);
    if (year_zero != events_by_year.end()) {
        logger.log_warning(ctx, std::to_string(year_zero->second.size()) +
                                " event(s) dated year 0 precede the first simulated year and were not applied");
    }

    const EarnerProfile primary = primary_profile(config);
    const std::optional<EarnerProfile> spouse = spouse_profile(config);
    const size_t primary_retirement_year = static_cast<size_t>(primary.retirement_year());
    const size_t spouse_retirement_year = spouse ? static_cast<size_t>(spouse->retirement_year()) : 0;

    for (size_t y = 1; y <= years; ++y) {
        const int year = static_cast<int>(y);

        const double monthly_expenses = expense_schedule.at(year - 1);
        const double monthly_mortgage = mortgage_schedule.at(year - 1);
        const double monthly_rental = rental_schedule.at(year - 1);

        // Nominal mortgage payments are fixed by contract and not inflated
        const double annual_mortgage = monthly_mortgage * 12.0;
        const double passive_income = total_passive_income(
            config.passive_income_streams, year, config.effective_tax_rate);

        const bool primary_retired = is_retired(primary.starting_age, primary.retirement_age, year);
        const bool spouse_retired = spouse && is_retired(spouse->starting_age, spouse->retirement_age, year);
        const bool drawing_pension = primary_retired && config.pension_income > 0.0;

#ifdef HAVE_OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (size_t p = 0; p < paths; ++p) {
            const double cumulative = result.cumulative_inflation(p, y - 1) *
                                      (1.0 + result.inflation_rates(p, y - 1));
            result.cumulative_inflation(p, y) = cumulative;

            // Pension income keeps pace with inflation realised since retirement
            const double primary_pension_inflation = primary_retired
                ? cumulative / result.cumulative_inflation(p, primary_retirement_year)
                : 1.0;
            const double spouse_pension_inflation = spouse_retired
                ? cumulative / result.cumulative_inflation(p, spouse_retirement_year)
                : 1.0;

            const HouseholdIncome income = household_income(
                primary, spouse, year, config.salary_inflation,
                primary_pension_inflation, spouse_pension_inflation);

            const double expenses = monthly_expenses * 12.0 * cumulative;
            const double rental = monthly_rental * 12.0 * cumulative;
            const double available = income.take_home() + rental + passive_income * cumulative
                                     - expenses - annual_mortgage;

            // A pot cannot lose more than its whole balance
            const double after_growth = std::max(
                result.pension_wealth(p, y - 1) * (1.0 + pension_returns(p, y - 1)), 0.0);
            double withdrawal = 0.0;
            if (drawing_pension) {
                withdrawal = std::min(config.pension_income * primary_pension_inflation, after_growth);
            }
            result.pension_wealth(p, y) = after_growth - withdrawal + income.pension_contribution();

            result.liquid_wealth(p, y) =
                result.liquid_wealth(p, y - 1) * (1.0 + portfolio_returns(p, y - 1)) + available;

            result.property_value(p, y) =
                result.property_value(p, y - 1) * (1.0 + config.property_appreciation);

            result.mortgage_balance(p, y) = amortize(
                result.mortgage_balance(p, y - 1), config.mortgage_interest_rate, annual_mortgage).balance;
        }

        auto events = events_by_year.find(year);
        if (events != events_by_year.end()) {
            EventApplier applier(result, year, config.mortgage_interest_rate,
                                 expense_schedule, mortgage_schedule, rental_schedule);
            for (const Event& event : events->second) {
                std::visit(applier, event);
                logger.log_event_applied(ctx, year, event_type_name(event_type(event)), event_label(event));
            }
        }

#ifdef HAVE_OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (size_t p = 0; p < paths; ++p) {
            result.net_worth(p, y) = result.liquid_wealth(p, y) + result.pension_wealth(p, y) +
                                     result.property_value(p, y) - result.mortgage_balance(p, y);
            result.real_net_worth(p, y) = result.net_worth(p, y) / result.cumulative_inflation(p, y);
        }
    }

    result.monthly_expense_schedule = expense_schedule.values();
    result.monthly_mortgage_schedule = mortgage_schedule.values();
    result.monthly_rental_schedule = rental_schedule.values();

    result.non_finite_values = count_non_finite(result);
    if (result.non_finite_values > 0) {
        logger.log_warning(ctx, std::to_string(result.non_finite_values) +
                                " non-finite values in simulation results; check volatility and rate inputs");
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    RunMetrics metrics;
    metrics.execution_time_ms = result.execution_time_ms;
    metrics.paths = paths;
    metrics.years = years;
    metrics.memory_used_mb = result.memory_footprint() / (1024 * 1024);
    logger.log_simulation_complete(ctx, metrics, result.non_finite_values);

    return result;
}

} // namespace wealthsim
