#include "cashflow_projector.hpp"
#include "household_income.hpp"
#include "mortgage.hpp"
#include "schedule.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace wealthsim {

Year1Breakdown::Year1Breakdown()
    : available(0.0),
      status("surplus") {}

namespace {

constexpr double LARGE_AMOUNT = 9.0e18;

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Single-path counterpart of the stochastic engine's event application.
// Only schedules and the tracked mortgage balance matter here; one-off
// cash movements do not change a year's recurring cash flow.
class ProjectionEventApplier {
public:
    ProjectionEventApplier(double mortgage_rate, double& mortgage_balance,
                           ForwardSchedule& expenses, ForwardSchedule& mortgage, ForwardSchedule& rental)
        : mortgage_rate_(mortgage_rate), mortgage_balance_(mortgage_balance),
          expenses_(expenses), mortgage_(mortgage), rental_(rental) {}

    void operator()(const PropertyPurchase& e) {
        mortgage_balance_ += e.mortgage_amount;
        mortgage_.add_from(e.year, resolved_mortgage_payment(e, mortgage_rate_));
    }

    void operator()(const PropertySale& e) {
        if (e.mortgage_payoff >= mortgage_balance_) {
            mortgage_.set_from(e.year, 0.0);
        }
        mortgage_balance_ = std::max(mortgage_balance_ - e.mortgage_payoff, 0.0);
    }

    void operator()(const OneTimeExpense&) {}

    void operator()(const ExpenseChange& e) {
        expenses_.add_from(e.year, e.monthly_change);
    }

    void operator()(const RentalIncome& e) {
        rental_.add_from(e.year, e.monthly_rental);
    }

    void operator()(const Windfall&) {}

private:
    double mortgage_rate_;
    double& mortgage_balance_;
    ForwardSchedule& expenses_;
    ForwardSchedule& mortgage_;
    ForwardSchedule& rental_;
};

} // anonymous namespace

CashFlowTable build_cashflow_table(const SimulationConfig& config, int max_years, const RunContext& ctx) {
    validate_config(config);
    if (max_years < 0) {
        throw ConfigError("max_years cannot be negative");
    }

    const int horizon = std::min({config.years, max_years, CASHFLOW_HORIZON_CAP});

    ForwardSchedule expense_schedule(static_cast<size_t>(horizon), config.monthly_expenses);
    ForwardSchedule mortgage_schedule(static_cast<size_t>(horizon), config.monthly_mortgage_payment);
    ForwardSchedule rental_schedule(static_cast<size_t>(horizon), 0.0);
    double mortgage_balance = config.initial_mortgage;

    const EventsByYear events_by_year = group_events_by_year(config.events);
    const EarnerProfile primary = primary_profile(config);
    const std::optional<EarnerProfile> spouse = spouse_profile(config);

    Logger& logger = Logger::get_instance();

    CashFlowTable table;
    table.rows.reserve(static_cast<size_t>(horizon) + 1);

    for (int year = 0; year <= horizon; ++year) {
        if (year > 0) {
            mortgage_balance = amortize(mortgage_balance, config.mortgage_interest_rate,
                                        mortgage_schedule.at(year - 1) * 12.0).balance;
        }

        std::string notes;
        auto events = events_by_year.find(year);
        if (events != events_by_year.end()) {
            ProjectionEventApplier applier(config.mortgage_interest_rate, mortgage_balance,
                                           expense_schedule, mortgage_schedule, rental_schedule);
            for (const Event& event : events->second) {
                std::visit(applier, event);
                if (!notes.empty()) {
                    notes += ", ";
                }
                notes += event_label(event);
                logger.log_event_applied(ctx, year, event_type_name(event_type(event)), event_label(event));
            }
        }

        const HouseholdIncome income = household_income(primary, spouse, year, config.salary_inflation);
        const double passive = total_passive_income(config.passive_income_streams, year,
                                                    config.effective_tax_rate);
        const double rental = rental_schedule.at(year) * 12.0;
        const double expenses = expense_schedule.at(year) * 12.0;
        const double mortgage = mortgage_schedule.at(year) * 12.0;
        const double available = income.take_home() + passive + rental - expenses - mortgage;

        CashFlowRow row;
        row.year = year;
        row.age = config.starting_age + year;
        row.retired = income.primary.retired;
        row.spouse_retired = income.spouse ? income.spouse->retired : false;
        row.take_home = round2(income.take_home());
        row.pension_contribution = round2(income.pension_contribution());
        row.passive_income = round2(passive);
        row.rental_income = round2(rental);
        row.living_expenses = round2(expenses);
        row.mortgage = round2(mortgage);
        row.available_savings = round2(available);
        row.monthly_savings = round2(available / 12.0);
        row.events = notes;
        table.rows.push_back(row);
    }

    table.year1 = create_year1_breakdown(config);

    logger.log_projection_complete(ctx, table.rows.size(), table.year1.status);
    return table;
}

Year1Breakdown create_year1_breakdown(const SimulationConfig& config) {
    const double gross = config.gross_annual_income;
    const double pension = gross * config.pension_contribution_rate;
    const double tax = gross * config.effective_tax_rate;
    const double take_home = gross - pension - tax;
    const double passive = total_passive_income(config.passive_income_streams, 0,
                                                config.effective_tax_rate);
    const double expenses = config.monthly_expenses * 12.0;
    const double mortgage = config.monthly_mortgage_payment * 12.0;

    Year1Breakdown breakdown;
    breakdown.items.push_back({"Gross Income", gross});
    breakdown.items.push_back({"- Pension Contrib", pension});
    breakdown.items.push_back({"- Tax", tax});
    breakdown.items.push_back({"= Take Home", take_home});
    if (passive > 0.0) {
        breakdown.items.push_back({"+ Passive Income", passive});
    }
    breakdown.items.push_back({"- Living Expenses", expenses});
    breakdown.items.push_back({"- Mortgage", mortgage});

    breakdown.available = take_home + passive - expenses - mortgage;
    breakdown.items.push_back({"= Available for Investment", breakdown.available});
    breakdown.status = breakdown.available < 0.0 ? "deficit" : "surplus";
    return breakdown;
}

RenderedTable render_cashflow_table(const CashFlowTable& table, const AmountFormatter& format) {
    RenderedTable rendered;
    rendered.header = {
        "Year", "Age", "Take Home", "Pension Contrib", "Passive Income", "Rental Income",
        "Living Expenses", "Mortgage", "Available Savings", "Events This Year"
    };
    rendered.rows.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        rendered.rows.push_back({
            std::to_string(row.year),
            std::to_string(row.age),
            format(row.take_home),
            format(row.pension_contribution),
            format(row.passive_income),
            format(row.rental_income),
            format(row.living_expenses),
            format(row.mortgage),
            format(row.available_savings),
            row.events
        });
    }
    return rendered;
}

std::vector<std::pair<std::string, std::string>> render_year1_breakdown(
    const Year1Breakdown& breakdown, const AmountFormatter& format) {
    std::vector<std::pair<std::string, std::string>> rendered;
    rendered.reserve(breakdown.items.size());
    for (const auto& item : breakdown.items) {
        rendered.emplace_back(item.label, format(item.amount));
    }
    return rendered;
}

std::string format_amount(double amount) {
    if (!std::isfinite(amount)) {
        return std::isnan(amount) ? "nan" : (amount > 0 ? "inf" : "-inf");
    }

    // Beyond long long range the digits come from the double itself
    std::string digits;
    if (std::fabs(amount) >= LARGE_AMOUNT) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0) << std::fabs(amount);
        digits = oss.str();
    } else {
        digits = std::to_string(static_cast<unsigned long long>(std::llround(std::fabs(amount))));
    }

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }
    return (amount < 0.0 && grouped != "0") ? "-" + grouped : grouped;
}

} // namespace wealthsim
