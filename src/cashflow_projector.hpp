#ifndef WEALTHSIM_CASHFLOW_PROJECTOR_HPP
#define WEALTHSIM_CASHFLOW_PROJECTOR_HPP

#include "config.hpp"
#include "logger.hpp"
#include <functional>
#include <string>
#include <vector>

namespace wealthsim {

// The explanatory table never shows more than years 0..10
constexpr int CASHFLOW_HORIZON_CAP = 10;

// One projected year, amounts annual and nominal, rounded to 2 decimals
struct CashFlowRow {
    int year;
    int age;                        // Primary member's age in this year
    bool retired;
    bool spouse_retired;            // Always false without a spouse
    double take_home;               // Household, salary or pension
    double pension_contribution;    // Household, 0 once both are retired
    double passive_income;          // After stream tax
    double rental_income;
    double living_expenses;
    double mortgage;
    double available_savings;
    double monthly_savings;         // available_savings / 12
    std::string events;             // Labels of this year's events, ", " separated
};

struct BreakdownItem {
    std::string label;
    double amount;
};

// Line-item view of the first year's cash flow
struct Year1Breakdown {
    std::vector<BreakdownItem> items;
    double available;
    std::string status;             // "deficit" or "surplus"

    Year1Breakdown();
};

struct CashFlowTable {
    std::vector<CashFlowRow> rows;
    Year1Breakdown year1;
};

// Injected by callers that display amounts; the projector never formats itself
using AmountFormatter = std::function<std::string(double)>;

// String view of a CashFlowTable, ready for printing
struct RenderedTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

// Project one deterministic path for years 0..min(years, max_years, 10).
//
// Each row:
//   1. The tracked mortgage balance amortizes with last year's payment
//   2. This year's events update the forward schedules
//   3. Household income at nominal salary or nominal pension
//   4. available = take_home + passive + rental - expenses - mortgage
//
// No randomness and no inflation adjustment. Year-0 events appear in row 0.
//
// Throws ConfigError if the configuration is invalid or max_years < 0.
CashFlowTable build_cashflow_table(
    const SimulationConfig& config,
    int max_years = 30,
    const RunContext& ctx = RunContext("", "cashflow")
);

// Gross Income through Available for Investment for the primary earner at
// year-0 salary, base expenses and year-0 passive income
Year1Breakdown create_year1_breakdown(const SimulationConfig& config);

RenderedTable render_cashflow_table(const CashFlowTable& table, const AmountFormatter& format);

// (label, formatted amount) pairs in breakdown order
std::vector<std::pair<std::string, std::string>> render_year1_breakdown(
    const Year1Breakdown& breakdown, const AmountFormatter& format);

// Default formatter: whole units with thousands separators ("-12,346")
std::string format_amount(double amount);

} // namespace wealthsim

#endif // WEALTHSIM_CASHFLOW_PROJECTOR_HPP
