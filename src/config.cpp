#include "config.hpp"
#include <cmath>
#include <sstream>

namespace wealthsim {

namespace {

constexpr int MAX_AGE = 120;

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

void require_finite(double value, const std::string& field) {
    require(std::isfinite(value), field + " must be a finite number");
}

void require_non_negative(double value, const std::string& field) {
    require_finite(value, field);
    require(value >= 0.0, field + " cannot be negative");
}

void require_rate(double value, const std::string& field) {
    require_finite(value, field);
    require(value >= 0.0 && value <= 1.0, field + " must be between 0 and 1");
}

std::string event_context(const Event& event) {
    std::ostringstream oss;
    oss << "Event '" << event_label(event) << "' (year " << event_year(event) << ")";
    return oss.str();
}

struct EventValidator {
    std::string context;

    void operator()(const PropertyPurchase& e) const {
        require_non_negative(e.property_price, context + " property_price");
        require_non_negative(e.down_payment, context + " down_payment");
        require_non_negative(e.mortgage_amount, context + " mortgage_amount");
        require_non_negative(e.new_mortgage_payment, context + " new_mortgage_payment");
        require(e.mortgage_term >= 0, context + " mortgage_term cannot be negative");
    }
    void operator()(const PropertySale& e) const {
        require_non_negative(e.sale_price, context + " sale_price");
        require_non_negative(e.mortgage_payoff, context + " mortgage_payoff");
        require_non_negative(e.selling_costs, context + " selling_costs");
    }
    void operator()(const OneTimeExpense& e) const {
        require_non_negative(e.amount, context + " amount");
    }
    void operator()(const ExpenseChange& e) const {
        require_finite(e.monthly_change, context + " monthly_change");
    }
    void operator()(const RentalIncome& e) const {
        require_finite(e.monthly_rental, context + " monthly_rental");
    }
    void operator()(const Windfall& e) const {
        require_non_negative(e.amount, context + " amount");
    }
};

void validate_stream(const PassiveIncomeStream& stream, size_t index) {
    std::string context = "Passive income stream " + std::to_string(index);
    if (!stream.name.empty()) {
        context += " '" + stream.name + "'";
    }
    require(stream.start_year >= 0, context + " start_year cannot be negative");
    if (stream.end_year) {
        require(*stream.end_year >= stream.start_year,
                context + " end_year cannot precede start_year");
    }
    require_non_negative(stream.monthly_amount, context + " monthly_amount");
    require_finite(stream.annual_growth_rate, context + " annual_growth_rate");
    if (stream.tax_rate) {
        require_rate(*stream.tax_rate, context + " tax_rate");
    }
}

void validate_spouse(const SpouseConfig& spouse, const SimulationConfig& config) {
    require(spouse.age >= 0 && spouse.age <= MAX_AGE,
            "Spouse age must be between 0 and " + std::to_string(MAX_AGE));
    require(spouse.retirement_age > spouse.age,
            "Spouse retirement age must be greater than spouse age");
    require_non_negative(spouse.gross_income, "Spouse gross_income");
    require_non_negative(spouse.pension_income, "Spouse pension_income");

    double tax = spouse.tax_rate.value_or(config.effective_tax_rate);
    double pension = spouse.pension_rate.value_or(config.pension_contribution_rate);
    require_rate(tax, "Spouse tax_rate");
    require_rate(pension, "Spouse pension_rate");
    require(tax + pension <= 1.0, "Spouse tax_rate + pension_rate cannot exceed 1");
}

} // anonymous namespace

void validate_config(const SimulationConfig& config) {
    require(config.years >= 1, "years must be at least 1");
    require(config.num_paths >= 1, "num_paths must be at least 1");

    require(config.starting_age >= 0 && config.starting_age <= MAX_AGE,
            "starting_age must be between 0 and " + std::to_string(MAX_AGE));
    require(config.retirement_age > config.starting_age,
            "Retirement age must be greater than current age");

    require_finite(config.initial_liquid_wealth, "initial_liquid_wealth");
    require_non_negative(config.initial_property_value, "initial_property_value");
    require_non_negative(config.initial_mortgage, "initial_mortgage");

    require_non_negative(config.gross_annual_income, "gross_annual_income");
    require_rate(config.effective_tax_rate, "effective_tax_rate");
    require_rate(config.pension_contribution_rate, "pension_contribution_rate");
    require(config.effective_tax_rate + config.pension_contribution_rate <= 1.0,
            "effective_tax_rate + pension_contribution_rate cannot exceed 1");
    require_non_negative(config.monthly_expenses, "monthly_expenses");
    require_non_negative(config.monthly_mortgage_payment, "monthly_mortgage_payment");

    require_finite(config.property_appreciation, "property_appreciation");
    require_non_negative(config.mortgage_interest_rate, "mortgage_interest_rate");

    require_finite(config.expected_return, "expected_return");
    require_non_negative(config.return_volatility, "return_volatility");
    require_finite(config.expected_inflation, "expected_inflation");
    require(config.expected_inflation > -1.0, "expected_inflation must be greater than -1");
    require_non_negative(config.inflation_volatility, "inflation_volatility");
    require_finite(config.salary_inflation, "salary_inflation");

    require_non_negative(config.pension_income, "pension_income");

    for (const auto& event : config.events) {
        require(event_year(event) >= 0, event_context(event) + " year cannot be negative");
        std::visit(EventValidator{event_context(event)}, event);
    }

    for (size_t i = 0; i < config.passive_income_streams.size(); ++i) {
        validate_stream(config.passive_income_streams[i], i);
    }

    if (config.spouse) {
        validate_spouse(*config.spouse, config);
    }
}

} // namespace wealthsim
