#ifndef WEALTHSIM_EVENTS_HPP
#define WEALTHSIM_EVENTS_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace wealthsim {

enum class EventType : uint8_t {
    PropertyPurchase = 0,
    PropertySale = 1,
    OneTimeExpense = 2,
    ExpenseChange = 3,
    RentalIncome = 4,
    Windfall = 5
};

// Buy a property: pay the deposit from liquid wealth, take on a new loan and
// add its payment on top of whatever is already scheduled.
struct PropertyPurchase {
    int year = 0;
    std::string name;
    double property_price = 0.0;
    double down_payment = 0.0;
    double mortgage_amount = 0.0;
    double new_mortgage_payment = 0.0;  // Monthly; 0 = derive from mortgage_amount and term
    int mortgage_term = 0;              // Years
};

// Sell the property: net proceeds land in liquid wealth, property value goes to 0
struct PropertySale {
    int year = 0;
    std::string name;
    double sale_price = 0.0;
    double mortgage_payoff = 0.0;
    double selling_costs = 0.0;
};

struct OneTimeExpense {
    int year = 0;
    std::string name;
    double amount = 0.0;
};

// Permanent delta to monthly living expenses from `year` onward
struct ExpenseChange {
    int year = 0;
    std::string name;
    double monthly_change = 0.0;
};

// Permanent delta to monthly rental income from `year` onward
struct RentalIncome {
    int year = 0;
    std::string name;
    double monthly_rental = 0.0;
};

struct Windfall {
    int year = 0;
    std::string name;
    double amount = 0.0;
};

using Event = std::variant<PropertyPurchase, PropertySale, OneTimeExpense,
                           ExpenseChange, RentalIncome, Windfall>;

// Events keyed by effective year, input order preserved within a year
using EventsByYear = std::map<int, std::vector<Event>>;

int event_year(const Event& event);
const std::string& event_name(const Event& event);
EventType event_type(const Event& event);

// Canonical snake_case tag ("property_purchase", "windfall", ...)
const char* event_type_name(EventType type);

// Inverse of event_type_name; throws std::invalid_argument on unknown tags
EventType parse_event_type(const std::string& tag);

// Label shown in tables: the event name, or its type tag when unnamed
std::string event_label(const Event& event);

EventsByYear group_events_by_year(const std::vector<Event>& events);

// Monthly payment a purchase adds to the mortgage schedule. An explicit
// new_mortgage_payment wins; otherwise the payment is amortized from the
// loan amount over mortgage_term years at the given annual rate.
double resolved_mortgage_payment(const PropertyPurchase& purchase, double annual_rate);

} // namespace wealthsim

#endif // WEALTHSIM_EVENTS_HPP
