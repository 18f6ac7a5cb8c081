#include "events.hpp"
#include "mortgage.hpp"
#include <stdexcept>

namespace wealthsim {

namespace {

struct TypeOf {
    EventType operator()(const PropertyPurchase&) const { return EventType::PropertyPurchase; }
    EventType operator()(const PropertySale&) const { return EventType::PropertySale; }
    EventType operator()(const OneTimeExpense&) const { return EventType::OneTimeExpense; }
    EventType operator()(const ExpenseChange&) const { return EventType::ExpenseChange; }
    EventType operator()(const RentalIncome&) const { return EventType::RentalIncome; }
    EventType operator()(const Windfall&) const { return EventType::Windfall; }
};

} // anonymous namespace

int event_year(const Event& event) {
    return std::visit([](const auto& e) { return e.year; }, event);
}

const std::string& event_name(const Event& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.name; }, event);
}

EventType event_type(const Event& event) {
    return std::visit(TypeOf{}, event);
}

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::PropertyPurchase: return "property_purchase";
        case EventType::PropertySale: return "property_sale";
        case EventType::OneTimeExpense: return "one_time_expense";
        case EventType::ExpenseChange: return "expense_change";
        case EventType::RentalIncome: return "rental_income";
        case EventType::Windfall: return "windfall";
    }
    return "unknown";
}

EventType parse_event_type(const std::string& tag) {
    if (tag == "property_purchase") return EventType::PropertyPurchase;
    if (tag == "property_sale") return EventType::PropertySale;
    if (tag == "one_time_expense") return EventType::OneTimeExpense;
    if (tag == "expense_change") return EventType::ExpenseChange;
    if (tag == "rental_income") return EventType::RentalIncome;
    if (tag == "windfall") return EventType::Windfall;
    throw std::invalid_argument("Unknown event type: " + tag);
}

std::string event_label(const Event& event) {
    const std::string& name = event_name(event);
    if (!name.empty()) {
        return name;
    }
    return event_type_name(event_type(event));
}

EventsByYear group_events_by_year(const std::vector<Event>& events) {
    EventsByYear grouped;
    for (const auto& event : events) {
        grouped[event_year(event)].push_back(event);
    }
    return grouped;
}

double resolved_mortgage_payment(const PropertyPurchase& purchase, double annual_rate) {
    if (purchase.new_mortgage_payment > 0.0) {
        return purchase.new_mortgage_payment;
    }
    if (purchase.mortgage_amount <= 0.0 || purchase.mortgage_term <= 0) {
        return 0.0;
    }
    return monthly_payment(purchase.mortgage_amount, annual_rate, purchase.mortgage_term * 12);
}

} // namespace wealthsim
