#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include "events.hpp"
#include "mortgage.hpp"

using namespace wealthsim;
using Catch::Matchers::WithinRel;

TEST_CASE("Event type tags round-trip", "[events]") {
    const EventType types[] = {
        EventType::PropertyPurchase, EventType::PropertySale, EventType::OneTimeExpense,
        EventType::ExpenseChange, EventType::RentalIncome, EventType::Windfall
    };
    for (EventType type : types) {
        REQUIRE(parse_event_type(event_type_name(type)) == type);
    }
    REQUIRE(std::string(event_type_name(EventType::OneTimeExpense)) == "one_time_expense");
}

TEST_CASE("Unknown event type tag throws", "[events][error]") {
    REQUIRE_THROWS_AS(parse_event_type("lottery"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_event_type(""), std::invalid_argument);
}

TEST_CASE("Event accessors dispatch on the variant", "[events]") {
    Event event = ExpenseChange{4, "Kids", 500.0};

    REQUIRE(event_year(event) == 4);
    REQUIRE(event_name(event) == "Kids");
    REQUIRE(event_type(event) == EventType::ExpenseChange);
}

TEST_CASE("Event label falls back to the type tag", "[events]") {
    Event named = Windfall{2, "Inheritance", 1000.0};
    Event unnamed = Windfall{2, "", 1000.0};

    REQUIRE(event_label(named) == "Inheritance");
    REQUIRE(event_label(unnamed) == "windfall");
}

TEST_CASE("Events are grouped by year in input order", "[events]") {
    std::vector<Event> events = {
        Windfall{5, "B", 1.0},
        OneTimeExpense{2, "A", 1.0},
        ExpenseChange{5, "C", 1.0},
        RentalIncome{5, "D", 1.0}
    };

    EventsByYear grouped = group_events_by_year(events);

    REQUIRE(grouped.size() == 2);
    REQUIRE(grouped[2].size() == 1);
    REQUIRE(grouped[5].size() == 3);
    REQUIRE(event_name(grouped[5][0]) == "B");
    REQUIRE(event_name(grouped[5][1]) == "C");
    REQUIRE(event_name(grouped[5][2]) == "D");
    REQUIRE(grouped.find(3) == grouped.end());
}

TEST_CASE("Explicit purchase payment wins over the derived one", "[events][mortgage]") {
    PropertyPurchase purchase;
    purchase.mortgage_amount = 200000.0;
    purchase.mortgage_term = 25;
    purchase.new_mortgage_payment = 1100.0;

    REQUIRE(resolved_mortgage_payment(purchase, 0.04) == 1100.0);
}

TEST_CASE("Purchase payment derived from amount and term in years", "[events][mortgage]") {
    PropertyPurchase purchase;
    purchase.mortgage_amount = 200000.0;
    purchase.mortgage_term = 25;

    REQUIRE_THAT(resolved_mortgage_payment(purchase, 0.04),
                 WithinRel(monthly_payment(200000.0, 0.04, 300), 1e-12));
}

TEST_CASE("Purchase without a loan adds no payment", "[events][boundary]") {
    PropertyPurchase cash_purchase;
    cash_purchase.property_price = 300000.0;
    cash_purchase.down_payment = 300000.0;

    PropertyPurchase no_term;
    no_term.mortgage_amount = 100000.0;

    REQUIRE(resolved_mortgage_payment(cash_purchase, 0.04) == 0.0);
    REQUIRE(resolved_mortgage_payment(no_term, 0.04) == 0.0);
}
