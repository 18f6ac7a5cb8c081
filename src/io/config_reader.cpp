#include "config_reader.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace wealthsim {
namespace io {

namespace {

[[noreturn]] void wrong_type(const json& value, const std::string& field) {
    throw ConfigParseError("Field '" + field + "' has the wrong type (got " +
                           std::string(value.type_name()) + ")");
}

// Whole numbers only, and within the range of T
template <typename T>
T checked_integer(const json& value, const std::string& field) {
    if (!value.is_number_integer()) {
        wrong_type(value, field);
    }
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v <= static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            return static_cast<T>(v);
        }
    } else if constexpr (std::is_signed_v<T>) {
        int64_t v = value.get<int64_t>();
        if (v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
            v <= static_cast<int64_t>(std::numeric_limits<T>::max())) {
            return static_cast<T>(v);
        }
    }
    throw ConfigParseError("Field '" + field + "' is out of range (got " + value.dump() + ")");
}

// Assign j[key] to target when present; a wrong type names the key
template <typename T>
void read_field(const json& j, const std::string& key, T& target, const std::string& context = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        target = checked_integer<T>(*it, context + key);
    } else {
        try {
            target = it->get<T>();
        } catch (const json::exception&) {
            wrong_type(*it, context + key);
        }
    }
}

template <typename T>
void read_field(const json& j, const std::string& key, std::optional<T>& target, const std::string& context = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    T value{};
    read_field(j, key, value, context);
    target = value;
}

const json& require_object(const json& j, const std::string& what) {
    if (!j.is_object()) {
        throw ConfigParseError(what + " must be a JSON object");
    }
    return j;
}

Event parse_event(const json& j, size_t index) {
    const std::string context = "events[" + std::to_string(index) + "].";
    require_object(j, "events[" + std::to_string(index) + "]");

    if (!j.contains("type")) {
        throw ConfigParseError("Event " + std::to_string(index) + " missing required field: type");
    }
    if (!j.contains("year")) {
        throw ConfigParseError("Event " + std::to_string(index) + " missing required field: year");
    }

    std::string tag;
    read_field(j, "type", tag, context);

    EventType type;
    try {
        type = parse_event_type(tag);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(context + "type: " + e.what());
    }

    switch (type) {
        case EventType::PropertyPurchase: {
            PropertyPurchase e;
            read_field(j, "year", e.year, context);
            read_field(j, "name", e.name, context);
            read_field(j, "property_price", e.property_price, context);
            read_field(j, "down_payment", e.down_payment, context);
            read_field(j, "mortgage_amount", e.mortgage_amount, context);
            read_field(j, "new_mortgage_payment", e.new_mortgage_payment, context);
            read_field(j, "mortgage_term", e.mortgage_term, context);
            return e;
        }
        case EventType::PropertySale: {
            PropertySale e;
            read_field(j, "year", e.year, context);
            read_field(j, "name", e.name, context);
            read_field(j, "sale_price", e.sale_price, context);
            read_field(j, "mortgage_payoff", e.mortgage_payoff, context);
            read_field(j, "selling_costs", e.selling_costs, context);
            return e;
        }
        case EventType::OneTimeExpense: {
            OneTimeExpense e;
            read_field(j, "year", e.year, context);
            read_field(j, "name", e.name, context);
            read_field(j, "amount", e.amount, context);
            return e;
        }
        case EventType::ExpenseChange: {
            ExpenseChange e;
            read_field(j, "year", e.year, context);
            read_field(j, "name", e.name, context);
            read_field(j, "monthly_change", e.monthly_change, context);
            return e;
        }
        case EventType::RentalIncome: {
            RentalIncome e;
            read_field(j, "year", e.year, context);
            read_field(j, "name", e.name, context);
            read_field(j, "monthly_rental", e.monthly_rental, context);
            return e;
        }
        case EventType::Windfall: {
            Windfall e;
            read_field(j, "year", e.year, context);
            read_field(j, "name", e.name, context);
            read_field(j, "amount", e.amount, context);
            return e;
        }
    }
    throw ConfigParseError(context + "type: unhandled event type " + tag);
}

PassiveIncomeStream parse_stream(const json& j, size_t index) {
    const std::string context = "passive_income_streams[" + std::to_string(index) + "].";
    require_object(j, "passive_income_streams[" + std::to_string(index) + "]");

    PassiveIncomeStream stream;
    read_field(j, "name", stream.name, context);
    read_field(j, "start_year", stream.start_year, context);
    read_field(j, "end_year", stream.end_year, context);
    read_field(j, "monthly_amount", stream.monthly_amount, context);
    read_field(j, "annual_growth_rate", stream.annual_growth_rate, context);
    read_field(j, "is_taxable", stream.is_taxable, context);
    read_field(j, "tax_rate", stream.tax_rate, context);
    return stream;
}

SpouseConfig parse_spouse(const json& j) {
    const std::string context = "spouse.";
    require_object(j, "spouse");

    SpouseConfig spouse;
    read_field(j, "age", spouse.age, context);
    read_field(j, "retirement_age", spouse.retirement_age, context);
    read_field(j, "gross_income", spouse.gross_income, context);
    read_field(j, "pension_income", spouse.pension_income, context);
    read_field(j, "tax_rate", spouse.tax_rate, context);
    read_field(j, "pension_rate", spouse.pension_rate, context);
    return spouse;
}

} // anonymous namespace

SimulationConfig load_config_from_string(const std::string& json_string) {
    SimulationConfig config;

    try {
        json j = json::parse(json_string);
        require_object(j, "Configuration");

        read_field(j, "initial_liquid_wealth", config.initial_liquid_wealth);
        read_field(j, "initial_property_value", config.initial_property_value);
        read_field(j, "initial_mortgage", config.initial_mortgage);

        read_field(j, "gross_annual_income", config.gross_annual_income);
        read_field(j, "effective_tax_rate", config.effective_tax_rate);
        read_field(j, "pension_contribution_rate", config.pension_contribution_rate);
        read_field(j, "monthly_expenses", config.monthly_expenses);
        read_field(j, "monthly_mortgage_payment", config.monthly_mortgage_payment);

        read_field(j, "property_appreciation", config.property_appreciation);
        read_field(j, "mortgage_interest_rate", config.mortgage_interest_rate);

        read_field(j, "expected_return", config.expected_return);
        read_field(j, "return_volatility", config.return_volatility);
        read_field(j, "expected_inflation", config.expected_inflation);
        read_field(j, "inflation_volatility", config.inflation_volatility);
        read_field(j, "salary_inflation", config.salary_inflation);

        read_field(j, "years", config.years);
        read_field(j, "num_paths", config.num_paths);
        read_field(j, "random_seed", config.random_seed);

        read_field(j, "starting_age", config.starting_age);
        read_field(j, "retirement_age", config.retirement_age);
        read_field(j, "pension_income", config.pension_income);

        // Parse events (optional array)
        if (j.contains("events") && !j["events"].is_null()) {
            if (!j["events"].is_array()) {
                throw ConfigParseError("Field 'events' must be an array");
            }
            size_t index = 0;
            for (const auto& event_json : j["events"]) {
                config.events.push_back(parse_event(event_json, index++));
            }
        }

        // Parse passive_income_streams (optional array)
        if (j.contains("passive_income_streams") && !j["passive_income_streams"].is_null()) {
            if (!j["passive_income_streams"].is_array()) {
                throw ConfigParseError("Field 'passive_income_streams' must be an array");
            }
            size_t index = 0;
            for (const auto& stream_json : j["passive_income_streams"]) {
                config.passive_income_streams.push_back(parse_stream(stream_json, index++));
            }
        }

        // Parse spouse (optional object)
        if (j.contains("spouse") && !j["spouse"].is_null()) {
            config.spouse = parse_spouse(j["spouse"]);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_config(config);

    return config;
}

SimulationConfig load_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return load_config_from_string(buffer.str());
}

} // namespace io
} // namespace wealthsim
