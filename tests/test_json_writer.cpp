#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "io/json_writer.hpp"

using namespace wealthsim;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

namespace {

SimulationConfig small_household() {
    SimulationConfig config;
    config.initial_liquid_wealth = 100000.0;
    config.initial_property_value = 500000.0;
    config.initial_mortgage = 400000.0;
    config.gross_annual_income = 75000.0;
    config.monthly_expenses = 3000.0;
    config.monthly_mortgage_payment = 2000.0;
    config.years = 5;
    config.num_paths = 20;
    config.events.push_back(Windfall{2, "Bonus \"cash\"", 5000.0});
    return config;
}

} // anonymous namespace

TEST_CASE("Summary JSON is well formed and complete", "[io][json]") {
    SimulationConfig config = small_household();
    SimulationResult result = run_stochastic_simulation(config);
    PathSummary summary = summarize_paths(result);
    CashFlowTable table = build_cashflow_table(config);

    std::ostringstream oss;
    io::write_simulation_summary_json(oss, result, summary, table);
    json doc = json::parse(oss.str());

    REQUIRE(doc["simulation"]["paths"] == 20);
    REQUIRE(doc["simulation"]["years"] == 5);
    REQUIRE(doc["simulation"]["non_finite_values"] == 0);
    REQUIRE(doc["statistics"]["real_terms"] == false);
    REQUIRE_THAT(doc["statistics"]["initial_net_worth"].get<double>(), WithinAbs(200000.0, 0.01));
    REQUIRE(doc["years"].size() == 6);
    REQUIRE(doc["years"][0]["year"] == 0);
    REQUIRE(doc["cashflow"].size() == 6);
    REQUIRE(doc["cashflow"][2]["events"] == "Bonus \"cash\"");
    REQUIRE(doc["year1_breakdown"]["status"] == "deficit");
    REQUIRE(doc["year1_breakdown"]["items"][0]["label"] == "Gross Income");
}

TEST_CASE("Compact JSON has no line breaks inside", "[io][json]") {
    SimulationConfig config = small_household();
    SimulationResult result = run_stochastic_simulation(config);
    CashFlowTable table = build_cashflow_table(config, 1);

    std::ostringstream oss;
    io::write_simulation_summary_json(oss, result, summarize_paths(result, true), table, false);
    std::string text = oss.str();

    REQUIRE(text.find('\n') == std::string::npos);
    json doc = json::parse(text);
    REQUIRE(doc["statistics"]["real_terms"] == true);
    REQUIRE(doc["cashflow"].size() == 2);
}

TEST_CASE("Non-finite statistics are written as null", "[io][json]") {
    SimulationResult result;
    PathSummary summary;
    summary.final_mean = std::numeric_limits<double>::quiet_NaN();
    CashFlowTable table;

    std::ostringstream oss;
    io::write_simulation_summary_json(oss, result, summary, table);
    json doc = json::parse(oss.str());

    REQUIRE(doc["statistics"]["final_mean"].is_null());
    REQUIRE(doc["years"].empty());
}

TEST_CASE("Summary JSON file overload", "[io][json]") {
    SimulationConfig config = small_household();
    SimulationResult result = run_stochastic_simulation(config);
    CashFlowTable table = build_cashflow_table(config);
    std::string path = (std::filesystem::temp_directory_path() / "wealthsim_test_summary.json").string();

    io::write_simulation_summary_json(path, result, summarize_paths(result), table);

    std::ifstream file(path);
    json doc = json::parse(file);
    REQUIRE(doc["simulation"]["paths"] == 20);

    std::filesystem::remove(path);
}

TEST_CASE("Unwritable output path throws", "[io][json][error]") {
    SimulationResult result;
    REQUIRE_THROWS_AS(io::write_simulation_summary_json("/nonexistent/dir/out.json", result,
                                                        PathSummary(), CashFlowTable()),
                      std::runtime_error);
}
