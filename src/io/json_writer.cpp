#include "json_writer.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wealthsim {
namespace io {

namespace {

// JSON has no NaN or Infinity
std::string number(double value, int precision = 2) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string quoted(const std::string& str) {
    std::ostringstream oss;
    oss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<int>(c));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

const char* boolean(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

void write_simulation_summary_json(std::ostream& os, const SimulationResult& result,
                                   const PathSummary& summary, const CashFlowTable& table,
                                   bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";
    const std::string i2 = indent + indent;
    const std::string i3 = i2 + indent;

    os << "{" << newline;

    // Run metadata
    os << indent << "\"simulation\":" << space << "{" << newline;
    os << i2 << "\"paths\":" << space << result.num_paths() << "," << newline;
    os << i2 << "\"years\":" << space << result.num_years() << "," << newline;
    os << i2 << "\"execution_time_ms\":" << space << number(result.execution_time_ms) << "," << newline;
    os << i2 << "\"non_finite_values\":" << space << result.non_finite_values << newline;
    os << indent << "}," << newline;

    // Statistics section
    os << indent << "\"statistics\":" << space << "{" << newline;
    os << i2 << "\"real_terms\":" << space << boolean(summary.real_terms) << "," << newline;
    os << i2 << "\"initial_net_worth\":" << space << number(summary.initial_net_worth) << "," << newline;
    os << i2 << "\"final_median\":" << space << number(summary.final_median) << "," << newline;
    os << i2 << "\"final_mean\":" << space << number(summary.final_mean) << "," << newline;
    os << i2 << "\"final_std_dev\":" << space << number(summary.final_std_dev) << "," << newline;
    os << i2 << "\"final_p10\":" << space << number(summary.final_p10()) << "," << newline;
    os << i2 << "\"final_p90\":" << space << number(summary.final_p90()) << "," << newline;
    os << i2 << "\"probability_of_growth\":" << space << number(summary.probability_of_growth, 4) << "," << newline;
    os << i2 << "\"probability_of_doubling\":" << space << number(summary.probability_of_doubling, 4) << "," << newline;
    os << i2 << "\"insolvency_probability\":" << space << number(summary.insolvency_probability, 4) << "," << newline;
    os << i2 << "\"min_median_liquid_wealth\":" << space << number(summary.min_median_liquid_wealth) << newline;
    os << indent << "}," << newline;

    // Per-year percentile bands and median composition
    os << indent << "\"years\":" << space << "[" << newline;
    for (size_t y = 0; y < summary.net_worth_bands.size(); ++y) {
        const PercentileBand& band = summary.net_worth_bands[y];
        os << i2 << "{"
           << "\"year\":" << space << y << "," << space
           << "\"p10\":" << space << number(band.p10) << "," << space
           << "\"p25\":" << space << number(band.p25) << "," << space
           << "\"p50\":" << space << number(band.p50) << "," << space
           << "\"p75\":" << space << number(band.p75) << "," << space
           << "\"p90\":" << space << number(band.p90) << "," << space
           << "\"median_liquid\":" << space << number(summary.median_liquid_wealth[y]) << "," << space
           << "\"median_pension\":" << space << number(summary.median_pension_wealth[y]) << "," << space
           << "\"median_property_equity\":" << space << number(summary.median_property_equity[y])
           << "}" << (y + 1 < summary.net_worth_bands.size() ? "," : "") << newline;
    }
    os << indent << "]," << newline;

    // Cash-flow table
    os << indent << "\"cashflow\":" << space << "[" << newline;
    for (size_t i = 0; i < table.rows.size(); ++i) {
        const CashFlowRow& row = table.rows[i];
        os << i2 << "{" << newline;
        os << i3 << "\"year\":" << space << row.year << "," << newline;
        os << i3 << "\"age\":" << space << row.age << "," << newline;
        os << i3 << "\"retired\":" << space << boolean(row.retired) << "," << newline;
        os << i3 << "\"spouse_retired\":" << space << boolean(row.spouse_retired) << "," << newline;
        os << i3 << "\"take_home\":" << space << number(row.take_home) << "," << newline;
        os << i3 << "\"pension_contribution\":" << space << number(row.pension_contribution) << "," << newline;
        os << i3 << "\"passive_income\":" << space << number(row.passive_income) << "," << newline;
        os << i3 << "\"rental_income\":" << space << number(row.rental_income) << "," << newline;
        os << i3 << "\"living_expenses\":" << space << number(row.living_expenses) << "," << newline;
        os << i3 << "\"mortgage\":" << space << number(row.mortgage) << "," << newline;
        os << i3 << "\"available_savings\":" << space << number(row.available_savings) << "," << newline;
        os << i3 << "\"monthly_savings\":" << space << number(row.monthly_savings) << "," << newline;
        os << i3 << "\"events\":" << space << quoted(row.events) << newline;
        os << i2 << "}" << (i + 1 < table.rows.size() ? "," : "") << newline;
    }
    os << indent << "]," << newline;

    // Year 1 breakdown
    os << indent << "\"year1_breakdown\":" << space << "{" << newline;
    os << i2 << "\"items\":" << space << "[" << newline;
    for (size_t i = 0; i < table.year1.items.size(); ++i) {
        const BreakdownItem& item = table.year1.items[i];
        os << i3 << "{\"label\":" << space << quoted(item.label) << "," << space
           << "\"amount\":" << space << number(item.amount) << "}"
           << (i + 1 < table.year1.items.size() ? "," : "") << newline;
    }
    os << i2 << "]," << newline;
    os << i2 << "\"available\":" << space << number(table.year1.available) << "," << newline;
    os << i2 << "\"status\":" << space << quoted(table.year1.status) << newline;
    os << indent << "}" << newline;

    os << "}" << newline;
}

void write_simulation_summary_json(const std::string& filepath, const SimulationResult& result,
                                   const PathSummary& summary, const CashFlowTable& table,
                                   bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_summary_json(file, result, summary, table, pretty_print);
}

} // namespace io
} // namespace wealthsim
