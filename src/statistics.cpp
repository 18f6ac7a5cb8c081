#include "statistics.hpp"
#include "wealth_engine.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace wealthsim {

// ============================================================================
// PathSummary Implementation
// ============================================================================

PathSummary::PathSummary()
    : real_terms(false),
      initial_net_worth(0.0),
      final_median(0.0),
      final_mean(0.0),
      final_std_dev(0.0),
      probability_of_growth(0.0),
      probability_of_doubling(0.0),
      min_median_liquid_wealth(0.0),
      insolvency_probability(0.0) {}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[std::min(lower_idx, sorted_values.size() - 1)];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

double percentile_of(std::vector<double> values, double p) {
    std::sort(values.begin(), values.end());
    return calculate_percentile(values, p);
}

std::vector<double> median_by_year(const PathMatrix& matrix) {
    std::vector<double> medians;
    medians.reserve(matrix.num_years());
    for (size_t y = 0; y < matrix.num_years(); ++y) {
        medians.push_back(percentile_of(matrix.column(y), 50.0));
    }
    return medians;
}

size_t count_non_finite(const SimulationResult& result) {
    size_t count = 0;
    const PathMatrix* matrices[] = {
        &result.net_worth, &result.real_net_worth, &result.liquid_wealth,
        &result.pension_wealth, &result.property_value, &result.mortgage_balance,
        &result.inflation_rates
    };
    for (const PathMatrix* matrix : matrices) {
        for (double v : matrix->data()) {
            if (!std::isfinite(v)) {
                ++count;
            }
        }
    }
    return count;
}

// ============================================================================
// Path Summary
// ============================================================================

namespace {

// Cross-section of `matrix` at `year`, optionally deflated path by path
std::vector<double> cross_section(const SimulationResult& result, const PathMatrix& matrix,
                                  size_t year, bool real_terms) {
    std::vector<double> values = matrix.column(year);
    if (real_terms) {
        for (size_t p = 0; p < values.size(); ++p) {
            values[p] /= result.cumulative_inflation(p, year);
        }
    }
    return values;
}

} // anonymous namespace

PathSummary summarize_paths(const SimulationResult& result, bool real_terms) {
    PathSummary summary;
    summary.real_terms = real_terms;

    const size_t paths = result.num_paths();
    if (paths == 0) {
        return summary;
    }
    const size_t columns = result.net_worth.num_years();
    const PathMatrix& net_worth = real_terms ? result.real_net_worth : result.net_worth;

    summary.net_worth_bands.reserve(columns);
    for (size_t y = 0; y < columns; ++y) {
        std::vector<double> values = net_worth.column(y);
        std::sort(values.begin(), values.end());
        summary.net_worth_bands.push_back(PercentileBand{
            calculate_percentile(values, 10.0),
            calculate_percentile(values, 25.0),
            calculate_percentile(values, 50.0),
            calculate_percentile(values, 75.0),
            calculate_percentile(values, 90.0)
        });

        summary.median_liquid_wealth.push_back(
            percentile_of(cross_section(result, result.liquid_wealth, y, real_terms), 50.0));
        summary.median_pension_wealth.push_back(
            percentile_of(cross_section(result, result.pension_wealth, y, real_terms), 50.0));

        std::vector<double> equity = cross_section(result, result.property_value, y, real_terms);
        std::vector<double> debt = cross_section(result, result.mortgage_balance, y, real_terms);
        for (size_t p = 0; p < paths; ++p) {
            equity[p] -= debt[p];
        }
        summary.median_property_equity.push_back(percentile_of(std::move(equity), 50.0));
    }

    std::vector<double> initial = net_worth.column(0);
    std::vector<double> final_values = net_worth.column(columns - 1);

    summary.initial_net_worth = percentile_of(initial, 50.0);
    summary.final_median = summary.net_worth_bands.back().p50;
    summary.final_mean = calculate_mean(final_values);
    summary.final_std_dev = calculate_std_dev(final_values, summary.final_mean);

    size_t grew = 0;
    size_t doubled = 0;
    size_t insolvent = 0;
    for (size_t p = 0; p < paths; ++p) {
        if (final_values[p] > initial[p]) {
            ++grew;
        }
        if (final_values[p] > 2.0 * initial[p]) {
            ++doubled;
        }
        for (size_t y = 1; y < columns; ++y) {
            if (result.liquid_wealth(p, y) < 0.0) {
                ++insolvent;
                break;
            }
        }
    }
    summary.probability_of_growth = static_cast<double>(grew) / static_cast<double>(paths);
    summary.probability_of_doubling = static_cast<double>(doubled) / static_cast<double>(paths);
    summary.insolvency_probability = static_cast<double>(insolvent) / static_cast<double>(paths);

    summary.min_median_liquid_wealth = *std::min_element(
        summary.median_liquid_wealth.begin(), summary.median_liquid_wealth.end());

    return summary;
}

} // namespace wealthsim
