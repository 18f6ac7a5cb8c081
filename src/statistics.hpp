#ifndef WEALTHSIM_STATISTICS_HPP
#define WEALTHSIM_STATISTICS_HPP

#include "path_matrix.hpp"
#include <vector>

namespace wealthsim {

struct SimulationResult;

// Percentile band of one year's cross-section
struct PercentileBand {
    double p10;
    double p25;
    double p50;
    double p75;
    double p90;
};

// Distribution summary of a stochastic run
struct PathSummary {
    bool real_terms;                             // Deflated to year-0 purchasing power

    std::vector<PercentileBand> net_worth_bands; // One band per year 0..N

    double initial_net_worth;                    // Median of year 0
    double final_median;
    double final_mean;
    double final_std_dev;
    double probability_of_growth;                // Share of paths ending above their start
    double probability_of_doubling;              // Share ending above twice their start

    // Median composition by year (same terms as the bands)
    std::vector<double> median_liquid_wealth;
    std::vector<double> median_pension_wealth;
    std::vector<double> median_property_equity;  // Property value - mortgage balance

    double min_median_liquid_wealth;
    double insolvency_probability;               // Share of paths with negative liquid wealth in any year >= 1

    PathSummary();

    double final_p10() const { return net_worth_bands.empty() ? 0.0 : net_worth_bands.back().p10; }
    double final_p90() const { return net_worth_bands.empty() ? 0.0 : net_worth_bands.back().p90; }
};

double calculate_mean(const std::vector<double>& values);

// Population standard deviation
double calculate_std_dev(const std::vector<double>& values, double mean);

// Percentile with linear interpolation between closest ranks.
// sorted_values must be ascending; p is in [0, 100].
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// Sorts a copy, then calculate_percentile
double percentile_of(std::vector<double> values, double p);

// Median of each year's cross-section
std::vector<double> median_by_year(const PathMatrix& matrix);

// Count NaN and infinite cells across every matrix in the result
size_t count_non_finite(const SimulationResult& result);

PathSummary summarize_paths(const SimulationResult& result, bool real_terms = false);

} // namespace wealthsim

#endif // WEALTHSIM_STATISTICS_HPP
