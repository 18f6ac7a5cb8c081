#ifndef WEALTHSIM_PARQUET_WRITER_HPP
#define WEALTHSIM_PARQUET_WRITER_HPP

#include "../wealth_engine.hpp"
#include <string>

namespace wealthsim {

class ParquetWriter {
public:
    /**
     * Write every simulated path to a Parquet file, one row per (path, year).
     *
     * Output schema:
     *   - path_id: uint32 (0-indexed)
     *   - year: uint32 (0..years)
     *   - net_worth, real_net_worth, liquid_wealth, pension_wealth,
     *     property_value, mortgage_balance: float64
     *
     * @param result SimulationResult from run_stochastic_simulation
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the result is empty, the file cannot be
     *         written, or the build has no Arrow support
     */
    static void write_paths(const SimulationResult& result, const std::string& filepath);
};

} // namespace wealthsim

#endif // WEALTHSIM_PARQUET_WRITER_HPP
