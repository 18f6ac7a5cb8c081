#ifndef WEALTHSIM_IO_JSON_WRITER_HPP
#define WEALTHSIM_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../cashflow_projector.hpp"
#include "../statistics.hpp"
#include "../wealth_engine.hpp"

namespace wealthsim {
namespace io {

// Write run metadata, path statistics, the cash-flow table and the Year 1
// breakdown as one JSON document. Non-finite numbers are written as null.
void write_simulation_summary_json(std::ostream& os, const SimulationResult& result,
                                   const PathSummary& summary, const CashFlowTable& table,
                                   bool pretty_print = true);

// Write the same document to a file
void write_simulation_summary_json(const std::string& filepath, const SimulationResult& result,
                                   const PathSummary& summary, const CashFlowTable& table,
                                   bool pretty_print = true);

} // namespace io
} // namespace wealthsim

#endif // WEALTHSIM_IO_JSON_WRITER_HPP
