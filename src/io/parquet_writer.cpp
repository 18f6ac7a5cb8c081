#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace wealthsim {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> matrix_column(const PathMatrix& matrix, const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(matrix.data().size()), "reserve memory for " + name + " column");
    // Row-major by path gives (path, year) order directly
    check(builder.AppendValues(matrix.data()), "append " + name);

    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_paths(const SimulationResult& result, const std::string& filepath) {
    if (result.net_worth.empty()) {
        throw std::runtime_error("SimulationResult has no paths to write");
    }

    const size_t paths = result.num_paths();
    const size_t columns = result.net_worth.num_years();

    // Build Arrow schema
    auto schema = arrow::schema({
        arrow::field("path_id", arrow::uint32()),
        arrow::field("year", arrow::uint32()),
        arrow::field("net_worth", arrow::float64()),
        arrow::field("real_net_worth", arrow::float64()),
        arrow::field("liquid_wealth", arrow::float64()),
        arrow::field("pension_wealth", arrow::float64()),
        arrow::field("property_value", arrow::float64()),
        arrow::field("mortgage_balance", arrow::float64())
    });

    arrow::UInt32Builder path_builder;
    arrow::UInt32Builder year_builder;
    check(path_builder.Reserve(paths * columns), "reserve memory for path_id column");
    check(year_builder.Reserve(paths * columns), "reserve memory for year column");

    for (size_t p = 0; p < paths; ++p) {
        for (size_t y = 0; y < columns; ++y) {
            check(path_builder.Append(static_cast<uint32_t>(p)), "append path_id");
            check(year_builder.Append(static_cast<uint32_t>(y)), "append year");
        }
    }

    std::shared_ptr<arrow::Array> path_array;
    check(path_builder.Finish(&path_array), "finish path_id array");
    std::shared_ptr<arrow::Array> year_array;
    check(year_builder.Finish(&year_array), "finish year array");

    auto table = arrow::Table::Make(schema, {
        path_array,
        year_array,
        matrix_column(result.net_worth, "net_worth"),
        matrix_column(result.real_net_worth, "real_net_worth"),
        matrix_column(result.liquid_wealth, "liquid_wealth"),
        matrix_column(result.pension_wealth, "pension_wealth"),
        matrix_column(result.property_value, "property_value"),
        matrix_column(result.mortgage_balance, "mortgage_balance")
    });

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_paths(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace wealthsim
