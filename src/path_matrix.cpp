#include "path_matrix.hpp"
#include <stdexcept>

namespace wealthsim {

PathMatrix::PathMatrix() : num_paths_(0), num_years_(0) {}

PathMatrix::PathMatrix(size_t num_paths, size_t num_years, double fill)
    : num_paths_(num_paths), num_years_(num_years), data_(num_paths * num_years, fill) {}

double PathMatrix::at(size_t path, size_t year) const {
    if (path >= num_paths_) {
        throw std::out_of_range("Path index out of range");
    }
    if (year >= num_years_) {
        throw std::out_of_range("Year index out of range");
    }
    return data_[path * num_years_ + year];
}

std::vector<double> PathMatrix::column(size_t year) const {
    if (year >= num_years_) {
        throw std::out_of_range("Year index out of range");
    }
    std::vector<double> values;
    values.reserve(num_paths_);
    for (size_t p = 0; p < num_paths_; ++p) {
        values.push_back(data_[p * num_years_ + year]);
    }
    return values;
}

} // namespace wealthsim
