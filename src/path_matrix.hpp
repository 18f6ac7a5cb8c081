#ifndef WEALTHSIM_PATH_MATRIX_HPP
#define WEALTHSIM_PATH_MATRIX_HPP

#include <cstddef>
#include <vector>

namespace wealthsim {

// PathMatrix: one value per (path, year), stored row-major by path so a
// single path's trajectory is contiguous
class PathMatrix {
public:
    PathMatrix();
    PathMatrix(size_t num_paths, size_t num_years, double fill = 0.0);

    double& operator()(size_t path, size_t year) { return data_[path * num_years_ + year]; }
    double operator()(size_t path, size_t year) const { return data_[path * num_years_ + year]; }

    // Bounds-checked access
    double at(size_t path, size_t year) const;

    // Copy of one year across all paths (a cross-section)
    std::vector<double> column(size_t year) const;

    size_t num_paths() const { return num_paths_; }
    size_t num_years() const { return num_years_; }
    bool empty() const { return data_.empty(); }

    const std::vector<double>& data() const { return data_; }

    size_t memory_footprint() const {
        return sizeof(PathMatrix) + data_.capacity() * sizeof(double);
    }

private:
    size_t num_paths_;
    size_t num_years_;
    std::vector<double> data_;
};

} // namespace wealthsim

#endif // WEALTHSIM_PATH_MATRIX_HPP
