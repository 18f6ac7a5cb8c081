#include "schedule.hpp"
#include <stdexcept>
#include <string>

namespace wealthsim {

ForwardSchedule::ForwardSchedule() = default;

ForwardSchedule::ForwardSchedule(size_t horizon, double base_amount)
    : values_(horizon + 1, base_amount) {}

double ForwardSchedule::at(int year) const {
    if (year < 0 || static_cast<size_t>(year) >= values_.size()) {
        throw std::out_of_range("Schedule year out of range: " + std::to_string(year));
    }
    return values_[static_cast<size_t>(year)];
}

void ForwardSchedule::add_from(int year, double delta) {
    if (year < 0) {
        throw std::out_of_range("Schedule year cannot be negative");
    }
    for (size_t y = static_cast<size_t>(year); y < values_.size(); ++y) {
        values_[y] += delta;
    }
}

void ForwardSchedule::set_from(int year, double value) {
    if (year < 0) {
        throw std::out_of_range("Schedule year cannot be negative");
    }
    for (size_t y = static_cast<size_t>(year); y < values_.size(); ++y) {
        values_[y] = value;
    }
}

} // namespace wealthsim
