#ifndef WEALTHSIM_SCHEDULE_HPP
#define WEALTHSIM_SCHEDULE_HPP

#include <cstddef>
#include <vector>

namespace wealthsim {

// ForwardSchedule: a recurring monthly amount by year (0..horizon).
// Events change it from their effective year onward; earlier years are
// never touched. Years past the horizon are ignored.
class ForwardSchedule {
public:
    ForwardSchedule();
    ForwardSchedule(size_t horizon, double base_amount);

    double at(int year) const;

    // values_[y] += delta for all y >= year
    void add_from(int year, double delta);

    // values_[y] = value for all y >= year
    void set_from(int year, double value);

    size_t horizon() const { return values_.empty() ? 0 : values_.size() - 1; }
    const std::vector<double>& values() const { return values_; }

private:
    std::vector<double> values_;
};

} // namespace wealthsim

#endif // WEALTHSIM_SCHEDULE_HPP
