#include "parameters.hpp"
#include <stdexcept>

void validate(const Parameters& p)
{
    if (p.num_lanes < 1)
        throw std::invalid_argument("num_lanes must be at least 1");
    if (p.length < 1)
        throw std::invalid_argument("length must be positive");
    if (p.cars_per_lane < 0 || p.cars_per_lane > p.length)
        throw std::invalid_argument("cars_per_lane must lie in [0, length]");
    if (p.max_velocity < 1)
        throw std::invalid_argument("max_velocity must be positive");
    if (p.p_slowdown < 0.0 || p.p_slowdown > 1.0)
        throw std::invalid_argument("p_slowdown must lie in [0, 1]");
    if (p.p_crash < 0.0 || p.p_crash > 1.0)
        throw std::invalid_argument("p_crash must lie in [0, 1]");
    if (p.crash_duration < 0)
        throw std::invalid_argument("crash_duration must be non-negative");
}
