#pragma once

#include <random>

using Rng = std::mt19937;

// ---- Parameters ---- //
struct Parameters {
    int num_lanes{1};
    int length{0};
    int cars_per_lane{0};

    int max_velocity{5};
    double p_slowdown{0.5};
    double p_crash{0.01};
    int crash_duration{30};

    bool lane_changes{true};
    bool verbose{false};
};

// Throws std::invalid_argument on the first bad field.
void validate(const Parameters& params);
