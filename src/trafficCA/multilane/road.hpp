#pragma once

#include <vector>
#include <random>
#include <cstddef>
#include <cstdint>

#include <Eigen/Dense>

#include "lane.hpp"
#include "parameters.hpp"

// One row per lane, one column per cell; -1 where no car is present.
using VelocityGrid =
    Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr int NO_CAR = -1;

// ---- Crash record ---- //
struct CrashEvent {
    long tick{0};
    int lane{0};
    int position{0};
};

// ---- Road ---- //
class Road {
private:
    Parameters params;
    std::vector<Lane> lanes;

    std::mt19937 rng;
    std::uniform_real_distribution<double> dist{0.0, 1.0};

    long ticks_done{0};
    std::vector<CrashEvent> crash_log;

    // After each lane: with probability p_crash, crash a car on a random
    // non-empty lane.
    void maybeCrash();

public:
    // Random cells and velocities; seeded from std::random_device.
    explicit Road(const Parameters& params);
    Road(const Parameters& params, std::uint32_t seed);

    // Explicit starting state. Lane count and lengths must match `params`;
    // `cars_per_lane` is ignored.
    Road(const Parameters& params, std::vector<Lane> lanes, std::uint32_t seed);

    void tick();
    void tickWithLaneChanges();

    // `steps` ticks of the variant selected by params.lane_changes.
    void simulate(int steps);

    VelocityGrid snapshot() const;

    // ---- Accessors ---- //
    int numLanes() const noexcept { return params.num_lanes; }
    int length() const noexcept { return params.length; }
    std::size_t carCount() const noexcept;
    long ticks() const noexcept { return ticks_done; }

    const Parameters& parameters() const noexcept { return params; }
    const Lane& lane(std::size_t i) const { return lanes.at(i); }
    const std::vector<CrashEvent>& crashes() const noexcept { return crash_log; }
};
