#include "road.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

std::uint32_t deviceSeed()
{
    std::random_device rd;
    return rd();
}

struct Transfer {
    Car car;
    std::size_t from{0};
    std::size_t to{0};
};

}

Road::Road(const Parameters& p)
    : Road(p, deviceSeed())
{
}

Road::Road(const Parameters& p, std::uint32_t seed)
    : params(p)
{
    validate(params);
    rng.seed(seed);

    lanes.reserve(params.num_lanes);
    for (int i = 0; i < params.num_lanes; ++i)
        lanes.emplace_back(params.length, params.cars_per_lane, params, rng);
}

Road::Road(const Parameters& p, std::vector<Lane> initial, std::uint32_t seed)
    : params(p),
      lanes(std::move(initial))
{
    validate(params);

    if (lanes.size() != static_cast<std::size_t>(params.num_lanes))
        throw std::invalid_argument("Lane count does not match num_lanes");

    for (const auto& l : lanes)
    {
        if (l.length() != params.length)
            throw std::invalid_argument("Lane length does not match road length");
        for (const auto& c : l.cars())
            if (c.velocity() < 0 || c.velocity() > params.max_velocity)
                throw std::invalid_argument("Car velocity outside [0, max_velocity]");
    }

    rng.seed(seed);
}

void Road::maybeCrash()
{
    if (dist(rng) >= params.p_crash) return;

    std::uniform_int_distribution<int> pick(0, params.num_lanes - 1);
    const int ind = pick(rng);
    if (lanes[ind].empty()) return;

    const Car& car = lanes[ind].injectCrash(rng, params.crash_duration);
    crash_log.push_back({ticks_done, ind, car.position()});

    if (params.verbose)
        std::cout << "Crash in lane " << ind
                  << " at position " << car.position()
                  << " (tick " << ticks_done << ")\n";
}

void Road::tick()
{
    for (auto& l : lanes)
    {
        l.tick(params, rng);
        maybeCrash();
    }
    ++ticks_done;
}

void Road::tickWithLaneChanges()
{
    // every lane decides against its neighbours' pre-tick state
    const std::vector<Lane> before = lanes;
    const std::size_t n = lanes.size();

    std::vector<Transfer> transfers;
    for (std::size_t i = 0; i < n; ++i)
    {
        const Lane* left  = i > 0     ? &before[i - 1] : nullptr;
        const Lane* right = i + 1 < n ? &before[i + 1] : nullptr;

        for (auto& d : lanes[i].tickWithLaneChange(left, right, params, rng))
        {
            const std::size_t to = d.side == LaneChoice::Left ? i - 1 : i + 1;
            transfers.push_back({d.car, i, to});
        }

        maybeCrash();
    }

    // Two cars merging into the same cell from both sides: the later one
    // goes back to its own cell, which nobody else can have taken.
    for (const auto& t : transfers)
    {
        if (lanes[t.to].occupied(t.car.position()))
            lanes[t.from].addCar(t.car);
        else
            lanes[t.to].addCar(t.car);
    }

    ++ticks_done;
}

void Road::simulate(int steps)
{
    if (steps < 0)
        throw std::invalid_argument("steps must be non-negative");

    for (int t = 0; t < steps; ++t)
    {
        if (params.lane_changes)
            tickWithLaneChanges();
        else
            tick();
    }
}

VelocityGrid Road::snapshot() const
{
    VelocityGrid grid = VelocityGrid::Constant(params.num_lanes, params.length, NO_CAR);

    for (std::size_t i = 0; i < lanes.size(); ++i)
        for (const auto& c : lanes[i].cars())
            grid(static_cast<Eigen::Index>(i), c.position()) = c.velocity();

    return grid;
}

std::size_t Road::carCount() const noexcept
{
    std::size_t total = 0;
    for (const auto& l : lanes)
        total += l.size();
    return total;
}
