#pragma once

#include <vector>
#include <cstddef>

#include "car.hpp"
#include "parameters.hpp"

// A car leaving its lane during a lane-change tick.
struct Departure {
    Car car;
    LaneChoice side{LaneChoice::Stay};
};

// ---- Lane ---- //
class Lane {
private:
    int len{0};

    // sorted by position
    std::vector<Car> population;

    void restoreOrder();

public:
    Lane(int length, std::vector<Car> cars);

    // `numCars` cars on distinct random cells with velocities in
    // [1, max_velocity].
    Lane(int length, int numCars, const Parameters& params, Rng& rng);

    void tick(const Parameters& params, Rng& rng);

    // `left` and `right` are read-only views of the neighbouring lanes as
    // they were before this tick. Departing cars are removed from this lane
    // and returned in their original order.
    std::vector<Departure> tickWithLaneChange(const Lane* left,
                                              const Lane* right,
                                              const Parameters& params,
                                              Rng& rng);

    void addCar(const Car& car);

    // Throws std::runtime_error if the lane is empty.
    const Car& injectCrash(Rng& rng, int duration);

    bool occupied(int position) const;

    // ---- Accessors ---- //
    int length() const noexcept { return len; }
    std::size_t size() const noexcept { return population.size(); }
    bool empty() const noexcept { return population.empty(); }
    const std::vector<Car>& cars() const noexcept { return population; }

    std::vector<int> positions() const;
    std::vector<int> velocities() const;
};
