#include "lane.hpp"
#include "neighbors.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace {

bool byPosition(const Car& a, const Car& b)
{
    return a.position() < b.position();
}

}

Lane::Lane(int length, std::vector<Car> cars)
    : len(length),
      population(std::move(cars))
{
    if (len < 1)
        throw std::invalid_argument("Lane length must be positive");

    for (const auto& c : population)
        if (c.position() < 0 || c.position() >= len)
            throw std::invalid_argument("Car position outside lane");

    restoreOrder();

    for (std::size_t i = 1; i < population.size(); ++i)
        if (population[i - 1].position() == population[i].position())
            throw std::invalid_argument("Two cars share a cell");
}

Lane::Lane(int length, int numCars, const Parameters& params, Rng& rng)
    : len(length)
{
    if (len < 1)
        throw std::invalid_argument("Lane length must be positive");
    if (numCars < 0 || numCars > len)
        throw std::invalid_argument("Lane cannot hold that many cars");

    std::vector<int> cells(len);
    std::iota(cells.begin(), cells.end(), 0);

    std::vector<int> start;
    start.reserve(numCars);
    std::sample(cells.begin(), cells.end(), std::back_inserter(start),
                numCars, rng);

    std::uniform_int_distribution<int> startVel(1, params.max_velocity);
    population.reserve(numCars);
    for (int p : start)
        population.emplace_back(p, startVel(rng));

    restoreOrder();
}

void Lane::restoreOrder()
{
    if (!std::is_sorted(population.begin(), population.end(), byPosition))
        std::sort(population.begin(), population.end(), byPosition);
}

void Lane::tick(const Parameters& params, Rng& rng)
{
    const std::size_t n = population.size();
    if (n == 0) return;

    const std::vector<int> before = positions();
    for (std::size_t i = 0; i < n; ++i)
    {
        const int gap = forwardDistance(before[i], before[(i + 1) % n], len);
        population[i].advance(gap, len, params, rng);
    }

    restoreOrder();
}

std::vector<Departure> Lane::tickWithLaneChange(const Lane* left,
                                                const Lane* right,
                                                const Parameters& params,
                                                Rng& rng)
{
    std::vector<Departure> departures;
    const std::size_t n = population.size();
    if (n == 0) return departures;

    const std::vector<int> before = positions();
    std::vector<std::size_t> leaving;
    std::vector<LaneChoice> sides;

    for (std::size_t i = 0; i < n; ++i)
    {
        const int gap = forwardDistance(before[i], before[(i + 1) % n], len);
        const LaneChoice choice =
            population[i].advanceWithLaneChange(gap, left, right, len, params, rng);
        if (choice != LaneChoice::Stay) {
            leaving.push_back(i);
            sides.push_back(choice);
        }
    }

    departures.reserve(leaving.size());
    for (std::size_t k = 0; k < leaving.size(); ++k)
        departures.push_back({population[leaving[k]], sides[k]});

    // descending, so the remaining indices stay valid
    for (auto it = leaving.rbegin(); it != leaving.rend(); ++it)
        population.erase(population.begin() + static_cast<std::ptrdiff_t>(*it));

    restoreOrder();
    return departures;
}

void Lane::addCar(const Car& car)
{
    if (car.position() < 0 || car.position() >= len)
        throw std::logic_error("Car position outside lane");

    auto at = std::lower_bound(population.begin(), population.end(), car, byPosition);
    if (at != population.end() && at->position() == car.position())
        throw std::logic_error("Cell already occupied");

    population.insert(at, car);
}

const Car& Lane::injectCrash(Rng& rng, int duration)
{
    if (population.empty())
        throw std::runtime_error("Cannot crash a car on an empty lane");

    std::uniform_int_distribution<std::size_t> pick(0, population.size() - 1);
    Car& car = population[pick(rng)];
    car.crash(duration);
    return car;
}

bool Lane::occupied(int position) const
{
    return std::binary_search(population.begin(), population.end(),
                              Car(position, 0), byPosition);
}

std::vector<int> Lane::positions() const
{
    std::vector<int> out;
    out.reserve(population.size());
    for (const auto& c : population)
        out.push_back(c.position());
    return out;
}

std::vector<int> Lane::velocities() const
{
    std::vector<int> out;
    out.reserve(population.size());
    for (const auto& c : population)
        out.push_back(c.velocity());
    return out;
}
