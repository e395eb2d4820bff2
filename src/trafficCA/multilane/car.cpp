#include "car.hpp"
#include "lane.hpp"
#include "neighbors.hpp"

#include <algorithm>

Car::Car(int position, int velocity, int crashTimer)
    : pos(position),
      vel(velocity),
      crash_timer(crashTimer)
{
}

void Car::advance(int gap, int length, const Parameters& params, Rng& rng)
{
    if (crash_timer > 0) {
        vel = 0;
        --crash_timer;
        return;
    }

    if (vel < params.max_velocity)
        ++vel;

    // never enter the cell of the car ahead
    if (gap <= vel)
        vel = std::max(gap - 1, 0);

    std::bernoulli_distribution slowdown(params.p_slowdown);
    if (vel > 0 && slowdown(rng))
        --vel;

    pos = (pos + vel) % length;
}

int Car::sideSpace(const Lane& lane) const
{
    if (lane.occupied(pos))
        return -1;

    const Neighbors n = findNeighbors(pos, lane.cars(), lane.length());
    if (n.behind == nullptr)
        return lane.length();

    const int behindGap = forwardDistance(n.behind->position(), pos, lane.length());
    if (n.behind->velocity() + 1 >= behindGap)
        return -1;

    return forwardDistance(pos, n.ahead->position(), lane.length());
}

LaneChoice Car::chooseLane(int gap, const Lane* left, const Lane* right) const
{
    if (crashed())
        return LaneChoice::Stay;

    const int mSpace = gap;
    const int lSpace = left  ? sideSpace(*left)  : -1;
    const int rSpace = right ? sideSpace(*right) : -1;

    if (mSpace >= rSpace && mSpace >= lSpace)
        return LaneChoice::Stay;
    if (rSpace >= lSpace)
        return LaneChoice::Right;
    return LaneChoice::Left;
}

LaneChoice Car::advanceWithLaneChange(int gap,
                                      const Lane* left,
                                      const Lane* right,
                                      int length,
                                      const Parameters& params,
                                      Rng& rng)
{
    const LaneChoice choice = chooseLane(gap, left, right);
    if (choice == LaneChoice::Stay)
        advance(gap, length, params, rng);
    return choice;
}
