#include "neighbors.hpp"
#include "car.hpp"

int forwardDistance(int from, int to, int length)
{
    const int d = ((to - from) % length + length) % length;
    return d == 0 ? length : d;
}

Neighbors findNeighbors(int position, const std::vector<Car>& cars, int length)
{
    Neighbors n;
    int minBehind = length;
    int minAhead  = length;

    for (const auto& c : cars)
    {
        if (c.position() == position) continue;

        const int dBehind = forwardDistance(c.position(), position, length);
        if (dBehind < minBehind) {
            minBehind = dBehind;
            n.behind = &c;
        }

        const int dAhead = forwardDistance(position, c.position(), length);
        if (dAhead < minAhead) {
            minAhead = dAhead;
            n.ahead = &c;
        }
    }
    return n;
}
