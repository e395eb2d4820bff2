#pragma once

#include <vector>

class Car;

// ---- Neighbor search on a circular track ---- //
struct Neighbors {
    const Car* behind{nullptr};
    const Car* ahead{nullptr};
};

// Cells travelled going forward from `from` to `to`, in [1, length].
// Equal positions give a full loop.
int forwardDistance(int from, int to, int length);

// Nearest cars strictly behind and strictly ahead of `position`. A side is
// null when no car qualifies.
Neighbors findNeighbors(int position, const std::vector<Car>& cars, int length);
