#pragma once

#include "parameters.hpp"

class Lane;

// ---- Lane change decision ---- //
enum class LaneChoice {
    Stay,
    Left,
    Right
};

// ---- Car ---- //
class Car {
private:
    int pos{0};
    int vel{0};
    int crash_timer{0};

    // Space offered by an adjacent lane, -1 when moving there is unsafe.
    int sideSpace(const Lane& lane) const;

public:
    Car() = default;
    Car(int position, int velocity, int crashTimer = 0);

    // Nagel-Schreckenberg update. `gap` is the circular distance to the
    // next car ahead on the same lane.
    void advance(int gap, int length, const Parameters& params, Rng& rng);

    // Either of `left` and `right` may be null when the lane has no
    // neighbour on that side.
    LaneChoice chooseLane(int gap, const Lane* left, const Lane* right) const;

    // On Stay the car is advanced; otherwise it is left untouched so the
    // caller can hand it to the chosen lane.
    LaneChoice advanceWithLaneChange(int gap,
                                     const Lane* left,
                                     const Lane* right,
                                     int length,
                                     const Parameters& params,
                                     Rng& rng);

    void crash(int ticks) noexcept { crash_timer = ticks; }

    // ---- Accessors ---- //
    int position() const noexcept { return pos; }
    int velocity() const noexcept { return vel; }
    int crashTimer() const noexcept { return crash_timer; }
    bool crashed() const noexcept { return crash_timer > 0; }
};
