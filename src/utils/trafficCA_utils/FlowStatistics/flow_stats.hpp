#pragma once

#include <Eigen/Dense>

#include "road.hpp"

// ---- Flow statistics ---- //
struct FlowStats {
    Eigen::VectorXd density;        // cars per cell, per lane
    Eigen::VectorXd mean_velocity;  // over present cars, 0 for an empty lane
    Eigen::VectorXd flow;           // sum of velocities per cell, per lane

    double total_density{0.0};
    double total_mean_velocity{0.0};
    double total_flow{0.0};
};

FlowStats measureFlow(const VelocityGrid& grid);

// Runs `warmup` ticks, then averages measureFlow over `steps` more ticks.
FlowStats sampleFlow(Road& road, int warmup, int steps);
