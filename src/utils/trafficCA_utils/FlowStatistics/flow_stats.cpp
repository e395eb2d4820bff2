#include "flow_stats.hpp"

#include <stdexcept>

FlowStats measureFlow(const VelocityGrid& grid)
{
    const Eigen::Index lanes = grid.rows();
    const Eigen::Index cells = grid.cols();
    if (lanes == 0 || cells == 0)
        throw std::invalid_argument("Velocity grid must be non-empty");

    /* ---- occupancy and velocities, sentinel cells masked out ---- */
    const Eigen::ArrayXXd occupied = (grid.array() != NO_CAR).cast<double>();
    const Eigen::ArrayXXd speed = grid.array().cast<double>().max(0.0);

    const Eigen::VectorXd count = occupied.rowwise().sum().matrix();
    const Eigen::VectorXd total = speed.rowwise().sum().matrix();

    FlowStats s;
    s.density = count / static_cast<double>(cells);
    s.flow    = total / static_cast<double>(cells);

    s.mean_velocity = Eigen::VectorXd::Zero(lanes);
    for (Eigen::Index i = 0; i < lanes; ++i)
        if (count(i) > 0.0)
            s.mean_velocity(i) = total(i) / count(i);

    const double cars = count.sum();
    s.total_density = cars / static_cast<double>(lanes * cells);
    s.total_flow    = total.sum() / static_cast<double>(lanes * cells);
    s.total_mean_velocity = cars > 0.0 ? total.sum() / cars : 0.0;
    return s;
}

FlowStats sampleFlow(Road& road, int warmup, int steps)
{
    if (warmup < 0 || steps <= 0)
        throw std::invalid_argument("warmup must be non-negative and steps positive");

    road.simulate(warmup);

    const Eigen::Index lanes = road.numLanes();
    FlowStats avg;
    avg.density       = Eigen::VectorXd::Zero(lanes);
    avg.mean_velocity = Eigen::VectorXd::Zero(lanes);
    avg.flow          = Eigen::VectorXd::Zero(lanes);

    for (int t = 0; t < steps; ++t)
    {
        road.simulate(1);
        const FlowStats s = measureFlow(road.snapshot());
        avg.density       += s.density;
        avg.mean_velocity += s.mean_velocity;
        avg.flow          += s.flow;
        avg.total_density       += s.total_density;
        avg.total_mean_velocity += s.total_mean_velocity;
        avg.total_flow          += s.total_flow;
    }

    const double n = static_cast<double>(steps);
    avg.density       /= n;
    avg.mean_velocity /= n;
    avg.flow          /= n;
    avg.total_density       /= n;
    avg.total_mean_velocity /= n;
    avg.total_flow          /= n;
    return avg;
}
