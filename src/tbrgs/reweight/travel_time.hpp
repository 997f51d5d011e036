/**
 * @file travel_time.hpp
 * @brief Flow to travel time conversion
 *
 * Speed follows a quadratic speed/flow relation:
 *
 *     flow = -a * speed^2 + b * speed
 *
 * Under capacity flow, traffic runs at the speed limit. Over capacity, the
 * congested (smaller) root of a*s^2 - b*s + flow = 0 is taken. A fixed delay
 * accounts for the intersection at the end of every segment.
 */

#pragma once

#include "estimators.hpp"

namespace tbrgs {
namespace reweight {


struct FlowModelParams
{
    double a = 1.4648375;       ///< quadratic coefficient
    double b = 93.75;           ///< linear coefficient
    double speed_limit = 60.0;  ///< free flow speed, km/h
    double capacity_flow = 351; ///< veh/h under which traffic runs free
    double delay_s = 30.0;      ///< fixed delay per segment, seconds

    void check_consistency() const;
};


/**
 * @brief travel time over a segment, in seconds
 *
 * @param flow         vehicles per hour
 * @param distance_km  segment length
 */
double flow_to_time(double flow, double distance_km, const FlowModelParams &params = FlowModelParams());


/**
 * @brief Estimator driven by the flow model
 *
 * The window average is scaled to an hourly flow, and the edge's static
 * cost is taken as its length in km. Edges without a static cost can't be
 * estimated.
 */
struct FlowTravelTimeEstimator: TravelTimeEstimator
{
    explicit FlowTravelTimeEstimator(const FlowModelParams &params = FlowModelParams()
                                     , unsigned intervals_per_hour = 4);

    virtual cost_t predict(const StaticEdge &edge, const VolumeWindow &window) const;

private:
    FlowModelParams m_params;
    unsigned m_intervals_per_hour;
};


} // namespace reweight
} // namespace tbrgs
