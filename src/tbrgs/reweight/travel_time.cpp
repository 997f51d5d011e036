#include "travel_time.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <tbrgs/model/tbrgs_constraints.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace tbrgs {
namespace reweight {


void FlowModelParams::check_consistency() const
{
    if (!(a > 0) || !(b > 0))
    {
        throw model::ConstraintConsistencyError("flow model coefficients must be > 0");
    }
    if (!(speed_limit > 0))
    {
        throw model::ConstraintConsistencyError("speed_limit must be > 0");
    }
    if (capacity_flow < 0 || delay_s < 0)
    {
        throw model::ConstraintConsistencyError("capacity_flow and delay_s can't be negative");
    }
}


double flow_to_time(double flow, double distance_km, const FlowModelParams &params)
{
    double speed = params.speed_limit;
    if (flow > params.capacity_flow)
    {
        const auto disc = params.b * params.b - 4 * params.a * flow;
        const auto sqrt_disc = std::sqrt(std::max(disc, 0.0));
        speed = std::min((params.b - sqrt_disc) / (2 * params.a)
                         , (params.b + sqrt_disc) / (2 * params.a));
    }
    return (distance_km / speed) * 3600.0 + params.delay_s;
}


FlowTravelTimeEstimator::FlowTravelTimeEstimator(const FlowModelParams &params
                                                 , unsigned intervals_per_hour)
    : m_params(params)
    , m_intervals_per_hour(intervals_per_hour)
{
    m_params.check_consistency();
    if (m_intervals_per_hour == 0)
    {
        throw model::ConstraintConsistencyError("intervals_per_hour must be >= 1");
    }
}


cost_t FlowTravelTimeEstimator::predict(const StaticEdge &edge, const VolumeWindow &window) const
{
    if (!edge.has_static_cost)
    {
        throw estimation_error(strfmt("edge (%1%, %2%) has no length", edge.from, edge.to));
    }
    if (window.empty())
    {
        throw estimation_error("empty volume window");
    }
    const auto mean = std::accumulate(window.begin(), window.end(), 0.0) / window.size();
    return flow_to_time(mean * m_intervals_per_hour, edge.static_cost, m_params);
}


} // namespace reweight
} // namespace tbrgs
