/**
 * @file estimators.hpp
 * @brief Travel time estimators consumed by the edge reweighter
 */

#pragma once

#include "volume_idx.hpp"
#include <functional>
#include <stdexcept>


namespace tbrgs {
namespace reweight {

using model::cost_t;


struct estimation_error: std::runtime_error
{
    using std::runtime_error::runtime_error;
};


/**
 * @brief An edge of the static road network, before reweighting
 *
 * The static cost (distance) is optional: some edges are only known
 * to exist, and can only be weighted by a prediction.
 */
struct StaticEdge
{
    node_id_t from;
    node_id_t to;
    bool      has_static_cost = false;
    cost_t    static_cost = 0;

    StaticEdge() = default;
    StaticEdge(const node_id_t &from_, const node_id_t &to_)
        : from(from_), to(to_) {}
    StaticEdge(const node_id_t &from_, const node_id_t &to_, cost_t static_cost_)
        : from(from_), to(to_), has_static_cost(true), static_cost(static_cost_) {}
};

typedef std::vector<StaticEdge> StaticEdgeList;


/**
 * @brief The Estimator turns recent traffic volumes into an edge cost
 *
 * Implementations may throw (anything derived from std::exception) or
 * return garbage: the reweighter validates every prediction and falls
 * back to the static cost.
 */
struct TravelTimeEstimator
{
    virtual ~TravelTimeEstimator() {}

    /**
     * @param edge    the edge being reweighted
     * @param window  most recent volumes observed at edge.from, oldest first
     */
    virtual cost_t predict(const StaticEdge &edge, const VolumeWindow &window) const = 0;
};


/**
 * @brief Adapts a pure function of the volume window (typically a trained model)
 */
struct FunctionEstimator: TravelTimeEstimator
{
    typedef std::function<double(const VolumeWindow &)> predictor_t;

    explicit FunctionEstimator(predictor_t predictor);

    virtual cost_t predict(const StaticEdge &edge, const VolumeWindow &window) const;

private:
    predictor_t m_predictor;
};


} // namespace reweight
} // namespace tbrgs
