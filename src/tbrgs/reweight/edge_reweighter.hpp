/**
 * @file edge_reweighter.hpp
 * @brief Rewrites graph edge costs from predicted travel times
 */

#pragma once

#include "estimators.hpp"
#include <tbrgs/model/tbrgs_constraints.hpp>
#include <tbrgs/model/tbrgs_graph.hpp>


namespace tbrgs {
namespace reweight {

using model::Graph;
using model::ReweightConstraints;


/**
 * @brief What happened to the edges of one reweighting pass
 *
 * Every edge falls in exactly one bucket, so that
 * updated + fallback + skipped == total.
 */
struct ReweightReport
{
    std::size_t total = 0;
    std::size_t updated = 0;   ///< cost set from a valid prediction
    std::size_t fallback = 0;  ///< cost reset to the static cost
    std::size_t skipped = 0;   ///< no prediction and no valid static cost: left untouched

    std::string infos() const;
};


/**
 * @brief Predict a new cost for every edge of @p edges and write it into @p graph
 *
 * For each edge (from, to):
 *
 *  - if @p volumes holds at least constraints.lookback observations for
 *    @p from, the most recent ones are handed to @p estimator. A finite,
 *    non negative prediction becomes the new cost.
 *  - short or missing history, a throwing estimator, or a negative or
 *    non-finite prediction, fall back to the static cost.
 *  - edges needing a fallback but carrying no static cost, or a negative
 *    or non-finite one, are skipped.
 *
 * Only edge costs are touched: nodes, origin and destinations never change.
 * A failing prediction never aborts the pass.
 *
 * @throws ConstraintConsistencyError if @p constraints are inconsistent
 */
ReweightReport reweight_edges(Graph &graph
                              , const StaticEdgeList &edges
                              , const VolumeIndex &volumes
                              , const TravelTimeEstimator &estimator
                              , const ReweightConstraints &constraints = ReweightConstraints());


} // namespace reweight
} // namespace tbrgs
