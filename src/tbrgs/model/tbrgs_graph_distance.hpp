/**
 * @file tbrgs_graph_distance.hpp
 * @brief Heuristic distance estimation between graph nodes
 */

#pragma once

#include "tbrgs_types.hpp"

namespace tbrgs {
namespace model {


/**
 * @brief Euclidean distance between the coordinates of two nodes
 *
 * Unknown nodes sit at (0,0).
 */
cost_t straight_line_distance(const Graph &graph
                              , const node_id_t &from
                              , const node_id_t &to);

/**
 * @brief Euclidean distance from @p from to its nearest destination
 *
 * This is the estimate used by the informed strategies, which do not
 * commit to a single target up front.
 *
 * Returns unreachable_distance when the graph has no destinations. That's a
 * caller bug, and it is logged as such.
 */
cost_t min_distance_to_destinations(const Graph &graph
                                    , const node_id_t &from);


} // namespace model
} // namespace tbrgs
