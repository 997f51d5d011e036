/**
 * @file strategies.hpp
 * @brief Ordering keys of the six search strategies
 */

#pragma once

#include "search_common.hpp"
#include <tbrgs/model/tbrgs_model_fwd.hpp>

namespace tbrgs {
namespace search {


/**
 * @brief frontier ordering key of a newly created entry
 *
 * @param strategy     which strategy is ordering the frontier
 * @param graph        searched graph (heuristic source)
 * @param node         node of the new entry
 * @param accumulated  path cost from origin to @p node, g(n)
 * @param constraints  search tunables (CUS2 weight)
 *
 * DFS and BFS don't order by key. They get 0.
 */
cost_t ordering_key(Strategy strategy
                    , const model::Graph &graph
                    , const node_id_t &node
                    , cost_t accumulated
                    , const model::SearchConstraints &constraints);


} // namespace search
} // namespace tbrgs
