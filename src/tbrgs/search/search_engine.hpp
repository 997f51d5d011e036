/**
 * @file search_engine.hpp
 * @brief Route search entry point
 *
 * One search loop serves all strategies:
 *
 *  1. the frontier starts with the origin entry. Created counter = 1
 *  2. pop an entry per frontier discipline
 *  3. if it is a destination, we're done. Destinations are recognized at
 *     pop time, not when they're generated
 *  4. if its node was already expanded, drop it. Otherwise expand it:
 *     one new entry per neighbor (ascending id order), each counted as
 *     created even if later dropped as a duplicate
 *  5. frontier exhausted: no solution
 *
 * The reported path follows the search tree's parent links
 * (@see ParentTree), its cost is the sum of its edges.
 *
 * The created counter semantics are the ones used to compare algorithms,
 * don't "optimize" duplicate entries away.
 */

#pragma once

#include "search_common.hpp"
#include <tbrgs/model/tbrgs_constraints.hpp>

namespace tbrgs {
namespace search {


/**
 * @brief run @p strategy on @p graph
 *
 * Never throws. Unknown origin, empty destination set, or a constraint
 * violation yield an unsuccessful result (and a log record).
 */
SearchResult search(const model::Graph &graph
                    , Strategy strategy
                    , const model::SearchConstraints &constraints = model::SearchConstraints());


} // namespace search
} // namespace tbrgs
