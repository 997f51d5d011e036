#pragma once

#include <tbrgs/model/tbrgs_types.hpp>
#include <cstddef>
#include <ostream>
#include <string>


namespace tbrgs {
namespace search {

using model::node_id_t;
using model::cost_t;
using model::NodePath;


/**
 * @brief Available search strategies
 *
 * They all share the same search loop (@see search_engine.hpp) and differ
 * only by frontier discipline and ordering key.
 */
typedef enum {
    STRATEGY_DFS,   ///< depth-first, stack
    STRATEGY_BFS,   ///< breadth-first, queue
    STRATEGY_GBFS,  ///< greedy best-first: h(n)
    STRATEGY_AS,    ///< A*: g(n) + h(n)
    STRATEGY_CUS1,  ///< uniform cost: g(n)
    STRATEGY_CUS2,  ///< weighted best-first: g(n) + w * h(n)
} Strategy;

constexpr Strategy all_strategies[] = {
    STRATEGY_DFS,
    STRATEGY_BFS,
    STRATEGY_GBFS,
    STRATEGY_AS,
    STRATEGY_CUS1,
    STRATEGY_CUS2,
};

/**
 * @brief canonical strategy name, as accepted on the command line
 */
const char *strategy_name(Strategy s);

/**
 * @brief parse a strategy name (case insensitive). "ASTAR" is accepted for AS.
 * @return false if @p name is not a known strategy
 */
bool strategy_from_string(const std::string &name, Strategy &out);

/**
 * @brief true if the strategy consults the heuristic
 */
bool is_heuristic_aware(Strategy s);


/**
 * @brief Outcome of a search
 *
 * The triple (goal, created, path) is what algorithm comparisons look at.
 * When no destination is reached, found is false, goal is empty and path is
 * empty: that's a normal outcome, not an error.
 */
struct SearchResult
{
    Strategy    strategy = STRATEGY_BFS;
    bool        found = false;
    node_id_t   goal;            ///< destination actually reached
    std::size_t created = 0;     ///< frontier entries ever constructed, origin included
    std::size_t expanded = 0;    ///< nodes whose neighbors were generated
    NodePath    path;            ///< origin..goal inclusive
    cost_t      cost = 0;        ///< accumulated edge cost along path

    std::string infos() const;
};

/**
 * @brief prints "goal created" and the path on the next line,
 *        or "No solution found."
 */
std::ostream& operator<< (std::ostream& stream, const SearchResult& o);


} // namespace search
} // namespace tbrgs
