#include "strategies.hpp"
#include <tbrgs/model/tbrgs_graph.hpp>
#include <tbrgs/model/tbrgs_constraints.hpp>

namespace tbrgs {
namespace search {

using model::Graph;
using model::SearchConstraints;


static cost_t m_key_uninformed(const Graph &, const node_id_t &, cost_t, const SearchConstraints &)
{
    return 0;
}

// greedy best-first: h(n)
static cost_t m_key_gbfs(const Graph &graph, const node_id_t &node, cost_t, const SearchConstraints &)
{
    return graph.heuristic(node);
}

// A*: g(n) + h(n)
static cost_t m_key_astar(const Graph &graph, const node_id_t &node, cost_t g, const SearchConstraints &)
{
    return g + graph.heuristic(node);
}

// uniform cost: g(n)
static cost_t m_key_cus1(const Graph &, const node_id_t &, cost_t g, const SearchConstraints &)
{
    return g;
}

// weighted best-first: g(n) + w * h(n)
static cost_t m_key_cus2(const Graph &graph, const node_id_t &node, cost_t g, const SearchConstraints &constraints)
{
    return g + constraints.cus2_weight * graph.heuristic(node);
}


cost_t ordering_key(Strategy strategy
                    , const Graph &graph
                    , const node_id_t &node
                    , cost_t accumulated
                    , const SearchConstraints &constraints)
{
    switch (strategy) {
    case STRATEGY_GBFS: return m_key_gbfs(graph, node, accumulated, constraints);
    case STRATEGY_AS:   return m_key_astar(graph, node, accumulated, constraints);
    case STRATEGY_CUS1: return m_key_cus1(graph, node, accumulated, constraints);
    case STRATEGY_CUS2: return m_key_cus2(graph, node, accumulated, constraints);
    case STRATEGY_DFS:
    case STRATEGY_BFS:
    default:
        break;
    }
    return m_key_uninformed(graph, node, accumulated, constraints);
}


} // namespace search
} // namespace tbrgs
