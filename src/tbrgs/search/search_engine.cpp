#include "search_engine.hpp"
#include "frontier.hpp"
#include "strategies.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <tbrgs/model/tbrgs_graph.hpp>
#include <set>

namespace tbrgs {
namespace search {

using namespace model;


template<typename Frontier>
static SearchResult m_run(const Graph &graph
                          , Strategy strategy
                          , const SearchConstraints &constraints)
{
    typedef SearchArena::index_t index_t;

    SearchResult res;
    res.strategy = strategy;

    SearchArena arena;
    Frontier frontier(arena);
    ParentTree parents;
    std::set<node_id_t, NodeIdLess> expanded;
    std::vector<index_t> children;

    auto key = [&](const node_id_t &node, cost_t g)
    {
        return ordering_key(strategy, graph, node, g, constraints);
    };

    auto bail_out = [&]()
    {
        log_warning("%1%: created nodes limit (%2%) reached, search aborted"
                    , strategy_name(strategy), constraints.created_limit);
        res.created = arena.size();
        res.expanded = expanded.size();
        return res;
    };

    const auto &origin = graph.origin();
    children.push_back(arena.add(origin, 0, key(origin, 0)));
    frontier.push(children);

    while (!frontier.empty())
    {
        const auto current = frontier.pop();
        // copied on purpose: arena grows (and relocates) while children are added
        const SearchEntry entry = arena[current];

        if (graph.is_destination(entry.node))
        {
            res.found = true;
            res.goal = entry.node;
            res.cost = parents.path_to(entry.node, res.path);
            res.created = arena.size();
            res.expanded = expanded.size();
            return res;
        }

        if (!expanded.insert(entry.node).second)
        {
            log_trace("%1%: %2% already expanded, dropped", strategy_name(strategy), entry.node);
            continue;
        }

        children.clear();
        for (auto &n: graph.neighbors(entry.node))
        {
            if (constraints.created_limit && arena.size() >= constraints.created_limit)
            {
                return bail_out();
            }
            const auto g = entry.cost + n.cost;
            children.push_back(arena.add(n.node, g, key(n.node, g)));
            if (!expanded.count(n.node))
            {
                parents.offer(n.node, entry.node, n.cost, g);
            }
        }
        log_trace("%1%: expanded %2%, %3% children", strategy_name(strategy), entry.node, children.size());
        frontier.push(children);
    }

    res.created = arena.size();
    res.expanded = expanded.size();
    return res;
}


SearchResult search(const Graph &graph
                    , Strategy strategy
                    , const SearchConstraints &constraints)
{
    SearchResult res;
    res.strategy = strategy;

    try {
        constraints.check_consistency();
    } catch (const ConstraintConsistencyError &e) {
        log_error("%1%: bad search constraints: %2%", strategy_name(strategy), e.what());
        return res;
    }

    // the origin entry would be created, popped, and found to go nowhere
    res.created = 1;
    if (!graph.has_node(graph.origin()))
    {
        log_warning("%1%: origin '%2%' is not a node of the graph", strategy_name(strategy), graph.origin());
        return res;
    }
    if (graph.destinations().empty())
    {
        log_warning("%1%: graph has no destinations", strategy_name(strategy));
        return res;
    }

    try {
        switch (strategy) {
        case STRATEGY_DFS:
            res = m_run<LifoFrontier>(graph, strategy, constraints);
            break;
        case STRATEGY_BFS:
            res = m_run<FifoFrontier>(graph, strategy, constraints);
            break;
        case STRATEGY_GBFS:
        case STRATEGY_AS:
        case STRATEGY_CUS1:
        case STRATEGY_CUS2:
            res = m_run<PriorityFrontier>(graph, strategy, constraints);
            break;
        default:
            log_error("unsupported search strategy %1%", static_cast<int>(strategy));
            return res;
        }
    } catch (const std::exception &e) {
        log_error("%1%: search failed: %2%", strategy_name(strategy), e.what());
        res = SearchResult();
        res.strategy = strategy;
        return res;
    }

    log_debug("%1%", res.infos());
    return res;
}


} // namespace search
} // namespace tbrgs
