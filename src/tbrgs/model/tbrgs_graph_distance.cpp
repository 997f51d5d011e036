#include "tbrgs_graph_distance.hpp"
#include "tbrgs_graph.hpp"
#include "../commons/tbrgs_log.hpp"
#include <algorithm>

namespace tbrgs {
namespace model {


cost_t straight_line_distance(const Graph &graph
                              , const node_id_t &from
                              , const node_id_t &to)
{
    return euclidean_distance(graph.coordinates(from), graph.coordinates(to));
}


cost_t min_distance_to_destinations(const Graph &graph
                                    , const node_id_t &from)
{
    auto &destinations = graph.destinations();
    if (destinations.empty())
    {
        log_error("heuristic requested for node '%1%' on a graph with no destinations", from);
        return unreachable_distance;
    }

    const auto position = graph.coordinates(from);
    auto best = unreachable_distance;
    for (auto &d: destinations)
    {
        best = std::min(best, euclidean_distance(position, graph.coordinates(d)));
    }
    return best;
}


} // namespace model
} // namespace tbrgs
