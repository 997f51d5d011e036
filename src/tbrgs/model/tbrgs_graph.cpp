#include "tbrgs_graph.hpp"
#include "tbrgs_graph_distance.hpp"
#include "../commons/tbrgs_log.hpp"
#include <cmath>


namespace tbrgs {
namespace model {

using namespace idx;


static void m_check_cost(const node_id_t &from, const node_id_t &to, cost_t cost)
{
    if (!std::isfinite(cost) || cost < 0)
    {
        throw bad_edge_cost(strfmt("invalid cost %1% for edge (%2%, %3%)", cost, from, to));
    }
}


Graph::Graph(const NodeTable &nodes_
             , const EdgeList &edges_
             , const node_id_t &origin_
             , const DestinationSet &destinations_)
    : m_nodes(nodes_)
    , m_origin(origin_)
    , m_destinations(destinations_)
{
    for (auto &e: edges_)
    {
        set_edge_cost(e.from, e.to, e.cost);
    }

    if (!check_consistency(true))
    {
        log_warning("graph references nodes without coordinates, they will be placed at (0,0)");
    }
    log_debug("graph created: %1% nodes, %2% edges, origin %3%, %4% destinations"
              , m_nodes.size()
              , m_edges.size()
              , m_origin
              , m_destinations.size());
}


Graph::NeighborList Graph::neighbors(const node_id_t &node) const
{
    NeighborList res;
    auto &idx = m_edges.get<by_src_and_dest>();
    auto range = idx.equal_range(boost::make_tuple(node));
    for (auto i = range.first; i != range.second; ++i)
    {
        res.push_back(Neighbor{i->to, i->cost});
    }
    return res;
}


bool Graph::is_destination(const node_id_t &node) const
{
    return m_destinations.count(node) != 0;
}


Coordinates Graph::coordinates(const node_id_t &node) const
{
    auto i = m_nodes.find(node);
    if (i == m_nodes.end())
    {
        return Coordinates();
    }
    return i->second;
}


cost_t Graph::heuristic(const node_id_t &node) const
{
    return min_distance_to_destinations(*this, node);
}


cost_t Graph::heuristic(const node_id_t &node, const node_id_t &target) const
{
    return straight_line_distance(*this, node, target);
}


void Graph::set_edge_cost(const node_id_t &from, const node_id_t &to, cost_t cost)
{
    m_check_cost(from, to, cost);
    if (m_edges.upsert(from, to, cost))
    {
        log_trace("edge (%1%, %2%) added, cost %3%", from, to, cost);
    }
    else
    {
        log_trace("edge (%1%, %2%) cost set to %3%", from, to, cost);
    }
}


const Edge *Graph::lookup_edge(const node_id_t &from, const node_id_t &to) const
{
    return m_edges.lookup(from, to);
}


bool Graph::has_node(const node_id_t &node) const
{
    return m_nodes.count(node) != 0;
}


static bool m_raise_maybe(bool no_except, const std::string &msg)
{
    if (no_except)
    {
        log_warning("%1%", msg);
        return false;
    }
    throw GraphConsistencyError(msg);
}


bool Graph::check_consistency(bool no_except) const
{
    bool res = true;
    if (!has_node(m_origin))
    {
        res = m_raise_maybe(no_except, strfmt("origin node '%1%' is not in the node table", m_origin));
    }
    for (auto &d: m_destinations)
    {
        if (!has_node(d))
        {
            res = m_raise_maybe(no_except, strfmt("destination node '%1%' is not in the node table", d));
        }
    }
    return res;
}


} // namespace model
} // namespace tbrgs
