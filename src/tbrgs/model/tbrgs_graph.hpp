/**
 * @file tbrgs_graph.hpp
 * @brief Route finding graph: nodes, directed weighted edges,
 *        one origin and a set of destinations.
 */

#pragma once

#include "tbrgs_types.hpp"
#include "tbrgs_edge_idx.hpp"
#include <map>
#include <set>
#include <stdexcept>


namespace tbrgs {
namespace model {

struct GraphConsistencyError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct bad_edge_cost: std::runtime_error
{
    using std::runtime_error::runtime_error;
};


/**
 * @brief Graph of a route finding problem
 *
 * Topology (node table, destination set, origin) is fixed at construction.
 * Edge costs are the only mutable state, and the only way to change them
 * is set_edge_cost(). That's what the reweighting pass uses before the
 * next search.
 *
 * A Graph is copyable. Callers that want to serve concurrent searches
 * give each one its own copy: there is no internal locking.
 */
struct Graph
{
    typedef std::map<node_id_t, Coordinates, NodeIdLess> NodeTable;
    typedef std::set<node_id_t, NodeIdLess> DestinationSet;

    struct Neighbor
    {
        node_id_t node;
        cost_t    cost;
    };
    typedef std::vector<Neighbor> NeighborList;

    Graph() = default;

    /**
     * @param nodes_         node coordinate table
     * @param edges_         edge list. Repeated (from, to) pairs overwrite earlier costs.
     * @param origin_        start node
     * @param destinations_  candidate goal nodes
     *
     * Origin and destinations missing from @p nodes_ are tolerated (their
     * coordinates read as (0,0)), but flagged with a warning.
     *
     * @throws bad_edge_cost on negative or non-finite costs
     */
    Graph(const NodeTable &nodes_
          , const EdgeList &edges_
          , const node_id_t &origin_
          , const DestinationSet &destinations_);

    /**
     * @brief all edges leaving @p node, sorted by neighbor id (NodeIdLess).
     *
     * This order is the tie-break rule every search strategy relies on.
     */
    NeighborList neighbors(const node_id_t &node) const;

    bool is_destination(const node_id_t &node) const;

    /**
     * @brief node position. (0,0) for unknown nodes, never fails.
     */
    Coordinates coordinates(const node_id_t &node) const;

    /**
     * @brief straight line distance from @p node to the nearest destination
     * @return unreachable_distance if there are no destinations (logged as error)
     */
    cost_t heuristic(const node_id_t &node) const;

    /**
     * @brief straight line distance from @p node to @p target
     */
    cost_t heuristic(const node_id_t &node, const node_id_t &target) const;

    /**
     * @brief insert the edge (from, to), or overwrite its cost
     * @throws bad_edge_cost on negative or non-finite cost
     */
    void set_edge_cost(const node_id_t &from, const node_id_t &to, cost_t cost);

    /**
     * @brief fetch a known edge
     * @return reference to the edge, if existing. Otherwise nullptr
     */
    const Edge *lookup_edge(const node_id_t &from, const node_id_t &to) const;

    /**
     * @brief true if @p node has an entry in the node table
     */
    bool has_node(const node_id_t &node) const;

    /**
     * @brief checks that origin and destinations are known nodes
     * @param no_except when true, report by return value instead of throwing
     * @throws GraphConsistencyError
     */
    bool check_consistency(bool no_except=false) const;

    const node_id_t &origin() const noexcept { return m_origin; }
    const DestinationSet &destinations() const noexcept { return m_destinations; }
    const NodeTable &nodes() const noexcept { return m_nodes; }
    const idx::EdgeIndex &edges() const noexcept { return m_edges; }

    std::size_t nodes_count() const noexcept { return m_nodes.size(); }
    std::size_t edges_count() const noexcept { return m_edges.size(); }

private:
    NodeTable      m_nodes;
    idx::EdgeIndex m_edges;
    node_id_t      m_origin;
    DestinationSet m_destinations;
};


} // namespace model
} // namespace tbrgs
