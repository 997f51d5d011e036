/**
 * @file tbrgs_edge_idx.hpp
 * @brief Lookup index for directed edges
 *
 * The machinery implemented here is based around boost::multi_index.
 * multi_index is great but ostensibly tortuous to use and read,
 * which is the reason I've partitioned this code here.
 */

#pragma once

#include "tbrgs_types.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>


namespace tbrgs {
namespace model {

/**
 * @brief A directed edge and its current cost
 *
 * (from, to) is the key. The cost is the only mutable part and is not
 * indexed, so it can be rewritten in place.
 */
struct Edge
{
    node_id_t from;
    node_id_t to;
    cost_t    cost;

    Edge(const node_id_t &from_, const node_id_t &to_, cost_t cost_)
        : from(from_)
        , to(to_)
        , cost(cost_)
    {}
};

typedef std::vector<Edge> EdgeList;


namespace idx {

using namespace boost::multi_index;

/**
 * @defgroup indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_src_and_dest {};
/** @} */


/**
 * @brief Base multi_index implementation
 *
 * Edges can be looked up:
 *
 *  - by_src_and_dest, which is unique: one cost per ordered pair.
 *    A partial lookup on the source alone yields all outgoing edges,
 *    already sorted by destination in NodeIdLess order.
 */
typedef multi_index_container<
  Edge,
  indexed_by<
          ordered_unique<     tag<by_src_and_dest>,  composite_key<Edge,
                 member<Edge, node_id_t, &Edge::from>
               , member<Edge, node_id_t, &Edge::to>                       >
             , composite_key_compare<NodeIdLess, NodeIdLess>
          >
  >
> EdgeIndex_base;


/**
 * @brief Public EdgeIndex type
 */
struct EdgeIndex: EdgeIndex_base
{
    using EdgeIndex_base::EdgeIndex_base;

    /**
     * @brief lookup an edge by its (from, to) key
     * @return matching edge pointer or null
     */
    const Edge *lookup(const node_id_t &from, const node_id_t &to) const noexcept
    {
        auto &idx = get<by_src_and_dest>();
        auto i = idx.find(boost::make_tuple(from, to));
        if (i == idx.end())
        {
            return nullptr;
        }
        return &(*i);
    }

    /**
     * @brief insert the edge, or overwrite the cost of the existing one
     * @return true if a new edge was inserted
     */
    bool upsert(const node_id_t &from, const node_id_t &to, cost_t cost)
    {
        auto &idx = get<by_src_and_dest>();
        auto i = idx.find(boost::make_tuple(from, to));
        if (i == idx.end())
        {
            idx.emplace(from, to, cost);
            return true;
        }
        idx.modify(i, [cost](Edge &e) { e.cost = cost; });
        return false;
    }
};


} // namespace idx
} // namespace model
} // namespace tbrgs
