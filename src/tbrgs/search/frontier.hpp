/**
 * @file frontier.hpp
 * @brief Search entry arena and frontier disciplines
 *
 * Entries created during a search are never freed individually:
 * they live in a SearchArena, owned by the search call, and are all
 * dropped together when it returns. Frontiers only hold arena indexes.
 *
 * An entry's index is also its creation sequence number. The arena size
 * is therefore the number of created nodes.
 *
 * Paths are not stored in entries, they are rebuilt from a ParentTree.
 */

#pragma once

#include "search_common.hpp"
#include <tbrgs/model/tbrgs_types.hpp>
#include <deque>
#include <map>
#include <queue>
#include <vector>


namespace tbrgs {
namespace search {


struct SearchEntry
{
    typedef std::size_t index_t;

    node_id_t node;
    cost_t    cost;      ///< accumulated cost from origin along this entry's own chain
    cost_t    priority;  ///< ordering key. Unused by LIFO/FIFO disciplines
};


struct SearchArena: std::vector<SearchEntry>
{
    typedef SearchEntry::index_t index_t;

    index_t add(const node_id_t &node, cost_t cost, cost_t priority)
    {
        push_back(SearchEntry{node, cost, priority});
        return size() - 1;
    }
};


/**
 * @brief parent pointers of the search tree
 *
 * Every node that is not expanded yet remembers the cheapest parent it has
 * been generated from so far (earliest one on ties). Once a node is
 * expanded its link is frozen. Links always point to expanded nodes, which
 * were expanded earlier than the node itself: the tree can't loop.
 *
 * The reported path is rebuilt from these links, not from the chain of
 * the popped entry. A destination reached through a costly entry is
 * reported along the cheapest route the search has seen to it.
 */
struct ParentTree
{
    struct Link
    {
        node_id_t parent;
        cost_t    edge_cost;  ///< cost of the (parent, node) edge
        cost_t    cost;       ///< g(node) through this link
    };

    /**
     * @brief @p node was generated from @p parent. Keep the link if it's the best so far.
     * @note only offer nodes that are not expanded yet
     */
    void offer(const node_id_t &node, const node_id_t &parent, cost_t edge_cost, cost_t cost);

    /**
     * @brief rebuild the origin..goal node sequence
     * @param[out] path   origin..goal inclusive
     * @return accumulated edge cost along @p path
     */
    cost_t path_to(const node_id_t &goal, NodePath &path) const;

private:
    std::map<node_id_t, Link, model::NodeIdLess> m_links;
};


/**
 * @defgroup frontiers Frontier disciplines
 *
 * All of them expose the same interface to the search loop:
 *
 *  - push(children): insert the entries generated by one expansion. They are
 *    handed over in ascending neighbor id order.
 *  - pop(): remove the next entry per discipline.
 *  - empty()
 *
 * @{
 */

/**
 * @brief last-in-first-out
 *
 * Children are pushed in reverse, so that the smallest neighbor id is the
 * next one popped.
 */
struct LifoFrontier
{
    typedef SearchArena::index_t index_t;

    explicit LifoFrontier(const SearchArena &) {}

    void push(const std::vector<index_t> &children)
    {
        for (auto i = children.rbegin(); i != children.rend(); ++i)
        {
            m_stack.push_back(*i);
        }
    }
    index_t pop()
    {
        auto res = m_stack.back();
        m_stack.pop_back();
        return res;
    }
    bool empty() const noexcept { return m_stack.empty(); }

private:
    std::vector<index_t> m_stack;
};


/**
 * @brief first-in-first-out
 */
struct FifoFrontier
{
    typedef SearchArena::index_t index_t;

    explicit FifoFrontier(const SearchArena &) {}

    void push(const std::vector<index_t> &children)
    {
        m_queue.insert(m_queue.end(), children.begin(), children.end());
    }
    index_t pop()
    {
        auto res = m_queue.front();
        m_queue.pop_front();
        return res;
    }
    bool empty() const noexcept { return m_queue.empty(); }

private:
    std::deque<index_t> m_queue;
};


/**
 * @brief lowest priority first
 *
 * Ties are broken by ascending node id (NodeIdLess), then by creation order.
 */
struct PriorityFrontier
{
    typedef SearchArena::index_t index_t;

    explicit PriorityFrontier(const SearchArena &arena)
        : m_heap(Later{&arena})
    {}

    void push(const std::vector<index_t> &children)
    {
        for (auto c: children)
        {
            m_heap.push(c);
        }
    }
    index_t pop()
    {
        auto res = m_heap.top();
        m_heap.pop();
        return res;
    }
    bool empty() const noexcept { return m_heap.empty(); }

private:
    // "a comes out after b". std::priority_queue keeps the greatest on top,
    // so this ordering turns it into a min-heap.
    struct Later
    {
        const SearchArena *arena;

        bool operator()(index_t a, index_t b) const
        {
            auto &ea = (*arena)[a];
            auto &eb = (*arena)[b];
            if (ea.priority != eb.priority)
            {
                return ea.priority > eb.priority;
            }
            model::NodeIdLess less;
            if (less(eb.node, ea.node)) return true;
            if (less(ea.node, eb.node)) return false;
            return a > b;
        }
    };

    std::priority_queue<index_t, std::vector<index_t>, Later> m_heap;
};

/** @} */


} // namespace search
} // namespace tbrgs
