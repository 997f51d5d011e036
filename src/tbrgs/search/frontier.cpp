#include "frontier.hpp"
#include <algorithm>

namespace tbrgs {
namespace search {


void ParentTree::offer(const node_id_t &node, const node_id_t &parent, cost_t edge_cost, cost_t cost)
{
    auto i = m_links.find(node);
    if (i == m_links.end())
    {
        m_links.emplace(node, Link{parent, edge_cost, cost});
        return;
    }
    if (cost < i->second.cost)
    {
        i->second = Link{parent, edge_cost, cost};
    }
}


cost_t ParentTree::path_to(const node_id_t &goal, NodePath &path) const
{
    cost_t cost = 0;
    path.clear();
    path.push_back(goal);
    for (auto i = m_links.find(goal); i != m_links.end(); i = m_links.find(i->second.parent))
    {
        cost += i->second.edge_cost;
        path.push_back(i->second.parent);
    }
    std::reverse(path.begin(), path.end());
    return cost;
}


} // namespace search
} // namespace tbrgs
