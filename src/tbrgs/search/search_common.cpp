#include "search_common.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <boost/algorithm/string.hpp>
#include <sstream>

namespace tbrgs {
namespace search {


const char *strategy_name(Strategy s)
{
    switch (s) {
    case STRATEGY_DFS:  return "DFS";
    case STRATEGY_BFS:  return "BFS";
    case STRATEGY_GBFS: return "GBFS";
    case STRATEGY_AS:   return "AS";
    case STRATEGY_CUS1: return "CUS1";
    case STRATEGY_CUS2: return "CUS2";
    default:
        break;
    }
    return "unknown";
}


bool strategy_from_string(const std::string &name, Strategy &out)
{
    const auto wanted = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
    if (wanted == "ASTAR")
    {
        out = STRATEGY_AS;
        return true;
    }
    for (auto s: all_strategies)
    {
        if (wanted == strategy_name(s))
        {
            out = s;
            return true;
        }
    }
    return false;
}


bool is_heuristic_aware(Strategy s)
{
    switch (s) {
    case STRATEGY_GBFS:
    case STRATEGY_AS:
    case STRATEGY_CUS2:
        return true;
    default:
        break;
    }
    return false;
}


std::string SearchResult::infos() const
{
    if (!found)
    {
        return strfmt("%1%: no solution, %2% nodes created, %3% expanded"
                      , strategy_name(strategy), created, expanded);
    }
    return strfmt("%1%: reached %2% with cost %3%, %4% nodes created, %5% expanded, path %6%"
                  , strategy_name(strategy), goal, cost, created, expanded
                  , model::join_path(path, " -> "));
}


std::ostream& operator<< (std::ostream& stream, const SearchResult& o)
{
    if (!o.found)
    {
        stream << "No solution found.";
        return stream;
    }
    stream << o.goal << " " << o.created << "\n"
           << model::join_path(o.path, " ");
    return stream;
}


} // namespace search
} // namespace tbrgs
