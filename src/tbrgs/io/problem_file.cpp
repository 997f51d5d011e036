#include "problem_file.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <boost/algorithm/string.hpp>
#include <cmath>

namespace tbrgs {
namespace io {

using namespace model;


namespace {

typedef enum {
    section_none,
    section_nodes,
    section_edges,
    section_origin,
    section_destinations,
} section_t;

struct Reader
{
    const std::string &source;
    std::size_t lineno = 0;
    section_t section = section_none;
    Problem res;

    explicit Reader(const std::string &source_): source(source_) {}

    [[noreturn]] void fail(const std::string &msg) const
    {
        throw ParseError(source, lineno, msg);
    }

    bool switch_section(const std::string &line)
    {
        if (line.empty() || line.back() != ':')
        {
            return false;
        }
        const auto name = boost::algorithm::to_lower_copy(
                    boost::algorithm::trim_copy(line.substr(0, line.size() - 1)));
        if      (name == "nodes")        section = section_nodes;
        else if (name == "edges")        section = section_edges;
        else if (name == "origin")       section = section_origin;
        else if (name == "destinations") section = section_destinations;
        else return false;
        return true;
    }

    void read_node(const std::string &line)
    {
        const auto sep = line.find(':');
        if (sep == std::string::npos)
        {
            fail("node line must look like 'id: (x,y)'");
        }
        const auto id = boost::algorithm::trim_copy(line.substr(0, sep));
        const auto pos = boost::algorithm::trim_copy(line.substr(sep + 1));
        if (id.empty())
        {
            fail("empty node id");
        }
        if (pos.size() < 2 || pos.front() != '(' || pos.back() != ')')
        {
            fail(strfmt("bad coordinates for node %1%: '%2%'", id, pos));
        }
        std::vector<std::string> xy;
        boost::algorithm::split(xy, pos.substr(1, pos.size() - 2), boost::algorithm::is_any_of(","));
        if (xy.size() != 2)
        {
            fail(strfmt("node %1% needs exactly two coordinates", id));
        }
        const Coordinates c(parse_number(xy[0], source, lineno, "x coordinate")
                            , parse_number(xy[1], source, lineno, "y coordinate"));
        if (!res.nodes.emplace(id, c).second)
        {
            fail(strfmt("node %1% declared twice", id));
        }
    }

    void read_edge(const std::string &line)
    {
        const auto close = line.find(')');
        if (line.front() != '(' || close == std::string::npos)
        {
            fail("edge line must look like '(from,to): cost'");
        }
        std::vector<std::string> ends;
        boost::algorithm::split(ends, line.substr(1, close - 1), boost::algorithm::is_any_of(","));
        if (ends.size() != 2)
        {
            fail("edge needs exactly two end nodes");
        }
        const auto from = boost::algorithm::trim_copy(ends[0]);
        const auto to = boost::algorithm::trim_copy(ends[1]);
        if (from.empty() || to.empty())
        {
            fail("empty edge end node");
        }
        const auto rest = boost::algorithm::trim_copy(line.substr(close + 1));
        if (rest.empty() || rest.front() != ':')
        {
            fail(strfmt("missing cost for edge (%1%,%2%)", from, to));
        }
        const auto cost = parse_number(rest.substr(1), source, lineno, "edge cost");
        if (!std::isfinite(cost) || cost < 0)
        {
            fail(strfmt("edge (%1%,%2%) has invalid cost %3%", from, to, cost));
        }
        res.edges.emplace_back(from, to, cost);
    }

    void read_origin(const std::string &line)
    {
        if (!res.origin.empty())
        {
            fail(strfmt("more than one origin ('%1%' and '%2%')", res.origin, line));
        }
        res.origin = line;
    }

    void read_destinations(const std::string &line)
    {
        std::vector<std::string> ids;
        boost::algorithm::split(ids, line, boost::algorithm::is_any_of(";,"));
        for (auto &i: ids)
        {
            boost::algorithm::trim(i);
            if (!i.empty())
            {
                res.destinations.insert(i);
            }
        }
    }

    void read_line(std::string line)
    {
        ++lineno;
        boost::algorithm::trim(line);
        if (line.empty() || switch_section(line))
        {
            return;
        }
        switch (section) {
        case section_nodes:        read_node(line); break;
        case section_edges:        read_edge(line); break;
        case section_origin:       read_origin(line); break;
        case section_destinations: read_destinations(line); break;
        default:
            fail(strfmt("'%1%' found outside of any section", line));
        }
    }
};

} // namespace


Problem parse_problem(std::istream &in, const std::string &source)
{
    Reader reader(source);
    std::string line;
    while (std::getline(in, line))
    {
        reader.read_line(line);
    }
    if (reader.res.origin.empty())
    {
        throw ParseError(source, 0, "missing Origin section");
    }
    log_debug("%1%: %2% nodes, %3% edges, origin %4%, %5% destinations"
              , source
              , reader.res.nodes.size()
              , reader.res.edges.size()
              , reader.res.origin
              , reader.res.destinations.size());
    return reader.res;
}


Problem load_problem_file(const std::string &path)
{
    std::ifstream in;
    open_input(in, path);
    return parse_problem(in, path);
}


Graph Problem::make_graph() const
{
    node_id_t checked_origin = origin;
    if (!nodes.count(origin))
    {
        log_warning("origin node '%1%' not found in graph", origin);
        checked_origin.clear();
    }

    Graph::DestinationSet checked_destinations;
    for (auto &d: destinations)
    {
        if (!nodes.count(d))
        {
            log_warning("destination node '%1%' not found in graph", d);
            continue;
        }
        checked_destinations.insert(d);
    }

    return Graph(nodes, edges, checked_origin, checked_destinations);
}


} // namespace io
} // namespace tbrgs
