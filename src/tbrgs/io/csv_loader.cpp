#include "csv_loader.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>
#include <algorithm>
#include <cmath>
#include <functional>

namespace tbrgs {
namespace io {

using namespace model;
using reweight::StaticEdge;
using reweight::VolumeRecord;
using reweight::site_id_t;


namespace {

typedef std::vector<std::string> Row;
typedef boost::tokenizer<boost::escaped_list_separator<char>> Tokenizer;


Row m_split(const std::string &line, const std::string &source, std::size_t lineno)
{
    Row res;
    try {
        Tokenizer tok(line);
        for (auto &field: tok)
        {
            res.push_back(boost::algorithm::trim_copy(field));
        }
    } catch (const boost::escaped_list_error &e) {
        throw ParseError(source, lineno, e.what());
    }
    return res;
}


/**
 * @brief reads the header, then feeds every non-blank row to @p on_row,
 *        reordered as @p columns
 */
void m_read_csv(std::istream &in
                , const std::string &source
                , const std::vector<std::string> &columns
                , const std::function<void(const Row &, std::size_t)> &on_row)
{
    std::string line;
    std::size_t lineno = 0;
    if (!std::getline(in, line))
    {
        throw ParseError(source, 0, "empty input, a header is expected");
    }
    ++lineno;
    boost::algorithm::trim(line);

    const auto header = m_split(line, source, lineno);
    std::vector<std::size_t> positions;
    for (auto &c: columns)
    {
        auto i = std::find_if(header.begin(), header.end(), [&](const std::string &h)
        {
            return boost::algorithm::iequals(h, c);
        });
        if (i == header.end())
        {
            throw ParseError(source, lineno, strfmt("missing column '%1%'", c));
        }
        positions.push_back(i - header.begin());
    }

    Row picked(columns.size());
    while (std::getline(in, line))
    {
        ++lineno;
        boost::algorithm::trim(line);
        if (line.empty())
        {
            continue;
        }
        const auto row = m_split(line, source, lineno);
        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            if (positions[i] >= row.size())
            {
                throw ParseError(source, lineno, strfmt("missing value for '%1%'", columns[i]));
            }
            picked[i] = row[positions[i]];
        }
        on_row(picked, lineno);
    }
}

} // namespace


StaticEdgeList read_edges_csv(std::istream &in, const std::string &source)
{
    StaticEdgeList res;
    m_read_csv(in, source, {"from", "to", "distance_km"}, [&](const Row &row, std::size_t lineno)
    {
        const auto from = normalize_node_name(row[0]);
        const auto to = normalize_node_name(row[1]);
        if (from.empty() || to.empty())
        {
            throw ParseError(source, lineno, "empty edge end node");
        }
        if (row[2].empty())
        {
            res.emplace_back(from, to);
            return;
        }
        const auto distance = parse_number(row[2], source, lineno, "distance_km");
        if (!std::isfinite(distance) || distance < 0)
        {
            throw ParseError(source, lineno, strfmt("invalid distance %1%", distance));
        }
        res.emplace_back(from, to, distance);
    });
    log_debug("%1%: %2% edges", source, res.size());
    return res;
}


Graph::NodeTable read_coords_csv(std::istream &in, const std::string &source)
{
    Graph::NodeTable res;
    m_read_csv(in, source, {"location", "longitude", "latitude"}, [&](const Row &row, std::size_t lineno)
    {
        const Coordinates c(parse_number(row[1], source, lineno, "longitude")
                            , parse_number(row[2], source, lineno, "latitude"));
        res[normalize_node_name(row[0])] = c;
    });
    log_debug("%1%: %2% locations", source, res.size());
    return res;
}


std::size_t read_volumes_csv(std::istream &in, VolumeIndex &volumes, const std::string &source)
{
    std::size_t count = 0;
    m_read_csv(in, source, {"Location", "SiteID", "Volume", "Datetime"}, [&](const Row &row, std::size_t lineno)
    {
        site_id_t site;
        try {
            site = boost::lexical_cast<site_id_t>(row[1]);
        } catch (const boost::bad_lexical_cast &) {
            throw ParseError(source, lineno, strfmt("bad SiteID: '%1%'", row[1]));
        }
        reweight::timestamp_t when;
        try {
            when = reweight::parse_timestamp(row[3]);
        } catch (const reweight::bad_timestamp &) {
            throw ParseError(source, lineno, strfmt("bad Datetime: '%1%'", row[3]));
        }
        volumes.add(VolumeRecord(row[0], site, parse_number(row[2], source, lineno, "Volume"), when));
        ++count;
    });
    log_debug("%1%: %2% volume records", source, count);
    return count;
}


StaticEdgeList load_edges_csv(const std::string &path)
{
    std::ifstream in;
    open_input(in, path);
    return read_edges_csv(in, path);
}


Graph::NodeTable load_coords_csv(const std::string &path)
{
    std::ifstream in;
    open_input(in, path);
    return read_coords_csv(in, path);
}


std::size_t load_volumes_csv(const std::string &path, VolumeIndex &volumes)
{
    std::ifstream in;
    open_input(in, path);
    return read_volumes_csv(in, volumes, path);
}


Graph make_route_graph(const StaticEdgeList &edges
                       , const Graph::NodeTable &coords
                       , const std::string &origin
                       , const std::vector<std::string> &destinations)
{
    Graph::NodeTable nodes;
    EdgeList weighted;
    for (auto &e: edges)
    {
        for (auto &n: {e.from, e.to})
        {
            auto c = coords.find(n);
            nodes[n] = c == coords.end() ? Coordinates() : c->second;
        }
        if (e.has_static_cost)
        {
            weighted.emplace_back(e.from, e.to, e.static_cost);
        }
        else
        {
            log_debug("edge (%1%, %2%) has no distance, left unweighted", e.from, e.to);
        }
    }

    auto checked_origin = normalize_node_name(origin);
    if (!nodes.count(checked_origin))
    {
        log_warning("origin node '%1%' not found in graph", checked_origin);
        checked_origin.clear();
    }

    Graph::DestinationSet checked_destinations;
    for (auto &d: destinations)
    {
        const auto name = normalize_node_name(d);
        if (!nodes.count(name))
        {
            log_warning("destination node '%1%' not found in graph", name);
            continue;
        }
        checked_destinations.insert(name);
    }

    return Graph(nodes, weighted, checked_origin, checked_destinations);
}


} // namespace io
} // namespace tbrgs
