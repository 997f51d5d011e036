/**
 * @file csv_loader.hpp
 * @brief CSV inputs of the traffic routing pipeline
 *
 * Three tables are consumed, columns are found by (case insensitive) header
 * name, extra columns are ignored:
 *
 *  - edges:   from, to, distance_km   (distance may be left empty)
 *  - coords:  location, longitude, latitude
 *  - volumes: Location, SiteID, Volume, Datetime
 *
 * Fields may be double-quoted. Location names are normalized
 * (@see model::normalize_node_name).
 */

#pragma once

#include "io_common.hpp"
#include <tbrgs/model/tbrgs_graph.hpp>
#include <tbrgs/reweight/estimators.hpp>
#include <istream>


namespace tbrgs {
namespace io {

using model::Graph;
using reweight::StaticEdgeList;
using reweight::VolumeIndex;


/**
 * @throws ParseError on missing columns or malformed numbers
 */
StaticEdgeList read_edges_csv(std::istream &in, const std::string &source = "<edges>");

/**
 * @return location -> (longitude, latitude)
 * @throws ParseError
 */
Graph::NodeTable read_coords_csv(std::istream &in, const std::string &source = "<coords>");

/**
 * @brief append the observations found in @p in to @p volumes
 * @return number of records added
 * @throws ParseError
 */
std::size_t read_volumes_csv(std::istream &in, VolumeIndex &volumes, const std::string &source = "<volumes>");

StaticEdgeList load_edges_csv(const std::string &path);
Graph::NodeTable load_coords_csv(const std::string &path);
std::size_t load_volumes_csv(const std::string &path, VolumeIndex &volumes);


/**
 * @brief assemble the road network graph
 *
 * Nodes are the ends of @p edges. Coordinates come from @p coords, (0,0)
 * when missing. Edges without a static distance are left out of the graph
 * until a reweighting pass predicts a cost for them.
 *
 * Origin and destinations are normalized. Those that are not graph nodes are
 * warned about and dropped.
 */
Graph make_route_graph(const StaticEdgeList &edges
                       , const Graph::NodeTable &coords
                       , const std::string &origin
                       , const std::vector<std::string> &destinations);


} // namespace io
} // namespace tbrgs
