/**
 * @file problem_file.hpp
 * @brief Route finding problem files
 *
 * Format, one section per header, whitespace tolerant, blank lines ignored:
 *
 *     Nodes:
 *     1: (4,1)
 *     2: (2,2)
 *     Edges:
 *     (2,1): 4
 *     (1,2): 4
 *     Origin:
 *     2
 *     Destinations:
 *     5; 4
 *
 * Section headers are case insensitive.
 */

#pragma once

#include "io_common.hpp"
#include <tbrgs/model/tbrgs_graph.hpp>
#include <istream>


namespace tbrgs {
namespace io {

using model::Graph;


/**
 * @brief Problem file contents, as read
 */
struct Problem
{
    Graph::NodeTable      nodes;
    model::EdgeList       edges;
    node_id_t             origin;
    Graph::DestinationSet destinations;

    /**
     * @brief build the search graph
     *
     * Origin and destinations not listed in the Nodes section are warned
     * about and dropped: an unknown origin yields a graph whose searches
     * find nothing.
     */
    Graph make_graph() const;
};


/**
 * @throws ParseError on malformed lines, or when the Origin section is missing
 */
Problem parse_problem(std::istream &in, const std::string &source = "<stream>");

/**
 * @throws ParseError
 */
Problem load_problem_file(const std::string &path);


} // namespace io
} // namespace tbrgs
