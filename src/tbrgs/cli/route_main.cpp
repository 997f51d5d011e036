/**
 * @file route_main.cpp
 * @brief tbrgs_route: traffic based route guidance over a road network
 *
 * Loads the road network from CSV, reweights its edges with the travel
 * times predicted from recent traffic volumes, then searches a route.
 */

#include "cli_common.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <tbrgs/io/csv_loader.hpp>
#include <tbrgs/reweight/edge_reweighter.hpp>
#include <tbrgs/reweight/travel_time.hpp>
#include <tbrgs/search/search_engine.hpp>
#include <iostream>

using namespace tbrgs;
using namespace tbrgs::cli;


struct RouteOptions
{
    std::string edges_path;
    std::string coords_path;
    std::string volumes_path;
    std::string origin;
    std::vector<std::string> destinations;
    std::string method;
    std::string log_level;
    bool no_reweight = false;
    model::SearchConstraints search_constraints;
    model::ReweightConstraints reweight_constraints;
};


static init_result_t m_parse_arguments(int argc, char *argv[], RouteOptions &opts)
{
    po::options_description generic_options("Options");
    add_common_options(generic_options, opts.log_level);
    generic_options.add_options()
            ("edges,e", po::value<std::string>(&opts.edges_path)->required(),
             "Edge list CSV (from, to, distance_km)")
            ("coords,c", po::value<std::string>(&opts.coords_path),
             "Location coordinates CSV (location, longitude, latitude)")
            ("volumes,v", po::value<std::string>(&opts.volumes_path),
             "Traffic volumes CSV (Location, SiteID, Volume, Datetime)")
            ("origin,o", po::value<std::string>(&opts.origin)->required(),
             "Origin location")
            ("dest,d", po::value<std::vector<std::string>>(&opts.destinations)->required()->multitoken(),
             "Destination location(s)")
            ("method,m", po::value<std::string>(&opts.method)->default_value("AS"),
             "Search method: DFS, BFS, GBFS, AS, CUS1, CUS2")
            ("lookback", po::value<unsigned>(&opts.reweight_constraints.lookback)->default_value(4),
             "Volume observations fed to the travel time estimator")
            ("cus2-weight,w", po::value<double>(&opts.search_constraints.cus2_weight)->default_value(2.0),
             "Heuristic weight of the CUS2 strategy")
            ("no-reweight", po::bool_switch(&opts.no_reweight),
             "Search over static distances");

    po::variables_map option_variables;
    po::store(po::parse_command_line(argc, argv, generic_options), option_variables);

    if (option_variables.count("help"))
    {
        std::cout << "Usage: tbrgs_route --edges <csv> --origin <location> --dest <location> [options]\n"
                  << generic_options << std::endl;
        return INIT_OK_EXIT;
    }

    po::notify(option_variables);

    if (!opts.no_reweight && opts.volumes_path.empty())
    {
        std::cerr << "Error: --volumes is needed, unless --no-reweight is given" << std::endl;
        return INIT_FAILED;
    }
    return apply_log_level(opts.log_level) ? INIT_OK_START : INIT_FAILED;
}


int main(int argc, char *argv[])
{
    try
    {
        RouteOptions opts;
        switch (m_parse_arguments(argc, argv, opts)) {
        case INIT_OK_EXIT:
            return 0;
        case INIT_FAILED:
            return 1;
        default:
            break;
        }

        search::Strategy strategy;
        if (!search::strategy_from_string(opts.method, strategy))
        {
            std::cerr << "Error: Method '" << opts.method << "' not recognized" << std::endl;
            return 1;
        }

        const auto edges = io::load_edges_csv(opts.edges_path);
        const auto coords = opts.coords_path.empty()
                ? model::Graph::NodeTable()
                : io::load_coords_csv(opts.coords_path);
        auto graph = io::make_route_graph(edges, coords, opts.origin, opts.destinations);

        if (!opts.no_reweight)
        {
            reweight::VolumeIndex volumes;
            io::load_volumes_csv(opts.volumes_path, volumes);
            const reweight::FlowTravelTimeEstimator estimator;
            const auto report = reweight::reweight_edges(graph, edges, volumes, estimator, opts.reweight_constraints);
            std::cout << report.infos() << "\n";
        }

        const auto res = search::search(graph, strategy, opts.search_constraints);
        std::cout << graph.origin() << " -> " << model::join_path(opts.destinations, ", ")
                  << " " << search::strategy_name(strategy) << "\n"
                  << res << std::endl;
        if (res.found)
        {
            std::cout << (opts.no_reweight ? "distance (km): " : "travel time (s): ")
                      << res.cost << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
