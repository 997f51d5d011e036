/**
 * @file search_main.cpp
 * @brief tbrgs_search: solves a route finding problem file
 *
 * Usage: tbrgs_search <problem_file> <method> [options]
 */

#include "cli_common.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <tbrgs/io/problem_file.hpp>
#include <tbrgs/search/search_engine.hpp>
#include <iostream>

using namespace tbrgs;
using namespace tbrgs::cli;


struct SearchOptions
{
    std::string problem_file;
    std::string method;
    std::string log_level;
    model::SearchConstraints constraints;
};


static init_result_t m_parse_arguments(int argc, char *argv[], SearchOptions &opts)
{
    po::options_description generic_options("Options");
    add_common_options(generic_options, opts.log_level);
    generic_options.add_options()
            ("cus2-weight,w", po::value<double>(&opts.constraints.cus2_weight)->default_value(2.0),
             "Heuristic weight of the CUS2 strategy")
            ("created-limit,n", po::value<std::size_t>(&opts.constraints.created_limit)->default_value(0),
             "Give up after creating this many nodes (0: no limit)");

    po::options_description hidden_options("Hidden options");
    hidden_options.add_options()
            ("problem-file", po::value<std::string>(&opts.problem_file), "Problem file")
            ("method", po::value<std::string>(&opts.method), "Search method");

    po::positional_options_description positional_options;
    positional_options.add("problem-file", 1);
    positional_options.add("method", 1);

    po::options_description cmdline_options;
    cmdline_options.add(generic_options).add(hidden_options);

    po::options_description visible_options("Usage: tbrgs_search <problem_file> <method> [options]\n"
                                            "Methods: DFS, BFS, GBFS, AS, CUS1, CUS2");
    visible_options.add(generic_options);

    po::variables_map option_variables;
    po::store(po::command_line_parser(argc, argv)
              .options(cmdline_options)
              .positional(positional_options)
              .run()
              , option_variables);

    if (option_variables.count("help"))
    {
        std::cout << visible_options << std::endl;
        return INIT_OK_EXIT;
    }

    po::notify(option_variables);

    if (!option_variables.count("problem-file") || !option_variables.count("method"))
    {
        std::cerr << visible_options << std::endl;
        return INIT_FAILED;
    }
    return apply_log_level(opts.log_level) ? INIT_OK_START : INIT_FAILED;
}


int main(int argc, char *argv[])
{
    try
    {
        SearchOptions opts;
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
            std::cerr << "Error: Method '" << opts.method << "' not recognized. "
                      << "Choose from: DFS, BFS, GBFS, AS, CUS1, CUS2" << std::endl;
            return 1;
        }

        const auto problem = io::load_problem_file(opts.problem_file);
        const auto graph = problem.make_graph();
        const auto res = search::search(graph, strategy, opts.constraints);

        std::cout << opts.problem_file << " " << search::strategy_name(strategy) << "\n"
                  << res << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
