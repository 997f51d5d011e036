/**
 * @file cli_common.hpp
 * @brief Helpers shared by the command line tools
 */

#pragma once

#include <boost/program_options.hpp>
#include <string>


namespace tbrgs {
namespace cli {

namespace po = boost::program_options;

typedef enum {
    INIT_OK_START,
    INIT_OK_EXIT,
    INIT_FAILED,
} init_result_t;

/**
 * @brief adds --help and --log-level to @p options
 */
void add_common_options(po::options_description &options, std::string &log_level);

/**
 * @brief applies --log-level
 * @return false (after reporting on stderr) if the level name is unknown
 */
bool apply_log_level(const std::string &log_level);


} // namespace cli
} // namespace tbrgs
