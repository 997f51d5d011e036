#include "cli_common.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <iostream>

namespace tbrgs {
namespace cli {


void add_common_options(po::options_description &options, std::string &log_level)
{
    options.add_options()
            ("help,h", "Show this help message")
            ("log-level,l", po::value<std::string>(&log_level)->default_value("warning"),
             "Log threshold: trace, debug, info, warning, error");
}


bool apply_log_level(const std::string &log_level)
{
    ::tbrgs::log_level lvl;
    if (!log_level_from_string(log_level, lvl))
    {
        std::cerr << "Error: unknown log level '" << log_level << "'" << std::endl;
        return false;
    }
    log_set_level(lvl);
    return true;
}


} // namespace cli
} // namespace tbrgs
