#include "tbrgs_log.hpp"
#include <iostream>

namespace tbrgs {

static log_sink_t m_sink;
static log_level m_current_level = log_level_info;


bool log_trigger(log_level lvl)
{
    return lvl >= m_current_level;
}

log_level log_get_level()
{
    return m_current_level;
}

void log_set_level(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:
    case log_level_debug:
    case log_level_info:
    case log_level_warning:
    case log_level_error:
        m_current_level = lvl;
        break;
    default:
        break;
    }
}


void log_register_sink(log_sink_t sink)
{
    m_sink = std::move(sink);
}


const char *log_level_name(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:   return "trace";
    case log_level_debug:   return "debug";
    case log_level_info:    return "info";
    case log_level_warning: return "warning";
    case log_level_error:   return "error";
    default:
        break;
    }
    return "unknown";
}


bool log_level_from_string(const std::string &name, log_level &out)
{
    for (auto lvl: {log_level_trace
                    , log_level_debug
                    , log_level_info
                    , log_level_warning
                    , log_level_error})
    {
        if (name == log_level_name(lvl))
        {
            out = lvl;
            return true;
        }
    }
    return false;
}


void log_emit_ll(log_level lvl, const std::string &msg)
{
    if (!log_trigger(lvl)) return;
    if (!m_sink)
    {
        std::cerr << "[" << log_level_name(lvl) << "] " << msg << std::endl;
        return;
    }
    try {
        m_sink(lvl, msg.c_str());
    } catch (const std::exception &e) {
        std::cerr << "[error] log sink failed (" << e.what() << "): " << msg << std::endl;
    }
}

} // namespace tbrgs
