/**
 * @file tbrgs_log.hpp
 * @brief Logger facility with pluggable sink
 *
 * Pretty standard logging with log_info(), log_debug() macros and so on.
 * The usual stuff.
 *
 * Features to mention:
 * - the output of the logging is delegated to a sink callable, injected
 *   with log_register_sink(). Without a sink, records go to stderr.
 *   The Python extension injects a delegate that forwards to Python's
 *   standard logging framework.
 * - single-branch runtime triggering of log statements
 * - remove (not minimize) runtime impact of log statement parameter
 *   evaluation when log is not triggered
 * - uses boost::format in a more log-context friendly fashion
 */

#pragma once

#include <boost/format.hpp>
#include <functional>
#include <string>

namespace tbrgs {

typedef enum {
    log_level_trace,
    log_level_debug,
    log_level_info,
    log_level_warning,
    log_level_error,
} log_level;

/**
 * @brief sink callable type. Receives the level and the formatted record.
 */
typedef std::function<void(log_level, const char *)> log_sink_t;

/**
 * @brief returns true if the specified log @p lvl triggers the currently set log threshold
 */
bool log_trigger(log_level lvl);

/**
 * @brief returns the currently set log level threshold
 */
log_level log_get_level();

/**
 * @brief sets the log level threshold
 */
void log_set_level(log_level lvl);

/**
 * @brief Injects the log data sink. An empty callable restores the stderr sink.
 */
void log_register_sink(log_sink_t sink);

/**
 * @brief parse a level name ("trace", "debug", "info", "warning", "error")
 * @return false if @p name is not a known level
 */
bool log_level_from_string(const std::string &name, log_level &out);

const char *log_level_name(log_level lvl);

void log_emit_ll(log_level lvl, const std::string &msg);


namespace detail {

inline void format_feed(boost::format &) {}

template<typename T, typename ... Args>
void format_feed(boost::format &f, const T &arg, const Args& ... args)
{
    f % arg;
    format_feed(f, args...);
}

} // namespace detail


/**
 * @brief boost::format as a one-liner: strfmt("%1% of %2%", a, b)
 */
template<typename ... Args>
std::string strfmt(const std::string &fmt, const Args& ... args)
{
    boost::format f(fmt);
    detail::format_feed(f, args...);
    return boost::str(f);
}

} // namespace tbrgs


#define log_emit(lvl, ...) \
    do { if (::tbrgs::log_trigger(lvl)) ::tbrgs::log_emit_ll(lvl, ::tbrgs::strfmt(__VA_ARGS__)); } while (0)

// here, use these:
#define log_trace(...)   log_emit(::tbrgs::log_level_trace  , __VA_ARGS__)
#define log_debug(...)   log_emit(::tbrgs::log_level_debug  , __VA_ARGS__)
#define log_info(...)    log_emit(::tbrgs::log_level_info   , __VA_ARGS__)
#define log_warning(...) log_emit(::tbrgs::log_level_warning, __VA_ARGS__)
#define log_error(...)   log_emit(::tbrgs::log_level_error  , __VA_ARGS__)
