#include "io_common.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace tbrgs {
namespace io {


ParseError::ParseError(const std::string &source_, std::size_t line_, const std::string &msg)
    : std::runtime_error(line_
                         ? strfmt("%1%:%2%: %3%", source_, line_, msg)
                         : strfmt("%1%: %2%", source_, msg))
    , m_source(source_)
    , m_line(line_)
{ }


double parse_number(const std::string &text
                    , const std::string &source
                    , std::size_t line
                    , const char *what)
{
    const auto trimmed = boost::algorithm::trim_copy(text);
    try {
        return boost::lexical_cast<double>(trimmed);
    } catch (const boost::bad_lexical_cast &) {
        throw ParseError(source, line, strfmt("bad %1%: '%2%'", what, trimmed));
    }
}


void open_input(std::ifstream &stream, const std::string &path)
{
    stream.open(path);
    if (!stream.is_open())
    {
        throw ParseError(path, 0, "unable to open file");
    }
    log_debug("reading %1%", path);
}


} // namespace io
} // namespace tbrgs
