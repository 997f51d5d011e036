/**
 * @file io_common.hpp
 * @brief Bits shared by the input loaders
 */

#pragma once

#include <tbrgs/model/tbrgs_types.hpp>
#include <fstream>
#include <stdexcept>
#include <string>


namespace tbrgs {
namespace io {

using model::node_id_t;
using model::cost_t;


/**
 * @brief Malformed input
 *
 * Carries the source name (file path, or a label for in-memory streams)
 * and the 1-based line number. Line 0 means the error is not tied to a line
 * (ie: the file can't be opened, or a whole section is missing).
 */
struct ParseError: std::runtime_error
{
    ParseError(const std::string &source_, std::size_t line_, const std::string &msg);

    const std::string &source() const noexcept { return m_source; }
    std::size_t line() const noexcept { return m_line; }

private:
    std::string m_source;
    std::size_t m_line;
};


/**
 * @brief parse a floating point field, the whole of it
 * @throws ParseError
 */
double parse_number(const std::string &text
                    , const std::string &source
                    , std::size_t line
                    , const char *what);

/**
 * @brief open @p path for reading
 * @throws ParseError if the file can't be opened
 */
void open_input(std::ifstream &stream, const std::string &path);


} // namespace io
} // namespace tbrgs
