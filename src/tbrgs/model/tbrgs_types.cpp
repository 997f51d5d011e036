#include "tbrgs_types.hpp"
#include <boost/algorithm/string.hpp>
#include <cmath>

namespace tbrgs {
namespace model {


bool is_integer_literal(const node_id_t &id) noexcept
{
    std::size_t i = 0;
    if (!id.empty() && (id[0] == '-' || id[0] == '+')) ++i;
    if (i == id.size()) return false;
    for (; i < id.size(); ++i)
    {
        if (id[i] < '0' || id[i] > '9') return false;
    }
    return true;
}


// compares two integer literals by value, without parsing them:
// sign first, then magnitude by digit count and digit text.
static int m_compare_integer_literals(const node_id_t &a, const node_id_t &b) noexcept
{
    auto negative = [](const node_id_t &s) { return s[0] == '-'; };
    auto digits = [](const node_id_t &s)
    {
        std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        while (i + 1 < s.size() && s[i] == '0') ++i;
        return s.substr(i);
    };

    auto da = digits(a);
    auto db = digits(b);
    auto zero = [](const std::string &d) { return d == "0"; };
    bool na = negative(a) && !zero(da);
    bool nb = negative(b) && !zero(db);

    if (na != nb) return na ? -1 : 1;

    int magnitude = 0;
    if (da.size() != db.size())
    {
        magnitude = da.size() < db.size() ? -1 : 1;
    }
    else
    {
        auto c = da.compare(db);
        magnitude = c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return na ? -magnitude : magnitude;
}


bool NodeIdLess::operator()(const node_id_t &a, const node_id_t &b) const noexcept
{
    const bool ia = is_integer_literal(a);
    const bool ib = is_integer_literal(b);

    if (ia && ib)
    {
        auto c = m_compare_integer_literals(a, b);
        if (c != 0) return c < 0;
        return a < b;
    }
    if (ia != ib)
    {
        return ia;
    }
    return a < b;
}


double euclidean_distance(const Coordinates &a, const Coordinates &b) noexcept
{
    const auto dx = b.x - a.x;
    const auto dy = b.y - a.y;
    return std::sqrt(dx*dx + dy*dy);
}


node_id_t normalize_node_name(const std::string &name)
{
    return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
}


std::string join_path(const NodePath &path, const std::string &separator)
{
    return boost::algorithm::join(path, separator);
}


} // namespace model
} // namespace tbrgs
