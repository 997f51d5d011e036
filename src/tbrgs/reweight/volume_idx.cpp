#include "volume_idx.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/time_parsers.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace tbrgs {
namespace reweight {

using namespace idx;


timestamp_t parse_timestamp(const std::string &text)
{
    const auto trimmed = boost::algorithm::trim_copy(text);
    timestamp_t res;
    try {
        if (trimmed.find(' ') == std::string::npos)
        {
            res = timestamp_t(boost::gregorian::from_simple_string(trimmed));
        }
        else
        {
            res = boost::posix_time::time_from_string(trimmed);
        }
    } catch (const std::out_of_range &) {
        // bad_year, bad_month, bad_day_of_month
        throw bad_timestamp(strfmt("bad timestamp: '%1%'", trimmed));
    } catch (const boost::bad_lexical_cast &) {
        throw bad_timestamp(strfmt("bad timestamp: '%1%'", trimmed));
    }
    if (res.is_special())
    {
        throw bad_timestamp(strfmt("bad timestamp: '%1%'", trimmed));
    }
    return res;
}


VolumeRecord::VolumeRecord(const std::string &location_
                           , site_id_t site_id_
                           , double volume_
                           , const timestamp_t &timestamp_)
    : location(model::normalize_node_name(location_))
    , site_id(site_id_)
    , volume(volume_)
    , timestamp(timestamp_)
{ }


VolumeRecord::VolumeRecord(const std::string &location_
                           , site_id_t site_id_
                           , double volume_
                           , const std::string &timestamp_)
    : VolumeRecord(location_, site_id_, volume_, parse_timestamp(timestamp_))
{ }


void VolumeIndex::add(const VolumeRecord &record)
{
    insert(record);
}


bool VolumeIndex::lookup_site(const std::string &location, site_id_t &out) const
{
    auto &idx = get<by_location>();
    auto i = idx.lower_bound(boost::make_tuple(model::normalize_node_name(location)));
    if (i == idx.end() || i->location != model::normalize_node_name(location))
    {
        return false;
    }
    out = i->site_id;
    return true;
}


VolumeWindow VolumeIndex::recent_window(const std::string &location, std::size_t how_many) const
{
    VolumeWindow res;
    site_id_t site;
    if (!lookup_site(location, site))
    {
        return res;
    }

    auto &idx = get<by_site_and_time>();
    auto range = idx.equal_range(boost::make_tuple(site));
    // walk back from the latest observation
    for (auto i = range.second; i != range.first && res.size() < how_many; )
    {
        --i;
        res.push_back(i->volume);
    }
    std::reverse(res.begin(), res.end());
    log_trace("site %1% (%2%): %3% observations selected", site, location, res.size());
    return res;
}


} // namespace reweight
} // namespace tbrgs
