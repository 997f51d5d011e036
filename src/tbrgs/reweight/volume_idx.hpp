/**
 * @file volume_idx.hpp
 * @brief Index of traffic volume observations
 *
 * Observations come from SCATS detector sites. Each one is tied to a
 * location name (a graph node) and a site id. A location may be served
 * by several sites: the lowest site id is the one used for predictions.
 */

#pragma once

#include <tbrgs/model/tbrgs_types.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <stdexcept>


namespace tbrgs {
namespace reweight {

using model::node_id_t;

typedef unsigned long site_id_t;
typedef boost::posix_time::ptime timestamp_t;

/**
 * @brief recent volume counts, oldest first
 */
typedef std::vector<double> VolumeWindow;


struct bad_timestamp: std::runtime_error
{
    using std::runtime_error::runtime_error;
};


/**
 * @brief parse an observation time
 *
 * Accepts "YYYY-MM-DD HH:MM[:SS]" with or without zero padding,
 * and a bare "YYYY-MM-DD" (midnight).
 *
 * @throws bad_timestamp
 */
timestamp_t parse_timestamp(const std::string &text);


struct VolumeRecord
{
    node_id_t   location;   ///< normalized location name
    site_id_t   site_id;
    double      volume;     ///< vehicles counted over one interval (15 minutes)
    timestamp_t timestamp;

    VolumeRecord(const std::string &location_
                 , site_id_t site_id_
                 , double volume_
                 , const timestamp_t &timestamp_);

    /// @throws bad_timestamp
    VolumeRecord(const std::string &location_
                 , site_id_t site_id_
                 , double volume_
                 , const std::string &timestamp_);
};


namespace idx {

using namespace boost::multi_index;

struct by_location {};
struct by_site_and_time {};

/**
 * @brief Base multi_index implementation
 *
 * Records can be looked up:
 *
 *  - by_location, ordered by (location, site_id). The first hit of
 *    a partial lookup on location is the site serving that location.
 *  - by_site_and_time, ordered by (site_id, timestamp). A partial lookup
 *    on site_id yields the site's history in chronological order.
 */
typedef multi_index_container<
  VolumeRecord,
  indexed_by<
          ordered_non_unique< tag<by_location>,  composite_key<VolumeRecord,
                 member<VolumeRecord, node_id_t, &VolumeRecord::location>
               , member<VolumeRecord, site_id_t, &VolumeRecord::site_id>                 >
          >
        , ordered_non_unique< tag<by_site_and_time>,  composite_key<VolumeRecord,
                 member<VolumeRecord, site_id_t  , &VolumeRecord::site_id>
               , member<VolumeRecord, timestamp_t, &VolumeRecord::timestamp>             >
          >
  >
> VolumeIndex_base;

} // namespace idx


/**
 * @brief Public VolumeIndex type
 */
struct VolumeIndex: idx::VolumeIndex_base
{
    using idx::VolumeIndex_base::VolumeIndex_base;

    void add(const VolumeRecord &record);

    /**
     * @brief fetch the site serving @p location
     * @return false if no observations exist for @p location
     */
    bool lookup_site(const std::string &location, site_id_t &out) const;

    /**
     * @brief the @p how_many most recent volumes observed at @p location
     *
     * Returned oldest first. Shorter than @p how_many if the history is
     * shorter, empty if the location is unknown.
     */
    VolumeWindow recent_window(const std::string &location, std::size_t how_many) const;
};


} // namespace reweight
} // namespace tbrgs
