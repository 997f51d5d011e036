#pragma once

#include "tbrgs_types.hpp"
#include <cstddef>
#include <stdexcept>

namespace tbrgs {
namespace model {

struct ConstraintConsistencyError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Tunables of a route search
 *
 * @note using a struct because they can add up quickly during development,
 *       and I don't want to pass them as a bunch of individual parameters.
 */
struct SearchConstraints {
    /**
     * @brief cus2_weight
     *
     * weight applied to the heuristic term of the CUS2 (weighted best-first)
     * ordering key: f(n) = g(n) + cus2_weight * h(n).
     *
     * 1.0 degenerates to A*, 0 degenerates to uniform cost.
     * Values > 1 trade path quality for fewer created nodes.
     *
     * @default 2.0
     */
    double cus2_weight = 2.0;

    /**
     * @brief created_limit
     *
     * stop the search, unsuccessfully, once this many frontier entries
     * have been created. Meant for callers that need to bound the
     * time spent on a single query.
     *
     * @default 0 (no constraint)
     */
    std::size_t created_limit = 0;

    void check_consistency() const;
};


/**
 * @brief Tunables of the edge reweighting pass
 */
struct ReweightConstraints {
    /**
     * @brief lookback
     *
     * number of most recent volume observations that are fed
     * to the travel time predictor. Locations with a shorter history
     * fall back to the static edge cost.
     *
     * @default 4
     */
    unsigned int lookback = 4;

    void check_consistency() const;
};


} // namespace model
} // namespace tbrgs
