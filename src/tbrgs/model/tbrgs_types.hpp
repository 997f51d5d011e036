#pragma once

#include "tbrgs_model_fwd.hpp"
#include <limits>
#include <string>
#include <vector>


namespace tbrgs {
namespace model {

/**
 * @brief Node identifier
 *
 * Problem files use integers, the traffic pipeline uses location names.
 * Both are carried as text. Ordering is defined by NodeIdLess.
 */
typedef std::string node_id_t;

/**
 * @brief Edge cost (distance, or travel time once reweighted)
 */
typedef double cost_t;

/**
 * @brief Sentinel distance returned when a heuristic can't be computed
 */
constexpr cost_t unreachable_distance = std::numeric_limits<cost_t>::infinity();


/**
 * @brief Canonical node identifier ordering
 *
 * This is the tie-break rule shared by every search strategy.
 *
 * - two integer literals compare numerically ("2" < "10")
 * - integer literals sort before any other name
 * - other names compare lexicographically
 *
 * Integer literals with the same value but different spelling ("7", "007")
 * are still distinct keys, ordered by their text.
 */
struct NodeIdLess
{
    bool operator()(const node_id_t &a, const node_id_t &b) const noexcept;
};

bool is_integer_literal(const node_id_t &id) noexcept;


/**
 * @brief 2-D position of a node. Only used for heuristic distances.
 */
struct Coordinates
{
    double x = 0;
    double y = 0;

    Coordinates() = default;
    Coordinates(double x_, double y_): x(x_), y(y_) {}

    bool operator==(const Coordinates &o) const noexcept
    {
        return x == o.x && y == o.y;
    }
};

double euclidean_distance(const Coordinates &a, const Coordinates &b) noexcept;


/**
 * @brief trims and upper-cases a location name
 *
 * The traffic data spells the same intersection with inconsistent
 * case and padding.
 */
node_id_t normalize_node_name(const std::string &name);


typedef std::vector<node_id_t> NodePath;

std::string join_path(const NodePath &path, const std::string &separator = " ");


} // namespace model
} // namespace tbrgs
