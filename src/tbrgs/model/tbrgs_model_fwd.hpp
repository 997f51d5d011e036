#pragma once

#include <string>

namespace tbrgs {
namespace model {

struct Coordinates;
struct Edge;
struct Graph;
struct NodeIdLess;
struct SearchConstraints;
struct ReweightConstraints;

} // namespace model
} // namespace tbrgs
