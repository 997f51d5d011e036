#include <tbrgs/model/tbrgs_edge_idx.hpp>
#include <stdexcept>
#include <string>

using namespace tbrgs::model;
using namespace tbrgs::model::idx;


// the edge index is a multi_index with a single composite (from, to) key,
// compared with NodeIdLess on both parts. Full lookups hit one edge,
// partial lookups on "from" yield the outgoing edges in neighbor order.

void test_lookup_and_upsert(void)
{
    EdgeIndex edges;
    if (!edges.upsert("1", "2", 3) || !edges.upsert("2", "1", 4))
    {
        throw std::runtime_error("test_lookup_and_upsert: insertion");
    }
    if (edges.upsert("1", "2", 5))
    {
        throw std::runtime_error("test_lookup_and_upsert: overwrite inserted");
    }
    if (edges.size() != 2)
    {
        throw std::runtime_error("test_lookup_and_upsert: size");
    }
    auto e = edges.lookup("1", "2");
    if (e == nullptr || e->cost != 5)
    {
        throw std::runtime_error("test_lookup_and_upsert: overwritten cost");
    }
    if (edges.lookup("1", "3") != nullptr || edges.lookup("3", "1") != nullptr)
    {
        throw std::runtime_error("test_lookup_and_upsert: phantom edge");
    }
}

void test_partial_lookup(void)
{
    EdgeIndex edges;
    for (auto to: {"10", "9", "B", "2", "A"})
    {
        edges.upsert("1", to, 1);
        edges.upsert("0", to, 1);
    }
    edges.upsert("100", "1", 1);

    auto &idx = edges.get<by_src_and_dest>();
    auto range = idx.equal_range(boost::make_tuple(std::string("1")));
    const char *expected[] = {"2", "9", "10", "A", "B"};
    std::size_t n = 0;
    for (auto i = range.first; i != range.second; ++i, ++n)
    {
        if (n >= 5 || i->to != expected[n])
        {
            throw std::runtime_error("test_partial_lookup: order");
        }
    }
    if (n != 5)
    {
        throw std::runtime_error("test_partial_lookup: count");
    }
}

int main()
{
    test_lookup_and_upsert();
    test_partial_lookup();
}
