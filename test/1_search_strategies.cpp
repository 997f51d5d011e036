#include "test_utils.hpp"
#include <tbrgs/search/search_engine.hpp>

using namespace tbrgs;
using namespace tbrgs::model;
using namespace tbrgs::search;
using namespace tbrgs::test;


struct Expected
{
    Strategy    strategy;
    node_id_t   goal;
    std::size_t created;
    NodePath    path;
    cost_t      cost;
};


static void m_run_expectations(const Graph &graph
                               , const std::vector<Expected> &expectations
                               , const std::string &label)
{
    for (auto &e: expectations)
    {
        const auto what = label + " " + strategy_name(e.strategy);
        const auto res = search::search(graph, e.strategy);
        check(res.found, what + ": solution expected");
        check_equal(res.strategy, e.strategy, what + ": strategy");
        check_equal(res.goal, e.goal, what + ": goal");
        check_equal(res.created, e.created, what + ": created nodes");
        check_path(res.path, e.path, what);
        check_equal(res.cost, e.cost, what + ": path cost");
    }
}


/**
 * @brief the four nodes graph
 *
 * The uninformed strategies, A* and uniform cost report 1 2 3 4:
 * node 3 is first generated from 1 (cost 4), then from 2 (cost 2)
 * before it gets expanded. Greedy best-first jumps to 3 straight away.
 */
static void test_four_nodes()
{
    m_run_expectations(make_four_nodes_graph(), {
                           {STRATEGY_DFS , "4", 5, {"1", "2", "3", "4"}, 3},
                           {STRATEGY_BFS , "4", 5, {"1", "2", "3", "4"}, 3},
                           {STRATEGY_GBFS, "4", 4, {"1", "3", "4"}     , 5},
                           {STRATEGY_AS  , "4", 5, {"1", "2", "3", "4"}, 3},
                           {STRATEGY_CUS1, "4", 5, {"1", "2", "3", "4"}, 3},
                           {STRATEGY_CUS2, "4", 5, {"1", "2", "3", "4"}, 3},
                       }, "four nodes");
}


static void test_six_nodes()
{
    m_run_expectations(make_six_nodes_graph(), {
                           {STRATEGY_DFS , "5", 9, {"2", "3", "5"}, 10},
                           {STRATEGY_BFS , "4", 9, {"2", "1", "4"}, 10},
                           {STRATEGY_GBFS, "5", 7, {"2", "3", "5"}, 10},
                           {STRATEGY_AS  , "4", 9, {"2", "1", "4"}, 10},
                           {STRATEGY_CUS1, "4", 9, {"2", "1", "4"}, 10},
                           {STRATEGY_CUS2, "4", 9, {"2", "1", "4"}, 10},
                       }, "six nodes");
}


/**
 * @brief children of 1 are 2, 3, 10 in node id order
 *
 * DFS must dive into 2 first. With a lexicographic order it would pick 10.
 */
static void test_star()
{
    m_run_expectations(make_star_graph(), {
                           {STRATEGY_DFS , "9", 5, {"1", "2", "9"} , 2},
                           {STRATEGY_BFS , "9", 7, {"1", "2", "9"} , 2},
                           {STRATEGY_GBFS, "9", 5, {"1", "10", "9"}, 2},
                           {STRATEGY_AS  , "9", 5, {"1", "10", "9"}, 2},
                           {STRATEGY_CUS1, "9", 7, {"1", "2", "9"} , 2},
                           {STRATEGY_CUS2, "9", 5, {"1", "10", "9"}, 2},
                       }, "star");
}


static void test_astar_not_worse_than_greedy()
{
    for (auto graph: {make_four_nodes_graph(), make_six_nodes_graph(), make_star_graph()})
    {
        const auto as = search::search(graph, STRATEGY_AS);
        const auto gbfs = search::search(graph, STRATEGY_GBFS);
        check(as.found && gbfs.found, "both succeed");
        check(as.cost <= gbfs.cost, "A* cost <= greedy best-first cost");
    }
}


static void test_cus2_weight()
{
    auto graph = make_four_nodes_graph();
    SearchConstraints c;

    // weight 0 is uniform cost
    c.cus2_weight = 0;
    auto cus2 = search::search(graph, STRATEGY_CUS2, c);
    auto cus1 = search::search(graph, STRATEGY_CUS1);
    check_path(cus2.path, cus1.path, "CUS2 with weight 0");
    check_equal(cus2.created, cus1.created, "CUS2 with weight 0: created");

    // weight 1 is A*
    c.cus2_weight = 1;
    cus2 = search::search(graph, STRATEGY_CUS2, c);
    auto as = search::search(graph, STRATEGY_AS);
    check_path(cus2.path, as.path, "CUS2 with weight 1");
    check_equal(cus2.created, as.created, "CUS2 with weight 1: created");
}


/**
 * @brief DFS reaches 3 through the 2 -> 3 detour, and reports 1 3 4
 *
 * 3 was first generated from 1 with cost 1: that link is kept when the
 * detour offers it again with cost 101. The path and its cost follow the
 * parent links, not the entry DFS actually popped.
 */
static void test_dfs_reports_cheapest_parent()
{
    const Graph graph(
        { {"1", {0, 0}}, {"2", {1, 0}}, {"3", {1, 1}}, {"4", {2, 1}} }
        , { {"1", "2", 1}, {"1", "3", 1}, {"2", "3", 100}, {"3", "4", 1} }
        , "1"
        , {"4"});

    const auto res = search::search(graph, STRATEGY_DFS);
    check(res.found, "detour: solution expected");
    check_equal(res.created, 5u, "detour: created nodes");
    check_equal(res.expanded, 3u, "detour: 1, 2 and 3 expanded");
    check_path(res.path, {"1", "3", "4"}, "detour");
    check_equal(res.cost, 2.0, "detour: cost along the reported path");
}


int main()
{
    test_four_nodes();
    test_six_nodes();
    test_star();
    test_astar_not_worse_than_greedy();
    test_cus2_weight();
    test_dfs_reports_cheapest_parent();
    return 0;
}
