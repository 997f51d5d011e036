#include "test_utils.hpp"
#include <tbrgs/reweight/edge_reweighter.hpp>
#include <tbrgs/reweight/travel_time.hpp>
#include <tbrgs/search/search_engine.hpp>
#include <cmath>
#include <numeric>

using namespace tbrgs;
using namespace tbrgs::model;
using namespace tbrgs::reweight;
using namespace tbrgs::test;


static void check_near(double got, double expected, double tolerance, const std::string &what)
{
    check(std::fabs(got - expected) <= tolerance
          , strfmt("%1%: got %2%, expected %3%", what, got, expected));
}


static double m_sum(const VolumeWindow &w)
{
    return std::accumulate(w.begin(), w.end(), 0.0);
}


static void test_volume_index()
{
    VolumeIndex volumes;
    // inserted out of order, on purpose
    volumes.add(VolumeRecord("WARRIGAL_RD/TOORAK_RD", 2000, 5, "2006-10-01 00:30:00"));
    volumes.add(VolumeRecord(" warrigal_rd/toorak_rd ", 970, 12, "2006-10-01 00:15:00"));
    volumes.add(VolumeRecord("WARRIGAL_RD/TOORAK_RD", 970, 11, "2006-10-01 00:00:00"));
    volumes.add(VolumeRecord("WARRIGAL_RD/TOORAK_RD", 970, 14, "2006-10-01 00:45:00"));
    volumes.add(VolumeRecord("WARRIGAL_RD/TOORAK_RD", 970, 13, "2006-10-01 00:30:00"));
    check_equal(volumes.size(), 5u, "records");

    site_id_t site = 0;
    check(volumes.lookup_site("Warrigal_Rd/Toorak_Rd", site), "site found");
    check_equal(site, 970u, "lowest site id serves the location");
    check(!volumes.lookup_site("NOWHERE", site), "unknown location");

    const auto last3 = volumes.recent_window("warrigal_rd/toorak_rd", 3);
    check_equal(last3.size(), 3u, "window size");
    check_equal(last3[0], 12.0, "window oldest first");
    check_equal(last3[1], 13.0, "window middle");
    check_equal(last3[2], 14.0, "window latest last");

    check_equal(volumes.recent_window("WARRIGAL_RD/TOORAK_RD", 10).size(), 4u, "short history");
    check(volumes.recent_window("NOWHERE", 4).empty(), "unknown location has no window");
}


static void test_volume_timestamps()
{
    check(parse_timestamp("2006-10-01 9:45") < parse_timestamp("2006-10-01 10:00:00"), "unpadded hour");
    check(parse_timestamp("2006-10-01 23:45:00") < parse_timestamp("2006-10-2 0:00"), "next day");
    check(parse_timestamp("2006-10-01") == parse_timestamp(" 2006-10-01 00:00:00 "), "date only is midnight");
    check_throws<bad_timestamp>([]() { parse_timestamp("01/10/2006 09:45"); }, "day first");
    check_throws<bad_timestamp>([]() { parse_timestamp("2006-13-01 09:45"); }, "bad month");
    check_throws<bad_timestamp>([]() { parse_timestamp("2006-10-01 nine"); }, "bad time");
    check_throws<bad_timestamp>([]() { parse_timestamp("yesterday"); }, "not a date");

    VolumeIndex volumes;
    volumes.add(VolumeRecord("A", 1, 50, "2006-10-01 10:00"));
    volumes.add(VolumeRecord("A", 1, 10, "2006-10-01 8:45"));
    volumes.add(VolumeRecord("A", 1, 20, "2006-10-01 9:00"));
    volumes.add(VolumeRecord("A", 1, 30, "2006-10-01 9:15"));
    volumes.add(VolumeRecord("A", 1, 40, "2006-10-01 9:30"));

    const auto w = volumes.recent_window("A", 4);
    check_equal(w.size(), 4u, "window size");
    check_equal(w[0], 20.0, "chronological window");
    check_equal(w[1], 30.0, "chronological window");
    check_equal(w[2], 40.0, "chronological window");
    check_equal(w[3], 50.0, "latest observation last");
}


static void test_flow_to_time()
{
    // free flow: 1 km at 60 km/h, plus the intersection delay
    check_near(flow_to_time(0, 1), 90, 1e-9, "no traffic");
    check_near(flow_to_time(351, 1), 90, 1e-9, "at capacity");
    // over capacity: congested speed is the smaller root, about 13.5 km/h at 1000 veh/h
    check_near(flow_to_time(1000, 1), 296.178, 0.001, "congested");
    // past the top of the parabola speed settles at b / 2a, about 32 km/h
    check_near(flow_to_time(5000, 1), 142.5, 0.01, "saturated");

    FlowModelParams params;
    params.delay_s = 0;
    check_near(flow_to_time(0, 2, params), 120, 1e-9, "no delay");

    params.speed_limit = 0;
    check_throws<ConstraintConsistencyError>([&]() { FlowTravelTimeEstimator e(params); }, "bad speed limit");
}


static void test_flow_estimator()
{
    const FlowTravelTimeEstimator estimator;

    // 10 vehicles per 15 minutes: 40 veh/h, free flow
    check_near(estimator.predict(StaticEdge("A", "B", 2), {10, 10, 10, 10}), 150, 1e-9, "free flow estimate");
    check_throws<estimation_error>([&]() { estimator.predict(StaticEdge("A", "B"), {10, 10, 10, 10}); }
                                   , "no distance, no estimate");
    check_throws<estimation_error>([&]() { estimator.predict(StaticEdge("A", "B", 2), {}); }
                                   , "no volumes, no estimate");
}


static VolumeIndex m_make_volumes()
{
    VolumeIndex volumes;
    for (int i = 0; i < 6; ++i)
    {
        // 1 has 6 observations, 2 only 2
        volumes.add(VolumeRecord("1", 100, i, strfmt("2006-10-01 0%1%:00:00", i)));
        if (i < 2)
        {
            volumes.add(VolumeRecord("2", 200, 1, strfmt("2006-10-01 0%1%:00:00", i)));
        }
    }
    return volumes;
}


static StaticEdgeList m_make_static_edges()
{
    return {
        StaticEdge("1", "2", 1),
        StaticEdge("1", "3", 4),
        StaticEdge("2", "3", 1),
        StaticEdge("3", "4", 1),
        StaticEdge("1", "4"),   // no length, but predictable
        StaticEdge("4", "1"),   // no length, no volumes
    };
}


static void test_reweight_outcomes()
{
    auto graph = make_four_nodes_graph();
    graph.set_edge_cost("2", "3", 7);
    graph.set_edge_cost("3", "4", 7);

    const FunctionEstimator estimator(m_sum);
    const auto report = reweight_edges(graph, m_make_static_edges(), m_make_volumes(), estimator);

    check_equal(report.total, 6u, "total");
    check_equal(report.updated, 3u, "updated");
    check_equal(report.fallback, 2u, "fallback");
    check_equal(report.skipped, 1u, "skipped");

    // last 4 volumes of location 1: 2+3+4+5
    check_equal(graph.lookup_edge("1", "2")->cost, 14.0, "predicted cost");
    check_equal(graph.lookup_edge("1", "3")->cost, 14.0, "predicted cost");
    check_equal(graph.lookup_edge("1", "4")->cost, 14.0, "predicted edge inserted");
    check_equal(graph.lookup_edge("2", "3")->cost, 1.0, "short history falls back");
    check_equal(graph.lookup_edge("3", "4")->cost, 1.0, "no history falls back");
    check(graph.lookup_edge("4", "1") == nullptr, "skipped edge untouched");

    check_equal(graph.nodes_count(), 4u, "nodes untouched");
    check_equal(graph.destinations().size(), 1u, "destinations untouched");
    check_equal(graph.origin(), std::string("1"), "origin untouched");

    // shorter lookback: location 2 qualifies
    ReweightConstraints c;
    c.lookback = 2;
    const auto report2 = reweight_edges(graph, m_make_static_edges(), m_make_volumes(), estimator, c);
    check_equal(report2.updated, 4u, "lookback 2: updated");
    check_equal(graph.lookup_edge("2", "3")->cost, 2.0, "lookback 2: predicted cost");
    check_equal(graph.lookup_edge("1", "2")->cost, 9.0, "lookback 2: last 2 volumes");

    c.lookback = 0;
    check_throws<ConstraintConsistencyError>([&]()
    {
        reweight_edges(graph, m_make_static_edges(), m_make_volumes(), estimator, c);
    }, "lookback 0");
}


static void test_bad_predictions_fall_back()
{
    const std::vector<FunctionEstimator::predictor_t> predictors = {
        [](const VolumeWindow &) -> double { return -1; },
        [](const VolumeWindow &) -> double { return NAN; },
        [](const VolumeWindow &) -> double { return INFINITY; },
        [](const VolumeWindow &) -> double { throw std::runtime_error("model not loaded"); },
    };

    for (auto &p: predictors)
    {
        LogCapture logs(log_level_warning);
        auto graph = make_four_nodes_graph();
        const auto report = reweight_edges(graph, m_make_static_edges(), m_make_volumes(), FunctionEstimator(p));

        check_equal(report.updated, 0u, "bad prediction: nothing updated");
        check_equal(report.fallback, 4u, "bad prediction: fallback");
        check_equal(report.skipped, 2u, "bad prediction: skipped");
        check_equal(graph.lookup_edge("1", "2")->cost, 1.0, "bad prediction: static cost restored");
        check_equal(graph.lookup_edge("1", "3")->cost, 4.0, "bad prediction: static cost restored");
        check(graph.lookup_edge("1", "4") == nullptr, "bad prediction: no length, no edge");
        // 2 failed predictions with a fallback, 1 with nothing to fall back to
        check(logs.count(log_level_warning) >= 3, "bad predictions logged");
    }
}


static void test_invalid_static_cost_skipped()
{
    LogCapture logs(log_level_warning);
    auto graph = make_four_nodes_graph();
    const VolumeIndex no_volumes;
    const FunctionEstimator estimator(m_sum);
    const StaticEdgeList edges = {
        StaticEdge("1", "2", 9),
        StaticEdge("2", "3", -1),
        StaticEdge("3", "4", NAN),
        StaticEdge("1", "3", INFINITY),
        StaticEdge("2", "4", 6),
    };

    const auto report = reweight_edges(graph, edges, no_volumes, estimator);
    check_equal(report.total, 5u, "invalid static cost: total");
    check_equal(report.fallback, 2u, "invalid static cost: fallback");
    check_equal(report.skipped, 3u, "invalid static cost: skipped");

    // every valid edge is still rewritten, wherever the invalid ones sit
    check_equal(graph.lookup_edge("1", "2")->cost, 9.0, "fallback before invalid edges");
    check_equal(graph.lookup_edge("2", "4")->cost, 6.0, "fallback after invalid edges");
    check_equal(graph.lookup_edge("2", "3")->cost, 1.0, "negative static cost left untouched");
    check_equal(graph.lookup_edge("3", "4")->cost, 1.0, "NaN static cost left untouched");
    check_equal(graph.lookup_edge("1", "3")->cost, 4.0, "infinite static cost left untouched");
    check(logs.count(log_level_warning) >= 3, "invalid static costs logged");
}


static void test_fallback_is_idempotent()
{
    auto graph = make_four_nodes_graph();
    const VolumeIndex no_volumes;
    const FunctionEstimator estimator(m_sum);

    const auto first = reweight_edges(graph, m_make_static_edges(), no_volumes, estimator);
    const auto costs = graph.edges();
    const auto second = reweight_edges(graph, m_make_static_edges(), no_volumes, estimator);

    check_equal(first.fallback, second.fallback, "same fallback count");
    check_equal(first.skipped, second.skipped, "same skipped count");
    check_equal(graph.edges_count(), costs.size(), "same edges");
    for (auto &e: costs)
    {
        check_equal(graph.lookup_edge(e.from, e.to)->cost, e.cost, "same costs");
    }
}


static void test_search_after_reweight()
{
    auto graph = make_four_nodes_graph();
    // jam 2 -> 3: the direct 1 -> 3 becomes cheaper
    VolumeIndex volumes;
    for (int i = 0; i < 4; ++i)
    {
        volumes.add(VolumeRecord("2", 1, 100, strfmt("2006-10-01 0%1%:00:00", i)));
    }
    const FunctionEstimator estimator(m_sum);
    reweight_edges(graph, { StaticEdge("2", "3", 1) }, volumes, estimator);

    const auto res = search::search(graph, search::STRATEGY_AS);
    check_path(res.path, {"1", "3", "4"}, "A* avoids the jam");
    check_equal(res.cost, 5.0, "A* cost after reweight");
}


int main()
{
    test_volume_index();
    test_volume_timestamps();
    test_flow_to_time();
    test_flow_estimator();
    test_reweight_outcomes();
    test_bad_predictions_fall_back();
    test_invalid_static_cost_skipped();
    test_fallback_is_idempotent();
    test_search_after_reweight();
    return 0;
}
