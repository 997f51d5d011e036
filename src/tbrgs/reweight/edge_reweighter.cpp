#include "edge_reweighter.hpp"
#include <tbrgs/commons/tbrgs_log.hpp>
#include <cmath>
#include <sstream>

namespace tbrgs {
namespace reweight {


std::string ReweightReport::infos() const
{
    std::stringstream ss;
    ss << "reweighted " << total << " edges: "
       << updated << " updated, "
       << fallback << " fallback, "
       << skipped << " skipped";
    return ss.str();
}


static bool m_fallback(Graph &graph, const StaticEdge &edge, ReweightReport &report)
{
    if (!edge.has_static_cost)
    {
        log_warning("edge (%1%, %2%): no prediction and no static cost, skipped"
                    , edge.from, edge.to);
        ++report.skipped;
        return false;
    }
    if (!std::isfinite(edge.static_cost) || edge.static_cost < 0)
    {
        log_warning("edge (%1%, %2%): no prediction and invalid static cost %3%, skipped"
                    , edge.from, edge.to, edge.static_cost);
        ++report.skipped;
        return false;
    }
    graph.set_edge_cost(edge.from, edge.to, edge.static_cost);
    ++report.fallback;
    return true;
}


ReweightReport reweight_edges(Graph &graph
                              , const StaticEdgeList &edges
                              , const VolumeIndex &volumes
                              , const TravelTimeEstimator &estimator
                              , const ReweightConstraints &constraints)
{
    constraints.check_consistency();

    ReweightReport report;
    report.total = edges.size();

    for (auto &edge: edges)
    {
        const auto window = volumes.recent_window(edge.from, constraints.lookback);
        if (window.size() < constraints.lookback)
        {
            log_trace("edge (%1%, %2%): %3% observations out of %4%, fallback"
                      , edge.from, edge.to, window.size(), constraints.lookback);
            m_fallback(graph, edge, report);
            continue;
        }

        cost_t predicted;
        try {
            predicted = estimator.predict(edge, window);
        } catch (const std::exception &e) {
            log_warning("edge (%1%, %2%): prediction failed: %3%", edge.from, edge.to, e.what());
            m_fallback(graph, edge, report);
            continue;
        }

        if (!std::isfinite(predicted) || predicted < 0)
        {
            log_warning("edge (%1%, %2%): invalid prediction %3%", edge.from, edge.to, predicted);
            m_fallback(graph, edge, report);
            continue;
        }

        graph.set_edge_cost(edge.from, edge.to, predicted);
        ++report.updated;
    }

    log_info("%1%", report.infos());
    return report;
}


} // namespace reweight
} // namespace tbrgs
