#pragma GCC diagnostic ignored "-Wdeprecated-declarations" // Silencing GCC nagging me about std::auto_ptr somewhere in boost legacy snippets

#include <boost/python.hpp>
#include <boost/python/suite/indexing/vector_indexing_suite.hpp>
#include <memory>
#include "tbrgs_graph.hpp"
#include "tbrgs_constraints.hpp"
#include "../commons/tbrgs_log.hpp"
#include "../io/problem_file.hpp"
#include "../reweight/edge_reweighter.hpp"
#include "../search/search_engine.hpp"


using namespace boost::python;
using namespace tbrgs;
using namespace tbrgs::model;
using namespace tbrgs::search;
using namespace tbrgs::reweight;


static std::string m_parse_python_exception()
{
    PyObject *type_ptr = NULL, *value_ptr = NULL, *traceback_ptr = NULL;
    PyErr_Fetch(&type_ptr, &value_ptr, &traceback_ptr);

    std::string ret("Unfetchable Python error");
    if (type_ptr != NULL)
    {
        handle<> h_type(type_ptr);
        extract<std::string> e_type(str(object(h_type).attr("__name__")));
        ret = e_type.check() ? e_type() : "Unknown exception type";
    }
    if (value_ptr != NULL)
    {
        handle<> h_val(value_ptr);
        extract<std::string> e_val{str(object(h_val))};
        ret += e_val.check() ? ": " + e_val() : std::string(": Unparseable Python error");
    }
    if (traceback_ptr != NULL)
    {
        // traceback is dropped: predictor failures are reported one line per edge
        handle<> h_tb(traceback_ptr);
    }
    return ret;
}


/**
 * @brief node ids come from Python as int or str
 */
static node_id_t m_node_id(const object &o)
{
    return extract<std::string>(str(o));
}


/**
 * @brief Graph(nodes, edges, origin, destinations)
 *
 * @param nodes         {id: (x, y)}
 * @param edges         {(from, to): cost}
 * @param origin        id
 * @param destinations  iterable of ids
 */
static std::shared_ptr<Graph> m_make_graph(const dict &nodes
                                           , const dict &edges
                                           , const object &origin
                                           , const object &destinations)
{
    Graph::NodeTable node_table;
    const list node_items = nodes.items();
    for (long i = 0; i < len(node_items); ++i)
    {
        const object item = node_items[i];
        const object xy = item[1];
        node_table[m_node_id(item[0])] = Coordinates(extract<double>(xy[0]), extract<double>(xy[1]));
    }

    EdgeList edge_list;
    const list edge_items = edges.items();
    for (long i = 0; i < len(edge_items); ++i)
    {
        const object item = edge_items[i];
        const object key = item[0];
        edge_list.emplace_back(m_node_id(key[0]), m_node_id(key[1]), extract<double>(item[1]));
    }

    Graph::DestinationSet dests;
    const list dest_list(destinations);
    for (long i = 0; i < len(dest_list); ++i)
    {
        dests.insert(m_node_id(dest_list[i]));
    }

    return std::make_shared<Graph>(node_table, edge_list, m_node_id(origin), dests);
}


static list m_graph_neighbors(const Graph &g, const object &node)
{
    list res;
    for (auto &n: g.neighbors(m_node_id(node)))
    {
        res.append(boost::python::make_tuple(n.node, n.cost));
    }
    return res;
}

static bool m_graph_is_destination(const Graph &g, const object &node)
{
    return g.is_destination(m_node_id(node));
}

static tuple m_graph_coordinates(const Graph &g, const object &node)
{
    const auto c = g.coordinates(m_node_id(node));
    return boost::python::make_tuple(c.x, c.y);
}

static cost_t m_graph_heuristic(const Graph &g, const object &node)
{
    return g.heuristic(m_node_id(node));
}

static cost_t m_graph_heuristic_to(const Graph &g, const object &node, const object &target)
{
    return g.heuristic(m_node_id(node), m_node_id(target));
}

static bool m_graph_check_consistency(const Graph &g, bool no_except)
{
    return g.check_consistency(no_except);
}

static node_id_t m_graph_origin(const Graph &g)
{
    return g.origin();
}

static std::size_t m_graph_nodes_count(const Graph &g)
{
    return g.nodes_count();
}

static std::size_t m_graph_edges_count(const Graph &g)
{
    return g.edges_count();
}

static void m_graph_set_edge_cost(Graph &g, const object &from, const object &to, cost_t cost)
{
    g.set_edge_cost(m_node_id(from), m_node_id(to), cost);
}

static object m_graph_edge_cost(const Graph &g, const object &from, const object &to)
{
    auto e = g.lookup_edge(m_node_id(from), m_node_id(to));
    return e == nullptr ? object() : object(e->cost);
}


static SearchResult m_search(const Graph &g, Strategy s, const SearchConstraints &c)
{
    return search::search(g, s, c);
}

static SearchResult m_search_default(const Graph &g, Strategy s)
{
    return search::search(g, s);
}

static Strategy m_strategy_from_name(const std::string &name)
{
    Strategy res;
    if (!strategy_from_string(name, res))
    {
        throw std::invalid_argument(strfmt("unknown strategy '%1%'", name));
    }
    return res;
}


static std::shared_ptr<Graph> m_load_problem_graph(const std::string &path)
{
    return std::make_shared<Graph>(io::load_problem_file(path).make_graph());
}


static void m_volume_add(VolumeIndex &v
                         , const std::string &location
                         , site_id_t site_id
                         , double volume
                         , const std::string &timestamp)
{
    v.add(VolumeRecord(location, site_id, volume, timestamp));
}

static std::size_t m_volume_count(const VolumeIndex &v)
{
    return v.size();
}


/**
 * @brief Estimator delegating to a Python callable
 *
 * The callable receives the volume window as a list of floats and
 * returns the predicted cost. Python exceptions become estimation_error,
 * so the reweighter can fall back.
 */
struct PyCallableEstimator: TravelTimeEstimator
{
    explicit PyCallableEstimator(const object &predictor_): predictor(predictor_) {}

    virtual cost_t predict(const StaticEdge &, const VolumeWindow &window) const
    {
        list args;
        for (auto v: window)
        {
            args.append(v);
        }
        try {
            return extract<double>(predictor(args));
        } catch (const error_already_set &) {
            throw estimation_error("Error in Python: " + m_parse_python_exception());
        }
    }

    object predictor;
};


static ReweightReport m_reweight_edges(Graph &g
                                       , const list &edges
                                       , const VolumeIndex &volumes
                                       , const object &predictor
                                       , const ReweightConstraints &constraints)
{
    StaticEdgeList static_edges;
    for (long i = 0; i < len(edges); ++i)
    {
        const StaticEdge e = extract<StaticEdge>(edges[i]);
        static_edges.push_back(e);
    }
    return reweight_edges(g, static_edges, volumes, PyCallableEstimator(predictor), constraints);
}

static ReweightReport m_reweight_edges_default(Graph &g
                                               , const list &edges
                                               , const VolumeIndex &volumes
                                               , const object &predictor)
{
    return m_reweight_edges(g, edges, volumes, predictor, ReweightConstraints());
}


struct sink_holder {
    // this is allocated on heap at runtime.
    // it avoids building boost::python::object statically:
    // It wouldn't be fair behaviour in a dynamically loadable module

    object functor;
};

static sink_holder *m_sink = nullptr;

static void m_log_register_sink(const object &sink)
{
    if (m_sink == nullptr) m_sink = new sink_holder;
    m_sink->functor = sink;
    if (sink.is_none())
    {
        log_register_sink(log_sink_t());
        return;
    }
    log_register_sink([](log_level lvl, const char *msg)
    {
        try {
            m_sink->functor(lvl, msg);
        } catch (const error_already_set &) {
            throw std::runtime_error(m_parse_python_exception());
        }
    });
}


/**
 * @brief Export C++ model to Python.
 *
 * This is what is seen by "import" of this CPython extension.
 */
BOOST_PYTHON_MODULE(tbrgs_ext)
{
    using dont_make_copies = boost::noncopyable;

    class_<NodePath>("NodePath")
            .def(vector_indexing_suite<NodePath>());

    class_<VolumeWindow>("VolumeWindow")
            .def(vector_indexing_suite<VolumeWindow>());

    class_<Graph, std::shared_ptr<Graph>>("Graph", no_init)
            .def("__init__"          , make_constructor(&m_make_graph))
            .def("neighbors"         , &m_graph_neighbors)
            .def("is_destination"    , &m_graph_is_destination)
            .def("coordinates"       , &m_graph_coordinates)
            .def("heuristic"         , &m_graph_heuristic)
            .def("heuristic"         , &m_graph_heuristic_to)
            .def("set_edge_cost"     , &m_graph_set_edge_cost)
            .def("edge_cost"         , &m_graph_edge_cost)
            .def("check_consistency" , &m_graph_check_consistency)
            .def("nodes_count"       , &m_graph_nodes_count)
            .def("edges_count"       , &m_graph_edges_count)
            .add_property("origin"   , &m_graph_origin)
            ;

    enum_<Strategy>("Strategy")
            .value("DFS" , STRATEGY_DFS )
            .value("BFS" , STRATEGY_BFS )
            .value("GBFS", STRATEGY_GBFS)
            .value("AS"  , STRATEGY_AS  )
            .value("CUS1", STRATEGY_CUS1)
            .value("CUS2", STRATEGY_CUS2)
            ;
    def("strategy_from_name", m_strategy_from_name);
    def("strategy_name", strategy_name);

    class_<SearchConstraints>("SearchConstraints")
            .def_readwrite("cus2_weight"   , &SearchConstraints::cus2_weight)
            .def_readwrite("created_limit" , &SearchConstraints::created_limit)
            .def("check_consistency"       , &SearchConstraints::check_consistency)
            ;

    class_<SearchResult>("SearchResult")
            .def_readonly("strategy" , &SearchResult::strategy)
            .def_readonly("found"    , &SearchResult::found)
            .def_readonly("goal"     , &SearchResult::goal)
            .def_readonly("created"  , &SearchResult::created)
            .def_readonly("expanded" , &SearchResult::expanded)
            .def_readonly("path"     , &SearchResult::path)
            .def_readonly("cost"     , &SearchResult::cost)
            .def("infos"             , &SearchResult::infos)
            .def(self_ns::str(self_ns::self))
            ;

    def("search", m_search);
    def("search", m_search_default);
    def("load_problem_graph", m_load_problem_graph);

    class_<VolumeIndex, dont_make_copies>("VolumeIndex")
            .def("add"           , &m_volume_add)
            .def("recent_window" , &VolumeIndex::recent_window)
            .def("__len__"       , &m_volume_count)
            ;

    class_<StaticEdge>("StaticEdge", init<const node_id_t &, const node_id_t &>())
            .def(init<const node_id_t &, const node_id_t &, cost_t>())
            .def_readwrite("from_"           , &StaticEdge::from)
            .def_readwrite("to"              , &StaticEdge::to)
            .def_readwrite("has_static_cost" , &StaticEdge::has_static_cost)
            .def_readwrite("static_cost"     , &StaticEdge::static_cost)
            ;

    class_<ReweightConstraints>("ReweightConstraints")
            .def_readwrite("lookback"  , &ReweightConstraints::lookback)
            .def("check_consistency"   , &ReweightConstraints::check_consistency)
            ;

    class_<ReweightReport>("ReweightReport")
            .def_readonly("total"    , &ReweightReport::total)
            .def_readonly("updated"  , &ReweightReport::updated)
            .def_readonly("fallback" , &ReweightReport::fallback)
            .def_readonly("skipped"  , &ReweightReport::skipped)
            .def("infos"             , &ReweightReport::infos)
            ;

    def("reweight_edges", m_reweight_edges);
    def("reweight_edges", m_reweight_edges_default);

    enum_<log_level>("log_level")
            .value("trace"  , log_level_trace  )
            .value("debug"  , log_level_debug  )
            .value("info"   , log_level_info   )
            .value("warning", log_level_warning)
            .value("error"  , log_level_error  )
            .export_values()
            ;
    def("log_get_level", log_get_level);
    def("log_set_level", log_set_level);
    def("log_register_sink", m_log_register_sink);
}
