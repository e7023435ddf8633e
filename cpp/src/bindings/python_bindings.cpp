#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "lazyagg/collection/pcollection.hpp"
#include "lazyagg/core/errors.hpp"
#include "lazyagg/dag/executor_options.hpp"
#include "lazyagg/dag/pipeline.hpp"
#include "lazyagg/lib/aggregate.hpp"
#include "lazyagg/util/logger.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace lazyagg;

namespace {

using Int64Collection = PCollection<int64_t>;
using StringCollection = PCollection<std::string>;
using StringInt64Table = PTable<std::string, int64_t>;
using Int64Int64Table = PTable<int64_t, int64_t>;
using StringInt64ListTable = PTable<std::string, std::vector<int64_t>>;

template<typename S>
void bind_collection(py::module_& m, const char* name) {
    py::class_<PCollection<S>>(m, name)
        .def("name", &PCollection<S>::name)
        .def("size", &PCollection<S>::size)
        .def("materialize", &PCollection<S>::materialize)
        .def("union_with",
             py::overload_cast<const PCollection<S>&>(&PCollection<S>::union_with, py::const_));
}

template<typename K, typename V>
void bind_table(py::module_& m, const char* name) {
    py::class_<PTable<K, V>>(m, name)
        .def("name", &PTable<K, V>::name)
        .def("size", &PTable<K, V>::size)
        .def("materialize", &PTable<K, V>::materialize)
        .def("materialize_to_map", &PTable<K, V>::materialize_to_map);
}

} // namespace

PYBIND11_MODULE(pylazyagg, m) {
    m.doc() = "lazyagg - distributive aggregations over lazy partitioned collections";

    py::register_exception<UnsupportedTypeError>(m, "UnsupportedTypeError", PyExc_TypeError);
    py::register_exception<EmptyAggregationError>(m, "EmptyAggregationError", PyExc_ValueError);

    py::enum_<util::LogLevel>(m, "LogLevel")
        .value("TRACE", util::LogLevel::TRACE)
        .value("DEBUG", util::LogLevel::DEBUG)
        .value("INFO", util::LogLevel::INFO)
        .value("WARNING", util::LogLevel::WARNING)
        .value("ERROR", util::LogLevel::ERROR)
        .value("OFF", util::LogLevel::OFF);

    m.def("setup_logging", &util::setup_logging, py::arg("level"));

    // Plan module
    auto m_dag = m.def_submodule("dag", "Pipelines and executor options");

    py::class_<dag::ExecutorOptions>(m_dag, "ExecutorOptions")
        .def(py::init<>())
        .def_readwrite("num_partitions", &dag::ExecutorOptions::num_partitions)
        .def_readwrite("num_reducers", &dag::ExecutorOptions::num_reducers)
        .def_readwrite("map_side_combine", &dag::ExecutorOptions::map_side_combine)
        .def_readwrite("combine_fan_in", &dag::ExecutorOptions::combine_fan_in)
        .def("validate", &dag::ExecutorOptions::validate)
        .def_static("from_environment", &dag::ExecutorOptions::from_environment)
        .def("__repr__", &dag::ExecutorOptions::to_string);

    py::class_<dag::Pipeline, std::shared_ptr<dag::Pipeline>>(m_dag, "Pipeline")
        .def(py::init<dag::ExecutorOptions, std::string>(),
             py::arg("options") = dag::ExecutorOptions(), py::arg("name") = "pipeline")
        .def("name", &dag::Pipeline::name)
        .def("num_nodes", [](const dag::Pipeline& p) { return p.nodes().size(); })
        .def("to_dot", &dag::Pipeline::to_dot)
        .def("log_execution_plan", &dag::Pipeline::log_execution_plan);

    // Collections
    bind_collection<int64_t>(m, "Int64Collection");
    bind_collection<std::string>(m, "StringCollection");
    bind_table<std::string, int64_t>(m, "StringInt64Table");
    bind_table<int64_t, int64_t>(m, "Int64Int64Table");
    bind_table<std::string, std::vector<int64_t>>(m, "StringInt64ListTable");

    m.def("int64_collection",
          [](std::shared_ptr<dag::Pipeline> pipeline, std::vector<int64_t> elements, const std::string& name) {
              return collection_of(pipeline, std::move(elements), name);
          },
          py::arg("pipeline"), py::arg("elements"), py::arg("name") = "source");

    m.def("string_collection",
          [](std::shared_ptr<dag::Pipeline> pipeline, std::vector<std::string> elements, const std::string& name) {
              return collection_of(pipeline, std::move(elements), name);
          },
          py::arg("pipeline"), py::arg("elements"), py::arg("name") = "source");

    m.def("string_int64_table",
          [](std::shared_ptr<dag::Pipeline> pipeline, std::vector<std::pair<std::string, int64_t>> pairs,
             const std::string& name) {
              return table_of(pipeline, std::move(pairs), name);
          },
          py::arg("pipeline"), py::arg("pairs"), py::arg("name") = "source");

    // Aggregations; scalar results are resolved before returning to Python
    auto m_agg = m.def_submodule("aggregate", "Distributive aggregations");

    m_agg.def("count", [](const StringCollection& c) { return aggregate::count(c); });
    m_agg.def("count", [](const Int64Collection& c) { return aggregate::count(c); });

    m_agg.def("length", [](const StringCollection& c) { return aggregate::length(c).get(); });
    m_agg.def("length", [](const Int64Collection& c) { return aggregate::length(c).get(); });

    m_agg.def("max", [](const Int64Collection& c) { return aggregate::max(c).get(); });
    m_agg.def("max", [](const StringCollection& c) { return aggregate::max(c).get(); });
    m_agg.def("min", [](const Int64Collection& c) { return aggregate::min(c).get(); });
    m_agg.def("min", [](const StringCollection& c) { return aggregate::min(c).get(); });

    m_agg.def("top",
              [](const StringInt64Table& t, size_t limit, bool maximize) {
                  return aggregate::top(t, limit, maximize);
              },
              py::arg("table"), py::arg("limit"), py::arg("maximize") = true);

    m_agg.def("top_overall",
              [](const StringInt64Table& t, size_t limit, bool maximize) {
                  return aggregate::top_overall(t, limit, maximize);
              },
              py::arg("table"), py::arg("limit"), py::arg("maximize") = true);

    m_agg.def("collect_values", [](const StringInt64Table& t) { return aggregate::collect_values(t); });

    // Utility functions
    m.def("version", []() { return "0.1.0"; });
}
