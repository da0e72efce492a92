// bindings for StrategyCatalog, IndexRegistry, CurveFactory, IndexCurveFactory
#include "bindings_common.h"
#include <ycurve/factory/CurveFactory.h>
#include <ycurve/factory/IndexCurveFactory.h>
#include <ycurve/factory/StrategyCatalog.h>
#include <ycurve/indexes/IndexRegistry.h>

namespace {

// module-wide defaults, built once at import and read-only afterwards
const StrategyCatalog &defaultCatalog()
{
    static const StrategyCatalog catalog = StrategyCatalog::defaults();
    return catalog;
}

const IndexRegistry &defaultIndexRegistry()
{
    static const IndexRegistry registry = IndexRegistry::withDefaults();
    return registry;
}

} // namespace

void bind_factories(py::module_ &m)
{
    defaultCatalog();
    defaultIndexRegistry();

    // ---- catalog ----
    py::class_<StrategyCatalog>(m, "StrategyCatalog", "Registered strategy names per family")
        .def_property_readonly("interpolations", [](const StrategyCatalog &c)
                               { return c.interpolators().names(); })
        .def_property_readonly("day_counts", [](const StrategyCatalog &c)
                               { return c.dayCounts().names(); })
        .def_property_readonly("compoundings", [](const StrategyCatalog &c)
                               { return c.compoundings().names(); })
        .def_property_readonly("bond_bootstrappers", [](const StrategyCatalog &c)
                               { return c.bondBootstrappers().names(); })
        .def_property_readonly("deposit_bootstrappers", [](const StrategyCatalog &c)
                               { return c.depositBootstrappers().names(); });

    m.def("default_catalog", &defaultCatalog, py::return_value_policy::reference,
          "Catalog of built-in strategies shared by the default factories");

    // ---- indexes ----
    py::enum_<IndexType>(m, "IndexType")
        .value("OIS", IndexType::OIS)
        .value("IBOR", IndexType::IBOR)
        .value("Treasury", IndexType::Treasury)
        .value("Swap", IndexType::Swap)
        .export_values();

    py::class_<InterestRateIndex>(m, "InterestRateIndex", "Benchmark index and its quoting conventions")
        .def_readonly("code", &InterestRateIndex::code)
        .def_readonly("name", &InterestRateIndex::name)
        .def_readonly("currency", &InterestRateIndex::currency)
        .def_readonly("index_type", &InterestRateIndex::indexType)
        .def_readonly("day_count", &InterestRateIndex::dayCount)
        .def_readonly("compounding", &InterestRateIndex::compounding)
        .def_readonly("fixing_frequency", &InterestRateIndex::fixingFrequency)
        .def_readonly("description", &InterestRateIndex::description)
        .def("__str__", [](const InterestRateIndex &i)
             { return i.code + " (" + i.currency + ")"; })
        .def("__repr__", [](const InterestRateIndex &i)
             { return "<InterestRateIndex " + i.code + " " + i.currency + " " + toString(i.indexType) + ">"; });

    py::class_<IndexRegistry>(m, "IndexRegistry", "Standard interest-rate indexes keyed by code")
        .def_static("default", &defaultIndexRegistry, py::return_value_policy::reference)
        .def("get", &IndexRegistry::get, py::arg("code"),
             "Index for a code (case-insensitive), None if unknown")
        .def("list_all", &IndexRegistry::listAll)
        .def("list_by_currency", &IndexRegistry::listByCurrency, py::arg("currency"))
        .def("codes", &IndexRegistry::codes)
        .def("__contains__", &IndexRegistry::contains)
        .def("__len__", &IndexRegistry::size);

    // ---- factories ----
    py::class_<CurveFactory>(m, "CurveFactory", "Builds yield curves from strategy names")
        .def(py::init([]()
                      { return std::make_unique<CurveFactory>(defaultCatalog()); }))
        .def("create_spot_curve", &CurveFactory::createSpotCurve,
             py::arg("tenors"), py::arg("rates"),
             py::arg("interpolation") = "linear",
             py::arg("day_count") = "ACT/365",
             py::arg("compounding") = "simple",
             py::arg("curve_type") = "spot")
        .def("create_from_bonds", &CurveFactory::createFromBonds,
             py::arg("bonds"),
             py::arg("bootstrapper") = "bond",
             py::arg("interpolation") = "cubic_spline",
             py::arg("day_count") = "ACT/365",
             py::arg("compounding") = "simple")
        .def("create_from_deposits", &CurveFactory::createFromDeposits,
             py::arg("deposits"),
             py::arg("bootstrapper") = "deposit",
             py::arg("interpolation") = "linear",
             py::arg("day_count") = "ACT/365",
             py::arg("compounding") = "simple");

    py::class_<IndexCurveFactory>(m, "IndexCurveFactory", "Builds yield curves from index fixings")
        .def(py::init([]()
                      { return std::make_unique<IndexCurveFactory>(defaultCatalog(), defaultIndexRegistry()); }))
        .def("create_from_index", &IndexCurveFactory::createFromIndex,
             py::arg("index_code"), py::arg("observations"),
             py::arg("interpolation") = "cubic_spline",
             py::arg("day_count") = py::none(),
             py::arg("compounding") = py::none())
        .def("create_from_multiple_indexes", &IndexCurveFactory::createFromMultipleIndexes,
             py::arg("index_rates"),
             py::arg("primary_index") = py::none(),
             py::arg("interpolation") = "cubic_spline",
             py::arg("day_count") = py::none(),
             py::arg("compounding") = py::none())
        .def("list_available_indexes", &IndexCurveFactory::listAvailableIndexes,
             py::arg("currency") = py::none());
}
