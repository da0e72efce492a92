// bindings for DayCount, Compounding and Interpolator strategies
#include "bindings_common.h"
#include <ycurve/conventions/Compounding.h>
#include <ycurve/conventions/DayCount.h>
#include <ycurve/market/Interpolator.h>

void bind_conventions(py::module_ &m)
{
    // ---- day count ----
    py::enum_<DayCountConvention>(m, "DayCountConvention", "Built-in day-count conventions")
        .value("Actual365Fixed", DayCountConvention::Actual365Fixed)
        .value("Actual360", DayCountConvention::Actual360)
        .value("Thirty360", DayCountConvention::Thirty360)
        .export_values();

    py::class_<DayCount, std::shared_ptr<DayCount>>(m, "DayCount",
                                                    "Day-count convention: calendar span -> year fraction")
        .def_property_readonly("name", &DayCount::name)
        .def("day_count", [](const DayCount &dc, const py::object &start, const py::object &end)
             { return dc.dayCount(toDate(start), toDate(end)); },
             py::arg("start"), py::arg("end"),
             "Day numerator between two datetime.date values")
        .def("year_fraction", [](const DayCount &dc, const py::object &start, const py::object &end)
             { return dc.yearFraction(toDate(start), toDate(end)); },
             py::arg("start"), py::arg("end"),
             "Year fraction between two datetime.date values")
        .def("__repr__", [](const DayCount &dc)
             { return "<DayCount " + dc.name() + ">"; });

    py::class_<Actual365Fixed, DayCount, std::shared_ptr<Actual365Fixed>>(m, "Actual365Fixed")
        .def(py::init<>());
    py::class_<Actual360, DayCount, std::shared_ptr<Actual360>>(m, "Actual360")
        .def(py::init<>());
    py::class_<Thirty360, DayCount, std::shared_ptr<Thirty360>>(m, "Thirty360")
        .def(py::init<>());

    // ---- compounding ----
    py::enum_<CompoundingType>(m, "CompoundingType", "Built-in compounding conventions")
        .value("Simple", CompoundingType::Simple)
        .value("Continuous", CompoundingType::Continuous)
        .export_values();

    py::class_<Compounding, std::shared_ptr<Compounding>>(m, "Compounding",
                                                          "Compounding convention linking rate, tenor and discount factor")
        .def_property_readonly("name", &Compounding::name)
        .def("discount_factor", &Compounding::discountFactor,
             py::arg("rate"), py::arg("tenor"))
        .def("forward_rate", &Compounding::forwardRate,
             py::arg("r1"), py::arg("t1"), py::arg("r2"), py::arg("t2"),
             "Forward rate between t1 and t2 implied by spot rates r1 and r2")
        .def("implied_rate", &Compounding::impliedRate,
             py::arg("discount_factor"), py::arg("tenor"),
             "Spot rate reproducing the given discount factor")
        .def("__repr__", [](const Compounding &c)
             { return "<Compounding " + c.name() + ">"; });

    py::class_<SimpleCompounding, Compounding, std::shared_ptr<SimpleCompounding>>(m, "SimpleCompounding")
        .def(py::init<>());
    py::class_<ContinuousCompounding, Compounding, std::shared_ptr<ContinuousCompounding>>(m, "ContinuousCompounding")
        .def(py::init<>());

    // ---- interpolation ----
    py::enum_<InterpolationMethod>(m, "InterpolationMethod", "Built-in interpolation methods")
        .value("Linear", InterpolationMethod::Linear)
        .value("CubicSpline", InterpolationMethod::CubicSpline)
        .value("LogLinear", InterpolationMethod::LogLinear)
        .export_values();

    py::class_<Interpolator, std::shared_ptr<Interpolator>>(m, "Interpolator",
                                                            "Rate-curve interpolation strategy")
        .def_property_readonly("name", &Interpolator::name)
        .def("interpolate", &Interpolator::interpolate,
             py::arg("tenors"), py::arg("rates"), py::arg("target"))
        .def("extrapolate", &Interpolator::extrapolate,
             py::arg("tenors"), py::arg("rates"), py::arg("target"))
        .def("__repr__", [](const Interpolator &i)
             { return "<Interpolator " + i.name() + ">"; });

    py::class_<LinearInterpolator, Interpolator, std::shared_ptr<LinearInterpolator>>(m, "LinearInterpolator")
        .def(py::init<>());
    py::class_<CubicSplineInterpolator, Interpolator, std::shared_ptr<CubicSplineInterpolator>>(m, "CubicSplineInterpolator")
        .def(py::init<>());
    py::class_<LogLinearInterpolator, Interpolator, std::shared_ptr<LogLinearInterpolator>>(m, "LogLinearInterpolator")
        .def(py::init<>());
}
