// common includes for all binding modules
#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include <ycurve/conventions/DayCount.h>

namespace py = pybind11;

// forward declarations for bind functions
void bind_conventions(py::module_ &m);
void bind_curves(py::module_ &m);
void bind_factories(py::module_ &m);

// datetime.date (or anything with year/month/day attributes) -> boost date
inline Date toDate(const py::object &obj)
{
    return Date(obj.attr("year").cast<int>(),
                obj.attr("month").cast<int>(),
                obj.attr("day").cast<int>());
}
