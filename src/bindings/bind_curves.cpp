// bindings for market records, YieldCurve, bootstrappers and CurveUtils
#include "bindings_common.h"
#include <ycurve/bootstrap/BondBootstrapper.h>
#include <ycurve/bootstrap/DepositBootstrapper.h>
#include <ycurve/market/Instruments.h>
#include <ycurve/market/YieldCurve.h>
#include <ycurve/utils/Utils.h>

void bind_curves(py::module_ &m)
{
    // ---- market records ----
    py::class_<BondRecord>(m, "BondRecord", "Coupon bond quote (coupon as annual rate, e.g. 0.05)")
        .def(py::init([](double maturity, double coupon, double price, int frequency, double faceValue)
                      { return BondRecord{maturity, coupon, price, frequency, faceValue}; }),
             py::arg("maturity"), py::arg("coupon"), py::arg("price"),
             py::arg("frequency") = 2, py::arg("face_value") = 100.0)
        .def_readwrite("maturity", &BondRecord::maturity)
        .def_readwrite("coupon", &BondRecord::coupon)
        .def_readwrite("price", &BondRecord::price)
        .def_readwrite("frequency", &BondRecord::frequency)
        .def_readwrite("face_value", &BondRecord::faceValue);

    py::class_<DepositRecord>(m, "DepositRecord", "Money-market deposit quote")
        .def(py::init([](double maturity, double rate)
                      { return DepositRecord{maturity, rate}; }),
             py::arg("maturity"), py::arg("rate"))
        .def_readwrite("maturity", &DepositRecord::maturity)
        .def_readwrite("rate", &DepositRecord::rate);

    py::class_<RatePoint>(m, "RatePoint", "Index observation without its index code")
        .def(py::init([](double tenor, double rate)
                      { return RatePoint{tenor, rate}; }),
             py::arg("tenor"), py::arg("rate"))
        .def_readwrite("tenor", &RatePoint::tenor)
        .def_readwrite("rate", &RatePoint::rate);

    py::class_<IndexObservation>(m, "IndexObservation", "Index fixing {index, tenor, rate}")
        .def(py::init([](const std::string &index, double tenor, double rate)
                      { return IndexObservation{index, tenor, rate}; }),
             py::arg("index"), py::arg("tenor"), py::arg("rate"))
        .def_readwrite("index", &IndexObservation::index)
        .def_readwrite("tenor", &IndexObservation::tenor)
        .def_readwrite("rate", &IndexObservation::rate);

    // ---- YieldCurve ----
    py::class_<CurveRepresentation>(m, "CurveRepresentation")
        .def_readonly("tenors", &CurveRepresentation::tenors)
        .def_readonly("rates", &CurveRepresentation::rates)
        .def_readonly("curve_type", &CurveRepresentation::curveType)
        .def("to_dict", [](const CurveRepresentation &r)
             {
                 py::dict d;
                 d["tenors"] = r.tenors;
                 d["rates"] = r.rates;
                 d["curve_type"] = r.curveType;
                 return d;
             });

    py::class_<YieldCurve>(m, "YieldCurve",
                           R"pbdoc(
            Spot-rate term structure.

            Build it through CurveFactory / IndexCurveFactory; the curve is immutable.
            Stored tenors return their exact rate, other tenors are interpolated
            (inside the grid) or extrapolated (outside of it).
        )pbdoc")
        .def("spot_rate", &YieldCurve::spotRate, py::arg("tenor"))
        .def("discount_factor",
             static_cast<double (YieldCurve::*)(double) const>(&YieldCurve::discountFactor),
             py::arg("tenor"))
        .def("discount_factor_between",
             [](const YieldCurve &c, const py::object &reference, const py::object &payment)
             { return c.discountFactor(toDate(reference), toDate(payment)); },
             py::arg("reference_date"), py::arg("payment_date"),
             "Discount factor for a payment date, tenor measured with the curve's day count")
        .def("forward_rate", &YieldCurve::forwardRate, py::arg("t1"), py::arg("t2"))
        .def("zero_coupon_price", &YieldCurve::zeroCouponPrice,
             py::arg("tenor"), py::arg("face_value") = 100.0)
        .def("year_fraction",
             [](const YieldCurve &c, const py::object &start, const py::object &end)
             { return c.yearFraction(toDate(start), toDate(end)); },
             py::arg("start"), py::arg("end"))
        .def("par_yield", &YieldCurve::parYield,
             py::arg("maturity"), py::arg("frequency") = 2)
        .def("to_representation", &YieldCurve::toRepresentation)
        .def_property_readonly("tenors", &YieldCurve::tenors)
        .def_property_readonly("rates", &YieldCurve::rates)
        .def_property_readonly("curve_type", &YieldCurve::curveType)
        .def_property_readonly("interpolation", [](const YieldCurve &c)
                               { return c.interpolator().name(); })
        .def_property_readonly("day_count", [](const YieldCurve &c)
                               { return c.dayCount().name(); })
        .def_property_readonly("compounding", [](const YieldCurve &c)
                               { return c.compounding().name(); })
        .def("__repr__", [](const YieldCurve &c)
             {
                 return "<YieldCurve " + c.curveType() + " points=" + std::to_string(c.tenors().size()) +
                        " interpolation=" + c.interpolator().name() + ">";
             });

    // ---- bootstrapping ----
    py::class_<CurvePoints>(m, "CurvePoints")
        .def_readonly("tenors", &CurvePoints::tenors)
        .def_readonly("rates", &CurvePoints::rates);

    py::class_<BootstrapOptions>(m, "BootstrapOptions", "Brent brackets and caps for bond stripping")
        .def(py::init<>())
        .def_readwrite("lower_rate", &BootstrapOptions::lowerRate)
        .def_readwrite("upper_rate", &BootstrapOptions::upperRate)
        .def_readwrite("max_iterations", &BootstrapOptions::maxIterations)
        .def_readwrite("widened_lower_rate", &BootstrapOptions::widenedLowerRate)
        .def_readwrite("widened_upper_rate", &BootstrapOptions::widenedUpperRate)
        .def_readwrite("widened_max_iterations", &BootstrapOptions::widenedMaxIterations)
        .def_readwrite("price_tolerance", &BootstrapOptions::priceTolerance)
        .def_readwrite("verbose", &BootstrapOptions::verbose);

    py::class_<BondBootstrapper>(m, "BondBootstrapper", "Recursive bond stripping")
        .def(py::init([](CompoundingType compounding, InterpolationMethod interpolation,
                         const BootstrapOptions &options)
                      {
                          return BondBootstrapper(makeCompounding(compounding),
                                                  makeInterpolator(interpolation), options);
                      }),
             py::arg("compounding") = CompoundingType::Simple,
             py::arg("interpolation") = InterpolationMethod::Linear,
             py::arg("options") = BootstrapOptions())
        .def("bootstrap", &BondBootstrapper::bootstrap, py::arg("bonds"))
        .def_static("payment_times", &BondBootstrapper::paymentTimes, py::arg("bond"));

    py::class_<DepositBootstrapper>(m, "DepositBootstrapper")
        .def(py::init<>())
        .def("bootstrap", &DepositBootstrapper::bootstrap, py::arg("deposits"));

    // ---- curve helpers ----
    m.def("ensure_sorted_unique", &CurveUtils::ensureSortedUnique,
          py::arg("tenors"), py::arg("rates"),
          "Sort by tenor and keep the first rate at each repeated tenor");
    m.def("forward_rate_from_discount_factors", &CurveUtils::forwardRateFromDiscountFactors,
          py::arg("df1"), py::arg("df2"), py::arg("t1"), py::arg("t2"));
    m.def("forward_rate_from_spot_rates", &CurveUtils::forwardRateFromSpotRates,
          py::arg("r1"), py::arg("r2"), py::arg("t1"), py::arg("t2"), py::arg("continuous") = false);
}
