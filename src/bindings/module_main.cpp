// pybind11 module entry point
#include "bindings_common.h"
#include <ycurve/utils/Errors.h>

PYBIND11_MODULE(_core, m)
{
    m.doc() = R"pbdoc(
        ycurve Python Bindings
        ----------------------

        Python interface to the ycurve yield-curve construction library.
        Provides access to:
        - Day-count, compounding and interpolation strategies
        - Yield curves (spot rates, discount factors, forwards, zero-coupon prices)
        - Bond and deposit bootstrapping
        - Index-based curves (SOFR, EURIBOR, SONIA, ...)

        Example:
            import ycurve

            factory = ycurve.CurveFactory()
            curve = factory.create_spot_curve([1.0, 2.0], [0.02, 0.025])
            curve.spot_rate(1.5)          # 0.0225
            curve.discount_factor(1.0)    # 1 / 1.02

            bonds = [ycurve.BondRecord(maturity=2.0, coupon=0.0, price=90.0)]
            zero = factory.create_from_bonds(bonds)

            index_factory = ycurve.IndexCurveFactory()
            sofr = index_factory.create_from_index(
                "SOFR", [ycurve.RatePoint(0.25, 0.05), ycurve.RatePoint(1.0, 0.052)]
            )
    )pbdoc";

    // error kinds, the two input errors are ValueError subclasses
    py::register_exception<ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<UnknownStrategyError>(m, "UnknownStrategyError", PyExc_ValueError);
    py::register_exception<ConvergenceError>(m, "ConvergenceError", PyExc_RuntimeError);

    bind_conventions(m);
    bind_curves(m);
    bind_factories(m);

    m.attr("__version__") = "0.1.0";
}
