#include <ycurve/factory/CurveFactory.h>

CurveFactory::CurveFactory(const StrategyCatalog& catalog)
    : _catalog(catalog)
{
}

YieldCurve CurveFactory::createSpotCurve(const std::vector<double>& tenors,
                                         const std::vector<double>& rates,
                                         const std::string& interpolation,
                                         const std::string& dayCount,
                                         const std::string& compounding,
                                         const std::string& curveType) const
{
    return YieldCurve(tenors, rates,
                      _catalog.interpolator(interpolation),
                      _catalog.dayCount(dayCount),
                      _catalog.compounding(compounding),
                      curveType);
}

YieldCurve CurveFactory::createFromBonds(const std::vector<BondRecord>& bonds,
                                         const std::string& bootstrapper,
                                         const std::string& interpolation,
                                         const std::string& dayCount,
                                         const std::string& compounding) const
{
    auto stripper = _catalog.bondBootstrapper(bootstrapper);
    // every name is resolved before stripping
    auto interp = _catalog.interpolator(interpolation);
    auto dc = _catalog.dayCount(dayCount);
    auto comp = _catalog.compounding(compounding);

    CurvePoints points = stripper->bootstrap(bonds);
    return YieldCurve(points.tenors, points.rates, interp, dc, comp);
}

YieldCurve CurveFactory::createFromDeposits(const std::vector<DepositRecord>& deposits,
                                            const std::string& bootstrapper,
                                            const std::string& interpolation,
                                            const std::string& dayCount,
                                            const std::string& compounding) const
{
    auto stripper = _catalog.depositBootstrapper(bootstrapper);
    auto interp = _catalog.interpolator(interpolation);
    auto dc = _catalog.dayCount(dayCount);
    auto comp = _catalog.compounding(compounding);

    CurvePoints points = stripper->bootstrap(deposits);
    return YieldCurve(points.tenors, points.rates, interp, dc, comp);
}
