#ifndef YCURVE_CURVEFACTORY_H
#define YCURVE_CURVEFACTORY_H

#include <ycurve/factory/StrategyCatalog.h>
#include <ycurve/market/Instruments.h>
#include <ycurve/market/YieldCurve.h>
#include <string>
#include <vector>

/**
 * Builds YieldCurve instances from strategy names
 *
 * Names are resolved against the catalog (case-insensitive); an unknown name throws
 * UnknownStrategyError before any curve work is done. The catalog must outlive the factory.
 */
class CurveFactory
{
public:
    explicit CurveFactory(const StrategyCatalog& catalog);
    CurveFactory(StrategyCatalog&&) = delete;     // would dangle

    YieldCurve createSpotCurve(const std::vector<double>& tenors,
                               const std::vector<double>& rates,
                               const std::string& interpolation = "linear",
                               const std::string& dayCount = "ACT/365",
                               const std::string& compounding = "simple",
                               const std::string& curveType = "spot") const;

    // Strips the bonds with the named bootstrapper, then builds a spot curve on the result
    YieldCurve createFromBonds(const std::vector<BondRecord>& bonds,
                               const std::string& bootstrapper = "bond",
                               const std::string& interpolation = "cubic_spline",
                               const std::string& dayCount = "ACT/365",
                               const std::string& compounding = "simple") const;

    YieldCurve createFromDeposits(const std::vector<DepositRecord>& deposits,
                                  const std::string& bootstrapper = "deposit",
                                  const std::string& interpolation = "linear",
                                  const std::string& dayCount = "ACT/365",
                                  const std::string& compounding = "simple") const;

    const StrategyCatalog& catalog() const { return _catalog; }

private:
    const StrategyCatalog& _catalog;
};

#endif //YCURVE_CURVEFACTORY_H
