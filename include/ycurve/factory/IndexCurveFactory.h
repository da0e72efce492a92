#ifndef YCURVE_INDEXCURVEFACTORY_H
#define YCURVE_INDEXCURVEFACTORY_H

#include <ycurve/factory/StrategyCatalog.h>
#include <ycurve/indexes/IndexRegistry.h>
#include <ycurve/market/Instruments.h>
#include <ycurve/market/YieldCurve.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * Curves built from benchmark index fixings (SOFR, EURIBOR, ...)
 *
 * Day count and compounding default to the conventions the index is quoted in.
 * Catalog and registry must outlive the factory.
 */
class IndexCurveFactory
{
public:
    IndexCurveFactory(const StrategyCatalog& catalog, const IndexRegistry& indexes);
    IndexCurveFactory(StrategyCatalog&&, const IndexRegistry&) = delete;
    IndexCurveFactory(const StrategyCatalog&, IndexRegistry&&) = delete;
    IndexCurveFactory(StrategyCatalog&&, IndexRegistry&&) = delete;

    // Single-index curve, curveType "index_based"
    YieldCurve createFromIndex(const std::string& indexCode,
                               const std::vector<RatePoint>& observations,
                               const std::string& interpolation = "cubic_spline",
                               const std::optional<std::string>& dayCount = std::nullopt,
                               const std::optional<std::string>& compounding = std::nullopt) const;

    /**
     * Curve merged from several indexes
     *
     * At a tenor quoted by more than one index the primary index's rate is kept; without a
     * primary index the source whose code sorts first (std::map key order, alphabetical) wins,
     * whatever order the caller inserted the indexes in. Conventions default to the primary
     * index's, else ACT/360 and simple.
     */
    YieldCurve createFromMultipleIndexes(const std::map<std::string, std::vector<RatePoint>>& indexRates,
                                         const std::optional<std::string>& primaryIndex = std::nullopt,
                                         const std::string& interpolation = "cubic_spline",
                                         const std::optional<std::string>& dayCount = std::nullopt,
                                         const std::optional<std::string>& compounding = std::nullopt) const;

    // code -> full name, optionally restricted to one currency
    std::map<std::string, std::string> listAvailableIndexes(
        const std::optional<std::string>& currency = std::nullopt) const;

private:
    const StrategyCatalog& _catalog;
    const IndexRegistry& _indexes;
};

#endif //YCURVE_INDEXCURVEFACTORY_H
