#include <ycurve/factory/IndexCurveFactory.h>
#include <ycurve/bootstrap/IndexBootstrapper.h>
#include <ycurve/utils/Errors.h>
#include <ycurve/utils/Utils.h>

IndexCurveFactory::IndexCurveFactory(const StrategyCatalog& catalog, const IndexRegistry& indexes)
    : _catalog(catalog), _indexes(indexes)
{
}

YieldCurve IndexCurveFactory::createFromIndex(const std::string& indexCode,
                                              const std::vector<RatePoint>& observations,
                                              const std::string& interpolation,
                                              const std::optional<std::string>& dayCount,
                                              const std::optional<std::string>& compounding) const
{
    const InterestRateIndex& index = _indexes.at(indexCode);

    auto interp = _catalog.interpolator(interpolation);
    auto dc = _catalog.dayCount(dayCount.value_or(index.dayCount));
    auto comp = _catalog.compounding(compounding.value_or(index.compounding));

    std::vector<IndexObservation> tagged;
    tagged.reserve(observations.size());
    for (const auto& point : observations) {
        tagged.push_back({index.code, point.tenor, point.rate});
    }

    CurvePoints points = IndexBootstrapper(_indexes).bootstrap(tagged);
    return YieldCurve(points.tenors, points.rates, interp, dc, comp, "index_based");
}

YieldCurve IndexCurveFactory::createFromMultipleIndexes(
    const std::map<std::string, std::vector<RatePoint>>& indexRates,
    const std::optional<std::string>& primaryIndex,
    const std::string& interpolation,
    const std::optional<std::string>& dayCount,
    const std::optional<std::string>& compounding) const
{
    if (indexRates.empty()) {
        throw ValidationError("IndexCurveFactory: no index rates provided");
    }

    std::string defaultDayCount = "ACT/360";
    std::string defaultCompounding = "simple";
    if (primaryIndex) {
        const InterestRateIndex& primary = _indexes.at(*primaryIndex);
        defaultDayCount = primary.dayCount;
        defaultCompounding = primary.compounding;
    }

    auto interp = _catalog.interpolator(interpolation);
    auto dc = _catalog.dayCount(dayCount.value_or(defaultDayCount));
    auto comp = _catalog.compounding(compounding.value_or(defaultCompounding));

    std::vector<IndexObservation> all;
    for (const auto& source : indexRates) {
        for (const auto& point : source.second) {
            all.push_back({source.first, point.tenor, point.rate});
        }
    }

    CurvePoints merged = IndexBootstrapper(_indexes).bootstrapMerged(all, primaryIndex);
    auto [tenors, rates] = CurveUtils::ensureSortedUnique(merged.tenors, merged.rates);
    return YieldCurve(tenors, rates, interp, dc, comp, "index_based");
}

std::map<std::string, std::string> IndexCurveFactory::listAvailableIndexes(
    const std::optional<std::string>& currency) const
{
    const auto indexes = currency ? _indexes.listByCurrency(*currency) : _indexes.listAll();

    std::map<std::string, std::string> result;
    for (const auto& entry : indexes) {
        result[entry.first] = entry.second.name;
    }
    return result;
}
