#include <ycurve/bootstrap/IndexBootstrapper.h>
#include <ycurve/utils/Errors.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <algorithm>
#include <sstream>

namespace {

CurvePoints toCurvePoints(const std::vector<IndexObservation>& observations)
{
    CurvePoints points;
    points.tenors.reserve(observations.size());
    points.rates.reserve(observations.size());
    for (const auto& obs : observations) {
        points.tenors.push_back(obs.tenor);
        points.rates.push_back(obs.rate);
    }
    return points;
}

} // namespace

IndexBootstrapper::IndexBootstrapper(const IndexRegistry& registry)
    : _registry(registry)
{
}

std::vector<IndexObservation> IndexBootstrapper::normalize(const std::vector<IndexObservation>& observations) const
{
    if (observations.empty()) {
        throw ValidationError("IndexBootstrapper: no index data provided for bootstrapping");
    }

    std::vector<IndexObservation> normalized;
    normalized.reserve(observations.size());
    for (const auto& obs : observations) {
        const InterestRateIndex& index = _registry.at(obs.index);   // throws on unknown code
        if (obs.tenor <= 0.0) {
            std::ostringstream msg;
            msg << "IndexBootstrapper: invalid tenor for index " << index.code << ": " << obs.tenor;
            throw ValidationError(msg.str());
        }
        normalized.push_back({index.code, obs.tenor, obs.rate});
    }

    std::stable_sort(normalized.begin(), normalized.end(),
                     [](const IndexObservation& a, const IndexObservation& b) { return a.tenor < b.tenor; });
    return normalized;
}

CurvePoints IndexBootstrapper::bootstrap(const std::vector<IndexObservation>& observations) const
{
    return toCurvePoints(normalize(observations));
}

CurvePoints IndexBootstrapper::bootstrapMerged(const std::vector<IndexObservation>& observations,
                                               const std::optional<std::string>& primaryIndex) const
{
    std::vector<IndexObservation> normalized = normalize(observations);
    if (!primaryIndex) {
        return toCurvePoints(normalized);
    }

    const std::string primary = boost::algorithm::to_upper_copy(*primaryIndex);
    std::stable_sort(normalized.begin(), normalized.end(),
                     [&primary](const IndexObservation& a, const IndexObservation& b) {
                         if (a.tenor != b.tenor) {
                             return a.tenor < b.tenor;
                         }
                         return a.index == primary && b.index != primary;
                     });
    return toCurvePoints(normalized);
}
