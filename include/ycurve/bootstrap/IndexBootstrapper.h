#ifndef YCURVE_INDEXBOOTSTRAPPER_H
#define YCURVE_INDEXBOOTSTRAPPER_H

#include <ycurve/bootstrap/Bootstrapper.h>
#include <ycurve/indexes/IndexRegistry.h>
#include <ycurve/market/Instruments.h>
#include <optional>

/**
 * Index fixings to spot points
 *
 * Observations are checked against the registry, their codes upper-cased and the list sorted by
 * tenor; the fixings themselves are returned unchanged as spot rates.
 * The registry must outlive the bootstrapper.
 */
class IndexBootstrapper : public Bootstrapper<IndexObservation>
{
public:
    explicit IndexBootstrapper(const IndexRegistry& registry);

    std::string name() const override { return "index"; }

    // @throws ValidationError (empty input, tenor <= 0), UnknownStrategyError (unknown code)
    CurvePoints bootstrap(const std::vector<IndexObservation>& observations) const override;

    // Same as bootstrap(), with observations of primaryIndex ahead of the others at equal tenor
    CurvePoints bootstrapMerged(const std::vector<IndexObservation>& observations,
                                const std::optional<std::string>& primaryIndex) const;

    // Validated copy with upper-case codes, stable-sorted by tenor
    std::vector<IndexObservation> normalize(const std::vector<IndexObservation>& observations) const;

private:
    const IndexRegistry& _registry;
};

#endif //YCURVE_INDEXBOOTSTRAPPER_H
