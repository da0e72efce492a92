#ifndef YCURVE_BOOTSTRAPPER_H
#define YCURVE_BOOTSTRAPPER_H

#include <string>
#include <vector>

// Sorted (tenor, spot rate) arrays produced by a bootstrapper
struct CurvePoints {
    std::vector<double> tenors;
    std::vector<double> rates;
};

/**
 * Bootstrapping strategy: derives spot-rate points from a list of market instruments
 * @tparam Instrument Market record the strategy consumes (BondRecord, DepositRecord, ...)
 */
template <typename Instrument>
class Bootstrapper
{
public:
    virtual ~Bootstrapper() = default;

    virtual std::string name() const = 0;

    // @throws ValidationError on empty or invalid instruments
    virtual CurvePoints bootstrap(const std::vector<Instrument>& instruments) const = 0;
};

#endif //YCURVE_BOOTSTRAPPER_H
