#ifndef YCURVE_BONDBOOTSTRAPPER_H
#define YCURVE_BONDBOOTSTRAPPER_H

#include <ycurve/bootstrap/Bootstrapper.h>
#include <ycurve/conventions/Compounding.h>
#include <ycurve/market/Instruments.h>
#include <ycurve/market/Interpolator.h>
#include <memory>
#include <vector>

struct BootstrapOptions {
    double lowerRate = -0.05;           // first Brent bracket
    double upperRate = 0.5;
    int maxIterations = 100;
    double widenedLowerRate = -0.1;     // retry bracket
    double widenedUpperRate = 1.0;
    int widenedMaxIterations = 200;
    double priceTolerance = 1e-10;      // |model price - market price|
    bool verbose = false;
};

/**
 * Recursive bond stripping
 *
 * Bonds are processed by ascending maturity. For each bond the coupons paid before maturity are
 * discounted with rates interpolated on the points already solved (nearest known rate outside
 * their range) and the spot rate at maturity is the root of
 *      sum_k CF_k * P(r(t_k), t_k) + CF_n * P(r, T) - price = 0
 * found by Brent. Zero-coupon bonds are inverted in closed form.
 *
 * Schedule: n = max(1, round(T * freq)), t_k = T - (n - k) / freq, k = 1..n
 */
class BondBootstrapper : public Bootstrapper<BondRecord>
{
public:
    BondBootstrapper(std::shared_ptr<const Compounding> compounding,
                     std::shared_ptr<const Interpolator> interpolator,
                     BootstrapOptions options = {});

    std::string name() const override { return "bond"; }

    // @throws ValidationError on bad records, ConvergenceError when no rate reprices a bond
    CurvePoints bootstrap(const std::vector<BondRecord>& bonds) const override;

    // Cash-flow times of a bond, ascending
    static std::vector<double> paymentTimes(const BondRecord& bond);

    // Present value of a bond off known spot points plus `finalRate` at maturity
    double bondPrice(const BondRecord& bond,
                     const std::vector<double>& knownTenors,
                     const std::vector<double>& knownRates,
                     double finalRate) const;

    const BootstrapOptions& options() const { return _options; }

private:
    std::shared_ptr<const Compounding> _compounding;
    std::shared_ptr<const Interpolator> _interpolator;
    BootstrapOptions _options;

    double solveRate(const BondRecord& bond,
                     const std::vector<double>& knownTenors,
                     const std::vector<double>& knownRates) const;
    static void validate(const std::vector<BondRecord>& bonds);
};

#endif //YCURVE_BONDBOOTSTRAPPER_H
