#include <ycurve/bootstrap/BondBootstrapper.h>
#include <ycurve/optimization/RootFinder.h>
#include <ycurve/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

BondBootstrapper::BondBootstrapper(std::shared_ptr<const Compounding> compounding,
                                   std::shared_ptr<const Interpolator> interpolator,
                                   BootstrapOptions options)
    : _compounding(compounding ? std::move(compounding) : makeCompounding(CompoundingType::Simple)),
      _interpolator(interpolator ? std::move(interpolator) : makeInterpolator(InterpolationMethod::Linear)),
      _options(options)
{
}

void BondBootstrapper::validate(const std::vector<BondRecord>& bonds)
{
    if (bonds.empty()) {
        throw ValidationError("BondBootstrapper: no bond data provided for bootstrapping");
    }
    for (const auto& bond : bonds) {
        if (bond.maturity <= 0.0) {
            throw ValidationError("BondBootstrapper: bond maturity must be positive");
        }
        if (bond.price <= 0.0) {
            throw ValidationError("BondBootstrapper: bond price must be positive");
        }
        if (bond.frequency <= 0) {
            throw ValidationError("BondBootstrapper: coupon frequency must be positive");
        }
        if (bond.faceValue <= 0.0) {
            throw ValidationError("BondBootstrapper: face value must be positive");
        }
    }
}

std::vector<double> BondBootstrapper::paymentTimes(const BondRecord& bond)
{
    const double freq = static_cast<double>(bond.frequency);
    const int periods = std::max(1, static_cast<int>(std::lround(bond.maturity * freq)));

    std::vector<double> times(periods);
    for (int k = 1; k <= periods; ++k) {
        times[k - 1] = bond.maturity - static_cast<double>(periods - k) / freq;
    }
    times.back() = bond.maturity;
    return times;
}

double BondBootstrapper::bondPrice(const BondRecord& bond,
                                   const std::vector<double>& knownTenors,
                                   const std::vector<double>& knownRates,
                                   double finalRate) const
{
    std::unique_ptr<InterpolationScheme> scheme;
    if (!knownTenors.empty()) {
        scheme = _interpolator->buildScheme(knownTenors, knownRates);
    }

    const std::vector<double> times = paymentTimes(bond);
    const double couponPayment = bond.faceValue * bond.coupon / bond.frequency;

    double pv = 0.0;
    for (size_t i = 0; i < times.size(); ++i) {
        const double t = times[i];
        const bool last = (i + 1 == times.size());
        const double cf = last ? couponPayment + bond.faceValue : couponPayment;

        // earlier coupons off the solved points, flat beyond them; no points yet -> same rate as the bond
        double rate = finalRate;
        if (!last && scheme) {
            if (t <= knownTenors.front()) {
                rate = knownRates.front();
            } else if (t >= knownTenors.back()) {
                rate = knownRates.back();
            } else {
                rate = scheme->interpolate(t);
            }
        }
        pv += cf * _compounding->discountFactor(rate, t);
    }
    return pv;
}

double BondBootstrapper::solveRate(const BondRecord& bond,
                                   const std::vector<double>& knownTenors,
                                   const std::vector<double>& knownRates) const
{
    if (bond.coupon == 0.0) {
        return _compounding->impliedRate(bond.price / bond.faceValue, bond.maturity);
    }

    auto objective = [&](double r) {
        return bondPrice(bond, knownTenors, knownRates, r) - bond.price;
    };

    BrentSolver brent;
    RootOptions opts;
    opts.fTol = _options.priceTolerance;
    opts.maxIter = _options.maxIterations;
    opts.verbose = _options.verbose;

    RootResult result = brent.solve(objective, _options.lowerRate, _options.upperRate, opts);
    if (result.converged) {
        return result.root;
    }

    if (_options.verbose) {
        std::cout << "  maturity " << bond.maturity << ": " << result.message
                  << ", retrying on [" << _options.widenedLowerRate << ", "
                  << _options.widenedUpperRate << "]\n";
    }

    opts.maxIter = _options.widenedMaxIterations;
    result = brent.solve(objective, _options.widenedLowerRate, _options.widenedUpperRate, opts);
    if (result.converged) {
        return result.root;
    }

    std::ostringstream msg;
    msg << "BondBootstrapper: no spot rate reprices bond with maturity " << bond.maturity
        << " and price " << bond.price << " (" << result.message << ")";
    throw ConvergenceError(msg.str());
}

CurvePoints BondBootstrapper::bootstrap(const std::vector<BondRecord>& bonds) const
{
    validate(bonds);

    std::vector<BondRecord> sorted(bonds);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const BondRecord& a, const BondRecord& b) { return a.maturity < b.maturity; });

    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i].maturity == sorted[i - 1].maturity) {
            std::ostringstream msg;
            msg << "BondBootstrapper: duplicate bond maturity " << sorted[i].maturity;
            throw ValidationError(msg.str());
        }
    }

    CurvePoints points;
    points.tenors.reserve(sorted.size());
    points.rates.reserve(sorted.size());

    for (const auto& bond : sorted) {
        double rate = solveRate(bond, points.tenors, points.rates);

        if (_options.verbose) {
            std::cout << "Bootstrapped maturity " << bond.maturity << " (coupon " << bond.coupon
                      << ", price " << bond.price << "): spot rate = " << rate << "\n";
        }

        points.tenors.push_back(bond.maturity);
        points.rates.push_back(rate);
    }
    return points;
}
