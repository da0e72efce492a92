#include <ycurve/market/YieldCurve.h>
#include <ycurve/utils/Errors.h>
#include <ycurve/utils/Utils.h>
#include <algorithm>
#include <numeric>
#include <utility>

YieldCurve::YieldCurve(const std::vector<double>& tenors,
                       const std::vector<double>& rates,
                       std::shared_ptr<const Interpolator> interpolator,
                       std::shared_ptr<const DayCount> dayCount,
                       std::shared_ptr<const Compounding> compounding,
                       std::string curveType)
    : _tenors(tenors), _rates(rates), _curveType(std::move(curveType)),
      _interpolator(interpolator ? std::move(interpolator) : makeInterpolator(InterpolationMethod::Linear)),
      _dayCount(dayCount ? std::move(dayCount) : makeDayCount(DayCountConvention::Actual365Fixed)),
      _compounding(compounding ? std::move(compounding) : makeCompounding(CompoundingType::Simple))
{
    validateInputData();
    sortByTenor();
    _scheme = _interpolator->buildScheme(_tenors, _rates);
}

void YieldCurve::validateInputData() const
{
    if (_tenors.size() != _rates.size()) {
        throw ValidationError("YieldCurve: tenors and rates must have the same length");
    }
    if (_tenors.empty()) {
        throw ValidationError("YieldCurve: at least one (tenor, rate) point is required");
    }
    for (double tenor : _tenors) {
        if (!(tenor > 0.0)) {
            throw ValidationError("YieldCurve: tenors must be positive");
        }
    }
}

void YieldCurve::sortByTenor()
{
    if (std::is_sorted(_tenors.begin(), _tenors.end())) {
        return;
    }

    std::vector<size_t> order(_tenors.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [this](size_t a, size_t b) { return _tenors[a] < _tenors[b]; });

    std::vector<double> sortedTenors;
    std::vector<double> sortedRates;
    sortedTenors.reserve(order.size());
    sortedRates.reserve(order.size());
    for (size_t idx : order) {
        sortedTenors.push_back(_tenors[idx]);
        sortedRates.push_back(_rates[idx]);
    }
    _tenors = std::move(sortedTenors);
    _rates = std::move(sortedRates);
}

double YieldCurve::spotRate(double tenor) const
{
    if (!(tenor > 0.0)) {
        throw ValidationError("YieldCurve::spotRate: tenor must be positive");
    }

    // stored point: return it exactly
    for (size_t i = 0; i < _tenors.size(); ++i) {
        if (CurveUtils::isClose(_tenors[i], tenor)) {
            return _rates[i];
        }
    }

    return (*_scheme)(tenor);
}

double YieldCurve::discountFactor(double tenor) const
{
    return _compounding->discountFactor(spotRate(tenor), tenor);
}

double YieldCurve::forwardRate(double t1, double t2) const
{
    if (t2 <= t1) {
        throw ValidationError("YieldCurve::forwardRate: t2 must be greater than t1");
    }
    double r1 = spotRate(t1);
    double r2 = spotRate(t2);
    return _compounding->forwardRate(r1, t1, r2, t2);
}

double YieldCurve::zeroCouponPrice(double tenor, double faceValue) const
{
    return faceValue * discountFactor(tenor);
}

double YieldCurve::yearFraction(const Date& start, const Date& end) const
{
    return _dayCount->yearFraction(start, end);
}

double YieldCurve::discountFactor(const Date& referenceDate, const Date& paymentDate) const
{
    return discountFactor(yearFraction(referenceDate, paymentDate));
}

double YieldCurve::parYield(double maturity, int frequency) const
{
    return CurveUtils::parYield([this](double t) { return discountFactor(t); }, maturity, frequency);
}

CurveRepresentation YieldCurve::toRepresentation() const
{
    return {_tenors, _rates, _curveType};
}
