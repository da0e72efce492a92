#ifndef YCURVE_YIELDCURVE_H
#define YCURVE_YIELDCURVE_H

#include <ycurve/conventions/Compounding.h>
#include <ycurve/conventions/DayCount.h>
#include <ycurve/market/Interpolator.h>
#include <ycurve/utils/InterpolationSchemes.h>
#include <memory>
#include <string>
#include <vector>

// Externally visible form of a curve; strategies are re-selected by name on reconstruction
struct CurveRepresentation {
    std::vector<double> tenors;
    std::vector<double> rates;
    std::string curveType;
};

/**
 * Spot-rate term structure built from (tenor, rate) points
 *
 * Immutable after construction. The curve owns copies of its arrays, sorted by tenor,
 * and shares its stateless strategies (interpolation, day count, compounding).
 * Queries at a stored tenor return the stored rate; other tenors are interpolated inside
 * [min tenor, max tenor] and extrapolated outside of it.
 */
class YieldCurve
{
public:
    /**
     * @param tenors Tenors in years, all > 0 (need not be sorted)
     * @param rates Spot rates aligned with tenors
     * @param interpolator Interpolation strategy (linear if null)
     * @param dayCount Day-count convention (ACT/365 if null)
     * @param compounding Compounding convention (simple if null)
     * @param curveType Descriptive tag, e.g. "spot" or "index_based"
     * @throws ValidationError on mismatched lengths, empty input or a non-positive tenor
     */
    YieldCurve(const std::vector<double>& tenors,
               const std::vector<double>& rates,
               std::shared_ptr<const Interpolator> interpolator = nullptr,
               std::shared_ptr<const DayCount> dayCount = nullptr,
               std::shared_ptr<const Compounding> compounding = nullptr,
               std::string curveType = "spot");

    double spotRate(double tenor) const;
    double discountFactor(double tenor) const;
    double forwardRate(double t1, double t2) const;     // requires t2 > t1
    double zeroCouponPrice(double tenor, double faceValue = 100.0) const;

    // Date-based queries through the bound day count
    double yearFraction(const Date& start, const Date& end) const;
    double discountFactor(const Date& referenceDate, const Date& paymentDate) const;

    double parYield(double maturity, int frequency = 2) const;

    CurveRepresentation toRepresentation() const;

    // Raw data accessors
    const std::vector<double>& tenors() const { return _tenors; }
    const std::vector<double>& rates() const { return _rates; }
    const std::string& curveType() const { return _curveType; }
    const Interpolator& interpolator() const { return *_interpolator; }
    const DayCount& dayCount() const { return *_dayCount; }
    const Compounding& compounding() const { return *_compounding; }

private:
    std::vector<double> _tenors;
    std::vector<double> _rates;
    std::string _curveType;

    std::shared_ptr<const Interpolator> _interpolator;
    std::shared_ptr<const DayCount> _dayCount;
    std::shared_ptr<const Compounding> _compounding;

    // built once from _interpolator, read-only afterwards so copies may share it
    std::shared_ptr<const InterpolationScheme> _scheme;

    void validateInputData() const;
    void sortByTenor();
};

#endif //YCURVE_YIELDCURVE_H
