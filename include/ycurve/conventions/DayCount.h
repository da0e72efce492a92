#ifndef YCURVE_DAYCOUNT_H
#define YCURVE_DAYCOUNT_H

#include <boost/date_time/gregorian/gregorian.hpp>
#include <memory>
#include <string>

using Date = boost::gregorian::date;

/**
 * Day-count convention: converts a calendar span into a year fraction
 * Stateless; instances are shared between curves.
 * An end date before the start date yields a negative fraction.
 */
class DayCount
{
public:
    virtual ~DayCount() = default;

    virtual std::string name() const = 0;
    virtual int dayCount(const Date& start, const Date& end) const = 0;   // numerator of the year fraction
    virtual double yearFraction(const Date& start, const Date& end) const = 0;
};

// Actual/365 (Fixed)
class Actual365Fixed : public DayCount
{
public:
    std::string name() const override { return "ACT/365"; }
    int dayCount(const Date& start, const Date& end) const override;
    double yearFraction(const Date& start, const Date& end) const override;
};

// Actual/360
class Actual360 : public DayCount
{
public:
    std::string name() const override { return "ACT/360"; }
    int dayCount(const Date& start, const Date& end) const override;
    double yearFraction(const Date& start, const Date& end) const override;
};

/**
 * 30/360 (US)
 *   d1 = min(d1, 30); d2 = 30 if d2 == 31 and d1 == 30
 *   days = 360(y2-y1) + 30(m2-m1) + (d2-d1)
 */
class Thirty360 : public DayCount
{
public:
    std::string name() const override { return "30/360"; }
    int dayCount(const Date& start, const Date& end) const override;
    double yearFraction(const Date& start, const Date& end) const override;
};

// Built-in conventions
enum class DayCountConvention { Actual365Fixed, Actual360, Thirty360 };

std::shared_ptr<const DayCount> makeDayCount(DayCountConvention convention);
std::string toString(DayCountConvention convention);

#endif //YCURVE_DAYCOUNT_H
