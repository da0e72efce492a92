#include <ycurve/conventions/DayCount.h>
#include <ycurve/utils/Errors.h>

// ============================================================================
// Actual/365 and Actual/360
// ============================================================================

int Actual365Fixed::dayCount(const Date& start, const Date& end) const
{
    return static_cast<int>((end - start).days());
}

double Actual365Fixed::yearFraction(const Date& start, const Date& end) const
{
    return dayCount(start, end) / 365.0;
}

int Actual360::dayCount(const Date& start, const Date& end) const
{
    return static_cast<int>((end - start).days());
}

double Actual360::yearFraction(const Date& start, const Date& end) const
{
    return dayCount(start, end) / 360.0;
}

// ============================================================================
// 30/360 (US)
// ============================================================================

int Thirty360::dayCount(const Date& start, const Date& end) const
{
    int d1 = start.day();
    int d2 = end.day();
    int m1 = start.month();
    int m2 = end.month();
    int y1 = start.year();
    int y2 = end.year();

    if (d1 == 31) {
        d1 = 30;
    }
    if (d2 == 31 && d1 == 30) {
        d2 = 30;
    }

    return 360 * (y2 - y1) + 30 * (m2 - m1) + (d2 - d1);
}

double Thirty360::yearFraction(const Date& start, const Date& end) const
{
    return dayCount(start, end) / 360.0;
}

// ============================================================================
// Built-in conventions
// ============================================================================

std::shared_ptr<const DayCount> makeDayCount(DayCountConvention convention)
{
    switch (convention) {
        case DayCountConvention::Actual365Fixed:
            return std::make_shared<Actual365Fixed>();
        case DayCountConvention::Actual360:
            return std::make_shared<Actual360>();
        case DayCountConvention::Thirty360:
            return std::make_shared<Thirty360>();
    }
    throw UnknownStrategyError("makeDayCount: unhandled day count convention");
}

std::string toString(DayCountConvention convention)
{
    switch (convention) {
        case DayCountConvention::Actual365Fixed: return "ACT/365";
        case DayCountConvention::Actual360:      return "ACT/360";
        case DayCountConvention::Thirty360:      return "30/360";
    }
    throw UnknownStrategyError("toString: unhandled day count convention");
}
