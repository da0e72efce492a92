#include <gtest/gtest.h>
#include <ycurve/conventions/DayCount.h>
#include <iostream>
#include <ostream>

/**
 * Test suite for the day-count conventions
 * - ACT/365 and ACT/360 count calendar days (leap days included)
 * - 30/360 US caps the day of month at 30
 */

using boost::gregorian::date;

// ============================================================================
// Actual conventions
// ============================================================================

TEST(DayCountTest, Actual365CountsLeapYear)
{
    Actual365Fixed dc;
    date start(2024, 1, 1);
    date end(2025, 1, 1);

    EXPECT_EQ(dc.dayCount(start, end), 366);
    EXPECT_DOUBLE_EQ(dc.yearFraction(start, end), 366.0 / 365.0);
    EXPECT_EQ(dc.name(), "ACT/365");
}

TEST(DayCountTest, Actual360HalfYear)
{
    Actual360 dc;
    date start(2024, 1, 1);
    date end(2024, 7, 1);

    // 31 + 29 + 31 + 30 + 31 + 30
    EXPECT_EQ(dc.dayCount(start, end), 182);
    EXPECT_DOUBLE_EQ(dc.yearFraction(start, end), 182.0 / 360.0);
    EXPECT_EQ(dc.name(), "ACT/360");
}

TEST(DayCountTest, ReversedDatesGiveNegativeFraction)
{
    Actual365Fixed act365;
    Actual360 act360;
    Thirty360 thirty360;
    date start(2024, 3, 15);
    date end(2024, 1, 15);

    EXPECT_LT(act365.yearFraction(start, end), 0.0);
    EXPECT_DOUBLE_EQ(act365.yearFraction(start, end), -act365.yearFraction(end, start));
    EXPECT_DOUBLE_EQ(act360.yearFraction(start, end), -60.0 / 360.0);
    EXPECT_DOUBLE_EQ(thirty360.yearFraction(start, end), -60.0 / 360.0);
}

TEST(DayCountTest, SameDateIsZero)
{
    date d(2024, 6, 30);
    EXPECT_DOUBLE_EQ(Actual365Fixed().yearFraction(d, d), 0.0);
    EXPECT_DOUBLE_EQ(Actual360().yearFraction(d, d), 0.0);
    EXPECT_DOUBLE_EQ(Thirty360().yearFraction(d, d), 0.0);
}

// ============================================================================
// 30/360 US (parameterized)
// ============================================================================

struct Thirty360Case
{
    date start;
    date end;
    int expectedDays;

    friend std::ostream& operator<<(std::ostream& os, const Thirty360Case& obj) {
        return os << obj.start << " -> " << obj.end << ": " << obj.expectedDays << " days";
    }
};

class Thirty360Test : public ::testing::TestWithParam<Thirty360Case> {};

TEST_P(Thirty360Test, DayCountMatchesConvention)
{
    const auto& c = GetParam();
    Thirty360 dc;

    EXPECT_EQ(dc.dayCount(c.start, c.end), c.expectedDays);
    EXPECT_DOUBLE_EQ(dc.yearFraction(c.start, c.end), c.expectedDays / 360.0);
}

INSTANTIATE_TEST_SUITE_P(Default, Thirty360Test,
    ::testing::Values(
        Thirty360Case{date(2024, 1, 15), date(2024, 4, 15), 90},      // whole months
        Thirty360Case{date(2024, 1, 31), date(2024, 3, 31), 60},      // both ends capped
        Thirty360Case{date(2024, 1, 30), date(2024, 3, 31), 60},      // d1 = 30 caps d2
        Thirty360Case{date(2024, 1, 15), date(2024, 3, 31), 76},      // d2 = 31 kept when d1 < 30
        Thirty360Case{date(2024, 1, 30), date(2024, 2, 28), 28},
        Thirty360Case{date(2023, 2, 28), date(2024, 2, 28), 360},     // one year
        Thirty360Case{date(2023, 12, 31), date(2024, 6, 30), 180}
    ));

// ============================================================================
// Built-in dispatch
// ============================================================================

TEST(DayCountTest, MakeDayCountMatchesToString)
{
    for (auto convention : {DayCountConvention::Actual365Fixed,
                            DayCountConvention::Actual360,
                            DayCountConvention::Thirty360}) {
        auto dc = makeDayCount(convention);
        ASSERT_NE(dc, nullptr);
        EXPECT_EQ(dc->name(), toString(convention));
        std::cout << "  " << toString(convention) << " -> " << dc->name() << std::endl;
    }
}
