#include <gtest/gtest.h>
#include <ycurve/bootstrap/BondBootstrapper.h>
#include <ycurve/bootstrap/DepositBootstrapper.h>
#include <ycurve/bootstrap/IndexBootstrapper.h>
#include <ycurve/utils/Errors.h>
#include <cmath>
#include <iostream>
#include <iomanip>

// ============================================================================
// Test Constants and Utilities
// ============================================================================

namespace {
    const double REPRICE_TOLERANCE = 1e-8;

    double simpleDf(double r, double t) {
        return 1.0 / (1.0 + r * t);
    }

    // linear on the known points, flat outside of them
    double knownRate(const std::vector<double>& t, const std::vector<double>& r, double x) {
        if (x <= t.front()) return r.front();
        if (x >= t.back()) return r.back();
        for (size_t i = 0; i + 1 < t.size(); ++i) {
            if (x <= t[i + 1]) {
                return r[i] + (r[i + 1] - r[i]) * (x - t[i]) / (t[i + 1] - t[i]);
            }
        }
        return r.back();
    }

    std::vector<BondRecord> createBonds() {
        return {
            {3.0, 0.035, 100.5},
            {0.5, 0.0, 99.0},
            {2.0, 0.03, 100.2},
            {1.0, 0.0, 97.8},
        };
    }
}

// ============================================================================
// BondBootstrapper
// ============================================================================

class BondBootstrapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        stripper = std::make_unique<BondBootstrapper>(makeCompounding(CompoundingType::Simple),
                                                      makeInterpolator(InterpolationMethod::Linear));
    }

    std::unique_ptr<BondBootstrapper> stripper;
};

TEST_F(BondBootstrapperTest, ZeroCouponClosedForm)
{
    CurvePoints points = stripper->bootstrap({{2.0, 0.0, 90.0, 2, 100.0}});

    ASSERT_EQ(points.tenors.size(), 1u);
    EXPECT_DOUBLE_EQ(points.tenors[0], 2.0);
    EXPECT_NEAR(points.rates[0], (100.0 / 90.0 - 1.0) / 2.0, 1e-14);
    EXPECT_NEAR(points.rates[0], 0.0556, 1e-4);
}

TEST_F(BondBootstrapperTest, ZeroCouponUnderContinuousCompounding)
{
    BondBootstrapper continuous(makeCompounding(CompoundingType::Continuous),
                                makeInterpolator(InterpolationMethod::Linear));
    CurvePoints points = continuous.bootstrap({{2.0, 0.0, 90.0}});
    EXPECT_NEAR(points.rates[0], -std::log(0.9) / 2.0, 1e-14);
}

TEST_F(BondBootstrapperTest, SortsByMaturity)
{
    CurvePoints points = stripper->bootstrap(createBonds());
    EXPECT_EQ(points.tenors, (std::vector<double>{0.5, 1.0, 2.0, 3.0}));
}

TEST_F(BondBootstrapperTest, RepricesEveryBondRecursively)
{
    std::vector<BondRecord> bonds = createBonds();
    CurvePoints points = stripper->bootstrap(bonds);

    std::cout << "\n=== Bond bootstrap ===\n";
    for (size_t i = 0; i < points.tenors.size(); ++i) {
        std::cout << "  T=" << std::fixed << std::setprecision(2) << points.tenors[i]
                  << "  r=" << std::setprecision(8) << points.rates[i] << "\n";
    }

    // zero-coupon legs
    EXPECT_NEAR(points.rates[0], (100.0 / 99.0 - 1.0) / 0.5, 1e-14);
    EXPECT_NEAR(points.rates[1], (100.0 / 97.8 - 1.0) / 1.0, 1e-14);

    // 2y 3% semi-annual: coupons at 0.5 and 1.0 on solved points, 1.5 flat beyond 1y
    {
        std::vector<double> t(points.tenors.begin(), points.tenors.begin() + 2);
        std::vector<double> r(points.rates.begin(), points.rates.begin() + 2);
        double pv = 1.5 * simpleDf(knownRate(t, r, 0.5), 0.5)
                  + 1.5 * simpleDf(knownRate(t, r, 1.0), 1.0)
                  + 1.5 * simpleDf(knownRate(t, r, 1.5), 1.5)
                  + 101.5 * simpleDf(points.rates[2], 2.0);
        EXPECT_NEAR(pv, 100.2, REPRICE_TOLERANCE);
    }

    // 3y 3.5% semi-annual: 1.5 interpolated between 1y and 2y, 2.5 flat beyond 2y
    {
        std::vector<double> t(points.tenors.begin(), points.tenors.begin() + 3);
        std::vector<double> r(points.rates.begin(), points.rates.begin() + 3);
        double pv = 0.0;
        for (double ti : {0.5, 1.0, 1.5, 2.0, 2.5}) {
            pv += 1.75 * simpleDf(knownRate(t, r, ti), ti);
        }
        pv += 101.75 * simpleDf(points.rates[3], 3.0);
        EXPECT_NEAR(pv, 100.5, REPRICE_TOLERANCE);
    }

    // and through the public pricer
    for (size_t i = 0; i < points.tenors.size(); ++i) {
        std::vector<double> t(points.tenors.begin(), points.tenors.begin() + i);
        std::vector<double> r(points.rates.begin(), points.rates.begin() + i);
        BondRecord bond = createBonds()[0];
        for (const auto& b : bonds) {
            if (b.maturity == points.tenors[i]) bond = b;
        }
        EXPECT_NEAR(stripper->bondPrice(bond, t, r, points.rates[i]), bond.price, REPRICE_TOLERANCE);
    }
}

TEST_F(BondBootstrapperTest, FirstCouponBondUsesItsOwnRate)
{
    // nothing solved yet: every cash flow is discounted at the unknown rate
    BondRecord bond{2.0, 0.04, 100.0};
    CurvePoints points = stripper->bootstrap({bond});

    double r = points.rates[0];
    double pv = 2.0 * (simpleDf(r, 0.5) + simpleDf(r, 1.0) + simpleDf(r, 1.5)) + 102.0 * simpleDf(r, 2.0);
    EXPECT_NEAR(pv, 100.0, REPRICE_TOLERANCE);
    EXPECT_GT(r, 0.03);
    EXPECT_LT(r, 0.05);
}

TEST_F(BondBootstrapperTest, RetriesOnWidenedBracket)
{
    BootstrapOptions opts;
    opts.lowerRate = 0.2;       // first bracket misses a ~3% rate
    opts.upperRate = 0.5;
    opts.verbose = true;
    BondBootstrapper narrow(makeCompounding(CompoundingType::Simple),
                            makeInterpolator(InterpolationMethod::Linear), opts);

    CurvePoints points = narrow.bootstrap({{2.0, 0.03, 100.0}});
    EXPECT_NEAR(narrow.bondPrice({2.0, 0.03, 100.0}, {}, {}, points.rates[0]), 100.0, REPRICE_TOLERANCE);
}

TEST_F(BondBootstrapperTest, UnreachablePriceThrowsConvergenceError)
{
    // no rate in [-10%, 100%] takes a 1y 5% bond to 1000
    EXPECT_THROW(stripper->bootstrap({{1.0, 0.05, 1000.0}}), ConvergenceError);

    try {
        stripper->bootstrap({{1.0, 0.05, 1000.0}});
    } catch (const ConvergenceError& e) {
        EXPECT_NE(std::string(e.what()).find("maturity 1"), std::string::npos) << e.what();
    }
}

TEST_F(BondBootstrapperTest, ValidatesInput)
{
    EXPECT_THROW(stripper->bootstrap({}), ValidationError);
    EXPECT_THROW(stripper->bootstrap({{0.0, 0.0, 99.0}}), ValidationError);
    EXPECT_THROW(stripper->bootstrap({{1.0, 0.0, 0.0}}), ValidationError);
    EXPECT_THROW(stripper->bootstrap({{1.0, 0.02, 99.0, 0}}), ValidationError);
    EXPECT_THROW(stripper->bootstrap({{1.0, 0.02, 99.0, 2, 0.0}}), ValidationError);
    EXPECT_THROW(stripper->bootstrap({{1.0, 0.0, 99.0}, {1.0, 0.02, 100.0}}), ValidationError);
}

TEST(BondScheduleTest, PaymentTimesRunBackFromMaturity)
{
    auto times = BondBootstrapper::paymentTimes({1.75, 0.04, 100.0, 2});
    ASSERT_EQ(times.size(), 4u);
    EXPECT_NEAR(times[0], 0.25, 1e-14);
    EXPECT_NEAR(times[1], 0.75, 1e-14);
    EXPECT_NEAR(times[2], 1.25, 1e-14);
    EXPECT_DOUBLE_EQ(times[3], 1.75);

    // at least one period
    auto shortTimes = BondBootstrapper::paymentTimes({0.2, 0.04, 100.0, 2});
    ASSERT_EQ(shortTimes.size(), 1u);
    EXPECT_DOUBLE_EQ(shortTimes[0], 0.2);

    EXPECT_EQ(BondBootstrapper::paymentTimes({5.0, 0.04, 100.0, 4}).size(), 20u);
}

// ============================================================================
// DepositBootstrapper
// ============================================================================

TEST(DepositBootstrapperTest, PassesRatesThroughSorted)
{
    DepositBootstrapper stripper;
    CurvePoints points = stripper.bootstrap({{1.0, 0.021}, {0.25, 0.018}, {0.5, 0.019}});

    EXPECT_EQ(points.tenors, (std::vector<double>{0.25, 0.5, 1.0}));
    EXPECT_EQ(points.rates, (std::vector<double>{0.018, 0.019, 0.021}));
    EXPECT_EQ(stripper.name(), "deposit");
}

TEST(DepositBootstrapperTest, ValidatesInput)
{
    DepositBootstrapper stripper;
    EXPECT_THROW(stripper.bootstrap({}), ValidationError);
    EXPECT_THROW(stripper.bootstrap({{0.0, 0.02}}), ValidationError);
    EXPECT_THROW(stripper.bootstrap({{1.0, 0.02}, {-0.5, 0.01}}), ValidationError);
}

// ============================================================================
// IndexBootstrapper
// ============================================================================

class IndexBootstrapperTest : public ::testing::Test {
protected:
    IndexRegistry registry = IndexRegistry::withDefaults();
};

TEST_F(IndexBootstrapperTest, PassThroughSortedByTenor)
{
    IndexBootstrapper stripper(registry);
    CurvePoints points = stripper.bootstrap({{"SOFR", 1.0, 0.051}, {"sofr", 0.25, 0.05}});

    EXPECT_EQ(points.tenors, (std::vector<double>{0.25, 1.0}));
    EXPECT_EQ(points.rates, (std::vector<double>{0.05, 0.051}));
}

TEST_F(IndexBootstrapperTest, NormalizesCodes)
{
    IndexBootstrapper stripper(registry);
    auto normalized = stripper.normalize({{"usd-libor-3m", 0.5, 0.055}, {"Sofr", 0.25, 0.05}});

    ASSERT_EQ(normalized.size(), 2u);
    EXPECT_EQ(normalized[0].index, "SOFR");
    EXPECT_EQ(normalized[1].index, "USD-LIBOR-3M");
}

TEST_F(IndexBootstrapperTest, UnknownIndexListsValidCodes)
{
    IndexBootstrapper stripper(registry);
    try {
        stripper.bootstrap({{"FOO", 1.0, 0.02}});
        FAIL() << "expected UnknownStrategyError";
    } catch (const UnknownStrategyError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("FOO"), std::string::npos);
        EXPECT_NE(msg.find("SOFR"), std::string::npos);
        EXPECT_NE(msg.find("EURIBOR-3M"), std::string::npos);
    }
}

TEST_F(IndexBootstrapperTest, ValidatesInput)
{
    IndexBootstrapper stripper(registry);
    EXPECT_THROW(stripper.bootstrap({}), ValidationError);
    EXPECT_THROW(stripper.bootstrap({{"SOFR", 0.0, 0.05}}), ValidationError);
}

TEST_F(IndexBootstrapperTest, PrimaryIndexFirstAtEqualTenor)
{
    IndexBootstrapper stripper(registry);
    std::vector<IndexObservation> obs = {
        {"USD-LIBOR-3M", 0.25, 0.0555},
        {"SOFR", 0.25, 0.0530},
        {"USD-LIBOR-3M", 0.5, 0.0550},
        {"SOFR", 1.0, 0.0510},
    };

    CurvePoints primarySofr = stripper.bootstrapMerged(obs, std::string("sofr"));
    EXPECT_EQ(primarySofr.tenors, (std::vector<double>{0.25, 0.25, 0.5, 1.0}));
    EXPECT_EQ(primarySofr.rates, (std::vector<double>{0.0530, 0.0555, 0.0550, 0.0510}));

    // no primary: input order kept at equal tenor
    CurvePoints noPrimary = stripper.bootstrapMerged(obs, std::nullopt);
    EXPECT_EQ(noPrimary.rates, (std::vector<double>{0.0555, 0.0530, 0.0550, 0.0510}));
}
