#include <gtest/gtest.h>
#include <ycurve/factory/CurveFactory.h>
#include <ycurve/factory/IndexCurveFactory.h>
#include <ycurve/utils/Errors.h>
#include <cmath>
#include <iostream>
#include <type_traits>

// ============================================================================
// Test Fixture
// ============================================================================

class CurveFactoryTest : public ::testing::Test {
protected:
    StrategyCatalog catalog = StrategyCatalog::defaults();
    IndexRegistry indexes = IndexRegistry::withDefaults();
    CurveFactory factory{catalog};
    IndexCurveFactory indexFactory{catalog, indexes};
};

// ============================================================================
// CurveFactory
// ============================================================================

TEST_F(CurveFactoryTest, SpotCurveLinearSimple)
{
    YieldCurve curve = factory.createSpotCurve({1.0, 2.0, 3.0}, {0.02, 0.025, 0.03}, "linear", "ACT/365", "simple");

    EXPECT_NEAR(curve.spotRate(1.5), 0.0225, 1e-15);
    EXPECT_NEAR(curve.discountFactor(1.0), 1.0 / 1.02, 1e-15);
    EXPECT_NEAR(curve.discountFactor(1.0), 0.98039, 1e-5);
    EXPECT_EQ(curve.curveType(), "spot");
}

TEST_F(CurveFactoryTest, SpotCurveDefaults)
{
    YieldCurve curve = factory.createSpotCurve({1.0, 2.0}, {0.02, 0.03});
    EXPECT_EQ(curve.interpolator().name(), "linear");
    EXPECT_EQ(curve.dayCount().name(), "ACT/365");
    EXPECT_EQ(curve.compounding().name(), "simple");
}

TEST_F(CurveFactoryTest, SpotCurveResolvesNamesCaseInsensitively)
{
    YieldCurve curve = factory.createSpotCurve({1.0, 2.0, 3.0}, {0.02, 0.025, 0.03},
                                               "CUBIC_SPLINE", "act/360", "Continuous");
    EXPECT_EQ(curve.interpolator().name(), "cubic_spline");
    EXPECT_EQ(curve.dayCount().name(), "ACT/360");
    EXPECT_EQ(curve.compounding().name(), "continuous");
    EXPECT_NEAR(curve.discountFactor(2.0), std::exp(-0.05), 1e-15);
}

TEST_F(CurveFactoryTest, BogusInterpolationListsRegisteredNames)
{
    try {
        factory.createSpotCurve({1.0, 2.0}, {0.02, 0.03}, "bogus");
        FAIL() << "expected UnknownStrategyError";
    } catch (const UnknownStrategyError& e) {
        std::string msg = e.what();
        for (const auto& name : catalog.interpolators().names()) {
            EXPECT_NE(msg.find(name), std::string::npos) << name << " missing from: " << msg;
        }
    }
    EXPECT_THROW(factory.createSpotCurve({1.0}, {0.02}, "linear", "ACT/999"), UnknownStrategyError);
    EXPECT_THROW(factory.createSpotCurve({1.0}, {0.02}, "linear", "ACT/365", "weekly"), UnknownStrategyError);
}

TEST_F(CurveFactoryTest, FromBondsZeroCoupon)
{
    YieldCurve curve = factory.createFromBonds({{2.0, 0.0, 90.0, 2, 100.0}});
    EXPECT_NEAR(curve.spotRate(2.0), (100.0 / 90.0 - 1.0) / 2.0, 1e-14);
    EXPECT_EQ(curve.interpolator().name(), "cubic_spline");
}

TEST_F(CurveFactoryTest, FromBondsChecksNamesBeforeStripping)
{
    // the bad price would fail stripping, the unknown name must surface first
    EXPECT_THROW(factory.createFromBonds({{2.0, 0.0, -1.0}}, "bond", "bogus"), UnknownStrategyError);
    EXPECT_THROW(factory.createFromBonds({{2.0, 0.0, 90.0}}, "swaps"), UnknownStrategyError);
    EXPECT_THROW(factory.createFromBonds({}), ValidationError);
}

TEST_F(CurveFactoryTest, FromDeposits)
{
    YieldCurve curve = factory.createFromDeposits({{0.5, 0.019}, {0.25, 0.018}, {1.0, 0.021}});

    EXPECT_EQ(curve.tenors(), (std::vector<double>{0.25, 0.5, 1.0}));
    EXPECT_DOUBLE_EQ(curve.spotRate(0.5), 0.019);
    EXPECT_NEAR(curve.spotRate(0.75), 0.020, 1e-15);
    EXPECT_EQ(curve.interpolator().name(), "linear");
}

// ============================================================================
// IndexCurveFactory
// ============================================================================

TEST_F(CurveFactoryTest, SofrPassThrough)
{
    YieldCurve curve = indexFactory.createFromIndex("SOFR", {{0.25, 0.05}});

    EXPECT_EQ(curve.spotRate(0.25), 0.05);
    EXPECT_EQ(curve.curveType(), "index_based");
    EXPECT_EQ(curve.dayCount().name(), "ACT/360");
    EXPECT_EQ(curve.compounding().name(), "simple");
}

TEST_F(CurveFactoryTest, IndexConventionsDefaultFromIndex)
{
    YieldCurve sonia = indexFactory.createFromIndex("sonia", {{0.25, 0.052}, {1.0, 0.05}, {2.0, 0.047}});
    EXPECT_EQ(sonia.dayCount().name(), "ACT/365");

    YieldCurve overridden = indexFactory.createFromIndex("SONIA", {{0.25, 0.052}, {1.0, 0.05}}, "linear",
                                                         std::string("30/360"), std::string("continuous"));
    EXPECT_EQ(overridden.dayCount().name(), "30/360");
    EXPECT_EQ(overridden.compounding().name(), "continuous");
}

TEST_F(CurveFactoryTest, UnknownIndex)
{
    EXPECT_THROW(indexFactory.createFromIndex("JIBAR", {{1.0, 0.07}}), UnknownStrategyError);
}

TEST_F(CurveFactoryTest, MultipleIndexesPreferPrimary)
{
    std::map<std::string, std::vector<RatePoint>> indexRates = {
        {"SOFR", {{0.25, 0.0530}, {1.0, 0.0510}}},
        {"USD-LIBOR-3M", {{0.25, 0.0555}, {0.5, 0.0550}, {2.0, 0.0500}}},
    };

    YieldCurve withSofr = indexFactory.createFromMultipleIndexes(indexRates, std::string("SOFR"), "linear");
    EXPECT_EQ(withSofr.tenors(), (std::vector<double>{0.25, 0.5, 1.0, 2.0}));
    EXPECT_DOUBLE_EQ(withSofr.spotRate(0.25), 0.0530);
    EXPECT_DOUBLE_EQ(withSofr.spotRate(0.5), 0.0550);

    YieldCurve withLibor = indexFactory.createFromMultipleIndexes(indexRates, std::string("usd-libor-3m"), "linear");
    EXPECT_DOUBLE_EQ(withLibor.spotRate(0.25), 0.0555);
    EXPECT_EQ(withLibor.curveType(), "index_based");
}

TEST_F(CurveFactoryTest, MultipleIndexesConventions)
{
    std::map<std::string, std::vector<RatePoint>> indexRates = {
        {"SONIA", {{0.25, 0.052}, {1.0, 0.050}}},
        {"GBP-LIBOR-3M", {{0.5, 0.053}}},
    };

    YieldCurve primary = indexFactory.createFromMultipleIndexes(indexRates, std::string("SONIA"));
    EXPECT_EQ(primary.dayCount().name(), "ACT/365");

    YieldCurve noPrimary = indexFactory.createFromMultipleIndexes(indexRates);
    EXPECT_EQ(noPrimary.dayCount().name(), "ACT/360");
    EXPECT_EQ(noPrimary.compounding().name(), "simple");
    EXPECT_EQ(noPrimary.interpolator().name(), "cubic_spline");

    EXPECT_THROW(indexFactory.createFromMultipleIndexes({}), ValidationError);
    EXPECT_THROW(indexFactory.createFromMultipleIndexes(indexRates, std::string("NOPE")), UnknownStrategyError);
}

TEST_F(CurveFactoryTest, ListAvailableIndexes)
{
    auto all = indexFactory.listAvailableIndexes();
    EXPECT_EQ(all.size(), 12u);
    EXPECT_EQ(all.at("SOFR"), "Secured Overnight Financing Rate");

    auto gbp = indexFactory.listAvailableIndexes(std::string("GBP"));
    ASSERT_EQ(gbp.size(), 2u);
    EXPECT_EQ(gbp.count("SONIA"), 1u);
    EXPECT_EQ(gbp.count("GBP-LIBOR-3M"), 1u);

    for (const auto& entry : gbp) {
        std::cout << "  " << entry.first << ": " << entry.second << std::endl;
    }
}

TEST_F(CurveFactoryTest, LogLinearSpotCurveWithNegativeRates)
{
    YieldCurve curve = factory.createSpotCurve({1.0, 2.0, 3.0}, {-0.005, -0.003, -0.001}, "log_linear");

    EXPECT_DOUBLE_EQ(curve.spotRate(0.5), -0.005);
    EXPECT_DOUBLE_EQ(curve.spotRate(10.0), -0.001);
}

TEST(CurveFactoryLifetimeTest, TemporariesAreRejected)
{
    // factories keep references, so they only accept catalogs and registries that outlive them
    static_assert(std::is_constructible_v<CurveFactory, const StrategyCatalog&>);
    static_assert(!std::is_constructible_v<CurveFactory, StrategyCatalog&&>);

    static_assert(std::is_constructible_v<IndexCurveFactory, const StrategyCatalog&, const IndexRegistry&>);
    static_assert(!std::is_constructible_v<IndexCurveFactory, StrategyCatalog&&, const IndexRegistry&>);
    static_assert(!std::is_constructible_v<IndexCurveFactory, const StrategyCatalog&, IndexRegistry&&>);
    static_assert(!std::is_constructible_v<IndexCurveFactory, StrategyCatalog&&, IndexRegistry&&>);
    SUCCEED();
}

TEST_F(CurveFactoryTest, MultipleIndexesWithoutPrimaryFollowCodeOrder)
{
    // "ESTR" sorts before "EURIBOR-3M", whatever the insertion order
    std::map<std::string, std::vector<RatePoint>> indexRates;
    indexRates["EURIBOR-3M"] = {{0.25, 0.0395}};
    indexRates["ESTR"] = {{0.25, 0.0390}, {1.0, 0.0370}};

    YieldCurve curve = indexFactory.createFromMultipleIndexes(indexRates, std::nullopt, "linear");
    EXPECT_EQ(curve.tenors(), (std::vector<double>{0.25, 1.0}));
    EXPECT_DOUBLE_EQ(curve.spotRate(0.25), 0.0390);
}
