#include <ycurve/factory/CurveFactory.h>
#include <ycurve/factory/IndexCurveFactory.h>
#include <ycurve/factory/StrategyCatalog.h>
#include <ycurve/indexes/IndexRegistry.h>
#include <ycurve/utils/Errors.h>

#include <iomanip>
#include <iostream>
#include <vector>

int main()
{
    const StrategyCatalog catalog = StrategyCatalog::defaults();
    const IndexRegistry indexes = IndexRegistry::withDefaults();
    CurveFactory factory(catalog);
    IndexCurveFactory indexFactory(catalog, indexes);

    std::cout << std::fixed << std::setprecision(6);

    // Spot curve from raw points
    YieldCurve spot = factory.createSpotCurve({0.5, 1.0, 2.0, 5.0, 10.0},
                                              {0.018, 0.020, 0.025, 0.030, 0.034});
    std::cout << "Spot curve (linear, ACT/365, simple)" << std::endl;
    std::cout << "  r(1.5)      = " << spot.spotRate(1.5) << std::endl;
    std::cout << "  P(0,1)      = " << spot.discountFactor(1.0) << std::endl;
    std::cout << "  f(1,2)      = " << spot.forwardRate(1.0, 2.0) << std::endl;
    std::cout << "  ZCB(2y)     = " << spot.zeroCouponPrice(2.0) << std::endl;
    std::cout << "  par(5y)     = " << spot.parYield(5.0) << std::endl;

    Date today(2024, 1, 15);
    Date payment(2025, 7, 15);
    std::cout << "  P(" << today << ", " << payment << ") = " << spot.discountFactor(today, payment) << std::endl;

    // Bond stripping
    std::vector<BondRecord> bonds = {
        {0.5, 0.0, 99.0},
        {1.0, 0.0, 97.8},
        {2.0, 0.03, 100.2},
        {3.0, 0.035, 100.5},
        {5.0, 0.04, 100.9},
    };
    YieldCurve bondCurve = factory.createFromBonds(bonds);
    std::cout << "\nBootstrapped bond curve (cubic spline)" << std::endl;
    for (size_t i = 0; i < bondCurve.tenors().size(); ++i) {
        std::cout << "  T = " << std::setw(4) << std::setprecision(1) << bondCurve.tenors()[i]
                  << "  r = " << std::setprecision(6) << bondCurve.rates()[i] << std::endl;
    }
    std::cout << "  r(4.0)      = " << bondCurve.spotRate(4.0) << std::endl;

    // Index curves
    YieldCurve sofr = indexFactory.createFromIndex("SOFR", {{0.25, 0.0530}, {0.5, 0.0525}, {1.0, 0.0510},
                                                            {2.0, 0.0480}, {5.0, 0.0440}});
    std::cout << "\nSOFR curve (" << sofr.dayCount().name() << ", " << sofr.compounding().name() << ")" << std::endl;
    std::cout << "  r(0.75)     = " << sofr.spotRate(0.75) << std::endl;

    YieldCurve merged = indexFactory.createFromMultipleIndexes(
        {{"SOFR", {{0.25, 0.0530}, {1.0, 0.0510}}},
         {"USD-LIBOR-3M", {{0.25, 0.0555}, {0.5, 0.0550}, {2.0, 0.0500}}}},
        std::string("SOFR"), "linear");
    std::cout << "\nSOFR + USD-LIBOR-3M (primary SOFR)" << std::endl;
    for (size_t i = 0; i < merged.tenors().size(); ++i) {
        std::cout << "  T = " << std::setw(4) << std::setprecision(2) << merged.tenors()[i]
                  << "  r = " << std::setprecision(6) << merged.rates()[i] << std::endl;
    }

    std::cout << "\nUSD indexes" << std::endl;
    for (const auto& entry : indexFactory.listAvailableIndexes(std::string("USD"))) {
        std::cout << "  " << std::left << std::setw(14) << entry.first << std::right << entry.second << std::endl;
    }

    try {
        factory.createSpotCurve({1.0, 2.0}, {0.02, 0.025}, "bogus");
    } catch (const UnknownStrategyError& e) {
        std::cout << "\nExpected error: " << e.what() << std::endl;
    }

    return 0;
}
