#ifndef YCURVE_STRATEGYCATALOG_H
#define YCURVE_STRATEGYCATALOG_H

#include <ycurve/bootstrap/Bootstrapper.h>
#include <ycurve/conventions/Compounding.h>
#include <ycurve/conventions/DayCount.h>
#include <ycurve/factory/Registry.h>
#include <ycurve/market/Instruments.h>
#include <ycurve/market/Interpolator.h>

using BondBootstrapperBase = Bootstrapper<BondRecord>;
using DepositBootstrapperBase = Bootstrapper<DepositRecord>;

/**
 * Read-only set of strategy registries, one per family
 *
 * Built by StrategyCatalogBuilder (or defaults()) and passed by const reference to the factories.
 * Every lookup is case-insensitive and throws UnknownStrategyError on a miss.
 */
class StrategyCatalog
{
public:
    // linear, cubic_spline, log_linear | ACT/365, ACT/360, 30/360 | simple, continuous | bond | deposit
    static StrategyCatalog defaults();

    std::shared_ptr<const Interpolator> interpolator(const std::string& name) const;
    std::shared_ptr<const DayCount> dayCount(const std::string& name) const;
    std::shared_ptr<const Compounding> compounding(const std::string& name) const;
    std::shared_ptr<const BondBootstrapperBase> bondBootstrapper(const std::string& name) const;
    std::shared_ptr<const DepositBootstrapperBase> depositBootstrapper(const std::string& name) const;

    const Registry<Interpolator>& interpolators() const { return _interpolators; }
    const Registry<DayCount>& dayCounts() const { return _dayCounts; }
    const Registry<Compounding>& compoundings() const { return _compoundings; }
    const Registry<BondBootstrapperBase>& bondBootstrappers() const { return _bondBootstrappers; }
    const Registry<DepositBootstrapperBase>& depositBootstrappers() const { return _depositBootstrappers; }

private:
    friend class StrategyCatalogBuilder;

    StrategyCatalog();

    Registry<Interpolator> _interpolators;
    Registry<DayCount> _dayCounts;
    Registry<Compounding> _compoundings;
    Registry<BondBootstrapperBase> _bondBootstrappers;
    Registry<DepositBootstrapperBase> _depositBootstrappers;
};

/**
 * Registration API for custom strategies
 *
 * Starts from the built-in variants; add*() registers (or replaces) an entry by name.
 *
 * Example:
 *      StrategyCatalog catalog = StrategyCatalogBuilder()
 *          .addInterpolator("my_scheme", [] { return std::make_shared<MyInterpolator>(); })
 *          .build();
 */
class StrategyCatalogBuilder
{
public:
    StrategyCatalogBuilder();

    StrategyCatalogBuilder& addInterpolator(const std::string& name, Registry<Interpolator>::Constructor ctor);
    StrategyCatalogBuilder& addDayCount(const std::string& name, Registry<DayCount>::Constructor ctor);
    StrategyCatalogBuilder& addCompounding(const std::string& name, Registry<Compounding>::Constructor ctor);
    StrategyCatalogBuilder& addBondBootstrapper(const std::string& name,
                                                Registry<BondBootstrapperBase>::Constructor ctor);
    StrategyCatalogBuilder& addDepositBootstrapper(const std::string& name,
                                                   Registry<DepositBootstrapperBase>::Constructor ctor);

    StrategyCatalog build() const { return _catalog; }

private:
    StrategyCatalog _catalog;
};

#endif //YCURVE_STRATEGYCATALOG_H
