#include <ycurve/factory/StrategyCatalog.h>
#include <ycurve/bootstrap/BondBootstrapper.h>
#include <ycurve/bootstrap/DepositBootstrapper.h>
#include <utility>

// ============================================================================
// StrategyCatalog
// ============================================================================

StrategyCatalog::StrategyCatalog()
    : _interpolators("interpolation method"),
      _dayCounts("day count convention"),
      _compoundings("compounding method"),
      _bondBootstrappers("bond bootstrapper"),
      _depositBootstrappers("deposit bootstrapper")
{
}

StrategyCatalog StrategyCatalog::defaults()
{
    return StrategyCatalogBuilder().build();
}

std::shared_ptr<const Interpolator> StrategyCatalog::interpolator(const std::string& name) const
{
    return _interpolators.get(name);
}

std::shared_ptr<const DayCount> StrategyCatalog::dayCount(const std::string& name) const
{
    return _dayCounts.get(name);
}

std::shared_ptr<const Compounding> StrategyCatalog::compounding(const std::string& name) const
{
    return _compoundings.get(name);
}

std::shared_ptr<const BondBootstrapperBase> StrategyCatalog::bondBootstrapper(const std::string& name) const
{
    return _bondBootstrappers.get(name);
}

std::shared_ptr<const DepositBootstrapperBase> StrategyCatalog::depositBootstrapper(const std::string& name) const
{
    return _depositBootstrappers.get(name);
}

// ============================================================================
// StrategyCatalogBuilder
// ============================================================================

StrategyCatalogBuilder::StrategyCatalogBuilder()
{
    for (InterpolationMethod method : {InterpolationMethod::Linear,
                                       InterpolationMethod::CubicSpline,
                                       InterpolationMethod::LogLinear}) {
        addInterpolator(toString(method), [method] { return makeInterpolator(method); });
    }

    for (DayCountConvention convention : {DayCountConvention::Actual365Fixed,
                                          DayCountConvention::Actual360,
                                          DayCountConvention::Thirty360}) {
        addDayCount(toString(convention), [convention] { return makeDayCount(convention); });
    }

    for (CompoundingType type : {CompoundingType::Simple, CompoundingType::Continuous}) {
        addCompounding(toString(type), [type] { return makeCompounding(type); });
    }

    // the registered bond stripper always discounts with simple compounding and linear interpolation
    addBondBootstrapper("bond", [] {
        return std::make_shared<const BondBootstrapper>(makeCompounding(CompoundingType::Simple),
                                                        makeInterpolator(InterpolationMethod::Linear));
    });
    addDepositBootstrapper("deposit", [] { return std::make_shared<const DepositBootstrapper>(); });
}

StrategyCatalogBuilder& StrategyCatalogBuilder::addInterpolator(const std::string& name,
                                                                Registry<Interpolator>::Constructor ctor)
{
    _catalog._interpolators.add(name, std::move(ctor));
    return *this;
}

StrategyCatalogBuilder& StrategyCatalogBuilder::addDayCount(const std::string& name,
                                                            Registry<DayCount>::Constructor ctor)
{
    _catalog._dayCounts.add(name, std::move(ctor));
    return *this;
}

StrategyCatalogBuilder& StrategyCatalogBuilder::addCompounding(const std::string& name,
                                                               Registry<Compounding>::Constructor ctor)
{
    _catalog._compoundings.add(name, std::move(ctor));
    return *this;
}

StrategyCatalogBuilder& StrategyCatalogBuilder::addBondBootstrapper(const std::string& name,
                                                                    Registry<BondBootstrapperBase>::Constructor ctor)
{
    _catalog._bondBootstrappers.add(name, std::move(ctor));
    return *this;
}

StrategyCatalogBuilder& StrategyCatalogBuilder::addDepositBootstrapper(const std::string& name,
                                                                       Registry<DepositBootstrapperBase>::Constructor ctor)
{
    _catalog._depositBootstrappers.add(name, std::move(ctor));
    return *this;
}
