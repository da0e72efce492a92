#include <ycurve/conventions/Compounding.h>
#include <ycurve/utils/Errors.h>
#include <cmath>

namespace {

void checkDistinctTenors(double t1, double t2)
{
    if (t1 == t2) {
        throw ValidationError("Compounding::forwardRate: t1 and t2 must differ");
    }
}

void checkImpliedRateInputs(double discountFactor, double tenor)
{
    if (tenor <= 0.0) {
        throw ValidationError("Compounding::impliedRate: tenor must be positive");
    }
    if (discountFactor <= 0.0) {
        throw ValidationError("Compounding::impliedRate: discount factor must be positive");
    }
}

} // namespace

// ============================================================================
// Simple
// ============================================================================

double SimpleCompounding::discountFactor(double rate, double tenor) const
{
    return 1.0 / (1.0 + rate * tenor);
}

double SimpleCompounding::forwardRate(double r1, double t1, double r2, double t2) const
{
    checkDistinctTenors(t1, t2);
    double df1 = discountFactor(r1, t1);
    double df2 = discountFactor(r2, t2);
    return (df1 / df2 - 1.0) / (t2 - t1);
}

double SimpleCompounding::impliedRate(double discountFactor, double tenor) const
{
    checkImpliedRateInputs(discountFactor, tenor);
    return (1.0 / discountFactor - 1.0) / tenor;
}

// ============================================================================
// Continuous
// ============================================================================

double ContinuousCompounding::discountFactor(double rate, double tenor) const
{
    return std::exp(-rate * tenor);
}

double ContinuousCompounding::forwardRate(double r1, double t1, double r2, double t2) const
{
    checkDistinctTenors(t1, t2);
    return (r2 * t2 - r1 * t1) / (t2 - t1);
}

double ContinuousCompounding::impliedRate(double discountFactor, double tenor) const
{
    checkImpliedRateInputs(discountFactor, tenor);
    return -std::log(discountFactor) / tenor;
}

// ============================================================================
// Built-in conventions
// ============================================================================

std::shared_ptr<const Compounding> makeCompounding(CompoundingType type)
{
    switch (type) {
        case CompoundingType::Simple:
            return std::make_shared<SimpleCompounding>();
        case CompoundingType::Continuous:
            return std::make_shared<ContinuousCompounding>();
    }
    throw UnknownStrategyError("makeCompounding: unhandled compounding type");
}

std::string toString(CompoundingType type)
{
    switch (type) {
        case CompoundingType::Simple:     return "simple";
        case CompoundingType::Continuous: return "continuous";
    }
    throw UnknownStrategyError("toString: unhandled compounding type");
}
