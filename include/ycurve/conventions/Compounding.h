#ifndef YCURVE_COMPOUNDING_H
#define YCURVE_COMPOUNDING_H

#include <memory>
#include <string>

/**
 * Compounding convention: the functional form linking a rate, a tenor and a discount factor
 * Stateless; instances are shared between curves and bootstrappers.
 */
class Compounding
{
public:
    virtual ~Compounding() = default;

    virtual std::string name() const = 0;

    // P(0,t) for a spot rate r
    virtual double discountFactor(double rate, double tenor) const = 0;

    // rate implied between t1 and t2 by the spot rates r1, r2; requires t1 != t2
    virtual double forwardRate(double r1, double t1, double r2, double t2) const = 0;

    // inverse of discountFactor: the spot rate r such that discountFactor(r, t) == df
    virtual double impliedRate(double discountFactor, double tenor) const = 0;
};

/**
 * Simple interest
 *   P = 1 / (1 + r t)
 *   f = (P1/P2 - 1) / (t2 - t1)
 */
class SimpleCompounding : public Compounding
{
public:
    std::string name() const override { return "simple"; }
    double discountFactor(double rate, double tenor) const override;
    double forwardRate(double r1, double t1, double r2, double t2) const override;
    double impliedRate(double discountFactor, double tenor) const override;
};

/**
 * Continuous compounding
 *   P = exp(-r t)
 *   f = (r2 t2 - r1 t1) / (t2 - t1)
 */
class ContinuousCompounding : public Compounding
{
public:
    std::string name() const override { return "continuous"; }
    double discountFactor(double rate, double tenor) const override;
    double forwardRate(double r1, double t1, double r2, double t2) const override;
    double impliedRate(double discountFactor, double tenor) const override;
};

// Built-in compounding conventions
enum class CompoundingType { Simple, Continuous };

std::shared_ptr<const Compounding> makeCompounding(CompoundingType type);
std::string toString(CompoundingType type);

#endif //YCURVE_COMPOUNDING_H
