#ifndef YCURVE_INTERPOLATOR_H
#define YCURVE_INTERPOLATOR_H

#include <ycurve/utils/InterpolationSchemes.h>
#include <memory>
#include <string>
#include <vector>

/**
 * Rate-curve interpolation strategy
 *
 * The strategy itself holds no data: buildScheme() binds it to a (tenor, rate) grid and returns
 * an InterpolationScheme the caller owns. YieldCurve builds its scheme once at construction.
 * interpolate()/extrapolate() are one-shot conveniences on top of buildScheme().
 */
class Interpolator
{
public:
    virtual ~Interpolator() = default;

    virtual std::string name() const = 0;
    virtual std::unique_ptr<InterpolationScheme> buildScheme(const std::vector<double>& tenors,
                                                             const std::vector<double>& rates) const = 0;

    // target inside [tenors.front(), tenors.back()]
    double interpolate(const std::vector<double>& tenors,
                       const std::vector<double>& rates,
                       double target) const;

    // target outside [tenors.front(), tenors.back()]
    double extrapolate(const std::vector<double>& tenors,
                       const std::vector<double>& rates,
                       double target) const;
};

// Piecewise linear, extrapolation continues the boundary segment's slope
class LinearInterpolator : public Interpolator
{
public:
    std::string name() const override { return "linear"; }
    std::unique_ptr<InterpolationScheme> buildScheme(const std::vector<double>& tenors,
                                                     const std::vector<double>& rates) const override;
};

// Natural cubic spline, linear extrapolation with the spline slope at the nearest endpoint
class CubicSplineInterpolator : public Interpolator
{
public:
    std::string name() const override { return "cubic_spline"; }
    std::unique_ptr<InterpolationScheme> buildScheme(const std::vector<double>& tenors,
                                                     const std::vector<double>& rates) const override;
};

// Linear in log-rate space, flat extrapolation
class LogLinearInterpolator : public Interpolator
{
public:
    std::string name() const override { return "log_linear"; }
    std::unique_ptr<InterpolationScheme> buildScheme(const std::vector<double>& tenors,
                                                     const std::vector<double>& rates) const override;
};

// Built-in interpolation methods
enum class InterpolationMethod { Linear, CubicSpline, LogLinear };

std::shared_ptr<const Interpolator> makeInterpolator(InterpolationMethod method);
std::string toString(InterpolationMethod method);

#endif //YCURVE_INTERPOLATOR_H
