#ifndef YCURVE_INTERPOLATIONSCHEMES_H
#define YCURVE_INTERPOLATIONSCHEMES_H

#include <vector>
#include <memory>
#include <utility>


/**
 *  InterpolationScheme owns a (x, y) grid and is told at construction which extrapolation to use [ExtrapolationType]
 *  operator() routes a point to interpolate() inside [x0, xN] and to extrapolate() outside of it
 *  A grid with a single point is accepted: every query returns that point's value
 */

enum class ExtrapolationType { Flat, Linear };

class ExtrapolationScheme;

// Rate curve scheme over (tenor, rate) knots; subclasses supply the in-range form and its derivatives
class InterpolationScheme
{
public:
    InterpolationScheme(const std::vector<double>& xData,
                        const std::vector<double>& yData,
                        ExtrapolationType extraType = ExtrapolationType::Linear);
    virtual ~InterpolationScheme() = default;

    virtual double interpolate(double x) const = 0;
    virtual double derivative(double x) const = 0;
    virtual double secondDerivative(double x) const = 0;

    double extrapolate(double x) const;
    double operator()(double x) const; // routes to interpolate or extrapolate automatically
    std::pair<double, double> getRange() const;
    std::pair<double, double> boundaryValues() const;   // y at the first and last knot
    size_t size() const { return _xData.size(); }

protected:
    std::vector<double> _xData;
    std::vector<double> _yData;
    std::unique_ptr<ExtrapolationScheme> _extrapolationScheme;

    void validateData() const;

    size_t findInterval(double x) const;
};



/**
 * Linear interpolation: y = y0 + (y1-y0) * (x-x0) / (x1-x0)
 */
class LinearInterpolation : public InterpolationScheme
{
public:
    LinearInterpolation(const std::vector<double>& xData,
                        const std::vector<double>& yData,
                        ExtrapolationType extraType = ExtrapolationType::Linear);

    double interpolate(double x) const override;
    double derivative(double x) const override;
    double secondDerivative(double x) const override;
};

// ============================================================================
// CUBIC SPLINE INTERPOLATION
// ============================================================================

/**
 * Natural cubic spline, second-derivative system solved with the Thomas algorithm
 * Analytical form: S(x) = α(x-x0)³ + β(x-x0)² + γ(x-x0) + δ
 * First derivative: S'(x) = 3α(x-x0)² + 2β(x-x0) + γ
 * Second derivative: S''(x) = 6α(x-x0) + 2β
 * Knots must be strictly increasing.
 */
class CubicSplineInterpolation : public InterpolationScheme
{
public:
    CubicSplineInterpolation(const std::vector<double>& xData,
                             const std::vector<double>& yData,
                             ExtrapolationType extraType = ExtrapolationType::Linear);

    double interpolate(double x) const override;
    double derivative(double x) const override;
    double secondDerivative(double x) const override;

private:
    std::vector<double> _alpha;
    std::vector<double> _beta;
    std::vector<double> _gamma;
    std::vector<double> _delta;

    void computeSplineCoefficients();
    void solveThomasAlgorithm();
};

// ============================================================================
// LOG-LINEAR INTERPOLATION
// ============================================================================

/**
 * Linear interpolation of log(max(y, floor)), mapped back with exp
 * Non-positive values are floored before taking the log.
 */
class LogLinearInterpolation : public InterpolationScheme
{
public:
    static constexpr double LOG_FLOOR = 1e-8;

    LogLinearInterpolation(const std::vector<double>& xData,
                           const std::vector<double>& yData,
                           ExtrapolationType extraType = ExtrapolationType::Flat);

    double interpolate(double x) const override;
    double derivative(double x) const override;
    double secondDerivative(double x) const override;

private:
    std::vector<double> _logY;
};


// Continuation past the first or last knot, fixed from the scheme's boundary values at construction
class ExtrapolationScheme
{
public:
    virtual ~ExtrapolationScheme() = default;
    virtual void initialize(const InterpolationScheme& interp) = 0;
    virtual double extrapolate(double x, const InterpolationScheme& interp) const = 0;
};

// Flat extrapolation: y = y(boundary)
class FlatExtrapolation : public ExtrapolationScheme
{
public:
    void initialize(const InterpolationScheme& interp) override; // extract the boundary values
    double extrapolate(double x, const InterpolationScheme& interp) const override;

private:
    double _yMin = 0.0, _yMax = 0.0;
};

// Linear extrapolation: y = y(boundary) + y'(boundary) * dx
class LinearExtrapolation : public ExtrapolationScheme
{
public:
    void initialize(const InterpolationScheme& interp) override;
    double extrapolate(double x, const InterpolationScheme& interp) const override;

private:
    double _yMin = 0.0, _yMax = 0.0;
    double _dyMin = 0.0, _dyMax = 0.0;
};

#endif //YCURVE_INTERPOLATIONSCHEMES_H
