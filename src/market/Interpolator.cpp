#include <ycurve/market/Interpolator.h>
#include <ycurve/utils/Errors.h>

double Interpolator::interpolate(const std::vector<double>& tenors,
                                 const std::vector<double>& rates,
                                 double target) const
{
    return buildScheme(tenors, rates)->interpolate(target);
}

double Interpolator::extrapolate(const std::vector<double>& tenors,
                                 const std::vector<double>& rates,
                                 double target) const
{
    return buildScheme(tenors, rates)->extrapolate(target);
}

std::unique_ptr<InterpolationScheme> LinearInterpolator::buildScheme(const std::vector<double>& tenors,
                                                                     const std::vector<double>& rates) const
{
    return std::make_unique<LinearInterpolation>(tenors, rates, ExtrapolationType::Linear);
}

std::unique_ptr<InterpolationScheme> CubicSplineInterpolator::buildScheme(const std::vector<double>& tenors,
                                                                          const std::vector<double>& rates) const
{
    return std::make_unique<CubicSplineInterpolation>(tenors, rates, ExtrapolationType::Linear);
}

std::unique_ptr<InterpolationScheme> LogLinearInterpolator::buildScheme(const std::vector<double>& tenors,
                                                                        const std::vector<double>& rates) const
{
    return std::make_unique<LogLinearInterpolation>(tenors, rates, ExtrapolationType::Flat);
}

std::shared_ptr<const Interpolator> makeInterpolator(InterpolationMethod method)
{
    switch (method) {
        case InterpolationMethod::Linear:
            return std::make_shared<LinearInterpolator>();
        case InterpolationMethod::CubicSpline:
            return std::make_shared<CubicSplineInterpolator>();
        case InterpolationMethod::LogLinear:
            return std::make_shared<LogLinearInterpolator>();
    }
    throw UnknownStrategyError("makeInterpolator: unhandled interpolation method");
}

std::string toString(InterpolationMethod method)
{
    switch (method) {
        case InterpolationMethod::Linear:      return "linear";
        case InterpolationMethod::CubicSpline: return "cubic_spline";
        case InterpolationMethod::LogLinear:   return "log_linear";
    }
    throw UnknownStrategyError("toString: unhandled interpolation method");
}
