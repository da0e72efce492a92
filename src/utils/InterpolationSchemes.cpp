#include <ycurve/utils/InterpolationSchemes.h>
#include <ycurve/utils/Utils.h>
#include <ycurve/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <tuple>


// ============================================================================
// InterpolationScheme Base Class Implementation
// ============================================================================
InterpolationScheme::InterpolationScheme(const std::vector<double>& xData, const std::vector<double>& yData, ExtrapolationType extraType)
    : _xData(xData), _yData(yData)
{
    validateData();

    // Create extrapolation scheme based on enum (but don't initialize yet)
    // Initialization happens in derived class constructors after their setup is complete
    switch (extraType) {
        case ExtrapolationType::Flat:
            _extrapolationScheme = std::make_unique<FlatExtrapolation>();
            break;
        case ExtrapolationType::Linear:
            _extrapolationScheme = std::make_unique<LinearExtrapolation>();
            break;
    }
}

void InterpolationScheme::validateData() const
{
    if (_xData.size() != _yData.size()) {
        throw ValidationError("InterpolationScheme: xData and yData must have same size");
    }

    if (_xData.empty()) {
        throw ValidationError("InterpolationScheme: At least 1 data point required");
    }

    if (!std::is_sorted(_xData.begin(), _xData.end())) {
        throw ValidationError("InterpolationScheme: xData must be sorted in ascending order");
    }
}

std::pair<double, double> InterpolationScheme::getRange() const
{
    return {_xData.front(), _xData.back()};
}

std::pair<double, double> InterpolationScheme::boundaryValues() const
{
    return {_yData.front(), _yData.back()};
}

size_t InterpolationScheme::findInterval(double x) const
{
    // Returns index i such that x is in [xData[i], xData[i+1]), clamped to the last interval
    // Callers guarantee at least 2 points
    auto it = std::upper_bound(_xData.begin(), _xData.end(), x);

    if (it == _xData.begin()) {
        return 0;
    }

    size_t idx = std::distance(_xData.begin(), it) - 1;
    if (idx >= _xData.size() - 1) {
        idx = _xData.size() - 2;
    }
    return idx;
}

double InterpolationScheme::extrapolate(double x) const
{
    // Extrapolation needs to query the interpolation object for boundary values and derivatives
    return _extrapolationScheme->extrapolate(x, *this);
}

double InterpolationScheme::operator()(double x) const
{
    auto [xMin, xMax] = getRange();
    if (x < xMin || x > xMax) {
        return extrapolate(x);
    }
    return interpolate(x);
}

// ============================================================================
// LinearInterpolation Implementation
// ============================================================================

LinearInterpolation::LinearInterpolation(const std::vector<double>& xData,
                                         const std::vector<double>& yData,
                                         ExtrapolationType extraType)
    : InterpolationScheme(xData, yData, extraType)
{
    _extrapolationScheme->initialize(*this);
}

double LinearInterpolation::interpolate(double x) const
{
    if (_xData.size() < 2) {
        return _yData.front();
    }

    size_t idx = findInterval(x);

    double x0 = _xData[idx];
    double x1 = _xData[idx + 1];
    double y0 = _yData[idx];
    double y1 = _yData[idx + 1];

    if (x1 == x0) {
        return y0;  // repeated knot
    }
    return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

double LinearInterpolation::derivative(double x) const
{
    // Slope of the interval: y = y0 + m(x - x0), so dy/dx = m
    if (_xData.size() < 2) {
        return 0.0;
    }

    size_t idx = findInterval(x);
    double dx = _xData[idx + 1] - _xData[idx];
    if (dx == 0.0) {
        return 0.0;
    }
    return (_yData[idx + 1] - _yData[idx]) / dx;
}

double LinearInterpolation::secondDerivative(double x) const
{
    return 0.0;
}



// ============================================================================
// CubicSplineInterpolation Implementation
// ============================================================================

CubicSplineInterpolation::CubicSplineInterpolation(const std::vector<double>& xData,
                                                   const std::vector<double>& yData,
                                                   ExtrapolationType extraType)
    : InterpolationScheme(xData, yData, extraType)
{
    for (size_t i = 1; i < _xData.size(); ++i) {
        if (_xData[i] <= _xData[i-1]) {
            throw ValidationError("CubicSplineInterpolation: xData must be strictly increasing");
        }
    }

    computeSplineCoefficients();

    // Initialize extrapolation scheme now that spline setup is complete
    _extrapolationScheme->initialize(*this);
}

void CubicSplineInterpolation::computeSplineCoefficients()
{
    size_t n = _xData.size();
    if (n < 2) {
        return;     // constant curve, handled in interpolate()
    }

    _alpha.resize(n-1);
    _beta.resize(n-1);
    _gamma.resize(n-1);
    _delta.resize(n-1);

    if (n == 2) {
        // Straight line - only gamma and delta are non-zero
        _alpha[0] = 0.0;
        _beta[0] = 0.0;
        _gamma[0] = (_yData[1] - _yData[0]) / (_xData[1] - _xData[0]);
        _delta[0] = _yData[0];
        return;
    }

    solveThomasAlgorithm();
}

void CubicSplineInterpolation::solveThomasAlgorithm()
{
    size_t n = _xData.size();

    // Natural spline: β_0 = β_{N-1} = 0, solve for the interior β_1 .. β_{N-2}
    // β_{j-1}Δx_{j-1} + 2β_j(Δx_{j-1} + Δx_j) + β_{j+1}Δx_j = 3(m_j - m_{j-1})
    size_t num_unknowns = n - 2;
    std::vector<double> lower(num_unknowns, 0.0);
    std::vector<double> diag(num_unknowns, 0.0);
    std::vector<double> upper(num_unknowns, 0.0);
    std::vector<double> rhs(num_unknowns, 0.0);

    for (size_t i = 0; i < num_unknowns; ++i) {
        size_t j = i + 1;

        double dx_j = _xData[j+1] - _xData[j];
        double dx_j_prev = _xData[j] - _xData[j-1];

        lower[i] = dx_j_prev;
        diag[i] = 2.0 * (dx_j_prev + dx_j);
        upper[i] = dx_j;

        double slope_j = (_yData[j+1] - _yData[j]) / dx_j;
        double slope_j_prev = (_yData[j] - _yData[j-1]) / dx_j_prev;
        rhs[i] = 3.0 * (slope_j - slope_j_prev);
    }

    std::vector<double> beta_interior = ThomasAlgorithm::solve(lower, diag, upper, rhs);

    std::vector<double> beta(n, 0.0);
    for (size_t i = 0; i < num_unknowns; ++i) {
        beta[i+1] = beta_interior[i];
    }

    for (size_t j = 0; j < n-1; ++j) {
        double dx_j = _xData[j+1] - _xData[j];

        // α_j = (β_{j+1} - β_j) / (3Δx_j)
        _alpha[j] = (beta[j+1] - beta[j]) / (3.0 * dx_j);

        // γ_j = (y_{j+1} - y_j) / Δx_j - α_j * Δx_j^2 - β_j * Δx_j
        _gamma[j] = (_yData[j+1] - _yData[j]) / dx_j - _alpha[j] * dx_j * dx_j - beta[j] * dx_j;

        _delta[j] = _yData[j];
        _beta[j] = beta[j];
    }
}

double CubicSplineInterpolation::interpolate(double x) const
{
    if (_xData.size() < 2) {
        return _yData.front();
    }

    size_t idx = findInterval(x);

    // S_j(x) = α_j(x-x_j)^3 + β_j(x-x_j)^2 + γ_j(x-x_j) + δ_j
    double dx = x - _xData[idx];
    double dx2 = dx * dx;
    double dx3 = dx2 * dx;

    return _alpha[idx] * dx3 + _beta[idx] * dx2 + _gamma[idx] * dx + _delta[idx];
}

double CubicSplineInterpolation::derivative(double x) const
{
    // S'(x) = γ_j + 2β_j(x-x_j) + 3α_j(x-x_j)², also valid at the boundaries
    if (_xData.size() < 2) {
        return 0.0;
    }

    size_t idx = findInterval(x);
    double dx = x - _xData[idx];

    return _gamma[idx] + 2.0 * _beta[idx] * dx + 3.0 * _alpha[idx] * dx * dx;
}

double CubicSplineInterpolation::secondDerivative(double x) const
{
    // S''(x) = 2β_j + 6α_j(x-x_j)
    if (_xData.size() < 2) {
        return 0.0;
    }

    size_t idx = findInterval(x);
    double dx = x - _xData[idx];

    return 2.0 * _beta[idx] + 6.0 * _alpha[idx] * dx;
}


// ============================================================================
// LogLinearInterpolation Implementation
// ============================================================================

LogLinearInterpolation::LogLinearInterpolation(const std::vector<double>& xData,
                                               const std::vector<double>& yData,
                                               ExtrapolationType extraType)
    : InterpolationScheme(xData, yData, extraType)
{
    _logY.reserve(_yData.size());
    for (double y : _yData) {
        _logY.push_back(std::log(std::max(y, LOG_FLOOR)));
    }
    _extrapolationScheme->initialize(*this);
}

double LogLinearInterpolation::interpolate(double x) const
{
    if (_xData.size() < 2) {
        return _yData.front();
    }

    size_t idx = findInterval(x);
    double x0 = _xData[idx];
    double x1 = _xData[idx + 1];
    if (x1 == x0) {
        return std::exp(_logY[idx]);
    }

    double w = (x - x0) / (x1 - x0);
    return std::exp(_logY[idx] + w * (_logY[idx + 1] - _logY[idx]));
}

double LogLinearInterpolation::derivative(double x) const
{
    // y = exp(l(x)) with l linear on the interval, so y' = y * l'
    if (_xData.size() < 2) {
        return 0.0;
    }

    size_t idx = findInterval(x);
    double dx = _xData[idx + 1] - _xData[idx];
    if (dx == 0.0) {
        return 0.0;
    }
    double logSlope = (_logY[idx + 1] - _logY[idx]) / dx;
    return interpolate(x) * logSlope;
}

double LogLinearInterpolation::secondDerivative(double x) const
{
    if (_xData.size() < 2) {
        return 0.0;
    }

    size_t idx = findInterval(x);
    double dx = _xData[idx + 1] - _xData[idx];
    if (dx == 0.0) {
        return 0.0;
    }
    double logSlope = (_logY[idx + 1] - _logY[idx]) / dx;
    return interpolate(x) * logSlope * logSlope;
}


// ============================================================================
// ExtrapolationScheme Implementations
// ============================================================================

// FlatExtrapolation
void FlatExtrapolation::initialize(const InterpolationScheme& interp)
{
    // knot values as given; a transformed scheme (log-linear) may not reproduce them exactly
    std::tie(_yMin, _yMax) = interp.boundaryValues();
}

double FlatExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();
    return (x < xMin) ? _yMin : _yMax;        // use the boundary values
}

// LinearExtrapolation
void LinearExtrapolation::initialize(const InterpolationScheme& interp)
{
    auto [xMin, xMax] = interp.getRange();
    std::tie(_yMin, _yMax) = interp.boundaryValues();
    _dyMin = interp.derivative(xMin);
    _dyMax = interp.derivative(xMax);
}

double LinearExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();

    if (x < xMin) {
        return _yMin + _dyMin * (x - xMin);
    } else {
        return _yMax + _dyMax * (x - xMax);
    }
}
