#include <ycurve/utils/Utils.h>
#include <ycurve/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>


// ============================================================================
// * Tridiagonal System Solver Implementation
// ============================================================================

std::vector<double> ThomasAlgorithm::solve(const std::vector<double>& lower,
                                           const std::vector<double>& diag,
                                           const std::vector<double>& upper,
                                           const std::vector<double>& rhs)
{
    size_t n = rhs.size();

    if (lower.size() != n || diag.size() != n || upper.size() != n) {
        throw std::invalid_argument("ThomasAlgorithm::solve: All input vectors must have the same size");
    }

    if (n == 0) {
        throw std::invalid_argument("ThomasAlgorithm::solve: Cannot solve empty system");
    }

    if (n == 1) {
        // b[0]*x[0] = d[0]
        if (std::abs(diag[0]) < 1e-14) {
            throw std::runtime_error(
                "ThomasAlgorithm::solve: Singular matrix (diagonal element is zero)");
        }
        return {rhs[0] / diag[0]};
    }

    std::vector<double> c_prime(n, 0.0);  // Modified upper diagonal
    std::vector<double> d_prime(n, 0.0);  // Modified RHS
    std::vector<double> x(n, 0.0);        // Solution vector

    // ------------------------------------------------------------------------
    /// PROCESS: Mx = r -> LUx = r -> (1) Ly = r -> (2) Ux = y
    // Step 1: Forward Elimination
    // ------------------------------------------------------------------------
    // Modified row:  x[i] + c'[i]*x[i+1] = d'[i]

    if (std::abs(diag[0]) < 1e-14) {
        throw std::runtime_error("ThomasAlgorithm::solve: Singular matrix at row 0");
    }
    c_prime[0] = upper[0] / diag[0];         // γ1 = c1/b1
    d_prime[0] = rhs[0] / diag[0];           // ρ1 = r1/b1

    for (size_t i = 1; i < n; ++i) {
        // Denominator after eliminating x[i-1]
        double m = diag[i] - lower[i] * c_prime[i-1];
        if (std::abs(m) < 1e-14) {
            throw std::runtime_error("ThomasAlgorithm::solve: Singular matrix at row " + std::to_string(i));
        }

        c_prime[i] = upper[i] / m;
        d_prime[i] = (rhs[i] - lower[i] * d_prime[i-1]) / m;
    }

    // ------------------------------------------------------------------------
    // Step 2: Back Substitution
    // ------------------------------------------------------------------------
    x[n-1] = d_prime[n-1];

    for (int i = static_cast<int>(n) - 2; i >= 0; --i) {
        x[i] = d_prime[i] - c_prime[i] * x[i+1];
    }

    return x;
}       // end of ThomasAlgorithm::solve


// ============================================================================
// * Curve helpers
// ============================================================================

std::pair<std::vector<double>, std::vector<double>> CurveUtils::ensureSortedUnique(
    const std::vector<double>& tenors,
    const std::vector<double>& rates)
{
    if (tenors.size() != rates.size()) {
        throw ValidationError("ensureSortedUnique: tenors and rates must have the same length");
    }

    std::vector<size_t> order(tenors.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&tenors](size_t a, size_t b) { return tenors[a] < tenors[b]; });

    std::vector<double> uniqueTenors;
    std::vector<double> uniqueRates;
    uniqueTenors.reserve(order.size());
    uniqueRates.reserve(order.size());

    for (size_t idx : order) {
        if (!uniqueTenors.empty() && tenors[idx] == uniqueTenors.back()) {
            continue;   // first occurrence already kept
        }
        uniqueTenors.push_back(tenors[idx]);
        uniqueRates.push_back(rates[idx]);
    }
    return {uniqueTenors, uniqueRates};
}

double CurveUtils::forwardRateFromDiscountFactors(double df1, double df2, double t1, double t2)
{
    if (t2 <= t1) {
        throw ValidationError("forwardRateFromDiscountFactors: t2 must be greater than t1");
    }
    return (df1 / df2 - 1.0) / (t2 - t1);
}

double CurveUtils::forwardRateFromSpotRates(double r1, double r2, double t1, double t2, bool continuous)
{
    if (t2 <= t1) {
        throw ValidationError("forwardRateFromSpotRates: t2 must be greater than t1");
    }
    if (continuous) {
        return (r2 * t2 - r1 * t1) / (t2 - t1);
    }
    double df1 = 1.0 / (1.0 + r1 * t1);
    double df2 = 1.0 / (1.0 + r2 * t2);
    return forwardRateFromDiscountFactors(df1, df2, t1, t2);
}

double CurveUtils::parYield(const std::function<double(double)>& discountFactor,
                            double maturity,
                            int frequency)
{
    if (maturity <= 0.0) {
        throw ValidationError("parYield: maturity must be positive");
    }
    if (frequency <= 0) {
        throw ValidationError("parYield: frequency must be positive");
    }

    long periods = std::lround(maturity * frequency);
    if (periods == 0) {
        throw ValidationError("parYield: periods computed to zero; check maturity/frequency");
    }

    double annuity = 0.0;
    double dfFinal = 0.0;
    for (long i = 0; i < periods; ++i) {
        double t = static_cast<double>(i + 1) / frequency;
        dfFinal = discountFactor(t);
        annuity += dfFinal;
    }

    // y = (1 - P(T_n)) / sum P(T_i), face value cancels
    return (1.0 - dfFinal) / annuity;
}

bool CurveUtils::isClose(double a, double b, double rtol, double atol)
{
    return std::abs(a - b) <= atol + rtol * std::abs(b);
}
