#ifndef YCURVE_UTILS_H
#define YCURVE_UTILS_H

#include <vector>
#include <functional>
#include <utility>


/**
 *  NOTES:
 *  (1) ThomasAlgorithm is shared by the natural cubic spline (second-derivative system)
 *  (2) CurveUtils collects the stateless helpers that sit next to the curve:
 *      deduplication of tenor grids, forward rates from discount factors or spot rates, par yields
 */


// ============================================================================
// Tridiagonal System Solver - Thomas Algorithm
// ============================================================================

/**
 * Thomas Algorithm: Solves the tridiagonal system:
 *   a[i]·x[i-1] + b[i]·x[i] + c[i]·x[i+1] = d[i]
 *
 * for i = 0, 1, ..., n-1
 *
 * Where:
 *   - a[i]: lower diagonal (subdiagonal)
 *   - b[i]: main diagonal
 *   - c[i]: upper diagonal (superdiagonal)
 *   - d[i]: right-hand side
 *
 * Boundary conditions are implicit:
 *   - a[0] is not used (no x[-1])
 *   - c[n-1] is not used (no x[n])
 *
 * Complexity: O(n)
 */
class ThomasAlgorithm
{
public:
    static std::vector<double> solve(
        const std::vector<double>& lower,
        const std::vector<double>& diag,
        const std::vector<double>& upper,
        const std::vector<double>& rhs
    );

private:
    ThomasAlgorithm() = delete; // everything is static
};


// ============================================================================
// Curve helpers
// ============================================================================

class CurveUtils
{
public:
    /**
     * Sort (tenor, rate) pairs by tenor and drop repeated tenors
     * The sort is stable, so the first occurrence of a tenor in the input is the one kept
     */
    static std::pair<std::vector<double>, std::vector<double>> ensureSortedUnique(
        const std::vector<double>& tenors,
        const std::vector<double>& rates);

    // f(t1,t2) = (P(t1)/P(t2) - 1) / (t2 - t1); requires t2 > t1
    static double forwardRateFromDiscountFactors(double df1, double df2, double t1, double t2);

    // simple: through 1/(1+r t) discount factors, continuous: (r2 t2 - r1 t1)/(t2 - t1)
    static double forwardRateFromSpotRates(double r1, double r2, double t1, double t2,
                                           bool continuous = false);

    /**
     * Par yield of a bullet bond paying on (i+1)/frequency, i = 0..round(T*frequency)-1
     *   y = (1 - P(T_n)) / sum_i P(T_i)
     * y is the coupon per period as a fraction of face value (not annualized)
     * @param discountFactor Discount function t -> P(0,t)
     * @param maturity Bond maturity in years (> 0)
     * @param frequency Coupons per year
     */
    static double parYield(const std::function<double(double)>& discountFactor,
                           double maturity,
                           int frequency = 2);

    // numpy-style closeness: |a - b| <= atol + rtol * |b|
    static bool isClose(double a, double b, double rtol = 1e-5, double atol = 1e-8);

private:
    CurveUtils() = delete;
};

#endif //YCURVE_UTILS_H
