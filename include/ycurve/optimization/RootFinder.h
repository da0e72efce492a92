/**
    RootFinder
    - Brent's method (inverse quadratic interpolation / secant steps, bisection fallback)
    Deterministic and bounded: at most maxIter function evaluations after the two bracket ends.
*/

#ifndef YCURVE_ROOTFINDER_H
#define YCURVE_ROOTFINDER_H

#include <functional>
#include <string>

// ---- function types ----

using ScalarFunc = std::function<double(double)>;

// ---- result struct ----

struct RootResult {
    double root = 0.0;
    double residual = 0.0;      // f(root)
    int iterations = 0;
    bool converged = false;
    std::string message;
};

// ---- options ----

struct RootOptions {
    double xTol = 1e-12;        // bracket width
    double fTol = 1e-10;        // |f(x)|
    int maxIter = 100;
    bool verbose = false;
};

// ---- Brent ----

class BrentSolver {
public:
    // f(lower) and f(upper) must have opposite signs, otherwise converged == false
    RootResult solve(const ScalarFunc& f, double lower, double upper,
        const RootOptions& opts = {}) const;
};

#endif
