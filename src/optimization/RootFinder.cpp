#include <ycurve/optimization/RootFinder.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

RootResult BrentSolver::solve(const ScalarFunc& f, double lower, double upper,
    const RootOptions& opts) const
{
    RootResult result;
    const double eps = std::numeric_limits<double>::epsilon();

    double a = lower;
    double b = upper;
    double fa = f(a);
    double fb = f(b);

    if (std::abs(fa) <= opts.fTol) {
        result.root = a;
        result.residual = fa;
        result.converged = true;
        result.message = "converged: lower bracket is a root";
        return result;
    }
    if (std::abs(fb) <= opts.fTol) {
        result.root = b;
        result.residual = fb;
        result.converged = true;
        result.message = "converged: upper bracket is a root";
        return result;
    }
    if ((fa > 0.0 && fb > 0.0) || (fa < 0.0 && fb < 0.0) || std::isnan(fa) || std::isnan(fb)) {
        result.root = b;
        result.residual = fb;
        result.converged = false;
        result.message = "failed: root not bracketed";
        return result;
    }

    // b is the best estimate, a the previous one, c the contrapoint with f(c) of opposite sign
    double c = b;
    double fc = fb;
    double d = b - a;
    double e = d;

    int iter = 0;
    while (iter < opts.maxIter) {
        if ((fb > 0.0 && fc > 0.0) || (fb < 0.0 && fc < 0.0)) {
            c = a;
            fc = fa;
            d = b - a;
            e = d;
        }
        if (std::abs(fc) < std::abs(fb)) {
            a = b;
            b = c;
            c = a;
            fa = fb;
            fb = fc;
            fc = fa;
        }

        double tol1 = 2.0 * eps * std::abs(b) + 0.5 * opts.xTol;
        double xm = 0.5 * (c - b);

        if (std::abs(xm) <= tol1 || std::abs(fb) <= opts.fTol) {
            result.converged = true;
            result.message = "converged: tolerance reached";
            break;
        }

        if (std::abs(e) >= tol1 && std::abs(fa) > std::abs(fb)) {
            // secant (a == c) or inverse quadratic interpolation
            double p, q;
            double s = fb / fa;
            if (a == c) {
                p = 2.0 * xm * s;
                q = 1.0 - s;
            } else {
                double qa = fa / fc;
                double r = fb / fc;
                p = s * (2.0 * xm * qa * (qa - r) - (b - a) * (r - 1.0));
                q = (qa - 1.0) * (r - 1.0) * (s - 1.0);
            }
            if (p > 0.0) {
                q = -q;
            }
            p = std::abs(p);

            double min1 = 3.0 * xm * q - std::abs(tol1 * q);
            double min2 = std::abs(e * q);
            if (2.0 * p < std::min(min1, min2)) {
                e = d;          // accept interpolation
                d = p / q;
            } else {
                d = xm;         // bisection
                e = d;
            }
        } else {
            d = xm;
            e = d;
        }

        a = b;
        fa = fb;
        b += (std::abs(d) > tol1) ? d : std::copysign(tol1, xm);
        fb = f(b);
        ++iter;

        if (opts.verbose) {
            std::cout << "Brent iter " << iter << ": x = " << b << ", f(x) = " << fb << "\n";
        }
    }

    if (!result.converged) {
        if (std::abs(fb) <= opts.fTol) {
            result.converged = true;
            result.message = "converged: tolerance reached";
        } else {
            result.message = "stopped: max iterations reached";
        }
    }

    result.root = b;
    result.residual = fb;
    result.iterations = iter;
    return result;
}
