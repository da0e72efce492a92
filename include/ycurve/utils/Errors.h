#ifndef YCURVE_ERRORS_H
#define YCURVE_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Error kinds raised by the curve engine
 * - ValidationError: bad inputs (empty instruments, non-positive tenors, mismatched arrays, t2 <= t1)
 * - UnknownStrategyError: unregistered strategy name or index code, message lists the valid set
 * - ConvergenceError: bond root finder failed even on the widened bracket
 */

class ValidationError : public std::invalid_argument
{
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

class UnknownStrategyError : public std::invalid_argument
{
public:
    explicit UnknownStrategyError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

class ConvergenceError : public std::runtime_error
{
public:
    explicit ConvergenceError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

#endif //YCURVE_ERRORS_H
