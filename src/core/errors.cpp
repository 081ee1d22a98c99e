/**
 * @file errors.cpp
 * @brief Finite-value guards
 */

#include "core/errors.hpp"
#include <cmath>

namespace riskengine
{
    void require_finite_input(double value, const std::string &what)
    {
        if (!std::isfinite(value))
        {
            throw ConfigurationError(what + " must be a finite number");
        }
    }

    void require_finite_data(double value, const std::string &what)
    {
        if (!std::isfinite(value))
        {
            throw DataInsufficientError(what + " is not finite; market data is incomplete or degenerate");
        }
    }
} // namespace riskengine
