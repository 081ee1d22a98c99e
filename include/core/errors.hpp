/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by every engine component
 *
 * Caller input problems derive from std::invalid_argument, data and
 * runtime problems from std::runtime_error, so callers that only know the
 * standard hierarchy still classify them correctly.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace riskengine
{

    /**
     * @class ConfigurationError
     * @brief Malformed holding, proxy set, limit set or engine configuration
     *
     * Never retried. Also raised when a caller-supplied number is NaN or Inf.
     */
    class ConfigurationError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @class DataInsufficientError
     * @brief Missing or short price history, or non-finite market data
     */
    class DataInsufficientError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class DataUnavailable
     * @brief Raised by a MarketDataProvider when a ticker has no data in range
     */
    class DataUnavailable : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class CacheError
     * @brief Result cache backend failure; recovered inside RiskEngine
     */
    class CacheError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class SolverDidNotConverge
     * @brief Optimizer ran out of iterations or time before finding a verified solution
     */
    class SolverDidNotConverge : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class OptimizationInfeasible
     * @brief No weight vector satisfies the configured limits within the universe
     */
    class OptimizationInfeasible : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Throw ConfigurationError unless value is finite
     * @param value Caller-supplied number
     * @param what Field name used in the message
     */
    void require_finite_input(double value, const std::string &what);

    /**
     * @brief Throw DataInsufficientError unless value is finite
     * @param value Number derived from market data
     * @param what Quantity name used in the message
     */
    void require_finite_data(double value, const std::string &what);

} // namespace riskengine
