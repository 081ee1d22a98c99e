/**
 * @file portfolio_aggregator.hpp
 * @brief Resolve raw holdings into dollar exposures and normalized weights
 *
 * Cash balances are replaced by the cash-equivalent proxy of their
 * currency so that they can be regressed like any other instrument. The
 * substitution changes what is held for analysis, never how much.
 */

#pragma once

#include "portfolio/holding.hpp"
#include "portfolio/factor_proxy_set.hpp"
#include "data/market_data_provider.hpp"
#include <Eigen/Dense>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace riskengine
{
    namespace portfolio
    {
        /**
         * @struct AggregatedPortfolio
         * @brief Mapped tickers with their dollar exposures and weights
         */
        struct AggregatedPortfolio
        {
            std::vector<std::string> tickers;       ///< Mapped tickers, first-appearance order
            Eigen::VectorXd dollar_exposures;       ///< Dollars per mapped ticker
            Eigen::VectorXd weights;                ///< dollars / total_value (zero when total is zero)
            double total_value = 0.0;               ///< Net dollar value of all holdings
            double original_cash_dollars = 0.0;     ///< Cash dollars before substitution
            double mapped_cash_dollars = 0.0;       ///< Dollars carried by cash proxies after substitution
            double net_exposure = 0.0;              ///< Sum of risky weights
            double gross_exposure = 0.0;            ///< Sum of absolute risky weights
            double leverage = 0.0;                  ///< gross / |net| over risky positions
            std::set<std::string> cash_tickers;     ///< Mapped tickers that came from cash balances
            std::vector<std::string> unmapped_cash; ///< Cash tickers with no proxy for their currency

            /**
             * @brief Position of a ticker in tickers, or -1
             */
            int index_of(const std::string &ticker) const;

            std::map<std::string, double> weight_map() const;
        };

        /**
         * @class PortfolioAggregator
         * @brief Turns a Portfolio into an AggregatedPortfolio
         *
         * Equity holdings are priced through the market data provider at the
         * valuation date. Holdings that resolve to the same ticker are summed.
         *
         * Usage Example:
         * @code
         * PortfolioAggregator aggregator;
         * auto mapped = aggregator.aggregate(portfolio, proxies, provider);
         * double aapl = mapped.weights(mapped.index_of("AAPL"));
         * @endcode
         */
        class PortfolioAggregator
        {
        public:
            /**
             * @param dollar_tolerance Allowed dollar drift from cash substitution
             */
            explicit PortfolioAggregator(double dollar_tolerance = 0.01);

            /**
             * @brief Resolve holdings into weights
             * @param portfolio Raw holdings and valuation date
             * @param proxies Only the cash-currency table is used
             * @param provider Price source for share-denominated holdings
             * @return Mapped portfolio
             * @throws ConfigurationError if a non-cash ticker is held with conflicting
             *         quantity types, or if dollars are not preserved within tolerance
             * @throws DataInsufficientError if a share-denominated holding has no price
             */
            AggregatedPortfolio aggregate(const Portfolio &portfolio,
                                          const FactorProxySet &proxies,
                                          const data::MarketDataProvider &provider) const;

        private:
            double dollar_tolerance_;
        };

    } // namespace portfolio
} // namespace riskengine
