/**
 * @file market_data_provider.hpp
 * @brief Pull interface for historical returns and prices
 *
 * The engine never sources prices itself. Callers inject a provider; the
 * bundled HistoricalMarketDataProvider serves a price matrix loaded by
 * DataLoader.
 */

#ifndef RISKENGINE_DATA_MARKET_DATA_PROVIDER_HPP
#define RISKENGINE_DATA_MARKET_DATA_PROVIDER_HPP

#include "data/market_data.hpp"
#include <string>

namespace riskengine
{
    namespace data
    {
        /**
         * @class MarketDataProvider
         * @brief Abstract source of historical market data
         *
         * Thread Safety: implementations must allow concurrent const calls.
         */
        class MarketDataProvider
        {
        public:
            virtual ~MarketDataProvider() = default;

            /**
             * @brief Period returns for a ticker over [start_date, end_date]
             * @return Ordered series, never empty
             * @throws DataUnavailable if the ticker has no data in range
             */
            virtual ReturnSeries get_returns(const std::string &ticker,
                                             const std::string &start_date,
                                             const std::string &end_date) const = 0;

            /**
             * @brief Last known price on or before a date
             * @throws DataUnavailable if no such price exists
             */
            virtual double get_price(const std::string &ticker, const std::string &date) const = 0;

            virtual std::string get_name() const = 0;
        };

        /**
         * @class HistoricalMarketDataProvider
         * @brief MarketDataProvider over an in-memory MarketData price matrix
         *
         * Usage Example:
         * @code
         * auto prices = DataLoader::load_csv_wide("prices.csv");
         * auto provider = std::make_shared<HistoricalMarketDataProvider>(prices);
         * auto spy = provider->get_returns("SPY", "2021-01-01", "2023-12-31");
         * @endcode
         */
        class HistoricalMarketDataProvider : public MarketDataProvider
        {
        public:
            explicit HistoricalMarketDataProvider(MarketData data,
                                                  ReturnType type = ReturnType::SIMPLE);

            ReturnSeries get_returns(const std::string &ticker,
                                     const std::string &start_date,
                                     const std::string &end_date) const override;

            double get_price(const std::string &ticker, const std::string &date) const override;

            std::string get_name() const override;

            const MarketData &data() const { return data_; }

        private:
            MarketData data_;
            ReturnType type_;
        };

    } // namespace data
} // namespace riskengine

#endif // RISKENGINE_DATA_MARKET_DATA_PROVIDER_HPP
