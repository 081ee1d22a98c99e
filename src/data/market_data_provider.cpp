/**
 * @file market_data_provider.cpp
 * @brief HistoricalMarketDataProvider implementation
 */

#include "data/market_data_provider.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <utility>

namespace riskengine
{
    namespace data
    {
        HistoricalMarketDataProvider::HistoricalMarketDataProvider(MarketData data, ReturnType type)
            : data_(std::move(data)), type_(type)
        {
        }

        ReturnSeries HistoricalMarketDataProvider::get_returns(const std::string &ticker,
                                                               const std::string &start_date,
                                                               const std::string &end_date) const
        {
            if (!data_.has_ticker(ticker))
            {
                throw DataUnavailable("No price history for " + ticker);
            }

            ReturnSeries series = data_.return_series(ticker, start_date, end_date, type_);
            if (series.empty())
            {
                throw DataUnavailable("No returns for " + ticker + " between " +
                                      start_date + " and " + end_date);
            }

            return series;
        }

        double HistoricalMarketDataProvider::get_price(const std::string &ticker, const std::string &date) const
        {
            double price = data_.price_on_or_before(ticker, date);
            if (std::isnan(price))
            {
                throw DataUnavailable("No price for " + ticker + " on or before " + date);
            }
            return price;
        }

        std::string HistoricalMarketDataProvider::get_name() const
        {
            return "HistoricalMarketDataProvider";
        }

    } // namespace data
} // namespace riskengine
