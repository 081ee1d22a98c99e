/**
 * @file market_data.cpp
 */

#include "data/market_data.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace riskengine
{
    namespace data
    {
        MarketData::MarketData(Eigen::MatrixXd prices,
                               std::vector<std::string> dates,
                               std::vector<std::string> tickers)
            : prices_(std::move(prices)), dates_(std::move(dates)), tickers_(std::move(tickers))
        {
            if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()) ||
                prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
            {
                throw std::invalid_argument("Price matrix is " + std::to_string(prices_.rows()) + "x" +
                                            std::to_string(prices_.cols()) + " but there are " +
                                            std::to_string(dates_.size()) + " dates and " +
                                            std::to_string(tickers_.size()) + " tickers");
            }

            const auto out_of_order = std::adjacent_find(dates_.begin(), dates_.end(),
                                                         [](const std::string &a, const std::string &b)
                                                         { return !(a < b); });
            if (out_of_order != dates_.end())
            {
                throw std::invalid_argument("Price dates must strictly ascend: " + *out_of_order +
                                            " is followed by " + *(out_of_order + 1));
            }

            for (Eigen::Index c = 0; c < prices_.cols(); ++c)
            {
                const auto &ticker = tickers_[static_cast<size_t>(c)];
                if (!column_.emplace(ticker, c).second)
                {
                    throw std::invalid_argument("Duplicate price column for " + ticker);
                }
            }
        }

        size_t MarketData::count_missing() const
        {
            return static_cast<size_t>(prices_.array().isNaN().count());
        }

        double MarketData::price_on_or_before(const std::string &ticker, const std::string &date) const
        {
            const auto col = column_of(ticker);
            if (col)
            {
                Eigen::Index row = std::upper_bound(dates_.begin(), dates_.end(), date) - dates_.begin();
                while (row-- > 0)
                {
                    if (!std::isnan(prices_(row, *col)))
                    {
                        return prices_(row, *col);
                    }
                }
            }
            return std::numeric_limits<double>::quiet_NaN();
        }

        ReturnSeries MarketData::return_series(const std::string &ticker,
                                               const std::string &start_date,
                                               const std::string &end_date,
                                               ReturnType type) const
        {
            const auto col = column_of(ticker);
            if (!col)
            {
                throw std::invalid_argument("No prices loaded for " + ticker);
            }

            const auto range = rows_between(start_date, end_date);
            std::vector<double> values;
            ReturnSeries series;

            for (Eigen::Index row = range.first + 1; row < range.second; ++row)
            {
                const double before = prices_(row - 1, *col);
                const double after = prices_(row, *col);
                if (std::isnan(before) || std::isnan(after) || before == 0.0)
                {
                    continue;
                }
                values.push_back(type == ReturnType::LOG ? std::log(after / before) : after / before - 1.0);
                series.dates.push_back(dates_[static_cast<size_t>(row)]);
            }

            series.values = Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
            return series;
        }

        std::optional<Eigen::Index> MarketData::column_of(const std::string &ticker) const
        {
            const auto it = column_.find(ticker);
            if (it == column_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::pair<Eigen::Index, Eigen::Index> MarketData::rows_between(const std::string &start_date,
                                                                       const std::string &end_date) const
        {
            const auto first = std::lower_bound(dates_.begin(), dates_.end(), start_date);
            const auto last = std::upper_bound(first, dates_.end(), end_date);
            return {first - dates_.begin(), last - dates_.begin()};
        }
    } // namespace data
} // namespace riskengine
