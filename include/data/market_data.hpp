/*
 * @file market_data.hpp
 * @brief Dated close prices for every ticker the engine can price or regress.
 *
 * Prices are held wide (dates x tickers). Missing observations are NaN.
 * Dates are ISO strings (YYYY-MM-DD), so string order is calendar order.
 */

#ifndef RISKENGINE_DATA_MARKET_DATA_HPP
#define RISKENGINE_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace riskengine
{
    namespace data
    {
        enum class ReturnType
        {
            SIMPLE, /**< P_t / P_{t-1} - 1 */
            LOG     /**< ln(P_t / P_{t-1}) */
        };

        /**
         * @struct ReturnSeries
         * @brief Period returns, each labelled with the date that closes the period
         */
        struct ReturnSeries
        {
            std::vector<std::string> dates;
            Eigen::VectorXd values;

            size_t size() const { return dates.size(); }
            bool empty() const { return dates.empty(); }
        };

        class MarketData
        {
        public:
            /**
             * @throws std::invalid_argument if the shapes disagree, dates are not
             *         strictly ascending or a ticker appears twice
             */
            MarketData(Eigen::MatrixXd prices,
                       std::vector<std::string> dates,
                       std::vector<std::string> tickers);

            const Eigen::MatrixXd &get_prices() const { return prices_; }
            const std::vector<std::string> &get_dates() const { return dates_; }
            const std::vector<std::string> &get_tickers() const { return tickers_; }

            size_t num_dates() const { return dates_.size(); }
            size_t num_assets() const { return tickers_.size(); }

            bool has_ticker(const std::string &ticker) const { return column_.count(ticker) > 0; }

            /// Number of NaN cells
            size_t count_missing() const;

            /**
             * @brief Latest non-missing price dated on or before date
             * @return NaN when the ticker is unknown or has no such price
             */
            double price_on_or_before(const std::string &ticker, const std::string &date) const;

            /**
             * @brief Returns between consecutive prices dated inside [start_date, end_date]
             *
             * The first in-window price only anchors the first return; nothing
             * before start_date is used. A return touching a missing price or a
             * zero base price is skipped.
             *
             * @throws std::invalid_argument if the ticker is unknown
             */
            ReturnSeries return_series(const std::string &ticker,
                                       const std::string &start_date,
                                       const std::string &end_date,
                                       ReturnType type = ReturnType::SIMPLE) const;

        private:
            std::optional<Eigen::Index> column_of(const std::string &ticker) const;

            /// Half-open row range of the dates inside [start_date, end_date]
            std::pair<Eigen::Index, Eigen::Index> rows_between(const std::string &start_date,
                                                               const std::string &end_date) const;

            Eigen::MatrixXd prices_;
            std::vector<std::string> dates_;
            std::vector<std::string> tickers_;
            std::map<std::string, Eigen::Index> column_;
        };

    } // namespace data
} // namespace riskengine
#endif // RISKENGINE_DATA_MARKET_DATA_HPP
