/**
 * @file holding.hpp
 * @brief Raw holdings, analysis window and portfolio input types
 *
 * A Holding carries exactly one quantity form, fixed when it is built:
 * a share count, a dollar amount, or a cash balance in a currency.
 * Downstream components only see the resolved dollar exposure produced
 * by PortfolioAggregator.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace riskengine
{
    namespace portfolio
    {
        struct EquityQuantity
        {
            double shares = 0.0;
        };

        struct DollarQuantity
        {
            double dollars = 0.0;
        };

        struct CashQuantity
        {
            double dollars = 0.0;
            std::string currency;
        };

        using Quantity = std::variant<EquityQuantity, DollarQuantity, CashQuantity>;

        /**
         * @struct Holding
         * @brief One position as held by the user
         *
         * Usage Example:
         * @code
         * auto aapl = Holding::equity("AAPL", 25);
         * auto usd = Holding::cash("CUR:USD", 4000.0, "USD");
         * @endcode
         */
        struct Holding
        {
            std::string ticker; ///< Identifier as held (a currency code for cash)
            Quantity quantity;  ///< Exactly one quantity form

            static Holding equity(const std::string &ticker, double shares);
            static Holding dollars(const std::string &ticker, double amount);
            static Holding cash(const std::string &ticker, double amount, const std::string &currency);

            bool is_cash() const { return std::holds_alternative<CashQuantity>(quantity); }

            /**
             * @brief Name of the quantity form ("shares", "dollars" or "cash")
             */
            std::string quantity_kind() const;

            /**
             * @brief Check ticker and quantity
             * @throws ConfigurationError on empty ticker, empty currency or non-finite amount
             */
            void validate() const;

            /**
             * @brief Parse a holding
             *
             * Accepts {"ticker", "shares"}, {"ticker", "dollars"} or
             * {"ticker", "dollars", "currency"}. A ticker of the form CUR:XXX
             * is cash in currency XXX even without an explicit currency.
             *
             * @throws ConfigurationError if both or neither of shares/dollars are given
             */
            static Holding from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct AnalysisWindow
         * @brief Inclusive date range for return history, ISO YYYY-MM-DD
         */
        struct AnalysisWindow
        {
            std::string start_date;
            std::string end_date;

            void validate() const;
            std::string key() const { return start_date + ":" + end_date; }

            bool operator==(const AnalysisWindow &other) const
            {
                return start_date == other.start_date && end_date == other.end_date;
            }
        };

        /**
         * @struct Portfolio
         * @brief Holdings plus the window they are analysed over
         *
         * Holding order carries no meaning; the fingerprint sorts them.
         */
        struct Portfolio
        {
            std::vector<Holding> holdings;
            AnalysisWindow window;
            std::string valuation_date; ///< Empty means window.end_date

            const std::string &effective_valuation_date() const
            {
                return valuation_date.empty() ? window.end_date : valuation_date;
            }

            void validate() const;

            static Portfolio from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

    } // namespace portfolio
} // namespace riskengine
