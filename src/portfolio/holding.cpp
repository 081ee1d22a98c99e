/**
 * @file holding.cpp
 * @brief Holding, AnalysisWindow and Portfolio parsing and validation
 */

#include "portfolio/holding.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace riskengine
{
    namespace portfolio
    {
        namespace
        {
            const std::string kCashPrefix = "CUR:";

            bool is_iso_date(const std::string &date)
            {
                if (date.size() != 10 || date[4] != '-' || date[7] != '-')
                {
                    return false;
                }
                for (size_t i = 0; i < date.size(); ++i)
                {
                    if (i == 4 || i == 7)
                        continue;
                    if (!std::isdigit(static_cast<unsigned char>(date[i])))
                        return false;
                }
                return true;
            }

            double number_field(const nlohmann::json &j, const char *key, const std::string &ticker)
            {
                if (!j.at(key).is_number())
                {
                    throw ConfigurationError("Holding " + ticker + ": '" + key + "' must be a number");
                }
                return j.at(key).get<double>();
            }
        } // namespace

        // ============================================================================
        // Holding
        // ============================================================================

        Holding Holding::equity(const std::string &ticker, double shares)
        {
            Holding h;
            h.ticker = ticker;
            h.quantity = EquityQuantity{shares};
            return h;
        }

        Holding Holding::dollars(const std::string &ticker, double amount)
        {
            Holding h;
            h.ticker = ticker;
            h.quantity = DollarQuantity{amount};
            return h;
        }

        Holding Holding::cash(const std::string &ticker, double amount, const std::string &currency)
        {
            Holding h;
            h.ticker = ticker;
            h.quantity = CashQuantity{amount, currency};
            return h;
        }

        std::string Holding::quantity_kind() const
        {
            switch (quantity.index())
            {
            case 0:
                return "shares";
            case 1:
                return "dollars";
            default:
                return "cash";
            }
        }

        void Holding::validate() const
        {
            if (ticker.empty())
            {
                throw ConfigurationError("Holding ticker cannot be empty");
            }

            std::visit([this](const auto &q)
                       {
                using Q = std::decay_t<decltype(q)>;
                if constexpr (std::is_same_v<Q, EquityQuantity>)
                {
                    require_finite_input(q.shares, "Holding " + ticker + " shares");
                }
                else if constexpr (std::is_same_v<Q, DollarQuantity>)
                {
                    require_finite_input(q.dollars, "Holding " + ticker + " dollars");
                }
                else
                {
                    require_finite_input(q.dollars, "Holding " + ticker + " dollars");
                    if (q.currency.empty())
                    {
                        throw ConfigurationError("Cash holding " + ticker + " has no currency");
                    }
                } },
                       quantity);
        }

        Holding Holding::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("ticker") || !j["ticker"].is_string())
            {
                throw ConfigurationError("Holding must be an object with a string 'ticker'");
            }

            const std::string ticker = j["ticker"].get<std::string>();
            const bool has_shares = j.contains("shares");
            const bool has_dollars = j.contains("dollars");

            if (has_shares == has_dollars)
            {
                throw ConfigurationError("Holding " + ticker +
                                         " must set exactly one of 'shares' or 'dollars'");
            }

            std::string currency = j.value("currency", "");
            if (currency.empty() && ticker.compare(0, kCashPrefix.size(), kCashPrefix) == 0)
            {
                currency = ticker.substr(kCashPrefix.size());
            }

            Holding holding;
            if (has_shares)
            {
                if (!currency.empty())
                {
                    throw ConfigurationError("Cash holding " + ticker + " must be given in dollars");
                }
                holding = equity(ticker, number_field(j, "shares", ticker));
            }
            else if (!currency.empty())
            {
                holding = cash(ticker, number_field(j, "dollars", ticker), currency);
            }
            else
            {
                holding = dollars(ticker, number_field(j, "dollars", ticker));
            }

            holding.validate();
            return holding;
        }

        nlohmann::json Holding::to_json() const
        {
            nlohmann::json j;
            j["ticker"] = ticker;

            if (const auto *e = std::get_if<EquityQuantity>(&quantity))
            {
                j["shares"] = e->shares;
            }
            else if (const auto *d = std::get_if<DollarQuantity>(&quantity))
            {
                j["dollars"] = d->dollars;
            }
            else
            {
                const auto &c = std::get<CashQuantity>(quantity);
                j["dollars"] = c.dollars;
                j["currency"] = c.currency;
            }

            return j;
        }

        // ============================================================================
        // AnalysisWindow / Portfolio
        // ============================================================================

        void AnalysisWindow::validate() const
        {
            if (!is_iso_date(start_date) || !is_iso_date(end_date))
            {
                throw ConfigurationError("Analysis window dates must be YYYY-MM-DD, got '" +
                                         start_date + "' and '" + end_date + "'");
            }
            if (end_date < start_date)
            {
                throw ConfigurationError("Analysis window ends (" + end_date +
                                         ") before it starts (" + start_date + ")");
            }
        }

        void Portfolio::validate() const
        {
            window.validate();

            if (!valuation_date.empty() && !is_iso_date(valuation_date))
            {
                throw ConfigurationError("Valuation date must be YYYY-MM-DD, got '" + valuation_date + "'");
            }

            for (const auto &holding : holdings)
            {
                holding.validate();
            }
        }

        Portfolio Portfolio::from_json(const nlohmann::json &j)
        {
            Portfolio portfolio;

            if (j.contains("holdings"))
            {
                if (!j["holdings"].is_array())
                {
                    throw ConfigurationError("'holdings' must be an array");
                }
                for (const auto &item : j["holdings"])
                {
                    portfolio.holdings.push_back(Holding::from_json(item));
                }
            }

            portfolio.window.start_date = j.value("start_date", "");
            portfolio.window.end_date = j.value("end_date", "");
            portfolio.valuation_date = j.value("valuation_date", "");
            return portfolio;
        }

        nlohmann::json Portfolio::to_json() const
        {
            // Sorted so that holding order does not change the document
            std::vector<std::string> dumped;
            dumped.reserve(holdings.size());
            for (const auto &holding : holdings)
            {
                dumped.push_back(holding.to_json().dump());
            }
            std::sort(dumped.begin(), dumped.end());

            nlohmann::json list = nlohmann::json::array();
            for (const auto &text : dumped)
            {
                list.push_back(nlohmann::json::parse(text));
            }

            return nlohmann::json{
                {"holdings", list},
                {"start_date", window.start_date},
                {"end_date", window.end_date},
                {"valuation_date", effective_valuation_date()}};
        }

    } // namespace portfolio
} // namespace riskengine
