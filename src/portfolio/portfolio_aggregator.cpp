/**
 * @file portfolio_aggregator.cpp
 * @brief Cash substitution, valuation and weight normalization
 */

#include "portfolio/portfolio_aggregator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace riskengine
{
    namespace portfolio
    {
        int AggregatedPortfolio::index_of(const std::string &ticker) const
        {
            auto it = std::find(tickers.begin(), tickers.end(), ticker);
            return it == tickers.end() ? -1 : static_cast<int>(std::distance(tickers.begin(), it));
        }

        std::map<std::string, double> AggregatedPortfolio::weight_map() const
        {
            std::map<std::string, double> result;
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                result[tickers[i]] = weights(i);
            }
            return result;
        }

        PortfolioAggregator::PortfolioAggregator(double dollar_tolerance)
            : dollar_tolerance_(dollar_tolerance)
        {
            if (!(dollar_tolerance_ >= 0.0))
            {
                throw ConfigurationError("Dollar tolerance must be non-negative");
            }
        }

        AggregatedPortfolio PortfolioAggregator::aggregate(const Portfolio &portfolio,
                                                           const FactorProxySet &proxies,
                                                           const data::MarketDataProvider &provider) const
        {
            portfolio.validate();

            const std::string &valuation_date = portfolio.effective_valuation_date();

            AggregatedPortfolio result;
            std::vector<double> dollars;
            std::vector<double> cash_dollars; // part of each position that came from cash
            std::map<std::string, std::string> kind_by_ticker;

            auto accumulate = [&](const std::string &ticker, double amount, bool from_cash)
            {
                int idx = result.index_of(ticker);
                if (idx < 0)
                {
                    result.tickers.push_back(ticker);
                    dollars.push_back(0.0);
                    cash_dollars.push_back(0.0);
                    idx = static_cast<int>(dollars.size()) - 1;
                }
                dollars[idx] += amount;
                if (from_cash)
                {
                    cash_dollars[idx] += amount;
                }
            };

            // ========================================================================
            // 1. Resolve every holding to (mapped ticker, dollars)
            // ========================================================================
            for (const auto &holding : portfolio.holdings)
            {
                if (const auto *cash = std::get_if<CashQuantity>(&holding.quantity))
                {
                    result.original_cash_dollars += cash->dollars;

                    auto proxy = proxies.cash_proxy_for(cash->currency);
                    if (!proxy)
                    {
                        spdlog::warn("No cash proxy for currency {}; {} stays unmapped",
                                     cash->currency, holding.ticker);
                        if (std::find(result.unmapped_cash.begin(), result.unmapped_cash.end(),
                                      holding.ticker) == result.unmapped_cash.end())
                        {
                            result.unmapped_cash.push_back(holding.ticker);
                        }
                        accumulate(holding.ticker, cash->dollars, true);
                        result.cash_tickers.insert(holding.ticker);
                        continue;
                    }

                    accumulate(*proxy, cash->dollars, true);
                    result.cash_tickers.insert(*proxy);
                    continue;
                }

                // Non-cash tickers must keep one quantity form
                const std::string kind = holding.quantity_kind();
                auto seen = kind_by_ticker.find(holding.ticker);
                if (seen != kind_by_ticker.end() && seen->second != kind)
                {
                    throw ConfigurationError("Ticker " + holding.ticker + " is held both in " +
                                             seen->second + " and in " + kind);
                }
                kind_by_ticker[holding.ticker] = kind;

                double amount = 0.0;
                if (const auto *equity = std::get_if<EquityQuantity>(&holding.quantity))
                {
                    double price = 0.0;
                    try
                    {
                        price = provider.get_price(holding.ticker, valuation_date);
                    }
                    catch (const DataUnavailable &e)
                    {
                        throw DataInsufficientError("Cannot value " + holding.ticker + ": " + e.what());
                    }
                    require_finite_data(price, "Price of " + holding.ticker);
                    amount = equity->shares * price;
                }
                else
                {
                    amount = std::get<DollarQuantity>(holding.quantity).dollars;
                }

                accumulate(holding.ticker, amount, false);
            }

            // ========================================================================
            // 2. Dollar preservation
            // ========================================================================
            result.dollar_exposures = Eigen::Map<const Eigen::VectorXd>(dollars.data(), dollars.size());
            result.total_value = result.dollar_exposures.sum();

            for (double amount : cash_dollars)
            {
                result.mapped_cash_dollars += amount;
            }

            if (std::abs(result.original_cash_dollars - result.mapped_cash_dollars) > dollar_tolerance_)
            {
                throw ConfigurationError("Cash substitution changed cash value from " +
                                         std::to_string(result.original_cash_dollars) + " to " +
                                         std::to_string(result.mapped_cash_dollars));
            }

            // ========================================================================
            // 3. Weights and leverage
            // ========================================================================
            const Eigen::Index n = static_cast<Eigen::Index>(result.tickers.size());
            result.weights = Eigen::VectorXd::Zero(n);

            if (result.total_value == 0.0)
            {
                if (n > 0)
                {
                    spdlog::warn("Portfolio net value is zero; all weights set to zero");
                }
                return result;
            }

            result.weights = result.dollar_exposures / result.total_value;
            if (!result.weights.allFinite())
            {
                throw ConfigurationError("Holding amounts produce non-finite weights");
            }

            // Positive cash is not risk; negative cash (borrowing) is. A directly
            // held position in a cash proxy stays risky.
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const double cash_part = std::max(cash_dollars[static_cast<size_t>(i)], 0.0);
                const double w = (dollars[static_cast<size_t>(i)] - cash_part) / result.total_value;
                result.net_exposure += w;
                result.gross_exposure += std::abs(w);
            }

            result.leverage = result.net_exposure == 0.0
                                  ? 0.0
                                  : result.gross_exposure / std::abs(result.net_exposure);

            spdlog::debug("Aggregated {} holdings into {} tickers, total value {:.2f}, leverage {:.3f}",
                          portfolio.holdings.size(), n, result.total_value, result.leverage);

            return result;
        }

    } // namespace portfolio
} // namespace riskengine
