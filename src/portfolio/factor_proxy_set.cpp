/**
 * @file factor_proxy_set.cpp
 * @brief FactorProxySet implementation
 */

#include "portfolio/factor_proxy_set.hpp"
#include "core/errors.hpp"
#include "core/fingerprint.hpp"

namespace riskengine
{
    namespace portfolio
    {
        const std::string FactorProxySet::kMarketFactor = "market";

        void FactorProxySet::add_factor(const std::string &factor,
                                        const std::string &proxy_ticker,
                                        bool excess_over_market)
        {
            if (proxies_.count(factor))
            {
                throw ConfigurationError("Factor '" + factor + "' appears twice in proxy set");
            }

            factor_names_.push_back(factor);
            proxies_[factor] = proxy_ticker;
            if (excess_over_market)
            {
                excess_.insert(factor);
            }
        }

        void FactorProxySet::add_cash_proxy(const std::string &currency, const std::string &proxy_ticker)
        {
            cash_proxies_[currency] = proxy_ticker;
        }

        const std::string &FactorProxySet::proxy_for(const std::string &factor) const
        {
            auto it = proxies_.find(factor);
            if (it == proxies_.end())
            {
                throw ConfigurationError("Unknown factor: " + factor);
            }
            return it->second;
        }

        std::optional<std::string> FactorProxySet::cash_proxy_for(const std::string &currency) const
        {
            auto it = cash_proxies_.find(currency);
            if (it == cash_proxies_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::set<std::string> FactorProxySet::cash_proxy_tickers() const
        {
            std::set<std::string> tickers;
            for (const auto &entry : cash_proxies_)
            {
                tickers.insert(entry.second);
            }
            return tickers;
        }

        void FactorProxySet::validate() const
        {
            if (factor_names_.empty())
            {
                throw ConfigurationError("Factor proxy set must define at least one factor");
            }

            for (const auto &factor : factor_names_)
            {
                if (factor.empty() || proxies_.at(factor).empty())
                {
                    throw ConfigurationError("Factor proxy set has a blank factor name or proxy ticker");
                }

                if (excess_.count(factor))
                {
                    if (factor == kMarketFactor)
                    {
                        throw ConfigurationError("The market factor cannot be measured in excess of itself");
                    }
                    if (!proxies_.count(kMarketFactor))
                    {
                        throw ConfigurationError("Factor '" + factor +
                                                 "' is excess-over-market but no market factor is defined");
                    }
                }
            }

            for (const auto &entry : cash_proxies_)
            {
                if (entry.first.empty() || entry.second.empty())
                {
                    throw ConfigurationError("Cash proxy mapping has a blank currency or ticker");
                }
            }
        }

        std::string FactorProxySet::identity() const
        {
            return fingerprint_of(to_json());
        }

        nlohmann::json FactorProxySet::to_json() const
        {
            nlohmann::json factors = nlohmann::json::array();
            for (const auto &factor : factor_names_)
            {
                factors.push_back({{"factor", factor},
                                   {"proxy", proxies_.at(factor)},
                                   {"excess_over_market", excess_.count(factor) > 0}});
            }

            return nlohmann::json{
                {"factors", factors},
                {"cash_proxies", cash_proxies_}};
        }

        FactorProxySet FactorProxySet::from_json(const nlohmann::json &j)
        {
            FactorProxySet proxies;

            std::set<std::string> excess;
            if (j.contains("excess_over_market"))
            {
                excess = j["excess_over_market"].get<std::set<std::string>>();
            }

            if (!j.contains("factors"))
            {
                throw ConfigurationError("Factor proxy set must contain 'factors'");
            }

            const auto &factors = j["factors"];
            if (factors.is_object())
            {
                for (auto it = factors.begin(); it != factors.end(); ++it)
                {
                    proxies.add_factor(it.key(), it.value().get<std::string>(), excess.count(it.key()) > 0);
                }
            }
            else if (factors.is_array())
            {
                for (const auto &item : factors)
                {
                    const std::string name = item.at("factor").get<std::string>();
                    proxies.add_factor(name,
                                       item.at("proxy").get<std::string>(),
                                       item.value("excess_over_market", excess.count(name) > 0));
                }
            }
            else
            {
                throw ConfigurationError("'factors' must be an object or an array");
            }

            if (j.contains("cash_proxies"))
            {
                for (auto it = j["cash_proxies"].begin(); it != j["cash_proxies"].end(); ++it)
                {
                    proxies.add_cash_proxy(it.key(), it.value().get<std::string>());
                }
            }

            proxies.validate();
            return proxies;
        }

    } // namespace portfolio
} // namespace riskengine
