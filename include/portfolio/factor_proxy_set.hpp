/**
 * @file factor_proxy_set.hpp
 * @brief Factor to proxy-ticker mapping plus cash currency proxies
 */

#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace riskengine
{
    namespace portfolio
    {
        /**
         * @class FactorProxySet
         * @brief Ordered list of factors, the tradable proxy used for each, and
         *        the cash-equivalent proxy for each currency
         *
         * Factors marked excess-over-market use the proxy return minus the
         * "market" proxy return, which isolates style factors such as
         * momentum or value from the broad market move.
         *
         * Usage Example:
         * @code
         * FactorProxySet proxies;
         * proxies.add_factor("market", "SPY");
         * proxies.add_factor("momentum", "MTUM", true);
         * proxies.add_cash_proxy("USD", "SGOV");
         * @endcode
         */
        class FactorProxySet
        {
        public:
            static const std::string kMarketFactor; ///< "market"

            FactorProxySet() = default;

            /**
             * @brief Append a factor
             * @throws ConfigurationError if the factor is already present
             */
            void add_factor(const std::string &factor,
                            const std::string &proxy_ticker,
                            bool excess_over_market = false);

            void add_cash_proxy(const std::string &currency, const std::string &proxy_ticker);

            const std::vector<std::string> &factor_names() const { return factor_names_; }
            size_t num_factors() const { return factor_names_.size(); }

            /**
             * @throws ConfigurationError for an unknown factor
             */
            const std::string &proxy_for(const std::string &factor) const;

            bool is_excess_over_market(const std::string &factor) const
            {
                return excess_.count(factor) > 0;
            }

            std::optional<std::string> cash_proxy_for(const std::string &currency) const;

            /**
             * @brief Tickers that stand in for cash balances
             */
            std::set<std::string> cash_proxy_tickers() const;

            const std::map<std::string, std::string> &cash_proxies() const { return cash_proxies_; }

            /**
             * @brief Check names, tickers and excess-return requirements
             * @throws ConfigurationError when empty, when a name or ticker is blank,
             *         or when an excess factor has no market factor to net against
             */
            void validate() const;

            /**
             * @brief Fingerprint of the canonical JSON form
             */
            std::string identity() const;

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"factors": {...}, "excess_over_market": [...], "cash_proxies": {...}}
             *
             * "factors" may be an object (ordered by name) or an array of
             * {"factor", "proxy"} objects (order kept).
             */
            static FactorProxySet from_json(const nlohmann::json &j);

        private:
            std::vector<std::string> factor_names_;
            std::map<std::string, std::string> proxies_;
            std::set<std::string> excess_;
            std::map<std::string, std::string> cash_proxies_;
        };

    } // namespace portfolio
} // namespace riskengine
