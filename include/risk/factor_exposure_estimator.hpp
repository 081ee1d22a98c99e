/**
 * @file factor_exposure_estimator.hpp
 * @brief Per-holding factor betas and residual variance from return regressions
 *
 * Each holding's period returns are regressed on the concurrent returns of
 * every factor proxy over the analysis window:
 *
 *     r_t = alpha + sum_f beta_f * F_{f,t} + e_t
 *
 * The default is one joint multivariate OLS against all factors at once,
 * so betas of correlated factors are not double counted. Residual variance
 * is the OLS residual variance SSR / (T - k - 1), annualized.
 *
 * Missing history is an error: a holding whose returns do not cover the
 * window, or a window with too few aligned periods, raises
 * DataInsufficientError instead of being zero-filled.
 */

#pragma once

#include "data/market_data_provider.hpp"
#include "portfolio/factor_proxy_set.hpp"
#include "portfolio/holding.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace riskengine
{
    namespace risk
    {
        /**
         * @enum BetaEstimation
         * @brief How betas are fitted
         */
        enum class BetaEstimation
        {
            JOINT,      ///< One multivariate OLS on all factors
            INDEPENDENT ///< cov(r, F_f) / var(F_f) per factor; residual variance still from the joint fit
        };

        /**
         * @struct EstimatorSettings
         * @brief Regression parameters
         */
        struct EstimatorSettings
        {
            int periods_per_year = 12;                     ///< 12 for monthly price data
            int min_observations = 12;                     ///< Aligned periods required per regression
            double min_coverage = 1.0;                     ///< Fraction of factor periods a holding must cover
            BetaEstimation method = BetaEstimation::JOINT; ///< Fitting method

            /**
             * @throws ConfigurationError on out-of-range values
             */
            void validate() const;

            static EstimatorSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct FactorBetaRow
         * @brief Regression output for one ticker
         */
        struct FactorBetaRow
        {
            std::string ticker;
            Eigen::VectorXd betas;          ///< One per factor, in proxy-set order
            double alpha = 0.0;             ///< Per-period intercept of the joint fit
            double r_squared = 0.0;         ///< Explained share of return variance
            double residual_variance = 0.0; ///< Annualized idiosyncratic variance
            int observations = 0;           ///< Aligned periods used
        };

        /**
         * @struct FactorBetaMatrix
         * @brief Holdings x factors beta matrix with residual variances
         */
        struct FactorBetaMatrix
        {
            std::vector<std::string> tickers;
            std::vector<std::string> factor_names;
            Eigen::MatrixXd betas;             ///< n_holdings x n_factors
            Eigen::VectorXd residual_variance; ///< n_holdings
            std::vector<FactorBetaRow> rows;   ///< Full regression output, same order as tickers

            /**
             * @throws ConfigurationError for an unknown ticker
             */
            const FactorBetaRow &row(const std::string &ticker) const;
        };

        /**
         * @struct FactorReturns
         * @brief Aligned factor return matrix for a window
         */
        struct FactorReturns
        {
            std::vector<std::string> factor_names;
            std::vector<std::string> dates; ///< Periods shared by every factor proxy
            Eigen::MatrixXd values;         ///< dates x factors
        };

        /**
         * @class ProxyReturnCache
         * @brief Read-through cache of proxy return series keyed by (proxy ticker, window)
         *
         * The provider call happens outside the lock; two threads missing the
         * same key may both fetch, and the first stored series wins.
         */
        class ProxyReturnCache
        {
        public:
            /**
             * @throws DataUnavailable as raised by the provider
             */
            data::ReturnSeries get_or_fetch(const std::string &proxy_ticker,
                                            const portfolio::AnalysisWindow &window,
                                            const data::MarketDataProvider &provider);

            void clear();
            size_t size() const;

        private:
            mutable std::mutex mutex_;
            std::map<std::pair<std::string, std::string>, data::ReturnSeries> series_;
        };

        /**
         * @class FactorExposureEstimator
         * @brief Estimates FactorBetaRows and caches them per (ticker, window, proxy-set identity)
         *
         * The estimator owns its caches; two estimators never share state.
         *
         * Usage Example:
         * @code
         * FactorExposureEstimator estimator(provider);
         * auto matrix = estimator.estimate_all({"AAPL", "SGOV"}, window, proxies);
         * double aapl_market = matrix.betas(0, 0);
         * @endcode
         */
        class FactorExposureEstimator
        {
        public:
            /**
             * @param provider Market data source
             * @param settings Regression parameters
             * @param proxy_cache Proxy return cache; a fresh one is created when null
             * @throws ConfigurationError if provider is null or settings are invalid
             */
            explicit FactorExposureEstimator(std::shared_ptr<const data::MarketDataProvider> provider,
                                             EstimatorSettings settings = EstimatorSettings(),
                                             std::unique_ptr<ProxyReturnCache> proxy_cache = nullptr);

            /**
             * @brief Betas and residual variance of one ticker
             * @throws DataInsufficientError on missing, short or collinear history
             */
            FactorBetaRow estimate(const std::string &ticker,
                                   const portfolio::AnalysisWindow &window,
                                   const portfolio::FactorProxySet &proxies) const;

            /**
             * @brief Beta matrix for a list of tickers, in the given order
             */
            FactorBetaMatrix estimate_all(const std::vector<std::string> &tickers,
                                          const portfolio::AnalysisWindow &window,
                                          const portfolio::FactorProxySet &proxies) const;

            /**
             * @brief Aligned factor returns, excess factors already netted against market
             * @throws DataInsufficientError if a proxy has no data or proxies cover different periods
             */
            FactorReturns factor_returns(const portfolio::AnalysisWindow &window,
                                         const portfolio::FactorProxySet &proxies) const;

            /**
             * @brief Drop every cached beta row and proxy series
             */
            void clear_cache();

            /**
             * @brief Drop cached beta rows estimated against one proxy set
             * @return Number of rows removed
             */
            size_t clear_proxy_set(const std::string &proxy_set_identity);

            size_t cached_rows() const;

            const EstimatorSettings &settings() const { return settings_; }

        private:
            using RowKey = std::tuple<std::string, std::string, std::string>;

            data::ReturnSeries fetch(const std::string &ticker,
                                     const portfolio::AnalysisWindow &window) const;

            FactorBetaRow cached_or_regress(const std::string &ticker,
                                            const portfolio::AnalysisWindow &window,
                                            const portfolio::FactorProxySet &proxies,
                                            const std::string &identity,
                                            std::optional<FactorReturns> &factors) const;

            FactorBetaRow regress(const std::string &ticker,
                                  const data::ReturnSeries &series,
                                  const FactorReturns &factors) const;

            std::shared_ptr<const data::MarketDataProvider> provider_;
            EstimatorSettings settings_;
            std::unique_ptr<ProxyReturnCache> proxy_cache_;

            mutable std::mutex rows_mutex_;
            mutable std::map<RowKey, FactorBetaRow> rows_;
        };

    } // namespace risk
} // namespace riskengine
