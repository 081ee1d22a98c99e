/**
 * @file risk_engine.hpp
 * @brief Public entry points of the factor risk engine
 *
 * Pipeline for one analysis:
 *
 *   Portfolio --PortfolioAggregator--> weights
 *             --FactorExposureEstimator--> betas, residual variance
 *             --CovarianceEstimator--> factor covariance
 *             --VarianceDecomposer / RiskContributionCalculator--> risk split
 *             --LimitsChecker--> verdicts
 *
 * Results are memoised in a ResultCache keyed by a fingerprint of the
 * holdings, window, proxy set and limit set. The engine itself persists
 * nothing; holdings and limits arrive as plain values.
 */

#pragma once

#include "data/market_data_provider.hpp"
#include "engine/result_cache.hpp"
#include "engine/risk_engine_config.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "portfolio/factor_proxy_set.hpp"
#include "portfolio/holding.hpp"
#include "portfolio/portfolio_aggregator.hpp"
#include "risk/factor_exposure_estimator.hpp"
#include "risk/risk_analysis_result.hpp"
#include "risk/risk_limits.hpp"
#include "risk/risk_scorer.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace riskengine
{
    namespace engine
    {
        /**
         * @struct OptimizationSettings
         * @brief Everything optimize_portfolio needs beyond the portfolio and limits
         */
        struct OptimizationSettings
        {
            portfolio::FactorProxySet proxies;
            std::map<std::string, double> expected_returns; ///< Annual, per ticker; MAX_RETURN only
            std::vector<std::string> candidates;            ///< Tickers the optimizer may add
            optimizer::BoxConstraints box;
            optimizer::SolverBudget budget;

            /**
             * @brief Parse the "optimization" config section; proxies are set separately
             */
            static OptimizationSettings from_json(const nlohmann::json &j);
        };

        /**
         * @class RiskEngine
         * @brief Facade over aggregation, estimation, decomposition, compliance, scoring and optimization
         *
         * Usage Example:
         * @code
         * auto provider = std::make_shared<data::HistoricalMarketDataProvider>(prices);
         * RiskEngine engine(provider);
         *
         * auto analysis = engine.analyze_portfolio(portfolio, proxies, limits);
         * auto score = engine.score_portfolio(*analysis);
         * std::cout << "Volatility: " << analysis->decomposition.volatility << "\n";
         * @endcode
         *
         * Thread Safety: all public methods may be called concurrently.
         */
        class RiskEngine
        {
        public:
            /**
             * @param provider Market data source
             * @param config Engine settings
             * @param cache Result cache; an InMemoryResultCache built from config when null
             * @throws ConfigurationError if provider is null or config is invalid
             */
            explicit RiskEngine(std::shared_ptr<const data::MarketDataProvider> provider,
                                RiskEngineConfig config = RiskEngineConfig(),
                                std::shared_ptr<ResultCache> cache = nullptr);

            /**
             * @brief Full risk analysis, served from the cache when possible
             * @throws ConfigurationError on malformed inputs
             * @throws DataInsufficientError on missing or short history
             */
            AnalysisPtr analyze_portfolio(const portfolio::Portfolio &portfolio,
                                          const portfolio::FactorProxySet &proxies,
                                          const risk::RiskLimitSet &limits);

            risk::RiskScoreResult score_portfolio(const risk::RiskAnalysisResult &analysis) const;

            /**
             * @brief Search for limit-compliant weights over the holdings plus candidates
             * @return Tagged result; never throws for infeasibility or non-convergence
             * @throws ConfigurationError on malformed inputs or missing expected returns
             * @throws DataInsufficientError on missing or short history
             */
            optimizer::OptimizationResult optimize_portfolio(const portfolio::Portfolio &portfolio,
                                                             optimizer::ObjectiveType objective,
                                                             const risk::RiskLimitSet &limits,
                                                             const OptimizationSettings &settings);

            /**
             * @brief Drop one cached result, or all results and estimator caches
             * @return Number of cached results removed
             */
            size_t invalidate_cache(const std::optional<std::string> &fingerprint = std::nullopt);

            /**
             * @brief Drop results and beta rows computed against a proxy set
             */
            size_t invalidate_proxy_set(const portfolio::FactorProxySet &proxies);

            /**
             * @brief Drop results checked against a limit set
             */
            size_t invalidate_limit_set(const risk::RiskLimitSet &limits);

            /**
             * @brief Canonical JSON dump of an analysis request
             *
             * Stored beside each cache entry so that two requests sharing a
             * fingerprint are never confused.
             */
            static std::string cache_key(const portfolio::Portfolio &portfolio,
                                         const portfolio::FactorProxySet &proxies,
                                         const risk::RiskLimitSet &limits);

            /**
             * @brief Cache key for an analysis request
             */
            static std::string fingerprint(const portfolio::Portfolio &portfolio,
                                           const portfolio::FactorProxySet &proxies,
                                           const risk::RiskLimitSet &limits);

            /**
             * @brief Number of analyses actually computed (cache misses and fallbacks)
             */
            size_t computations() const { return computations_.load(); }

            CacheStats cache_stats() const;

            const RiskEngineConfig &config() const { return config_; }

        private:
            AnalysisPtr compute_analysis(const portfolio::Portfolio &portfolio,
                                         const portfolio::FactorProxySet &proxies,
                                         const risk::RiskLimitSet &limits,
                                         const std::string &fingerprint);

            Eigen::MatrixXd factor_covariance(const risk::FactorReturns &factors) const;

            Eigen::VectorXd resolve_expected_returns(const std::vector<std::string> &universe,
                                                     const std::set<std::string> &cash_tickers,
                                                     const std::map<std::string, double> &provided) const;

            std::shared_ptr<const data::MarketDataProvider> provider_;
            RiskEngineConfig config_;
            std::shared_ptr<ResultCache> cache_;
            portfolio::PortfolioAggregator aggregator_;
            risk::FactorExposureEstimator estimator_;
            risk::RiskScorer scorer_;
            std::atomic<size_t> computations_{0};
        };

    } // namespace engine
} // namespace riskengine
