/**
 * @file risk_engine.cpp
 * @brief Implementation of RiskEngine
 */

#include "engine/risk_engine.hpp"
#include "core/errors.hpp"
#include "core/fingerprint.hpp"
#include "optimizer/portfolio_optimizer.hpp"
#include "risk/limits_checker.hpp"
#include "risk/risk_contribution.hpp"
#include "risk/covariance_factory.hpp"
#include "risk/variance_decomposition.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace riskengine
{
    namespace engine
    {

        // ============================================================================
        // OptimizationSettings
        // ============================================================================

        OptimizationSettings OptimizationSettings::from_json(const nlohmann::json &j)
        {
            OptimizationSettings settings;
            if (j.contains("expected_returns"))
            {
                settings.expected_returns = j.at("expected_returns").get<std::map<std::string, double>>();
                for (const auto &entry : settings.expected_returns)
                {
                    require_finite_input(entry.second, "expected_returns." + entry.first);
                }
            }
            if (j.contains("candidates"))
            {
                settings.candidates = j.at("candidates").get<std::vector<std::string>>();
            }
            settings.box = optimizer::BoxConstraints::from_json(j);
            settings.budget = optimizer::SolverBudget::from_json(j);
            return settings;
        }

        // ============================================================================
        // RiskEngine
        // ============================================================================

        RiskEngine::RiskEngine(std::shared_ptr<const data::MarketDataProvider> provider,
                               RiskEngineConfig config,
                               std::shared_ptr<ResultCache> cache)
            : provider_(std::move(provider)),
              config_(std::move(config)),
              cache_(std::move(cache)),
              estimator_(provider_, config_.estimation),
              scorer_(config_.scoring)
        {
            config_.validate();
            if (!cache_)
            {
                cache_ = std::make_shared<InMemoryResultCache>(std::chrono::seconds(config_.cache_ttl_seconds),
                                                               config_.cache_max_entries);
            }
        }

        std::string RiskEngine::cache_key(const portfolio::Portfolio &portfolio,
                                          const portfolio::FactorProxySet &proxies,
                                          const risk::RiskLimitSet &limits)
        {
            nlohmann::json key{
                {"portfolio", portfolio.to_json()},
                {"proxy_set", proxies.identity()},
                {"limit_set", limits.identity()}};
            return key.dump();
        }

        std::string RiskEngine::fingerprint(const portfolio::Portfolio &portfolio,
                                            const portfolio::FactorProxySet &proxies,
                                            const risk::RiskLimitSet &limits)
        {
            return fingerprint_of_dump(cache_key(portfolio, proxies, limits));
        }

        AnalysisPtr RiskEngine::analyze_portfolio(const portfolio::Portfolio &portfolio,
                                                  const portfolio::FactorProxySet &proxies,
                                                  const risk::RiskLimitSet &limits)
        {
            portfolio.validate();
            proxies.validate();
            limits.validate();

            const std::string key = cache_key(portfolio, proxies, limits);
            const std::string fp = fingerprint_of_dump(key);
            auto compute = [&]()
            { return compute_analysis(portfolio, proxies, limits, fp); };

            try
            {
                return cache_->get_or_compute(fp, key, {proxies.identity(), limits.identity()}, compute);
            }
            catch (const CacheError &e)
            {
                spdlog::warn("Result cache unavailable ({}); computing {} directly", e.what(), fp);
            }
            return compute();
        }

        Eigen::MatrixXd RiskEngine::factor_covariance(const risk::FactorReturns &factors) const
        {
            auto estimator = risk::make_covariance_estimator(config_.covariance);
            Eigen::MatrixXd cov = estimator->annualized(factors.values, config_.estimation.periods_per_year);
            if (!cov.allFinite())
            {
                throw DataInsufficientError("Factor covariance contains NaN or Inf");
            }
            return cov;
        }

        AnalysisPtr RiskEngine::compute_analysis(const portfolio::Portfolio &portfolio,
                                                 const portfolio::FactorProxySet &proxies,
                                                 const risk::RiskLimitSet &limits,
                                                 const std::string &fp)
        {
            ++computations_;
            spdlog::debug("Computing risk analysis {}", fp);

            auto result = std::make_shared<risk::RiskAnalysisResult>();
            result->fingerprint = fp;
            result->window = portfolio.window;
            result->valuation_date = portfolio.effective_valuation_date();
            result->limits = limits;

            // 1. Holdings -> weights
            const portfolio::AggregatedPortfolio mapped = aggregator_.aggregate(portfolio, proxies, *provider_);
            result->tickers = mapped.tickers;
            result->weights = mapped.weights;
            result->dollar_exposures = mapped.dollar_exposures;
            result->total_value = mapped.total_value;
            result->leverage = mapped.leverage;
            result->unmapped_cash = mapped.unmapped_cash;
            result->herfindahl = risk::RiskContributionCalculator::herfindahl(mapped.weights);

            // 2. Factor model
            const risk::FactorReturns factors = estimator_.factor_returns(portfolio.window, proxies);
            result->factor_names = factors.factor_names;
            result->betas = estimator_.estimate_all(mapped.tickers, portfolio.window, proxies);
            result->factor_covariance = factor_covariance(factors);
            result->factor_correlation = risk::CovarianceEstimator::correlation(result->factor_covariance);

            // 3. Decomposition and attribution
            result->decomposition = risk::VarianceDecomposer::decompose(result->weights,
                                                                        result->betas.betas,
                                                                        result->betas.residual_variance,
                                                                        result->factor_covariance);
            const Eigen::MatrixXd asset_cov = risk::VarianceDecomposer::asset_covariance(
                result->betas.betas, result->betas.residual_variance, result->factor_covariance);
            result->holding_contributions = risk::RiskContributionCalculator::by_holding(
                result->tickers, result->weights, asset_cov, result->decomposition);
            result->factor_contributions = risk::RiskContributionCalculator::by_factor(
                result->factor_names, result->factor_covariance, result->decomposition);
            result->factor_losses = risk::RiskContributionCalculator::worst_case_factor_losses(
                result->factor_names, result->decomposition.portfolio_betas, config_.worst_case_moves,
                result->leverage);

            // 4. Compliance
            result->verdicts = risk::LimitsChecker::check(result->metrics(), limits);

            spdlog::info("Analysed {} holdings: volatility {:.4f}, factor share {:.3f}, {} of {} limits failed",
                         result->tickers.size(), result->decomposition.volatility,
                         result->decomposition.factor_share, result->failed_verdicts(), result->verdicts.size());

            return result;
        }

        risk::RiskScoreResult RiskEngine::score_portfolio(const risk::RiskAnalysisResult &analysis) const
        {
            return scorer_.score(analysis);
        }

        Eigen::VectorXd RiskEngine::resolve_expected_returns(const std::vector<std::string> &universe,
                                                             const std::set<std::string> &cash_tickers,
                                                             const std::map<std::string, double> &provided) const
        {
            Eigen::VectorXd mu(static_cast<Eigen::Index>(universe.size()));
            for (size_t i = 0; i < universe.size(); ++i)
            {
                const std::string &ticker = universe[i];
                auto it = provided.find(ticker);
                double value = 0.0;
                if (it != provided.end())
                {
                    value = it->second;
                }
                else if (cash_tickers.count(ticker))
                {
                    value = config_.cash_proxy_return;
                }
                else if (config_.expected_return_fallback)
                {
                    value = *config_.expected_return_fallback;
                }
                else
                {
                    throw ConfigurationError("No expected return for " + ticker +
                                             " (set optimization.expected_returns or engine.expected_return_fallback)");
                }
                require_finite_input(value, "Expected return of " + ticker);
                mu(static_cast<Eigen::Index>(i)) = value;
            }
            return mu;
        }

        optimizer::OptimizationResult RiskEngine::optimize_portfolio(const portfolio::Portfolio &portfolio,
                                                                     optimizer::ObjectiveType objective,
                                                                     const risk::RiskLimitSet &limits,
                                                                     const OptimizationSettings &settings)
        {
            portfolio.validate();
            settings.proxies.validate();
            limits.validate();
            settings.box.validate();
            settings.budget.validate();

            const portfolio::AggregatedPortfolio mapped =
                aggregator_.aggregate(portfolio, settings.proxies, *provider_);

            // Universe: current holdings, then candidates not already held
            std::vector<std::string> universe = mapped.tickers;
            for (const auto &ticker : settings.candidates)
            {
                if (ticker.empty())
                {
                    throw ConfigurationError("Candidate ticker cannot be empty");
                }
                if (std::find(universe.begin(), universe.end(), ticker) == universe.end())
                {
                    universe.push_back(ticker);
                }
            }
            if (universe.empty())
            {
                throw ConfigurationError("Nothing to optimize: no holdings and no candidates");
            }

            std::set<std::string> cash_tickers = settings.proxies.cash_proxy_tickers();
            cash_tickers.insert(mapped.cash_tickers.begin(), mapped.cash_tickers.end());

            const risk::FactorReturns factors = estimator_.factor_returns(portfolio.window, settings.proxies);
            const risk::FactorBetaMatrix betas = estimator_.estimate_all(universe, portfolio.window, settings.proxies);

            optimizer::OptimizationProblem problem;
            problem.objective = objective;
            problem.tickers = universe;
            problem.factor_names = factors.factor_names;
            problem.betas = betas.betas;
            problem.residual_variance = betas.residual_variance;
            problem.factor_covariance = factor_covariance(factors);
            problem.limits = limits;
            problem.box = settings.box;
            problem.budget = settings.budget;
            problem.worst_case_moves = config_.worst_case_moves;

            const Eigen::Index n = static_cast<Eigen::Index>(universe.size());
            problem.current_weights = Eigen::VectorXd::Zero(n);
            problem.cash_flags.assign(universe.size(), false);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const std::string &ticker = universe[static_cast<size_t>(i)];
                const int held = mapped.index_of(ticker);
                if (held >= 0)
                {
                    problem.current_weights(i) = mapped.weights(held);
                }
                problem.cash_flags[static_cast<size_t>(i)] = cash_tickers.count(ticker) > 0;
            }

            if (objective == optimizer::ObjectiveType::MAX_RETURN)
            {
                problem.expected_returns = resolve_expected_returns(universe, cash_tickers, settings.expected_returns);
            }

            optimizer::PortfolioOptimizer optimizer;
            return optimizer.optimize(problem);
        }

        size_t RiskEngine::invalidate_cache(const std::optional<std::string> &fingerprint)
        {
            size_t removed = 0;
            try
            {
                removed = cache_->invalidate(fingerprint);
            }
            catch (const CacheError &e)
            {
                spdlog::warn("Result cache invalidation failed: {}", e.what());
            }
            if (!fingerprint)
            {
                estimator_.clear_cache();
            }
            return removed;
        }

        size_t RiskEngine::invalidate_proxy_set(const portfolio::FactorProxySet &proxies)
        {
            const std::string identity = proxies.identity();
            const size_t rows = estimator_.clear_proxy_set(identity);
            spdlog::debug("Dropped {} cached beta rows for proxy set {}", rows, identity);
            try
            {
                return cache_->invalidate_component(identity);
            }
            catch (const CacheError &e)
            {
                spdlog::warn("Result cache invalidation failed: {}", e.what());
            }
            return 0;
        }

        size_t RiskEngine::invalidate_limit_set(const risk::RiskLimitSet &limits)
        {
            try
            {
                return cache_->invalidate_component(limits.identity());
            }
            catch (const CacheError &e)
            {
                spdlog::warn("Result cache invalidation failed: {}", e.what());
            }
            return 0;
        }

        CacheStats RiskEngine::cache_stats() const
        {
            try
            {
                return cache_->stats();
            }
            catch (const CacheError &e)
            {
                spdlog::warn("Result cache statistics unavailable: {}", e.what());
            }
            return CacheStats();
        }

    } // namespace engine
} // namespace riskengine
