/**
 * @file factor_exposure_estimator.cpp
 * @brief Factor regressions, date alignment and estimator caches
 */

#include "risk/factor_exposure_estimator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            std::vector<std::string> intersect_dates(const std::vector<std::string> &a,
                                                     const std::vector<std::string> &b)
            {
                std::vector<std::string> common;
                std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                                      std::back_inserter(common));
                return common;
            }

            std::map<std::string, double> by_date(const data::ReturnSeries &series)
            {
                std::map<std::string, double> lookup;
                for (size_t i = 0; i < series.size(); ++i)
                {
                    lookup[series.dates[i]] = series.values(i);
                }
                return lookup;
            }
        } // namespace

        // ============================================================================
        // EstimatorSettings
        // ============================================================================

        void EstimatorSettings::validate() const
        {
            if (periods_per_year <= 0)
            {
                throw ConfigurationError("periods_per_year must be positive, got " +
                                         std::to_string(periods_per_year));
            }
            if (min_observations < 3)
            {
                throw ConfigurationError("min_observations must be at least 3, got " +
                                         std::to_string(min_observations));
            }
            if (!(min_coverage > 0.0 && min_coverage <= 1.0))
            {
                throw ConfigurationError("min_coverage must be in (0, 1], got " +
                                         std::to_string(min_coverage));
            }
        }

        EstimatorSettings EstimatorSettings::from_json(const nlohmann::json &j)
        {
            EstimatorSettings settings;
            settings.periods_per_year = j.value("periods_per_year", settings.periods_per_year);
            settings.min_observations = j.value("min_observations", settings.min_observations);
            settings.min_coverage = j.value("min_coverage", settings.min_coverage);

            const std::string method = j.value("beta_estimation", std::string("joint"));
            if (method == "joint")
            {
                settings.method = BetaEstimation::JOINT;
            }
            else if (method == "independent")
            {
                settings.method = BetaEstimation::INDEPENDENT;
            }
            else
            {
                throw ConfigurationError("Unknown beta_estimation '" + method +
                                         "'. Valid options: joint, independent");
            }

            settings.validate();
            return settings;
        }

        nlohmann::json EstimatorSettings::to_json() const
        {
            return nlohmann::json{
                {"periods_per_year", periods_per_year},
                {"min_observations", min_observations},
                {"min_coverage", min_coverage},
                {"beta_estimation", method == BetaEstimation::JOINT ? "joint" : "independent"}};
        }

        const FactorBetaRow &FactorBetaMatrix::row(const std::string &ticker) const
        {
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                if (tickers[i] == ticker)
                {
                    return rows[i];
                }
            }
            throw ConfigurationError("No betas estimated for " + ticker);
        }

        // ============================================================================
        // ProxyReturnCache
        // ============================================================================

        data::ReturnSeries ProxyReturnCache::get_or_fetch(const std::string &proxy_ticker,
                                                          const portfolio::AnalysisWindow &window,
                                                          const data::MarketDataProvider &provider)
        {
            const auto key = std::make_pair(proxy_ticker, window.key());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = series_.find(key);
                if (it != series_.end())
                {
                    return it->second;
                }
            }

            data::ReturnSeries series = provider.get_returns(proxy_ticker, window.start_date, window.end_date);

            std::lock_guard<std::mutex> lock(mutex_);
            return series_.emplace(key, std::move(series)).first->second;
        }

        void ProxyReturnCache::clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            series_.clear();
        }

        size_t ProxyReturnCache::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return series_.size();
        }

        // ============================================================================
        // FactorExposureEstimator
        // ============================================================================

        FactorExposureEstimator::FactorExposureEstimator(std::shared_ptr<const data::MarketDataProvider> provider,
                                                         EstimatorSettings settings,
                                                         std::unique_ptr<ProxyReturnCache> proxy_cache)
            : provider_(std::move(provider)),
              settings_(settings),
              proxy_cache_(std::move(proxy_cache))
        {
            if (!provider_)
            {
                throw ConfigurationError("FactorExposureEstimator requires a market data provider");
            }
            settings_.validate();

            if (!proxy_cache_)
            {
                proxy_cache_ = std::make_unique<ProxyReturnCache>();
            }
        }

        data::ReturnSeries FactorExposureEstimator::fetch(const std::string &ticker,
                                                          const portfolio::AnalysisWindow &window) const
        {
            try
            {
                return provider_->get_returns(ticker, window.start_date, window.end_date);
            }
            catch (const DataUnavailable &e)
            {
                throw DataInsufficientError("Return history unavailable for " + ticker + ": " + e.what());
            }
        }

        FactorReturns FactorExposureEstimator::factor_returns(const portfolio::AnalysisWindow &window,
                                                              const portfolio::FactorProxySet &proxies) const
        {
            proxies.validate();

            // ========================================================================
            // 1. Fetch each distinct proxy once (read-through cache)
            // ========================================================================
            std::map<std::string, data::ReturnSeries> series;
            std::vector<std::string> needed;
            for (const auto &factor : proxies.factor_names())
            {
                needed.push_back(proxies.proxy_for(factor));
            }
            if (std::any_of(proxies.factor_names().begin(), proxies.factor_names().end(),
                            [&](const std::string &f)
                            { return proxies.is_excess_over_market(f); }))
            {
                needed.push_back(proxies.proxy_for(portfolio::FactorProxySet::kMarketFactor));
            }

            for (const auto &proxy : needed)
            {
                if (series.count(proxy))
                    continue;
                try
                {
                    series[proxy] = proxy_cache_->get_or_fetch(proxy, window, *provider_);
                }
                catch (const DataUnavailable &e)
                {
                    throw DataInsufficientError("Factor proxy " + proxy + " has no history: " + e.what());
                }
            }

            // ========================================================================
            // 2. Align on periods every proxy covers
            // ========================================================================
            std::set<std::string> all_dates;
            std::vector<std::string> common = series.begin()->second.dates;
            for (const auto &entry : series)
            {
                all_dates.insert(entry.second.dates.begin(), entry.second.dates.end());
                common = intersect_dates(common, entry.second.dates);
            }

            const double coverage = static_cast<double>(common.size()) / static_cast<double>(all_dates.size());
            if (coverage < settings_.min_coverage)
            {
                throw DataInsufficientError("Factor proxies share only " + std::to_string(common.size()) +
                                            " of " + std::to_string(all_dates.size()) + " periods in window " +
                                            window.key());
            }

            // ========================================================================
            // 3. Build the period x factor matrix
            // ========================================================================
            std::map<std::string, std::map<std::string, double>> lookup;
            for (const auto &entry : series)
            {
                lookup[entry.first] = by_date(entry.second);
            }

            FactorReturns result;
            result.factor_names = proxies.factor_names();
            result.dates = common;
            result.values.resize(static_cast<Eigen::Index>(common.size()),
                                 static_cast<Eigen::Index>(proxies.num_factors()));

            for (size_t f = 0; f < proxies.num_factors(); ++f)
            {
                const std::string &factor = result.factor_names[f];
                const auto &proxy_returns = lookup.at(proxies.proxy_for(factor));
                const bool excess = proxies.is_excess_over_market(factor);
                const auto *market_returns = excess
                                                 ? &lookup.at(proxies.proxy_for(portfolio::FactorProxySet::kMarketFactor))
                                                 : nullptr;

                for (size_t t = 0; t < common.size(); ++t)
                {
                    double value = proxy_returns.at(common[t]);
                    if (market_returns)
                    {
                        value -= market_returns->at(common[t]);
                    }
                    result.values(t, f) = value;
                }
            }

            if (!result.values.allFinite())
            {
                throw DataInsufficientError("Factor returns contain NaN or Inf values in window " + window.key());
            }

            return result;
        }

        FactorBetaRow FactorExposureEstimator::regress(const std::string &ticker,
                                                       const data::ReturnSeries &series,
                                                       const FactorReturns &factors) const
        {
            const std::vector<std::string> aligned = intersect_dates(series.dates, factors.dates);

            const double coverage = factors.dates.empty()
                                        ? 0.0
                                        : static_cast<double>(aligned.size()) / static_cast<double>(factors.dates.size());
            if (coverage < settings_.min_coverage)
            {
                throw DataInsufficientError(ticker + " has returns for " + std::to_string(aligned.size()) +
                                            " of " + std::to_string(factors.dates.size()) + " factor periods");
            }

            const Eigen::Index k = factors.values.cols();
            const Eigen::Index T = static_cast<Eigen::Index>(aligned.size());
            const Eigen::Index required = std::max<Eigen::Index>(settings_.min_observations, k + 2);
            if (T < required)
            {
                throw DataInsufficientError(ticker + " has " + std::to_string(T) +
                                            " aligned observations, " + std::to_string(required) + " required");
            }

            // Design matrix [1, F] and response y on the aligned periods
            std::map<std::string, Eigen::Index> factor_row;
            for (size_t t = 0; t < factors.dates.size(); ++t)
            {
                factor_row[factors.dates[t]] = static_cast<Eigen::Index>(t);
            }
            const auto returns = by_date(series);

            Eigen::MatrixXd X(T, k + 1);
            Eigen::VectorXd y(T);
            for (Eigen::Index t = 0; t < T; ++t)
            {
                X(t, 0) = 1.0;
                X.row(t).tail(k) = factors.values.row(factor_row.at(aligned[t]));
                y(t) = returns.at(aligned[t]);
            }

            if (!y.allFinite())
            {
                throw DataInsufficientError("Returns for " + ticker + " contain NaN or Inf values");
            }

            // ========================================================================
            // Joint OLS via column-pivoting QR
            // ========================================================================
            Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
            if (qr.rank() < k + 1)
            {
                throw DataInsufficientError("Factor returns are collinear over the window; cannot estimate betas for " +
                                            ticker);
            }

            const Eigen::VectorXd coef = qr.solve(y);
            const Eigen::VectorXd residuals = y - X * coef;
            const double ssr = residuals.squaredNorm();
            const double sst = (y.array() - y.mean()).matrix().squaredNorm();

            FactorBetaRow row;
            row.ticker = ticker;
            row.alpha = coef(0);
            row.betas = coef.tail(k);
            row.observations = static_cast<int>(T);
            row.residual_variance = ssr / static_cast<double>(T - k - 1) * settings_.periods_per_year;
            row.r_squared = sst > 0.0 ? 1.0 - ssr / sst : 0.0;

            if (settings_.method == BetaEstimation::INDEPENDENT)
            {
                const Eigen::VectorXd y_centered = (y.array() - y.mean()).matrix();
                for (Eigen::Index f = 0; f < k; ++f)
                {
                    const Eigen::VectorXd factor = X.col(f + 1);
                    const Eigen::VectorXd f_centered = (factor.array() - factor.mean()).matrix();
                    const double variance = f_centered.squaredNorm();
                    if (!(variance > 0.0))
                    {
                        throw DataInsufficientError("Factor " + factors.factor_names[f] + " has zero variance in window");
                    }
                    row.betas(f) = f_centered.dot(y_centered) / variance;
                }
            }

            if (!row.betas.allFinite())
            {
                throw DataInsufficientError("Regression for " + ticker + " produced non-finite betas");
            }
            require_finite_data(row.residual_variance, "Residual variance of " + ticker);

            spdlog::debug("Estimated {} betas for {} over {} periods (R^2 {:.3f})",
                          k, ticker, T, row.r_squared);

            return row;
        }

        FactorBetaRow FactorExposureEstimator::cached_or_regress(const std::string &ticker,
                                                                 const portfolio::AnalysisWindow &window,
                                                                 const portfolio::FactorProxySet &proxies,
                                                                 const std::string &identity,
                                                                 std::optional<FactorReturns> &factors) const
        {
            const RowKey key(ticker, window.key(), identity);
            {
                std::lock_guard<std::mutex> lock(rows_mutex_);
                auto it = rows_.find(key);
                if (it != rows_.end())
                {
                    return it->second;
                }
            }

            // Fetch and regress without holding the lock
            if (!factors)
            {
                factors = factor_returns(window, proxies);
            }
            FactorBetaRow row = regress(ticker, fetch(ticker, window), *factors);

            std::lock_guard<std::mutex> lock(rows_mutex_);
            return rows_.emplace(key, std::move(row)).first->second;
        }

        FactorBetaRow FactorExposureEstimator::estimate(const std::string &ticker,
                                                        const portfolio::AnalysisWindow &window,
                                                        const portfolio::FactorProxySet &proxies) const
        {
            window.validate();
            proxies.validate();

            std::optional<FactorReturns> factors;
            return cached_or_regress(ticker, window, proxies, proxies.identity(), factors);
        }

        FactorBetaMatrix FactorExposureEstimator::estimate_all(const std::vector<std::string> &tickers,
                                                               const portfolio::AnalysisWindow &window,
                                                               const portfolio::FactorProxySet &proxies) const
        {
            window.validate();
            proxies.validate();

            const std::string identity = proxies.identity();
            const Eigen::Index k = static_cast<Eigen::Index>(proxies.num_factors());

            FactorBetaMatrix matrix;
            matrix.tickers = tickers;
            matrix.factor_names = proxies.factor_names();
            matrix.betas.resize(static_cast<Eigen::Index>(tickers.size()), k);
            matrix.residual_variance.resize(static_cast<Eigen::Index>(tickers.size()));

            std::optional<FactorReturns> factors;
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                FactorBetaRow row = cached_or_regress(tickers[i], window, proxies, identity, factors);
                matrix.betas.row(i) = row.betas.transpose();
                matrix.residual_variance(i) = row.residual_variance;
                matrix.rows.push_back(std::move(row));
            }

            return matrix;
        }

        void FactorExposureEstimator::clear_cache()
        {
            {
                std::lock_guard<std::mutex> lock(rows_mutex_);
                rows_.clear();
            }
            proxy_cache_->clear();
        }

        size_t FactorExposureEstimator::clear_proxy_set(const std::string &proxy_set_identity)
        {
            std::lock_guard<std::mutex> lock(rows_mutex_);
            size_t removed = 0;
            for (auto it = rows_.begin(); it != rows_.end();)
            {
                if (std::get<2>(it->first) == proxy_set_identity)
                {
                    it = rows_.erase(it);
                    ++removed;
                }
                else
                {
                    ++it;
                }
            }
            return removed;
        }

        size_t FactorExposureEstimator::cached_rows() const
        {
            std::lock_guard<std::mutex> lock(rows_mutex_);
            return rows_.size();
        }

    } // namespace risk
} // namespace riskengine
