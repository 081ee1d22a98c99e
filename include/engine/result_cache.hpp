/**
 * @file result_cache.hpp
 * @brief Fingerprint-keyed cache of analysis results with in-flight joining
 */

#pragma once

#include "risk/risk_analysis_result.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace riskengine
{
    namespace engine
    {
        using AnalysisPtr = std::shared_ptr<const risk::RiskAnalysisResult>;

        /**
         * @struct CacheStats
         * @brief Counters since construction
         */
        struct CacheStats
        {
            size_t hits = 0;       ///< Served from a completed entry
            size_t misses = 0;     ///< Started a computation
            size_t joins = 0;      ///< Waited on another caller's computation
            size_t evictions = 0;  ///< Removed by TTL, invalidation or capacity
            size_t collisions = 0; ///< Fingerprint matched but the request document did not
            size_t entries = 0;    ///< Current size

            double hit_rate() const;
        };

        /**
         * @class ResultCache
         * @brief Abstract cache interface used by RiskEngine
         *
         * Implementations raise CacheError when their backend is unusable;
         * the engine recovers by computing directly.
         */
        class ResultCache
        {
        public:
            using Compute = std::function<AnalysisPtr()>;

            virtual ~ResultCache() = default;

            /**
             * @brief Return the cached result or run compute exactly once per fingerprint
             * @param fingerprint Key of the request
             * @param canonical_key Full request document; a fingerprint hit with a
             *        different document is computed without touching the cache
             * @param components Identities (proxy set, limit set) the entry depends on
             * @param compute Producer invoked on a miss, outside any cache lock
             * @throws Whatever compute throws; failed computations are not cached
             * @throws CacheError on backend failure
             */
            virtual AnalysisPtr get_or_compute(const std::string &fingerprint,
                                               const std::string &canonical_key,
                                               const std::set<std::string> &components,
                                               const Compute &compute) = 0;

            /**
             * @brief Drop one entry, or everything when fingerprint is empty
             * @return Number of entries removed
             */
            virtual size_t invalidate(const std::optional<std::string> &fingerprint) = 0;

            /**
             * @brief Drop every entry that depends on a component identity
             * @return Number of entries removed
             */
            virtual size_t invalidate_component(const std::string &identity) = 0;

            virtual CacheStats stats() const = 0;

            virtual std::string get_name() const = 0;
        };

        /**
         * @class InMemoryResultCache
         * @brief Process-local ResultCache
         *
         * Each fingerprint maps to a std::shared_future. The first caller
         * installs the future and computes with the map unlocked; concurrent
         * callers for the same fingerprint wait on that future, so identical
         * requests collapse into one computation while distinct requests run
         * in parallel. Expiry is checked on read.
         *
         * Usage Example:
         * @code
         * auto cache = std::make_shared<InMemoryResultCache>(std::chrono::seconds(900));
         * auto result = cache->get_or_compute(fp, key, {proxy_id, limit_id}, [&] { return analyze(); });
         * @endcode
         */
        class InMemoryResultCache : public ResultCache
        {
        public:
            using Clock = std::function<std::chrono::steady_clock::time_point()>;

            /**
             * @param ttl Entry lifetime from completion
             * @param max_entries Oldest entries are evicted beyond this (0 = unbounded)
             * @param clock Time source; steady_clock::now when empty
             */
            explicit InMemoryResultCache(std::chrono::seconds ttl = std::chrono::seconds(900),
                                         size_t max_entries = 100,
                                         Clock clock = Clock());

            AnalysisPtr get_or_compute(const std::string &fingerprint,
                                       const std::string &canonical_key,
                                       const std::set<std::string> &components,
                                       const Compute &compute) override;

            size_t invalidate(const std::optional<std::string> &fingerprint) override;

            size_t invalidate_component(const std::string &identity) override;

            CacheStats stats() const override;

            std::string get_name() const override;

        private:
            struct Entry
            {
                std::shared_future<AnalysisPtr> future;
                std::string canonical_key;
                std::set<std::string> components;
                std::chrono::steady_clock::time_point created;
                std::uint64_t generation = 0;
                bool ready = false;
            };

            std::chrono::steady_clock::time_point now() const;
            bool expired(const Entry &entry, std::chrono::steady_clock::time_point at) const;
            void evict_oldest_locked();

            std::chrono::seconds ttl_;
            size_t max_entries_;
            Clock clock_;

            mutable std::mutex mutex_;
            std::map<std::string, Entry> entries_;
            std::uint64_t next_generation_ = 0;
            CacheStats stats_;
        };

    } // namespace engine
} // namespace riskengine
