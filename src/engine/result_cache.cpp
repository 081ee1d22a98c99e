/**
 * @file result_cache.cpp
 * @brief Implementation of InMemoryResultCache
 */

#include "engine/result_cache.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace riskengine
{
    namespace engine
    {

        double CacheStats::hit_rate() const
        {
            const size_t lookups = hits + misses + joins;
            return lookups == 0 ? 0.0 : static_cast<double>(hits + joins) / static_cast<double>(lookups);
        }

        InMemoryResultCache::InMemoryResultCache(std::chrono::seconds ttl, size_t max_entries, Clock clock)
            : ttl_(ttl), max_entries_(max_entries), clock_(std::move(clock))
        {
            if (ttl_.count() <= 0)
            {
                throw ConfigurationError("Cache TTL must be positive");
            }
        }

        std::string InMemoryResultCache::get_name() const
        {
            return "InMemoryResultCache";
        }

        std::chrono::steady_clock::time_point InMemoryResultCache::now() const
        {
            return clock_ ? clock_() : std::chrono::steady_clock::now();
        }

        bool InMemoryResultCache::expired(const Entry &entry, std::chrono::steady_clock::time_point at) const
        {
            return entry.ready && at - entry.created >= ttl_;
        }

        void InMemoryResultCache::evict_oldest_locked()
        {
            while (max_entries_ > 0 && entries_.size() > max_entries_)
            {
                auto oldest = entries_.end();
                for (auto it = entries_.begin(); it != entries_.end(); ++it)
                {
                    // In-flight entries have waiters; never evict them for capacity
                    if (!it->second.ready)
                        continue;
                    if (oldest == entries_.end() || it->second.created < oldest->second.created)
                    {
                        oldest = it;
                    }
                }
                if (oldest == entries_.end())
                    return;
                entries_.erase(oldest);
                ++stats_.evictions;
            }
        }

        AnalysisPtr InMemoryResultCache::get_or_compute(const std::string &fingerprint,
                                                        const std::string &canonical_key,
                                                        const std::set<std::string> &components,
                                                        const Compute &compute)
        {
            std::promise<AnalysisPtr> promise;
            std::shared_future<AnalysisPtr> future;
            std::uint64_t generation = 0;
            bool owner = false;
            bool collision = false;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(fingerprint);
                if (it != entries_.end() && expired(it->second, now()))
                {
                    spdlog::debug("Result cache entry {} expired", fingerprint);
                    entries_.erase(it);
                    ++stats_.evictions;
                    it = entries_.end();
                }

                if (it != entries_.end() && it->second.canonical_key != canonical_key)
                {
                    ++stats_.collisions;
                    collision = true;
                }
                else if (it != entries_.end())
                {
                    future = it->second.future;
                    if (it->second.ready)
                    {
                        ++stats_.hits;
                        spdlog::debug("Result cache hit {}", fingerprint);
                    }
                    else
                    {
                        ++stats_.joins;
                        spdlog::debug("Result cache join {}", fingerprint);
                    }
                }
                else
                {
                    Entry entry;
                    entry.future = promise.get_future().share();
                    entry.canonical_key = canonical_key;
                    entry.components = components;
                    entry.created = now();
                    entry.generation = ++next_generation_;
                    generation = entry.generation;
                    future = entry.future;
                    entries_.emplace(fingerprint, std::move(entry));
                    owner = true;
                    ++stats_.misses;
                    spdlog::debug("Result cache miss {}", fingerprint);
                }
            }

            if (collision)
            {
                // The cached entry belongs to another request; it stays in place
                spdlog::warn("Result cache fingerprint {} collides with a different request; computing uncached",
                             fingerprint);
                return compute();
            }

            if (!owner)
            {
                try
                {
                    return future.get();
                }
                catch (const std::future_error &e)
                {
                    throw CacheError(std::string("Result cache entry abandoned: ") + e.what());
                }
            }

            AnalysisPtr result;
            try
            {
                result = compute();
            }
            catch (...)
            {
                promise.set_exception(std::current_exception());
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(fingerprint);
                if (it != entries_.end() && it->second.generation == generation)
                {
                    entries_.erase(it);
                }
                throw;
            }

            promise.set_value(result);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(fingerprint);
                // A concurrent invalidation may have removed or replaced the entry
                if (it != entries_.end() && it->second.generation == generation)
                {
                    it->second.ready = true;
                    it->second.created = now();
                    evict_oldest_locked();
                }
            }
            return result;
        }

        size_t InMemoryResultCache::invalidate(const std::optional<std::string> &fingerprint)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t removed = 0;
            if (!fingerprint)
            {
                removed = entries_.size();
                entries_.clear();
            }
            else
            {
                removed = entries_.erase(*fingerprint);
            }
            stats_.evictions += removed;
            if (removed > 0)
            {
                spdlog::debug("Result cache invalidated {} entries", removed);
            }
            return removed;
        }

        size_t InMemoryResultCache::invalidate_component(const std::string &identity)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t removed = 0;
            for (auto it = entries_.begin(); it != entries_.end();)
            {
                if (it->second.components.count(identity))
                {
                    it = entries_.erase(it);
                    ++removed;
                }
                else
                {
                    ++it;
                }
            }
            stats_.evictions += removed;
            if (removed > 0)
            {
                spdlog::debug("Result cache invalidated {} entries depending on {}", removed, identity);
            }
            return removed;
        }

        CacheStats InMemoryResultCache::stats() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            CacheStats s = stats_;
            s.entries = entries_.size();
            return s;
        }

    } // namespace engine
} // namespace riskengine
