#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "cpl_error.h"
#include "geogrid_cache_key.h"
#include "geogrid_config.h"
#include "geogrid_errors.h"

namespace GeoGrid
{
struct ResultCacheOptions
{
    // Maximum number of completed entries, 0 = unbounded
    size_t capacity = 0;
    // Lifetime of a completed entry, 0 = no expiry
    std::chrono::milliseconds ttl{0};

    static ResultCacheOptions FromConfig(CSLConstList papszOptions = nullptr)
    {
        ResultCacheOptions options;
        options.capacity = Config::GetCacheCapacity(papszOptions);
        options.ttl = std::chrono::milliseconds(
            static_cast<long long>(Config::GetCacheTTLSeconds(papszOptions) * 1000.0));
        return options;
    }
};

struct ResultCacheStatistics
{
    size_t hits = 0;
    size_t misses = 0;
    size_t computations = 0;
    size_t failures = 0;
    size_t evictions = 0;
};

/**
 * @brief Single-flight cache of computed results keyed by CacheKey
 *
 * GetOrCompute() runs the computation at most once per key while the entry
 * lives. Callers that ask for a key whose computation is in progress wait
 * for it and share its result or its exception. A failed computation is
 * removed so the next caller retries, except IncompatibleGridsError which
 * cannot heal and stays cached.
 *
 * Completed entries are evicted least-recently-used beyond the capacity and
 * once older than the time-to-live. Entries still being computed are never
 * evicted.
 */
template <typename T> class ResultCache
{
  public:
    using ValuePtr = std::shared_ptr<const T>;
    using ComputeFn = std::function<T()>;

    explicit ResultCache(const ResultCacheOptions& options = ResultCacheOptions::FromConfig())
        : mOptions(options)
    {
    }

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    ValuePtr GetOrCompute(const CacheKey& key, const ComputeFn& computeFn)
    {
        const std::string canonical = key.GetCanonical();

        std::unique_lock<std::mutex> lock(mMutex);
        PurgeExpiredLocked(std::chrono::steady_clock::now());

        auto it = mEntries.find(canonical);
        if (it != mEntries.end())
        {
            mStatistics.hits++;
            if (it->second.ready)
                mLru.splice(mLru.begin(), mLru, it->second.lruPos);
            std::shared_future<ValuePtr> future = it->second.future;
            lock.unlock();
            return future.get();
        }

        mStatistics.misses++;
        mStatistics.computations++;
        const uint64_t generation = ++mGeneration;
        std::promise<ValuePtr> promise;
        Entry entry;
        entry.future = promise.get_future().share();
        entry.generation = generation;
        mEntries.emplace(canonical, std::move(entry));
        lock.unlock();

        CPLDebug(ErrorHandler::DEBUG_KEY, "Result cache miss for %s", key.GetFingerprint().c_str());

        try
        {
            ValuePtr value = std::make_shared<const T>(computeFn());
            promise.set_value(value);
            Complete(canonical, generation, false);
            return value;
        }
        catch (const IncompatibleGridsError&)
        {
            promise.set_exception(std::current_exception());
            Complete(canonical, generation, true);
            throw;
        }
        catch (...)
        {
            promise.set_exception(std::current_exception());
            Fail(canonical, generation);
            throw;
        }
    }

    bool Contains(const CacheKey& key) const
    {
        std::lock_guard<std::mutex> lock(mMutex);
        return mEntries.find(key.GetCanonical()) != mEntries.end();
    }

    /**
     * @brief Drop one entry; waiters of an in-flight computation still
     *        receive its result
     */
    bool Erase(const CacheKey& key)
    {
        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mEntries.find(key.GetCanonical());
        if (it == mEntries.end())
            return false;
        RemoveLocked(it);
        return true;
    }

    void Clear()
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mEntries.clear();
        mLru.clear();
    }

    size_t GetSize() const
    {
        std::lock_guard<std::mutex> lock(mMutex);
        return mEntries.size();
    }

    ResultCacheStatistics GetStatistics() const
    {
        std::lock_guard<std::mutex> lock(mMutex);
        return mStatistics;
    }

    const ResultCacheOptions& GetOptions() const { return mOptions; }

  private:
    struct Entry
    {
        std::shared_future<ValuePtr> future;
        uint64_t generation = 0;
        bool ready = false;
        std::chrono::steady_clock::time_point completedAt;
        std::list<std::string>::iterator lruPos;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    void Complete(const std::string& canonical, uint64_t generation, bool failed)
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (failed)
            mStatistics.failures++;

        // The entry may have been erased or replaced while computing.
        auto it = mEntries.find(canonical);
        if (it == mEntries.end() || it->second.generation != generation)
            return;

        it->second.ready = true;
        it->second.completedAt = std::chrono::steady_clock::now();
        mLru.push_front(canonical);
        it->second.lruPos = mLru.begin();

        while (mOptions.capacity > 0 && mLru.size() > mOptions.capacity)
        {
            auto victim = mEntries.find(mLru.back());
            mStatistics.evictions++;
            RemoveLocked(victim);
        }
    }

    void Fail(const std::string& canonical, uint64_t generation)
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mStatistics.failures++;
        auto it = mEntries.find(canonical);
        if (it != mEntries.end() && it->second.generation == generation)
            mEntries.erase(it);
    }

    void PurgeExpiredLocked(std::chrono::steady_clock::time_point now)
    {
        if (mOptions.ttl.count() <= 0)
            return;

        // The LRU list is ordered by last use, not completion time, so walk
        // all of it.
        for (auto lruIt = mLru.begin(); lruIt != mLru.end();)
        {
            auto it = mEntries.find(*lruIt);
            ++lruIt;
            if (it != mEntries.end() && now - it->second.completedAt > mOptions.ttl)
            {
                mStatistics.evictions++;
                RemoveLocked(it);
            }
        }
    }

    void RemoveLocked(typename EntryMap::iterator it)
    {
        if (it->second.ready)
            mLru.erase(it->second.lruPos);
        mEntries.erase(it);
    }

    ResultCacheOptions mOptions;
    mutable std::mutex mMutex;
    EntryMap mEntries;
    std::list<std::string> mLru;
    ResultCacheStatistics mStatistics;
    uint64_t mGeneration = 0;
};
}  // namespace GeoGrid
