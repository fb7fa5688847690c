#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include "DateRange.h"
#include "PerformanceMetrics.h"

namespace stratvalidator
{
namespace validation
{

enum class BaselineType
{
    BuyAndHold,        ///< Buy and hold the broad index
    EqualWeightTopN,   ///< Equal weights over the N largest names by market cap
    RiskParity         ///< Inverse-volatility weights over the whole universe
};

std::string getBaselineTypeString(BaselineType type);

struct BaselineResult
{
    BaselineType type;
    stratval::PerformanceMetrics metrics;
    std::optional<std::string> warning;   ///< e.g. index symbol missing, proxy used
};

/**
 * @brief Key -> baseline store keyed by a content hash of (universe, period, type).
 *
 * Baselines are deterministic in their inputs, so an entry never goes stale
 * while the universe fingerprint it was computed from is current.
 * invalidateUniverse() drops the entries of a replaced snapshot.
 *
 * Lookups take a shared lock. A miss computes the value outside any lock;
 * concurrent requests for the same key wait for that one computation
 * instead of starting their own.
 *
 * With a cache directory, every computed entry is also written to
 * <directory>/<key>.json and a miss reads that file before computing, so
 * baselines survive across runs. An entry loaded from disk counts as a hit.
 */
class BaselineCache
{
public:
    using Key = uint64_t;
    using Compute = std::function<BaselineResult()>;

    BaselineCache();

    // Backs the cache with JSON files in cacheDirectory, creating it when missing
    explicit BaselineCache(const std::string& cacheDirectory);

    BaselineCache(const BaselineCache&) = delete;
    BaselineCache& operator=(const BaselineCache&) = delete;

    static Key makeKey(uint64_t universeFingerprint, const stratval::DateRange& period, BaselineType type);

    /**
     * @brief Cached value for the key, computing it on the first request
     *
     * A throwing compute leaves no entry behind and the exception reaches
     * every caller waiting on that key.
     */
    BaselineResult getOrCompute(uint64_t universeFingerprint,
                                const stratval::DateRange& period,
                                BaselineType type,
                                const Compute& compute);

    std::optional<BaselineResult> find(uint64_t universeFingerprint,
                                       const stratval::DateRange& period,
                                       BaselineType type) const;

    // Drops every entry computed from the given universe snapshot, on disk too; returns the in-memory count removed
    std::size_t invalidateUniverse(uint64_t universeFingerprint);

    // Empties the in-memory store and resets the counters; files on disk are kept
    void clear();

    const std::optional<std::string>& getCacheDirectory() const
    {
        return mCacheDirectory;
    }

    std::string getCacheFilePath(Key key) const;

    std::size_t size() const;

    std::size_t hits() const
    {
        return mHits.load();
    }

    std::size_t misses() const
    {
        return mMisses.load();
    }

    // Entries that could not be written to the cache directory
    std::size_t diskWriteFailures() const
    {
        return mDiskWriteFailures.load();
    }

private:
    std::optional<BaselineResult> loadFromDisk(Key key, uint64_t universeFingerprint, BaselineType type) const;
    bool saveToDisk(Key key, uint64_t universeFingerprint, const BaselineResult& result) const;
    std::size_t removeFromDisk(uint64_t universeFingerprint) const;

    struct Entry
    {
        uint64_t universeFingerprint;
        BaselineResult result;
    };

    mutable std::shared_mutex mMutex;
    std::map<Key, Entry> mEntries;
    std::map<Key, std::shared_future<BaselineResult>> mInFlight;
    std::atomic<std::size_t> mHits;
    std::atomic<std::size_t> mMisses;
    std::atomic<std::size_t> mDiskWriteFailures;
    std::optional<std::string> mCacheDirectory;
};

} // namespace validation
} // namespace stratvalidator
