#include "BaselineCache.h"
#include <cmath>
#include <exception>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "RngUtils.h"
#include "TimeSeriesException.h"

namespace stratvalidator
{
namespace validation
{

std::string getBaselineTypeString(BaselineType type)
{
    switch (type)
    {
        case BaselineType::BuyAndHold:
            return "BuyAndHold";
        case BaselineType::EqualWeightTopN:
            return "EqualWeightTopN";
        case BaselineType::RiskParity:
            return "RiskParity";
        default:
            throw std::invalid_argument("Unknown BaselineType");
    }
}

namespace
{
    rapidjson::Value serializeDouble(double value)
    {
        rapidjson::Value v;
        if (std::isfinite(value))
            v.SetDouble(value);
        return v;
    }

    bool readDouble(const rapidjson::Document& doc, const char* name, double& out)
    {
        if (!doc.HasMember(name) || !doc[name].IsNumber())
            return false;
        out = doc[name].GetDouble();
        return true;
    }
}

BaselineCache::BaselineCache()
    : mMutex(),
      mEntries(),
      mInFlight(),
      mHits(0),
      mMisses(0),
      mDiskWriteFailures(0),
      mCacheDirectory()
{
}

BaselineCache::BaselineCache(const std::string& cacheDirectory)
    : BaselineCache()
{
    if (cacheDirectory.empty())
        throw std::invalid_argument("BaselineCache: cache directory must not be empty");

    boost::system::error_code ec;
    boost::filesystem::create_directories(cacheDirectory, ec);
    if (ec || !boost::filesystem::is_directory(cacheDirectory))
        throw stratval::TimeSeriesException("BaselineCache: cannot use cache directory " + cacheDirectory +
                                            (ec ? ": " + ec.message() : std::string()));

    mCacheDirectory = cacheDirectory;
}

BaselineCache::Key BaselineCache::makeKey(uint64_t universeFingerprint,
                                          const stratval::DateRange& period,
                                          BaselineType type)
{
    using namespace stratval::rng_utils;

    return hash_combine64({ universeFingerprint,
                            static_cast<uint64_t>(period.getFirstDate().julian_day()),
                            static_cast<uint64_t>(period.getLastDate().julian_day()),
                            static_cast<uint64_t>(type) });
}

BaselineResult BaselineCache::getOrCompute(uint64_t universeFingerprint,
                                           const stratval::DateRange& period,
                                           BaselineType type,
                                           const Compute& compute)
{
    const Key key = makeKey(universeFingerprint, period, type);

    {
        std::shared_lock<std::shared_mutex> readLock(mMutex);
        auto it = mEntries.find(key);
        if (it != mEntries.end())
        {
            ++mHits;
            return it->second.result;
        }
    }

    std::promise<BaselineResult> promise;
    std::shared_future<BaselineResult> pending;
    bool owner = false;

    {
        std::unique_lock<std::shared_mutex> writeLock(mMutex);

        auto it = mEntries.find(key);
        if (it != mEntries.end())
        {
            ++mHits;
            return it->second.result;
        }

        auto inFlight = mInFlight.find(key);
        if (inFlight != mInFlight.end())
        {
            pending = inFlight->second;
        }
        else
        {
            pending = promise.get_future().share();
            mInFlight.emplace(key, pending);
            owner = true;
        }
    }

    if (!owner)
    {
        // Another thread is computing this key
        ++mHits;
        return pending.get();
    }

    try
    {
        std::optional<BaselineResult> stored = loadFromDisk(key, universeFingerprint, type);
        if (stored)
            ++mHits;
        else
            ++mMisses;

        BaselineResult result = stored ? *stored : compute();
        if (!stored && mCacheDirectory && !saveToDisk(key, universeFingerprint, result))
            ++mDiskWriteFailures;

        {
            std::unique_lock<std::shared_mutex> writeLock(mMutex);
            mEntries.emplace(key, Entry{ universeFingerprint, result });
            mInFlight.erase(key);
        }

        promise.set_value(result);
        return result;
    }
    catch (...)
    {
        {
            std::unique_lock<std::shared_mutex> writeLock(mMutex);
            mInFlight.erase(key);
        }

        promise.set_exception(std::current_exception());
        throw;
    }
}

std::optional<BaselineResult> BaselineCache::find(uint64_t universeFingerprint,
                                                  const stratval::DateRange& period,
                                                  BaselineType type) const
{
    const Key key = makeKey(universeFingerprint, period, type);

    std::shared_lock<std::shared_mutex> readLock(mMutex);
    auto it = mEntries.find(key);
    if (it == mEntries.end())
        return std::nullopt;

    return it->second.result;
}

std::size_t BaselineCache::invalidateUniverse(uint64_t universeFingerprint)
{
    std::unique_lock<std::shared_mutex> writeLock(mMutex);

    std::size_t removed = 0;
    for (auto it = mEntries.begin(); it != mEntries.end();)
    {
        if (it->second.universeFingerprint == universeFingerprint)
        {
            it = mEntries.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }

    removeFromDisk(universeFingerprint);
    return removed;
}

void BaselineCache::clear()
{
    std::unique_lock<std::shared_mutex> writeLock(mMutex);
    mEntries.clear();
    mHits = 0;
    mMisses = 0;
}

std::size_t BaselineCache::size() const
{
    std::shared_lock<std::shared_mutex> readLock(mMutex);
    return mEntries.size();
}

std::string BaselineCache::getCacheFilePath(Key key) const
{
    if (!mCacheDirectory)
        throw std::logic_error("BaselineCache: no cache directory configured");

    std::ostringstream name;
    name << std::hex << std::setw(16) << std::setfill('0') << key << ".json";
    return (boost::filesystem::path(*mCacheDirectory) / name.str()).string();
}

std::optional<BaselineResult> BaselineCache::loadFromDisk(Key key,
                                                          uint64_t universeFingerprint,
                                                          BaselineType type) const
{
    if (!mCacheDirectory)
        return std::nullopt;

    const std::string filePath = getCacheFilePath(key);
    boost::system::error_code ec;
    if (!boost::filesystem::exists(filePath, ec) || ec)
        return std::nullopt;

    std::ifstream file(filePath);
    if (!file.is_open())
        return std::nullopt;

    std::stringstream buffer;
    buffer << file.rdbuf();

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(buffer.str().c_str());
    if (doc.HasParseError() || !doc.IsObject())
        return std::nullopt;

    // A file that does not describe exactly this entry is ignored and overwritten
    if (!doc.HasMember("key") || !doc["key"].IsUint64() || doc["key"].GetUint64() != key)
        return std::nullopt;
    if (!doc.HasMember("universe_fingerprint") || !doc["universe_fingerprint"].IsUint64() ||
        doc["universe_fingerprint"].GetUint64() != universeFingerprint)
        return std::nullopt;
    if (!doc.HasMember("type") || !doc["type"].IsString() ||
        getBaselineTypeString(type) != doc["type"].GetString())
        return std::nullopt;
    if (!doc.HasMember("num_periods") || !doc["num_periods"].IsUint64())
        return std::nullopt;

    double sharpe, annualReturn, maxDrawdown, winRate;
    if (!readDouble(doc, "sharpe_ratio", sharpe) || !readDouble(doc, "annual_return", annualReturn) ||
        !readDouble(doc, "max_drawdown", maxDrawdown) || !readDouble(doc, "win_rate", winRate))
        return std::nullopt;

    std::optional<std::string> warning;
    if (doc.HasMember("warning") && doc["warning"].IsString())
        warning = std::string(doc["warning"].GetString());

    return BaselineResult{ type,
                           stratval::PerformanceMetrics(sharpe, annualReturn, maxDrawdown, winRate,
                                                        static_cast<std::size_t>(doc["num_periods"].GetUint64())),
                           warning };
}

bool BaselineCache::saveToDisk(Key key, uint64_t universeFingerprint, const BaselineResult& result) const
{
    using namespace rapidjson;

    Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("key", static_cast<uint64_t>(key), allocator);
    doc.AddMember("universe_fingerprint", static_cast<uint64_t>(universeFingerprint), allocator);
    doc.AddMember("type", Value(getBaselineTypeString(result.type).c_str(), allocator), allocator);
    doc.AddMember("sharpe_ratio", serializeDouble(result.metrics.getSharpeRatio()), allocator);
    doc.AddMember("annual_return", serializeDouble(result.metrics.getAnnualReturn()), allocator);
    doc.AddMember("max_drawdown", serializeDouble(result.metrics.getMaxDrawdown()), allocator);
    doc.AddMember("win_rate", serializeDouble(result.metrics.getWinRate()), allocator);
    doc.AddMember("num_periods", static_cast<uint64_t>(result.metrics.getNumPeriods()), allocator);
    if (result.warning)
        doc.AddMember("warning", Value(result.warning->c_str(), allocator), allocator);
    else
        doc.AddMember("warning", Value(), allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    // Written beside the target and renamed so readers never see a partial file
    const boost::filesystem::path target(getCacheFilePath(key));
    const boost::filesystem::path staging =
        target.parent_path() / boost::filesystem::unique_path(target.filename().string() + ".%%%%-%%%%.tmp");

    {
        std::ofstream file(staging.string());
        if (!file.is_open())
            return false;
        file << buffer.GetString() << "\n";
        if (!file)
        {
            file.close();
            boost::system::error_code ignored;
            boost::filesystem::remove(staging, ignored);
            return false;
        }
    }

    boost::system::error_code ec;
    boost::filesystem::rename(staging, target, ec);
    if (ec)
    {
        boost::system::error_code ignored;
        boost::filesystem::remove(staging, ignored);
        return false;
    }

    return true;
}

std::size_t BaselineCache::removeFromDisk(uint64_t universeFingerprint) const
{
    if (!mCacheDirectory)
        return 0;

    std::vector<boost::filesystem::path> stale;
    boost::system::error_code ec;
    for (boost::filesystem::directory_iterator it(*mCacheDirectory, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto& filePath = it->path();
        if (filePath.extension() != ".json")
            continue;

        std::ifstream file(filePath.string());
        std::stringstream buffer;
        buffer << file.rdbuf();

        rapidjson::Document doc;
        doc.Parse(buffer.str().c_str());
        if (!doc.HasParseError() && doc.IsObject() && doc.HasMember("universe_fingerprint") &&
            doc["universe_fingerprint"].IsUint64() &&
            doc["universe_fingerprint"].GetUint64() == universeFingerprint)
            stale.push_back(filePath);
    }

    std::size_t removed = 0;
    for (const auto& filePath : stale)
    {
        boost::system::error_code removeError;
        if (boost::filesystem::remove(filePath, removeError))
            ++removed;
    }
    return removed;
}

} // namespace validation
} // namespace stratvalidator
