#pragma once

/*
    Memoizes DiffResult's for repeated (original, modified, options)
    requests.

    Entries expire after a time-to-live and the cache holds at most
    `max_size` entries; inserting into a full cache drops the entry that
    was stored first. Only the options that change the result's identity
    (granularity and the two ignore flags) take part in the key, so a
    cached result may carry semantic fields from an earlier request.

    Not thread safe. The clock can be replaced for tests.
*/

#include "processing/change.hpp"
#include "processing/options.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace textdiff {

struct CacheStats {
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t expired = 0;
    std::size_t max_size = 0;
};

class DiffCache {
  public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultTtl = std::chrono::minutes(5);
    static constexpr std::size_t kDefaultMaxSize = 1000;

    explicit DiffCache(std::chrono::milliseconds ttl = kDefaultTtl,
                       std::size_t max_size = kDefaultMaxSize,
                       TimeSource now = Clock::now);

    std::optional<DiffResult>
    get(const std::string& original, const std::string& modified, const DiffOptions& options);

    void
    set(const std::string& original,
        const std::string& modified,
        const DiffOptions& options,
        DiffResult result,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Drop expired entries; returns how many were dropped.
    std::size_t
    cleanup();

    void
    clear();

    CacheStats
    stats() const;

    std::size_t
    size() const {
        return entries_.size();
    }

  private:
    struct Entry {
        std::string original;
        std::string modified;
        DiffResult result;
        Clock::time_point stored_at;
        Clock::time_point expires_at;
        uint64_t sequence = 0;
    };

    void
    evict_oldest();

    std::chrono::milliseconds ttl_;
    std::size_t max_size_;
    TimeSource now_;

    uint64_t sequence_ = 0;
    std::unordered_map<std::string, Entry> entries_;
};

// Key for a request: checksums and sizes of both texts plus the options
// that affect the result.
std::string
cache_key(const std::string& original, const std::string& modified, const DiffOptions& options);

// Run `diff` through the cache.
DiffResult
cached_diff(DiffCache& cache, const std::string& original, const std::string& modified, const DiffOptions& options);

}  // namespace textdiff
