#include "processing/diff_cache.hpp"

#include "processing/text_diff.hpp"
#include "util/hash.hpp"

#include <fmt/format.h>

#include <utility>

using namespace textdiff;

DiffCache::DiffCache(std::chrono::milliseconds ttl, std::size_t max_size, TimeSource now)
    : ttl_(ttl)
    , max_size_(max_size)
    , now_(std::move(now)) {}

std::optional<DiffResult>
DiffCache::get(const std::string& original, const std::string& modified, const DiffOptions& options) {
    auto it = entries_.find(cache_key(original, modified, options));
    if (it == entries_.end()) {
        return {};
    }

    if (now_() > it->second.expires_at) {
        entries_.erase(it);
        return {};
    }

    // Checksum collision.
    if (it->second.original != original || it->second.modified != modified) {
        return {};
    }

    return it->second.result;
}

void
DiffCache::set(const std::string& original,
               const std::string& modified,
               const DiffOptions& options,
               DiffResult result,
               std::optional<std::chrono::milliseconds> ttl) {
    if (max_size_ == 0) {
        return;
    }

    auto key = cache_key(original, modified, options);
    if (!entries_.contains(key) && entries_.size() >= max_size_) {
        evict_oldest();
    }

    const auto now = now_();
    auto& entry = entries_[key];
    entry.original = original;
    entry.modified = modified;
    entry.result = std::move(result);
    entry.stored_at = now;
    entry.expires_at = now + ttl.value_or(ttl_);
    entry.sequence = sequence_++;
}

void
DiffCache::evict_oldest() {
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (oldest == entries_.end() || it->second.sequence < oldest->second.sequence) {
            oldest = it;
        }
    }

    if (oldest != entries_.end()) {
        entries_.erase(oldest);
    }
}

std::size_t
DiffCache::cleanup() {
    const auto now = now_();
    std::size_t cleaned = 0;

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now > it->second.expires_at) {
            it = entries_.erase(it);
            cleaned++;
        } else {
            ++it;
        }
    }
    return cleaned;
}

void
DiffCache::clear() {
    entries_.clear();
}

CacheStats
DiffCache::stats() const {
    const auto now = now_();

    CacheStats stats;
    stats.total = entries_.size();
    stats.max_size = max_size_;
    for (const auto& [key, entry] : entries_) {
        if (now > entry.expires_at) {
            stats.expired++;
        } else {
            stats.active++;
        }
    }
    return stats;
}

std::string
textdiff::cache_key(const std::string& original, const std::string& modified, const DiffOptions& options) {
    return fmt::format("{:08x}:{}:{:08x}:{}:{}:{:d}{:d}",
                       hash::hash(original),
                       original.size(),
                       hash::hash(modified),
                       modified.size(),
                       to_string(options.granularity),
                       options.ignore_whitespace,
                       options.ignore_case);
}

DiffResult
textdiff::cached_diff(DiffCache& cache,
                      const std::string& original,
                      const std::string& modified,
                      const DiffOptions& options) {
    if (auto hit = cache.get(original, modified, options); hit) {
        return *hit;
    }

    auto result = diff(original, modified, options);
    cache.set(original, modified, options, result);
    return result;
}
