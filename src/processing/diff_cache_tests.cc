#include "processing/diff_cache.hpp"

#include "processing/text_diff.hpp"

#include <doctest.h>

#include <chrono>
#include <string>

using namespace textdiff;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    DiffCache::Clock::time_point now{};

    DiffCache::TimeSource
    source() {
        return [this] { return now; };
    }
};

}  // namespace

TEST_CASE("diff_cache") {
    FakeClock clock;
    DiffOptions options;

    SUBCASE("miss then hit") {
        DiffCache cache(DiffCache::kDefaultTtl, DiffCache::kDefaultMaxSize, clock.source());
        REQUIRE_FALSE(cache.get("a", "b", options));

        auto result = diff("a", "b", options);
        cache.set("a", "b", options, result);

        auto hit = cache.get("a", "b", options);
        REQUIRE(hit);
        REQUIRE(*hit == result);
    }

    SUBCASE("key covers granularity and ignore flags") {
        DiffCache cache(DiffCache::kDefaultTtl, DiffCache::kDefaultMaxSize, clock.source());
        cache.set("a", "b", options, diff("a", "b", options));

        DiffOptions by_word = options;
        by_word.granularity = Granularity::Word;
        REQUIRE_FALSE(cache.get("a", "b", by_word));

        DiffOptions ignore_case = options;
        ignore_case.ignore_case = true;
        REQUIRE_FALSE(cache.get("a", "b", ignore_case));

        DiffOptions semantic = options;
        semantic.semantic_analysis = true;
        semantic.similarity_threshold = 0.9;
        REQUIRE(cache.get("a", "b", semantic));

        REQUIRE(cache_key("a", "b", options) != cache_key("b", "a", options));
    }

    SUBCASE("entries expire") {
        DiffCache cache(1000ms, DiffCache::kDefaultMaxSize, clock.source());
        cache.set("a", "b", options, diff("a", "b", options));

        clock.now += 1000ms;
        REQUIRE(cache.get("a", "b", options));

        clock.now += 1ms;
        REQUIRE_FALSE(cache.get("a", "b", options));
        REQUIRE(cache.size() == 0);
    }

    SUBCASE("per entry ttl") {
        DiffCache cache(1000ms, DiffCache::kDefaultMaxSize, clock.source());
        cache.set("a", "b", options, diff("a", "b", options), 10s);

        clock.now += 5s;
        REQUIRE(cache.get("a", "b", options));
    }

    SUBCASE("oldest entry is evicted") {
        DiffCache cache(DiffCache::kDefaultTtl, 2, clock.source());
        cache.set("1", "x", options, diff("1", "x", options));
        cache.set("2", "x", options, diff("2", "x", options));
        cache.set("3", "x", options, diff("3", "x", options));

        REQUIRE(cache.size() == 2);
        REQUIRE_FALSE(cache.get("1", "x", options));
        REQUIRE(cache.get("2", "x", options));
        REQUIRE(cache.get("3", "x", options));
    }

    SUBCASE("replacing an entry does not evict") {
        DiffCache cache(DiffCache::kDefaultTtl, 2, clock.source());
        cache.set("1", "x", options, diff("1", "x", options));
        cache.set("2", "x", options, diff("2", "x", options));
        cache.set("2", "x", options, diff("2", "x", options));

        REQUIRE(cache.size() == 2);
        REQUIRE(cache.get("1", "x", options));
    }

    SUBCASE("cleanup and stats") {
        DiffCache cache(1000ms, 10, clock.source());
        cache.set("a", "b", options, diff("a", "b", options));
        cache.set("c", "d", options, diff("c", "d", options), 1h);

        clock.now += 2s;
        auto stats = cache.stats();
        REQUIRE(stats.total == 2);
        REQUIRE(stats.active == 1);
        REQUIRE(stats.expired == 1);
        REQUIRE(stats.max_size == 10);

        REQUIRE(cache.cleanup() == 1);
        REQUIRE(cache.size() == 1);
        REQUIRE(cache.cleanup() == 0);

        cache.clear();
        REQUIRE(cache.size() == 0);
        REQUIRE(cache.stats().total == 0);
    }

    SUBCASE("cached_diff") {
        DiffCache cache(DiffCache::kDefaultTtl, DiffCache::kDefaultMaxSize, clock.source());
        auto first = cached_diff(cache, "x\ny", "x\nz", options);
        REQUIRE(cache.size() == 1);

        auto second = cached_diff(cache, "x\ny", "x\nz", options);
        REQUIRE(first == second);
        REQUIRE(cache.size() == 1);
    }
}
