#include <gtest/gtest.h>
#include "../src/metadata_cache.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

TEST(MetadataCacheTest, MissThenPut) {
    MetadataCache cache;
    EXPECT_FALSE(cache.get(Ecosystem::PYTHON, "flask").has_value());
    EXPECT_FALSE(cache.get_size(Ecosystem::PYTHON, "flask").has_value());

    cache.put(Ecosystem::PYTHON, "flask", make_metadata(1024, "web", "3.0.0"));
    ASSERT_TRUE(cache.get_size(Ecosystem::PYTHON, "flask").has_value());
    EXPECT_EQ(*cache.get_size(Ecosystem::PYTHON, "flask"), 1024u);
    EXPECT_EQ(cache.get(Ecosystem::PYTHON, "flask")->latest_version, "3.0.0");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MetadataCacheTest, EcosystemsAreIsolated) {
    MetadataCache cache;
    cache.put(Ecosystem::NODE, "express", make_metadata(200));
    EXPECT_TRUE(cache.get_size(Ecosystem::NODE, "express").has_value());
    EXPECT_FALSE(cache.get_size(Ecosystem::PYTHON, "express").has_value());
}

TEST(MetadataCacheTest, GetOrFetchFetchesOnce) {
    MetadataCache cache;
    int calls = 0;
    auto fetcher = [&] {
        ++calls;
        return LookupResult<RegistryMetadata>::Ok(make_metadata(42));
    };

    auto first = cache.get_or_fetch(Ecosystem::PYTHON, "six", fetcher);
    auto second = cache.get_or_fetch(Ecosystem::PYTHON, "six", fetcher);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value->size, 42u);
    EXPECT_EQ(second.value->size, 42u);
    EXPECT_EQ(calls, 1);
}

TEST(MetadataCacheTest, FailedFetchIsNotCachedAndRetried) {
    MetadataCache cache;
    int calls = 0;
    bool fail = true;
    auto fetcher = [&] {
        ++calls;
        if (fail) return LookupResult<RegistryMetadata>::Err(LookupErrorCode::Timeout, "timed out");
        return LookupResult<RegistryMetadata>::Ok(make_metadata(7));
    };

    auto failed = cache.get_or_fetch(Ecosystem::NODE, "left-pad", fetcher);
    EXPECT_FALSE(failed);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(failed.error->code, LookupErrorCode::Timeout);
    EXPECT_FALSE(cache.get(Ecosystem::NODE, "left-pad").has_value());

    fail = false;
    auto retried = cache.get_or_fetch(Ecosystem::NODE, "left-pad", fetcher);
    ASSERT_TRUE(retried);
    EXPECT_EQ(retried.value->size, 7u);
    EXPECT_EQ(calls, 2);
}

TEST(MetadataCacheTest, ConcurrentMissesAreCoalesced) {
    MetadataCache cache;
    std::atomic<int> calls{0};
    auto fetcher = [&] {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return LookupResult<RegistryMetadata>::Ok(make_metadata(99));
    };

    std::vector<std::future<LookupResult<RegistryMetadata>>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&] {
            return cache.get_or_fetch(Ecosystem::PYTHON, "numpy", fetcher);
        }));
    }
    for (auto& fut : futures) {
        auto result = fut.get();
        ASSERT_TRUE(result);
        EXPECT_EQ(result.value->size, 99u);
    }
    EXPECT_EQ(calls.load(), 1);
}

TEST(MetadataCacheTest, ThrowingFetcherReleasesKey) {
    MetadataCache cache;
    EXPECT_THROW(cache.get_or_fetch(Ecosystem::PYTHON, "boom", []() -> LookupResult<RegistryMetadata> {
        throw std::runtime_error("fetcher bug");
    }), std::runtime_error);

    auto result = cache.get_or_fetch(Ecosystem::PYTHON, "boom", [] {
        return LookupResult<RegistryMetadata>::Ok(make_metadata(1));
    });
    EXPECT_TRUE(result);
}
