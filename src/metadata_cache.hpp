#pragma once

#include "ecosystem.hpp"
#include "lookup_result.hpp"
#include "registry_schema.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Registry metadata resolved during one analysis run, keyed by (ecosystem, normalized name).
// Entries are never evicted or invalidated; failed lookups are never stored.
class MetadataCache {
public:
    using Fetcher = std::function<LookupResult<RegistryMetadata>()>;

    MetadataCache() = default;
    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    std::optional<RegistryMetadata> get(Ecosystem eco, std::string_view name);
    std::optional<std::uint64_t> get_size(Ecosystem eco, std::string_view name);
    void put(Ecosystem eco, std::string_view name, RegistryMetadata metadata);

    // Returns the cached entry, or runs `fetcher` and stores a successful result.
    // Concurrent first requests for one key share a single fetcher call.
    LookupResult<RegistryMetadata> get_or_fetch(Ecosystem eco, std::string_view name, const Fetcher& fetcher);

    size_t size();

private:
    using Key = std::pair<Ecosystem, std::string>;

    std::map<Key, RegistryMetadata> entries_;
    std::map<Key, std::shared_future<LookupResult<RegistryMetadata>>> in_flight_;
    std::mutex mtx_;
};
