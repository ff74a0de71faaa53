#include "metadata_cache.hpp"

std::optional<RegistryMetadata> MetadataCache::get(Ecosystem eco, std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(Key{eco, std::string(name)});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::uint64_t> MetadataCache::get_size(Ecosystem eco, std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(Key{eco, std::string(name)});
    if (it == entries_.end()) return std::nullopt;
    return it->second.size;
}

void MetadataCache::put(Ecosystem eco, std::string_view name, RegistryMetadata metadata) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_[Key{eco, std::string(name)}] = std::move(metadata);
}

LookupResult<RegistryMetadata> MetadataCache::get_or_fetch(Ecosystem eco, std::string_view name, const Fetcher& fetcher) {
    Key key{eco, std::string(name)};
    std::promise<LookupResult<RegistryMetadata>> promise;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            return LookupResult<RegistryMetadata>::Ok(it->second);
        }
        if (auto it = in_flight_.find(key); it != in_flight_.end()) {
            auto pending = it->second;
            lock.unlock();
            return pending.get();
        }
        in_flight_.emplace(key, promise.get_future().share());
    }

    LookupResult<RegistryMetadata> result;
    try {
        result = fetcher();
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (result) {
            entries_[key] = *result.value;
        }
        in_flight_.erase(key);
    }
    promise.set_value(result);
    return result;
}

size_t MetadataCache::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}
