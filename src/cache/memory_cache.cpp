/**
 * @file memory_cache.cpp
 * @brief MemoryCache implementation.
 */

#include "cache/memory_cache.hpp"

#include <mutex>

namespace telemetry_hub {

void MemoryCache::set(const std::string& key, std::string value,
                      std::optional<std::chrono::milliseconds> ttl) {
    auto now = Clock::now();
    std::unique_lock lock(mutex_);
    purge_expired(now);
    entries_[key] = Entry{
        .value = std::move(value),
        .expires_at = ttl ? std::optional<Clock::time_point>{now + *ttl} : std::nullopt
    };
}

std::optional<std::string> MemoryCache::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.expires_at && Clock::now() >= *it->second.expires_at) return std::nullopt;
    return it->second.value;
}

bool MemoryCache::erase(const std::string& key) {
    std::unique_lock lock(mutex_);
    return entries_.erase(key) > 0;
}

void MemoryCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t MemoryCache::size() const {
    auto now = Clock::now();
    std::shared_lock lock(mutex_);
    size_t live = 0;
    for (const auto& [key, entry] : entries_) {
        if (!entry.expires_at || now < *entry.expires_at) ++live;
    }
    return live;
}

void MemoryCache::purge_expired(Clock::time_point now) {
    std::erase_if(entries_, [now](const auto& item) {
        return item.second.expires_at && now >= *item.second.expires_at;
    });
}

}  // namespace telemetry_hub
