/**
 * @file memory_cache.hpp
 * @brief Thread-safe in-process key/value cache with optional TTL.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace telemetry_hub {

/**
 * @brief String key/value store. Thread-safe via shared_mutex.
 *
 * Expired entries are invisible to get() and are purged lazily on the next
 * write.
 */
class MemoryCache {
public:
    using Clock = std::chrono::steady_clock;

    void set(const std::string& key, std::string value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    bool erase(const std::string& key);
    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::string backend_name() const { return "MemoryCache"; }

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expires_at;
    };

    void purge_expired(Clock::time_point now);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace telemetry_hub
