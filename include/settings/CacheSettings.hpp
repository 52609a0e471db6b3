#pragma once

#include <cstdlib>
#include <string>

namespace tiercache::settings {

/**
 * @brief Настройки кэширования
 *
 * Читает из ENV:
 * - LOCAL_CACHE_ENABLED (default: true)
 * - LOCAL_CACHE_CAPACITY (default: 10000)
 * - LOCAL_CACHE_TTL_MS (default: 0 = 1 минута, < 0 = без устаревания)
 * - CACHE_STATS_ENABLED (default: true)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("LOCAL_CACHE_ENABLED")) {
            localCacheEnabled_ = parseFlag(val);
        }
        if (const char* val = std::getenv("LOCAL_CACHE_CAPACITY")) {
            localCacheCapacity_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("LOCAL_CACHE_TTL_MS")) {
            localCacheTtlMs_ = std::stoll(val);
        }
        if (const char* val = std::getenv("CACHE_STATS_ENABLED")) {
            statsEnabled_ = parseFlag(val);
        }
    }

    bool isLocalCacheEnabled() const { return localCacheEnabled_; }
    size_t getLocalCacheCapacity() const { return localCacheCapacity_; }
    long long getLocalCacheTtlMs() const { return localCacheTtlMs_; }
    bool isStatsEnabled() const { return statsEnabled_; }

private:
    static bool parseFlag(const std::string& value) {
        return !(value == "0" || value == "false" || value == "no");
    }

    bool localCacheEnabled_ = true;
    size_t localCacheCapacity_ = 10000;
    long long localCacheTtlMs_ = 0;
    bool statsEnabled_ = true;
};

} // namespace tiercache::settings
