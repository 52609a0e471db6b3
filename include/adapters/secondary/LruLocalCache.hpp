#pragma once

#include "ports/output/ILocalCache.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace tiercache::adapters::secondary {

/**
 * @brief Локальный кэш на основе cpp-cache библиотеки
 *
 * LRU вытеснение по количеству элементов, БЕЗ политики истечения:
 * устаревание добавляет TimestampedLocalCache поверх.
 * Thread-safe благодаря ThreadSafeCache wrapper.
 */
class LruLocalCache : public ports::output::ILocalCache {
public:
    /**
     * @param capacity Максимальное количество элементов
     */
    explicit LruLocalCache(size_t capacity = 10000)
        : capacity_(capacity)
    {
        auto innerCache = std::make_unique<CacheType>(
            capacity,
            std::make_unique<LRUPolicy<std::string>>());
        cache_ = std::make_unique<ThreadSafeCacheType>(std::move(innerCache));

        std::cout << "[LruLocalCache] Created with capacity=" << capacity_ << std::endl;
    }

    void set(const std::string& key, const std::string& value) override {
        cache_->put(key, value);
    }

    std::optional<std::string> get(const std::string& key) override {
        return cache_->get(key);
    }

    void remove(const std::string& key) override {
        cache_->remove(key);
    }

    bool has(const std::string& key) override {
        return cache_->get(key).has_value();
    }

    void clear() {
        cache_->clear();
    }

    size_t size() const {
        return cache_->size();
    }

    size_t capacity() const {
        return capacity_;
    }

private:
    using CacheType = Cache<std::string, std::string>;
    using ThreadSafeCacheType = ThreadSafeCache<std::string, std::string>;

    size_t capacity_;
    std::unique_ptr<ICache<std::string, std::string>> cache_;
};

} // namespace tiercache::adapters::secondary
