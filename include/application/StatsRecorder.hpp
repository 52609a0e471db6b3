#pragma once

#include "domain/CacheStats.hpp"
#include <atomic>
#include <cstdint>
#include <optional>

namespace tiercache::application {

/**
 * @brief Атомарные счётчики попаданий/промахов
 *
 * Инкременты lock-free, вызываются из любых потоков.
 * Выключенный recorder игнорирует инкременты, snapshot() даёт nullopt.
 */
class StatsRecorder {
public:
    explicit StatsRecorder(bool enabled) : enabled_(enabled) {}

    void recordHit() { add(hits_); }
    void recordMiss() { add(misses_); }
    void recordLocalHit() { add(localHits_); }
    void recordLocalMiss() { add(localMisses_); }

    bool isEnabled() const { return enabled_; }

    std::optional<domain::CacheStats> snapshot() const {
        if (!enabled_) {
            return std::nullopt;
        }
        domain::CacheStats stats;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.localHits = localHits_.load(std::memory_order_relaxed);
        stats.localMisses = localMisses_.load(std::memory_order_relaxed);
        return stats;
    }

private:
    void add(std::atomic<std::uint64_t>& counter) {
        if (enabled_) {
            counter.fetch_add(1, std::memory_order_relaxed);
        }
    }

    const bool enabled_;
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> localHits_{0};
    std::atomic<std::uint64_t> localMisses_{0};
};

} // namespace tiercache::application
