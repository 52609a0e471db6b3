#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace tiercache::utils {

/**
 * @brief Потокобезопасный пул буферов для кодирования
 *
 * acquire() отдаёт пустую строку с зарезервированной ёмкостью,
 * release() возвращает её в пул. Если байты буфера уходят наружу
 * (результат once), вместо release() вызывается updateLength(),
 * чтобы новые буферы сразу резервировались под типичный размер.
 *
 * Семантики нет, только экономия аллокаций.
 */
class BufferPool {
public:
    explicit BufferPool(size_t maxPooled = 64, size_t maxBufferSize = 1024 * 1024)
        : maxPooled_(maxPooled)
        , maxBufferSize_(maxBufferSize)
    {}

    std::string acquire() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!buffers_.empty()) {
                std::string buf = std::move(buffers_.back());
                buffers_.pop_back();
                buf.clear();
                return buf;
            }
        }

        std::string buf;
        buf.reserve(typicalLength_.load(std::memory_order_relaxed));
        return buf;
    }

    void release(std::string buf) {
        updateLength(buf.size());
        if (buf.capacity() > maxBufferSize_) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (buffers_.size() < maxPooled_) {
            buffers_.push_back(std::move(buf));
        }
    }

    void updateLength(size_t length) {
        if (length <= maxBufferSize_) {
            typicalLength_.store(length, std::memory_order_relaxed);
        }
    }

    size_t pooled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffers_.size();
    }

    size_t typicalLength() const {
        return typicalLength_.load(std::memory_order_relaxed);
    }

private:
    size_t maxPooled_;
    size_t maxBufferSize_;

    mutable std::mutex mutex_;
    std::vector<std::string> buffers_;
    std::atomic<size_t> typicalLength_{0};
};

} // namespace tiercache::utils
