#pragma once

#include "ports/output/IRemoteStore.hpp"
#include "domain/CacheErrors.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>

namespace tiercache::tests::mocks {

/**
 * @brief In-Memory реализация удалённого хранилища для unit-тестов
 *
 * Учитывает TTL (по steady_clock), запоминает последний TTL записи
 * и умеет имитировать сбой транспорта.
 */
class InMemoryRemoteStore : public ports::output::IRemoteStore {
public:
    void set(
        const domain::Context&,
        const std::string& key,
        const std::string& value,
        std::chrono::milliseconds expiration
    ) override {
        ++setCalls_;
        throwIfFailing();
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry;
        entry.value = value;
        entry.expiration = expiration;
        if (expiration > std::chrono::milliseconds::zero()) {
            entry.expiresAt = std::chrono::steady_clock::now() + expiration;
        }
        entries_[key] = entry;
    }

    std::optional<std::string> get(const domain::Context&, const std::string& key) override {
        ++getCalls_;
        throwIfFailing();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        if (isExpired(it->second)) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    std::int64_t del(const domain::Context&, const std::vector<std::string>& keys) override {
        ++delCalls_;
        throwIfFailing();
        std::lock_guard<std::mutex> lock(mutex_);
        std::int64_t deleted = 0;
        for (const auto& key : keys) {
            auto it = entries_.find(key);
            if (it == entries_.end()) continue;
            if (!isExpired(it->second)) ++deleted;
            entries_.erase(it);
        }
        return deleted;
    }

    // Помощники для тестов

    void put(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{value, std::chrono::milliseconds::zero(), std::nullopt};
    }

    std::optional<std::chrono::milliseconds> expirationOf(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second.expiration;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(key) > 0;
    }

    void setFailing(bool failing) { failing_ = failing; }

    int getCalls() const { return getCalls_; }
    int setCalls() const { return setCalls_; }
    int delCalls() const { return delCalls_; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        std::string value;
        std::chrono::milliseconds expiration{0};
        std::optional<std::chrono::steady_clock::time_point> expiresAt;
    };

    static bool isExpired(const Entry& entry) {
        return entry.expiresAt && std::chrono::steady_clock::now() >= *entry.expiresAt;
    }

    void throwIfFailing() const {
        if (failing_) {
            throw domain::RemoteStoreException("connection refused");
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::atomic<bool> failing_{false};

    std::atomic<int> getCalls_{0};
    std::atomic<int> setCalls_{0};
    std::atomic<int> delCalls_{0};
};

} // namespace tiercache::tests::mocks
