#pragma once

#include "ports/output/ILocalCache.hpp"
#include "application/TtlCodec.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace tiercache::application {

/**
 * @brief Декоратор ILocalCache с эмуляцией TTL
 *
 * set() дописывает к значению 4 байта метки времени записи,
 * get() проверяет возраст и отрезает метку. Нижележащий кэш
 * о суффиксе не знает.
 *
 * Устаревшая запись возвращается как промах и физически не удаляется:
 * её вытеснит следующая запись по ключу или LRU.
 *
 * Для кэша с собственным TTL декоратор не нужен.
 */
class TimestampedLocalCache : public ports::output::ILocalCache {
public:
    using ClockFn = std::function<TtlCodec::TimePoint()>;

    TimestampedLocalCache(
        std::shared_ptr<ports::output::ILocalCache> inner,
        std::chrono::milliseconds staleAfter,
        ClockFn clock = [] { return TtlCodec::Clock::now(); }
    );

    void set(const std::string& key, const std::string& value) override;

    /**
     * @throws std::logic_error если сохранённое значение не длиннее метки
     *         (его записали в обход декоратора)
     */
    std::optional<std::string> get(const std::string& key) override;

    void remove(const std::string& key) override;

    bool has(const std::string& key) override;

    std::chrono::milliseconds staleAfter() const { return staleAfter_; }

private:
    std::shared_ptr<ports::output::ILocalCache> inner_;
    std::chrono::milliseconds staleAfter_;
    ClockFn clock_;
};

} // namespace tiercache::application
