#pragma once

#include <optional>
#include <string>

namespace tiercache::ports::output {

/**
 * @brief Интерфейс локального (in-process) кэша байтов
 *
 * Фиксированная ёмкость, политика вытеснения скрыта от ядра.
 * Собственного TTL нет: устаревание эмулирует TimestampedLocalCache.
 *
 * Реализации:
 * - LruLocalCache - обёртка над cpp-cache
 * - TimestampedLocalCache - декоратор с меткой времени записи
 *
 * Реализация должна быть потокобезопасной.
 */
class ILocalCache {
public:
    virtual ~ILocalCache() = default;

    virtual void set(const std::string& key, const std::string& value) = 0;

    /**
     * @return Значение или nullopt если не найдено (или устарело)
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void remove(const std::string& key) = 0;

    virtual bool has(const std::string& key) = 0;
};

} // namespace tiercache::ports::output
