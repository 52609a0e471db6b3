#pragma once

#include "domain/Context.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tiercache::ports::output {

/**
 * @brief Интерфейс удалённого key-value хранилища
 *
 * Output Port для общего (сетевого) уровня кэша.
 *
 * Реализации:
 * - RedisRemoteStore - Redis через IRedisConnection
 *
 * Реализация должна быть потокобезопасной.
 * Ошибки транспорта/протокола - RemoteStoreException.
 */
class IRemoteStore {
public:
    virtual ~IRemoteStore() = default;

    /**
     * @brief Записать значение
     *
     * @param ctx Контекст отмены
     * @param key Ключ
     * @param value Сериализованное значение
     * @param expiration Время жизни (0 = без истечения)
     */
    virtual void set(
        const domain::Context& ctx,
        const std::string& key,
        const std::string& value,
        std::chrono::milliseconds expiration
    ) = 0;

    /**
     * @brief Прочитать значение
     *
     * @return Значение или nullopt если ключа нет
     */
    virtual std::optional<std::string> get(
        const domain::Context& ctx,
        const std::string& key
    ) = 0;

    /**
     * @brief Удалить ключи
     *
     * @return Количество реально удалённых ключей
     */
    virtual std::int64_t del(
        const domain::Context& ctx,
        const std::vector<std::string>& keys
    ) = 0;
};

} // namespace tiercache::ports::output
