#pragma once

#include "adapters/secondary/redis/RespValue.hpp"
#include "domain/Context.hpp"
#include <string>
#include <vector>

namespace tiercache::adapters::secondary::redis {

/**
 * @brief Соединение с Redis на уровне команд
 *
 * Отправляет команду (массив bulk-строк) и возвращает один ответ.
 * Сетевые ошибки, отмена ctx или истёкший дедлайн - RemoteStoreException.
 * Ответ-ошибка Redis (-ERR ...) возвращается как RespValue с типом Error.
 */
class IRedisConnection {
public:
    virtual ~IRedisConnection() = default;

    virtual RespValue execute(
        const domain::Context& ctx,
        const std::vector<std::string>& command
    ) = 0;
};

} // namespace tiercache::adapters::secondary::redis
