#pragma once

#include "ports/output/IRemoteStore.hpp"
#include "adapters/secondary/redis/IRedisConnection.hpp"
#include <memory>

namespace tiercache::adapters::secondary {

/**
 * @brief Удалённое хранилище на Redis
 *
 * Команды:
 * - SET key value [PX ms]
 * - GET key  (nil -> промах)
 * - DEL key [key ...]
 *
 * Любой ответ-ошибка Redis превращается в RemoteStoreException
 * с исходным текстом.
 */
class RedisRemoteStore : public ports::output::IRemoteStore {
public:
    explicit RedisRemoteStore(std::shared_ptr<redis::IRedisConnection> connection);

    void set(
        const domain::Context& ctx,
        const std::string& key,
        const std::string& value,
        std::chrono::milliseconds expiration
    ) override;

    std::optional<std::string> get(
        const domain::Context& ctx,
        const std::string& key
    ) override;

    std::int64_t del(
        const domain::Context& ctx,
        const std::vector<std::string>& keys
    ) override;

private:
    redis::RespValue execute(const domain::Context& ctx, const std::vector<std::string>& command);

    std::shared_ptr<redis::IRedisConnection> connection_;
};

} // namespace tiercache::adapters::secondary
