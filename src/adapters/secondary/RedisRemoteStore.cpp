#include "adapters/secondary/RedisRemoteStore.hpp"
#include "domain/CacheErrors.hpp"
#include <iostream>

namespace tiercache::adapters::secondary {

using redis::RespValue;

RedisRemoteStore::RedisRemoteStore(std::shared_ptr<redis::IRedisConnection> connection)
    : connection_(std::move(connection))
{
    std::cout << "[RedisRemoteStore] Created" << std::endl;
}

void RedisRemoteStore::set(
    const domain::Context& ctx,
    const std::string& key,
    const std::string& value,
    std::chrono::milliseconds expiration
) {
    std::vector<std::string> command{"SET", key, value};
    if (expiration > std::chrono::milliseconds::zero()) {
        command.push_back("PX");
        command.push_back(std::to_string(expiration.count()));
    }

    auto reply = execute(ctx, command);
    if (reply.type != RespValue::Type::SimpleString) {
        throw domain::RemoteStoreException("redis: unexpected reply to SET");
    }
}

std::optional<std::string> RedisRemoteStore::get(
    const domain::Context& ctx,
    const std::string& key
) {
    auto reply = execute(ctx, {"GET", key});
    if (reply.isNull()) {
        return std::nullopt;
    }
    if (reply.type != RespValue::Type::BulkString) {
        throw domain::RemoteStoreException("redis: unexpected reply to GET");
    }
    return std::move(reply.str);
}

std::int64_t RedisRemoteStore::del(
    const domain::Context& ctx,
    const std::vector<std::string>& keys
) {
    if (keys.empty()) {
        return 0;
    }

    std::vector<std::string> command;
    command.reserve(keys.size() + 1);
    command.push_back("DEL");
    command.insert(command.end(), keys.begin(), keys.end());

    auto reply = execute(ctx, command);
    if (reply.type != RespValue::Type::Integer) {
        throw domain::RemoteStoreException("redis: unexpected reply to DEL");
    }
    return reply.integer;
}

RespValue RedisRemoteStore::execute(
    const domain::Context& ctx,
    const std::vector<std::string>& command
) {
    if (ctx.isCancelled()) {
        throw domain::RemoteStoreException("redis: context cancelled before " + command.front());
    }

    auto reply = connection_->execute(ctx, command);
    if (reply.isError()) {
        throw domain::RemoteStoreException(reply.str);
    }
    return reply;
}

} // namespace tiercache::adapters::secondary
