#pragma once

#include "adapters/secondary/redis/IRedisConnection.hpp"
#include "adapters/secondary/redis/RespParser.hpp"
#include "settings/IRedisSettings.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>

namespace tiercache::adapters::secondary::redis {

/**
 * @brief TCP соединение с Redis на Boost.Asio
 *
 * - Подключение ленивое, при первой команде
 * - Команды сериализуются мьютексом (одно соединение)
 * - Ввод-вывод асинхронный, io_context крутится квантами до завершения
 *   операции; между квантами проверяются отмена и дедлайн ctx
 * - После ошибки, отмены или таймаута сокет закрывается,
 *   следующая команда переподключается
 */
class AsioRedisConnection : public IRedisConnection {
public:
    explicit AsioRedisConnection(std::shared_ptr<settings::IRedisSettings> settings);
    ~AsioRedisConnection() override;

    RespValue execute(
        const domain::Context& ctx,
        const std::vector<std::string>& command
    ) override;

    bool isConnected() const;

private:
    void ensureConnected(const domain::Context& ctx);
    void disconnect();
    RespValue readReply(const domain::Context& ctx);

    /**
     * @brief Крутить io_context, пока не выставлен done
     * @throws RemoteStoreException если ctx отменён или дедлайн истёк
     */
    void runUntil(const domain::Context& ctx, const bool& done);

    static constexpr std::chrono::milliseconds kPollInterval{10};

    std::shared_ptr<settings::IRedisSettings> settings_;

    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::socket socket_;
    RespParser parser_;

    mutable std::mutex mutex_;
};

} // namespace tiercache::adapters::secondary::redis
