#include "adapters/secondary/redis/AsioRedisConnection.hpp"
#include "domain/CacheErrors.hpp"
#include <algorithm>
#include <array>
#include <iostream>

namespace tiercache::adapters::secondary::redis {

AsioRedisConnection::AsioRedisConnection(std::shared_ptr<settings::IRedisSettings> settings)
    : settings_(std::move(settings))
    , ioContext_()
    , socket_(ioContext_)
{
    std::cout << "[AsioRedisConnection] Created, target: "
              << settings_->getHost() << ":" << settings_->getPort() << std::endl;
}

AsioRedisConnection::~AsioRedisConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect();
}

RespValue AsioRedisConnection::execute(
    const domain::Context& ctx,
    const std::vector<std::string>& command
) {
    std::lock_guard<std::mutex> lock(mutex_);

    ensureConnected(ctx);

    try {
        const std::string request = encodeCommand(command);

        boost::system::error_code ec;
        bool done = false;
        boost::asio::async_write(socket_, boost::asio::buffer(request),
            [&ec, &done](const boost::system::error_code& error, std::size_t) {
                ec = error;
                done = true;
            });
        runUntil(ctx, done);
        if (ec) {
            throw boost::system::system_error(ec);
        }

        return readReply(ctx);
    } catch (const boost::system::system_error& e) {
        std::cerr << "[AsioRedisConnection] I/O error: " << e.what() << std::endl;
        disconnect();
        throw domain::RemoteStoreException(std::string("redis: ") + e.what());
    } catch (const domain::RemoteStoreException&) {
        // Поток рассинхронизирован, дальше читать нельзя
        disconnect();
        throw;
    }
}

bool AsioRedisConnection::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return socket_.is_open();
}

void AsioRedisConnection::ensureConnected(const domain::Context& ctx) {
    if (socket_.is_open()) return;

    const std::string target = settings_->getHost() + ":" + std::to_string(settings_->getPort());
    try {
        boost::asio::ip::tcp::resolver resolver(ioContext_);
        auto endpoints = resolver.resolve(settings_->getHost(), std::to_string(settings_->getPort()));

        boost::system::error_code ec;
        bool done = false;
        boost::asio::async_connect(socket_, endpoints,
            [&ec, &done](const boost::system::error_code& error, const boost::asio::ip::tcp::endpoint&) {
                ec = error;
                done = true;
            });
        runUntil(ctx, done);
        if (ec) {
            throw boost::system::system_error(ec);
        }

        socket_.set_option(boost::asio::ip::tcp::no_delay(true));
        parser_.reset();

        std::cout << "[AsioRedisConnection] Connected to " << target << std::endl;
    } catch (const boost::system::system_error& e) {
        disconnect();
        throw domain::RemoteStoreException("redis: connect to " + target + " failed: " + e.what());
    }
}

void AsioRedisConnection::disconnect() {
    if (!socket_.is_open()) return;

    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    parser_.reset();
}

void AsioRedisConnection::runUntil(const domain::Context& ctx, const bool& done) {
    ioContext_.restart();

    while (!done) {
        if (ctx.isCancelled()) {
            // Закрытие сокета завершает ожидающую операцию с operation_aborted;
            // её обработчик ссылается на стек вызывающего и должен отработать здесь
            boost::system::error_code ec;
            socket_.close(ec);
            parser_.reset();
            ioContext_.restart();
            ioContext_.run();

            const auto deadline = ctx.deadline();
            if (deadline && domain::Context::Clock::now() >= *deadline) {
                throw domain::RemoteStoreException("redis: deadline exceeded");
            }
            throw domain::RemoteStoreException("redis: context cancelled");
        }

        auto slice = std::chrono::duration_cast<std::chrono::steady_clock::duration>(kPollInterval);
        if (auto deadline = ctx.deadline()) {
            auto remaining = *deadline - domain::Context::Clock::now();
            slice = std::max(std::chrono::steady_clock::duration::zero(), std::min(slice, remaining));
        }

        ioContext_.run_for(slice);
        if (ioContext_.stopped()) {
            ioContext_.restart();
        }
    }
}

RespValue AsioRedisConnection::readReply(const domain::Context& ctx) {
    std::array<char, 4096> chunk{};
    while (true) {
        if (auto reply = parser_.next()) {
            return *reply;
        }

        boost::system::error_code ec;
        std::size_t n = 0;
        bool done = false;
        socket_.async_read_some(boost::asio::buffer(chunk),
            [&ec, &n, &done](const boost::system::error_code& error, std::size_t bytes) {
                ec = error;
                n = bytes;
                done = true;
            });
        runUntil(ctx, done);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        parser_.feed(chunk.data(), n);
    }
}

} // namespace tiercache::adapters::secondary::redis
