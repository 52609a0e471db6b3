#pragma once

#include "application/CacheOptions.hpp"
#include "application/SingleFlight.hpp"
#include "application/StatsRecorder.hpp"
#include "application/TieredAccessor.hpp"
#include "adapters/secondary/MsgpackSerializer.hpp"
#include "domain/CacheErrors.hpp"
#include "domain/CacheItem.hpp"
#include "domain/CacheStats.hpp"
#include "domain/Context.hpp"
#include "utils/BufferPool.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace tiercache::application {

/**
 * @brief Двухуровневый кэш: локальный in-process + удалённое хранилище
 *
 * Read-through / write-through поверх IRemoteStore и ILocalCache.
 *
 * once() гарантирует, что producer для ключа выполняется не более
 * одного раза одновременно в пределах процесса. Если закэшированные
 * байты не декодируются в T (сменилась схема), ключ удаляется и
 * once() повторяется один раз.
 *
 * @example
 * ```cpp
 * CacheOptions opt;
 * opt.remote = std::make_shared<RedisRemoteStore>(connection);
 * opt.localCache = std::make_shared<LruLocalCache>(1000);
 * TieredCache cache(opt);
 *
 * CacheItem<Report> item;
 * item.key = "report:42";
 * item.ttl = std::chrono::minutes(5);
 * item.producer = [] { return buildReport(42); };
 * Report report = cache.once(item);
 * ```
 */
class TieredCache {
public:
    explicit TieredCache(CacheOptions options);

    // ============================================
    // ЗАПИСЬ
    // ============================================

    /**
     * @brief Закодировать значение item и записать в оба уровня
     * @throws ConfigurationException, SerializationException, RemoteStoreException,
     *         исключение producer
     */
    template <typename T>
    void set(const domain::CacheItem<T>& item) {
        T value = item.resolveValue();

        std::string buf = pool_.acquire();
        adapters::secondary::MsgpackSerializer::encode(value, buf);
        accessor_->write(item.context(), item.key, buf, item.expiration());
        pool_.release(std::move(buf));
    }

    // ============================================
    // ЧТЕНИЕ
    // ============================================

    /**
     * @brief Получить значение по ключу
     * @return nullopt при промахе; T{} если сохранены пустые байты
     * @throws ConfigurationException, SerializationException, RemoteStoreException
     */
    template <typename T>
    std::optional<T> get(const domain::Context& ctx, const std::string& key) {
        auto result = accessor_->read(ctx, key);
        if (!result.found()) {
            return std::nullopt;
        }
        return decodeStored<T>(result.bytes);
    }

    template <typename T>
    std::optional<T> get(const std::string& key) {
        return get<T>(domain::Context::background(), key);
    }

    /**
     * @brief Получить сырые байты без декодирования
     */
    std::optional<std::string> getBytes(const domain::Context& ctx, const std::string& key);

    /**
     * @brief Есть ли значение хотя бы в одном уровне
     *
     * Ошибка удалённого хранилища означает false.
     * @throws ConfigurationException
     */
    bool exists(const domain::Context& ctx, const std::string& key);
    bool exists(const std::string& key) { return exists(domain::Context::background(), key); }

    // ============================================
    // ONCE
    // ============================================

    /**
     * @brief Получить значение из кэша или вычислить его один раз
     *
     * 1. Локальный кэш - без координации
     * 2. Иначе группа по ключу: лидер читает кэш, при промахе вызывает
     *    producer и записывает результат; ведомые получают те же байты
     * 3. Декодирование; ошибка на закэшированных байтах - удалить ключ
     *    и повторить один раз
     *
     * @throws ConfigurationException, SerializationException, RemoteStoreException,
     *         исключение producer
     */
    template <typename T>
    T once(const domain::CacheItem<T>& item) {
        return onceAttempt(item, true);
    }

    // ============================================
    // УДАЛЕНИЕ И СТАТИСТИКА
    // ============================================

    /**
     * @brief Удалить ключ из обоих уровней
     * @return false если удалённое хранилище ключа не содержало
     * @throws ConfigurationException, RemoteStoreException
     */
    bool remove(const domain::Context& ctx, const std::string& key);
    bool remove(const std::string& key) { return remove(domain::Context::background(), key); }

    /**
     * @return nullopt если статистика выключена
     */
    std::optional<domain::CacheStats> stats() const;

    std::chrono::milliseconds localCacheTtl() const { return localCacheTtl_; }

private:
    template <typename T>
    T onceAttempt(const domain::CacheItem<T>& item, bool healStaleEntry) {
        auto shared = onceBytes(item);

        try {
            return decodeStored<T>(shared.bytes);
        } catch (const domain::SerializationException& e) {
            if (!shared.cached || !healStaleEntry) {
                throw;
            }

            std::cerr << "[TieredCache] Cached entry for key=" << item.key
                      << " does not decode, deleting: " << e.what() << std::endl;

            auto decodeError = std::current_exception();
            try {
                accessor_->remove(item.context(), item.key);
            } catch (const std::exception& deleteError) {
                std::cerr << "[TieredCache] Delete of key=" << item.key
                          << " failed: " << deleteError.what() << std::endl;
                std::rethrow_exception(decodeError);
            }
        }

        return onceAttempt(item, false);
    }

    template <typename T>
    SingleFlight::Result onceBytes(const domain::CacheItem<T>& item) {
        if (auto local = accessor_->readLocal(item.key)) {
            return SingleFlight::Result{std::move(*local), true};
        }

        return group_.run(item.key, [this, &item]() {
            if (auto cached = readForOnce(item.context(), item.key)) {
                return SingleFlight::Result{std::move(*cached), true};
            }

            T value = item.resolveValue();

            std::string buf = pool_.acquire();
            adapters::secondary::MsgpackSerializer::encode(value, buf);
            accessor_->write(item.context(), item.key, buf, item.expiration());
            pool_.updateLength(buf.size());

            return SingleFlight::Result{std::move(buf), false};
        });
    }

    // Пустые байты - присутствующее значение без содержимого
    template <typename T>
    static T decodeStored(const std::string& bytes) {
        if (bytes.empty()) {
            return T{};
        }
        return adapters::secondary::MsgpackSerializer::decode<T>(bytes);
    }

    std::optional<std::string> readForOnce(const domain::Context& ctx, const std::string& key);

    std::chrono::milliseconds localCacheTtl_;
    std::shared_ptr<StatsRecorder> stats_;
    std::unique_ptr<TieredAccessor> accessor_;
    SingleFlight group_;
    utils::BufferPool pool_;
};

} // namespace tiercache::application
