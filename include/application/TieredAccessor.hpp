#pragma once

#include "ports/output/IRemoteStore.hpp"
#include "ports/output/ILocalCache.hpp"
#include "application/StatsRecorder.hpp"
#include "domain/Context.hpp"
#include "domain/ReadResult.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tiercache::application {

/**
 * @brief Чтение и запись сериализованных значений в два уровня
 *
 * Чтение: локальный кэш, затем удалённое хранилище; попадание
 * в удалённом записывается обратно в локальный.
 * Запись: сначала локальный (best effort), затем удалённый.
 *
 * Локальный кэш и удалённое хранилище могут быть nullptr,
 * но не оба сразу: тогда любая операция бросает ConfigurationException.
 */
class TieredAccessor {
public:
    TieredAccessor(
        std::shared_ptr<ports::output::IRemoteStore> remote,
        std::shared_ptr<ports::output::ILocalCache> local,
        std::shared_ptr<StatsRecorder> stats
    );

    /**
     * @brief Записать байты в оба уровня
     *
     * @param expiration TTL для удалённого хранилища (0 = без истечения)
     * @throws ConfigurationException, RemoteStoreException
     */
    void write(
        const domain::Context& ctx,
        const std::string& key,
        const std::string& bytes,
        std::chrono::milliseconds expiration
    );

    /**
     * @brief Прочитать байты
     *
     * Промах (в т.ч. nil от удалённого хранилища) - Source::Miss.
     * @throws ConfigurationException, RemoteStoreException
     */
    domain::ReadResult read(const domain::Context& ctx, const std::string& key);

    /**
     * @brief Только локальный уровень (быстрый путь once)
     * @return nullopt если локального кэша нет или записи нет
     */
    std::optional<std::string> readLocal(const std::string& key);

    /**
     * @brief Удалить ключ из обоих уровней
     *
     * @return false - удалённое хранилище ничего не удалило (промах)
     * @throws ConfigurationException, RemoteStoreException
     */
    bool remove(const domain::Context& ctx, const std::string& key);

    bool hasRemote() const { return static_cast<bool>(remote_); }
    bool hasLocal() const { return static_cast<bool>(local_); }

private:
    void localSet(const std::string& key, const std::string& bytes);
    void requireAnyTier() const;

    std::shared_ptr<ports::output::IRemoteStore> remote_;
    std::shared_ptr<ports::output::ILocalCache> local_;
    std::shared_ptr<StatsRecorder> stats_;
};

} // namespace tiercache::application
