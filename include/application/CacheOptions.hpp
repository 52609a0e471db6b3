#pragma once

#include "ports/output/IRemoteStore.hpp"
#include "ports/output/ILocalCache.hpp"
#include <chrono>
#include <memory>

namespace tiercache::application {

/**
 * @brief Конфигурация TieredCache, задаётся один раз при создании
 *
 * localCacheTtl:
 * - < 0 - локальные записи не устаревают (метка не дописывается)
 * - 0   - окно по умолчанию (1 минута)
 * - > 0 - точное окно
 */
struct CacheOptions {
    std::shared_ptr<ports::output::IRemoteStore> remote;
    std::shared_ptr<ports::output::ILocalCache> localCache;

    std::chrono::milliseconds localCacheTtl{0};

    bool statsEnabled = false;

    static constexpr std::chrono::milliseconds kDefaultLocalCacheTtl = std::chrono::minutes(1);

    /**
     * @brief Окно устаревания после нормализации (0 = не устаревают)
     */
    std::chrono::milliseconds resolvedLocalCacheTtl() const {
        if (localCacheTtl < std::chrono::milliseconds::zero()) {
            return std::chrono::milliseconds::zero();
        }
        if (localCacheTtl == std::chrono::milliseconds::zero()) {
            return kDefaultLocalCacheTtl;
        }
        return localCacheTtl;
    }
};

} // namespace tiercache::application
