#pragma once

#include <boost/di.hpp>
#include <nlohmann/json.hpp>

// Settings
#include "settings/CacheSettings.hpp"
#include "settings/IRedisSettings.hpp"
#include "settings/RedisSettings.hpp"

// Application
#include "application/CacheOptions.hpp"
#include "application/TieredCache.hpp"

// Secondary Adapters
#include "adapters/secondary/LruLocalCache.hpp"
#include "adapters/secondary/RedisRemoteStore.hpp"
#include "adapters/secondary/redis/AsioRedisConnection.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace di = boost::di;

namespace tiercache {

/**
 * @brief Отчёт, который демо "долго" вычисляет
 */
struct DemoReport {
    std::string id;
    std::int64_t computedAtMs = 0;
    std::vector<double> values;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DemoReport, id, computedAtMs, values)

/**
 * @brief Демо-приложение TieredCache
 *
 * Собирает кэш из ENV (см. CacheSettings, RedisSettings) и запускает
 * несколько потоков, одновременно запрашивающих один ключ через once().
 * Producer должен выполниться один раз.
 */
class CacheDemoApp {
public:
    CacheDemoApp() { std::cout << "[CacheDemoApp] Initializing..." << std::endl; }
    ~CacheDemoApp() { std::cout << "[CacheDemoApp] Shutting down..." << std::endl; }

    /**
     * @brief Template Method: окружение, DI, запуск
     *
     * SIGINT/SIGTERM во время запуска прекращают старт новых потоков.
     * @return Код возврата процесса
     */
    int run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        return start();
    }

    void stop() { stopped_ = true; }

private:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    int start();
    int runWorkers();

    DemoReport buildReport(const std::string& id);

    std::string key_ = "demo:report";
    int workers_ = 8;
    std::atomic<bool> stopped_{false};
    std::atomic<int> producerCalls_{0};

    std::shared_ptr<application::TieredCache> cache_;
};

} // namespace tiercache
