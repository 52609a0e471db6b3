#include "CacheDemoApp.hpp"
#include <boost/asio.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace tiercache {

void CacheDemoApp::loadEnvironment(int argc, char* argv[]) {
    if (argc > 1) {
        key_ = argv[1];
    }
    if (argc > 2) {
        workers_ = std::max(1, std::stoi(argv[2]));
    }
    std::cout << "[CacheDemoApp] usage: " << (argc > 0 ? argv[0] : "tiercache-demo")
              << " [key] [workers]" << std::endl;
    std::cout << "[CacheDemoApp] Environment loaded: key=" << key_
              << " workers=" << workers_ << std::endl;
}

void CacheDemoApp::configureInjection() {
    std::cout << "[CacheDemoApp] Configuring DI..." << std::endl;

    auto injector = di::make_injector(
        di::bind<settings::CacheSettings>().in(di::singleton),
        di::bind<settings::IRedisSettings>().to<settings::RedisSettings>().in(di::singleton),
        di::bind<adapters::secondary::redis::IRedisConnection>()
            .to<adapters::secondary::redis::AsioRedisConnection>().in(di::singleton));

    auto cacheSettings = injector.create<std::shared_ptr<settings::CacheSettings>>();
    auto redisSettings = injector.create<std::shared_ptr<settings::IRedisSettings>>();

    application::CacheOptions options;
    if (redisSettings->isEnabled()) {
        options.remote = injector.create<std::shared_ptr<adapters::secondary::RedisRemoteStore>>();
    }
    if (cacheSettings->isLocalCacheEnabled()) {
        options.localCache = std::make_shared<adapters::secondary::LruLocalCache>(
            cacheSettings->getLocalCacheCapacity());
    }
    options.localCacheTtl = std::chrono::milliseconds(cacheSettings->getLocalCacheTtlMs());
    options.statsEnabled = cacheSettings->isStatsEnabled();

    cache_ = std::make_shared<application::TieredCache>(options);
}

DemoReport CacheDemoApp::buildReport(const std::string& id) {
    ++producerCalls_;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    DemoReport report;
    report.id = id;
    report.computedAtMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    for (int i = 1; i <= 5; ++i) {
        report.values.push_back(i * 1.5);
    }
    return report;
}

int CacheDemoApp::start() {
    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal) {
        if (ec) return;
        std::cout << "[CacheDemoApp] Received signal " << signal << ", stopping..." << std::endl;
        stop();
    });
    std::thread signalThread([&signalContext]() { signalContext.run(); });

    int code = runWorkers();

    boost::system::error_code ec;
    signals.cancel(ec);
    signalContext.stop();
    signalThread.join();

    return code;
}

int CacheDemoApp::runWorkers() {
    domain::CacheItem<DemoReport> item;
    item.key = key_;
    item.ttl = std::chrono::minutes(5);
    item.producer = [this] { return buildReport(key_); };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < workers_ && !stopped_; ++i) {
        threads.emplace_back([this, &item, &failures]() {
            try {
                auto report = cache_->once(item);
                std::cout << "[CacheDemoApp] Got report " << report.id
                          << " computedAt=" << report.computedAtMs << std::endl;
            } catch (const std::exception& e) {
                ++failures;
                std::cerr << "[CacheDemoApp] once failed: " << e.what() << std::endl;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::cout << "[CacheDemoApp] Producer calls: " << producerCalls_.load() << std::endl;
    if (auto stats = cache_->stats()) {
        std::cout << "[CacheDemoApp] Stats: hits=" << stats->hits
                  << " misses=" << stats->misses
                  << " localHits=" << stats->localHits
                  << " localMisses=" << stats->localMisses << std::endl;
    }

    return failures == 0 ? 0 : 1;
}

} // namespace tiercache
