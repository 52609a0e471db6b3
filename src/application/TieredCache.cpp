#include "application/TieredCache.hpp"
#include "application/TimestampedLocalCache.hpp"

namespace tiercache::application {

namespace {

std::shared_ptr<ports::output::ILocalCache> wrapLocalCache(
    std::shared_ptr<ports::output::ILocalCache> local,
    std::chrono::milliseconds staleAfter
) {
    if (!local || staleAfter == std::chrono::milliseconds::zero()) {
        return local;
    }
    return std::make_shared<TimestampedLocalCache>(std::move(local), staleAfter);
}

} // namespace

TieredCache::TieredCache(CacheOptions options)
    : localCacheTtl_(options.resolvedLocalCacheTtl())
    , stats_(std::make_shared<StatsRecorder>(options.statsEnabled))
{
    accessor_ = std::make_unique<TieredAccessor>(
        options.remote,
        wrapLocalCache(options.localCache, localCacheTtl_),
        stats_
    );

    std::cout << "[TieredCache] Created with:"
              << " remote=" << (options.remote ? "yes" : "no")
              << " local=" << (options.localCache ? "yes" : "no")
              << " localTtl=";
    if (localCacheTtl_ == std::chrono::milliseconds::zero()) {
        std::cout << "never";
    } else {
        std::cout << localCacheTtl_.count() << "ms";
    }
    std::cout << " stats=" << (options.statsEnabled ? "on" : "off") << std::endl;

    if (!options.remote && !options.localCache) {
        std::cerr << "[TieredCache] Neither remote store nor local cache configured,"
                  << " every operation will fail" << std::endl;
    }
}

std::optional<std::string> TieredCache::getBytes(const domain::Context& ctx, const std::string& key) {
    auto result = accessor_->read(ctx, key);
    if (!result.found()) {
        return std::nullopt;
    }
    return std::move(result.bytes);
}

bool TieredCache::exists(const domain::Context& ctx, const std::string& key) {
    try {
        return accessor_->read(ctx, key).found();
    } catch (const domain::RemoteStoreException& e) {
        std::cerr << "[TieredCache] exists(" << key << ") treated as miss: "
                  << e.what() << std::endl;
        return false;
    }
}

bool TieredCache::remove(const domain::Context& ctx, const std::string& key) {
    return accessor_->remove(ctx, key);
}

std::optional<domain::CacheStats> TieredCache::stats() const {
    return stats_->snapshot();
}

std::optional<std::string> TieredCache::readForOnce(const domain::Context& ctx, const std::string& key) {
    try {
        auto result = accessor_->read(ctx, key);
        if (result.found()) {
            return std::move(result.bytes);
        }
    } catch (const domain::RemoteStoreException& e) {
        // Недоступность хранилища не мешает вычислить значение
        std::cerr << "[TieredCache] Read of key=" << key
                  << " failed, computing value: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace tiercache::application
