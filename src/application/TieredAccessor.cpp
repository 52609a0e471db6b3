#include "application/TieredAccessor.hpp"
#include "domain/CacheErrors.hpp"
#include <iostream>

namespace tiercache::application {

TieredAccessor::TieredAccessor(
    std::shared_ptr<ports::output::IRemoteStore> remote,
    std::shared_ptr<ports::output::ILocalCache> local,
    std::shared_ptr<StatsRecorder> stats
) : remote_(std::move(remote))
  , local_(std::move(local))
  , stats_(stats ? std::move(stats) : std::make_shared<StatsRecorder>(false))
{}

// ============================================
// ЗАПИСЬ
// ============================================

void TieredAccessor::write(
    const domain::Context& ctx,
    const std::string& key,
    const std::string& bytes,
    std::chrono::milliseconds expiration
) {
    requireAnyTier();

    if (local_) {
        localSet(key, bytes);
    }

    if (remote_) {
        remote_->set(ctx, key, bytes, expiration);
    }
}

void TieredAccessor::localSet(const std::string& key, const std::string& bytes) {
    // Локальный уровень вспомогательный: его сбой не блокирует удалённый
    try {
        local_->set(key, bytes);
    } catch (const std::exception& e) {
        std::cerr << "[TieredAccessor] local set failed for key=" << key
                  << ": " << e.what() << std::endl;
    }
}

// ============================================
// ЧТЕНИЕ
// ============================================

std::optional<std::string> TieredAccessor::readLocal(const std::string& key) {
    if (!local_) {
        return std::nullopt;
    }

    auto bytes = local_->get(key);
    if (bytes) {
        stats_->recordLocalHit();
    } else {
        stats_->recordLocalMiss();
    }
    return bytes;
}

domain::ReadResult TieredAccessor::read(const domain::Context& ctx, const std::string& key) {
    if (auto local = readLocal(key)) {
        return domain::ReadResult::local(std::move(*local));
    }

    if (!remote_) {
        requireAnyTier();
        return domain::ReadResult::miss();
    }

    std::optional<std::string> bytes;
    try {
        bytes = remote_->get(ctx, key);
    } catch (const std::exception&) {
        stats_->recordMiss();
        throw;
    }

    if (!bytes) {
        stats_->recordMiss();
        return domain::ReadResult::miss();
    }

    stats_->recordHit();

    if (local_) {
        localSet(key, *bytes);
    }
    return domain::ReadResult::remote(std::move(*bytes));
}

// ============================================
// УДАЛЕНИЕ
// ============================================

bool TieredAccessor::remove(const domain::Context& ctx, const std::string& key) {
    requireAnyTier();

    if (local_) {
        local_->remove(key);
    }

    if (!remote_) {
        return true;
    }

    // Наличие только в локальном уровне не считается: решает удалённый
    auto deleted = remote_->del(ctx, {key});
    return deleted > 0;
}

void TieredAccessor::requireAnyTier() const {
    if (!remote_ && !local_) {
        throw domain::ConfigurationException();
    }
}

} // namespace tiercache::application
