#include "application/TimestampedLocalCache.hpp"
#include <stdexcept>

namespace tiercache::application {

TimestampedLocalCache::TimestampedLocalCache(
    std::shared_ptr<ports::output::ILocalCache> inner,
    std::chrono::milliseconds staleAfter,
    ClockFn clock
) : inner_(std::move(inner))
  , staleAfter_(staleAfter)
  , clock_(std::move(clock))
{
    if (!inner_) {
        throw std::invalid_argument("TimestampedLocalCache: inner cache is null");
    }
    if (staleAfter_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("TimestampedLocalCache: staleness window must be positive");
    }
}

void TimestampedLocalCache::set(const std::string& key, const std::string& value) {
    std::string stamped;
    stamped.reserve(value.size() + TtlCodec::kTimestampSize);
    stamped.append(value);
    stamped.append(TtlCodec::encode(clock_()));
    inner_->set(key, stamped);
}

std::optional<std::string> TimestampedLocalCache::get(const std::string& key) {
    auto stored = inner_->get(key);
    if (!stored) {
        return std::nullopt;
    }
    if (stored->empty()) {
        return stored;
    }
    if (stored->size() <= TtlCodec::kTimestampSize) {
        throw std::logic_error(
            "TimestampedLocalCache: entry '" + key + "' is shorter than its timestamp");
    }

    const auto payloadSize = stored->size() - TtlCodec::kTimestampSize;
    const auto now = clock_();
    const auto writtenAt = TtlCodec::decode(stored->data() + payloadSize, now);
    if (now - writtenAt > staleAfter_) {
        return std::nullopt;
    }

    stored->resize(payloadSize);
    return stored;
}

void TimestampedLocalCache::remove(const std::string& key) {
    inner_->remove(key);
}

bool TimestampedLocalCache::has(const std::string& key) {
    return get(key).has_value();
}

} // namespace tiercache::application
