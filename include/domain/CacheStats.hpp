#pragma once

#include <cstdint>

namespace tiercache::domain {

/**
 * @brief Снимок счётчиков кэша
 *
 * hits/misses относятся к удалённому хранилищу,
 * localHits/localMisses к локальному уровню.
 */
struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t localHits = 0;
    std::uint64_t localMisses = 0;
};

} // namespace tiercache::domain
