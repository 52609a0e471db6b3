#pragma once

#include "domain/Context.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace tiercache::domain {

/**
 * @brief Описание одного запроса к кэшу
 *
 * Создаётся вызывающим на каждый вызов.
 *
 * - value: уже вычисленное значение (приоритетнее producer)
 * - producer: функция, вычисляющая значение (может бросать исключения)
 * - ttl: время жизни в удалённом хранилище
 *   (< 0 - без истечения, < 1s - по умолчанию 1 час)
 * - ctx: контекст отмены, по умолчанию background
 *
 * @tparam T Тип значения (должен иметь to_json/from_json для nlohmann::json)
 */
template <typename T>
struct CacheItem {
    Context ctx;

    std::string key;
    std::optional<T> value;

    std::chrono::milliseconds ttl{0};

    std::function<T()> producer;

    static constexpr std::chrono::milliseconds kDefaultTtl = std::chrono::hours(1);

    const Context& context() const { return ctx; }

    /**
     * @brief Значение для записи: value, иначе результат producer
     * @throws std::invalid_argument если нет ни value, ни producer
     */
    T resolveValue() const {
        if (value) {
            return *value;
        }
        if (producer) {
            return producer();
        }
        throw std::invalid_argument("cache: item '" + key + "' has neither value nor producer");
    }

    /**
     * @brief TTL для удалённого хранилища (0 - без истечения)
     */
    std::chrono::milliseconds expiration() const {
        if (ttl < std::chrono::milliseconds::zero()) {
            return std::chrono::milliseconds::zero();
        }
        if (ttl < std::chrono::seconds(1)) {
            return kDefaultTtl;
        }
        return ttl;
    }
};

} // namespace tiercache::domain
