#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CacheErrors.hpp
 * @brief Исключения слоя кэширования
 *
 * Промах кэша исключением НЕ является: get() возвращает nullopt,
 * exists() и remove() возвращают false.
 */

namespace tiercache::domain {

/**
 * @brief Базовое исключение кэша
 */
class CacheException : public std::runtime_error {
public:
    explicit CacheException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Не настроен ни удалённый, ни локальный уровень
 */
class ConfigurationException : public CacheException {
public:
    ConfigurationException()
        : CacheException("cache: both remote store and local cache are nil") {}

    explicit ConfigurationException(const std::string& message)
        : CacheException(message) {}
};

/**
 * @brief Ошибка транспорта или протокола удалённого хранилища
 */
class RemoteStoreException : public CacheException {
public:
    explicit RemoteStoreException(const std::string& message)
        : CacheException(message) {}
};

/**
 * @brief Ошибка кодирования/декодирования значения
 */
class SerializationException : public CacheException {
public:
    explicit SerializationException(const std::string& message)
        : CacheException(message) {}
};

} // namespace tiercache::domain
