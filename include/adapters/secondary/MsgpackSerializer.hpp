#pragma once

#include "domain/CacheErrors.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tiercache::adapters::secondary {

/**
 * @brief Сериализация значений в MessagePack через nlohmann::json
 *
 * Тип T должен иметь to_json/from_json
 * (например, NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE).
 */
class MsgpackSerializer {
public:
    /**
     * @brief Закодировать значение, дописав байты в out
     * @throws SerializationException
     */
    template <typename T>
    static void encode(const T& value, std::string& out) {
        try {
            nlohmann::json j = value;
            nlohmann::json::to_msgpack(j, out);
        } catch (const nlohmann::json::exception& e) {
            throw domain::SerializationException(std::string("cache: encode failed: ") + e.what());
        }
    }

    template <typename T>
    static std::string encode(const T& value) {
        std::string out;
        encode(value, out);
        return out;
    }

    /**
     * @brief Декодировать байты в T
     * @throws SerializationException если байты не MessagePack
     *         или не соответствуют схеме T
     */
    template <typename T>
    static T decode(const std::string& bytes) {
        try {
            return nlohmann::json::from_msgpack(bytes).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw domain::SerializationException(std::string("cache: decode failed: ") + e.what());
        }
    }
};

} // namespace tiercache::adapters::secondary
