#pragma once

#include "adapters/secondary/redis/RespValue.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tiercache::adapters::secondary::redis {

/**
 * @brief Инкрементальный парсер ответов RESP2
 *
 * Данные из сокета скармливаются через feed(), готовые ответы
 * забираются через next(). Неполный ответ остаётся в буфере.
 *
 * @throws RemoteStoreException при нарушении протокола
 */
class RespParser {
public:
    void feed(const char* data, std::size_t size);
    void feed(const std::string& data);

    std::optional<RespValue> next();

    std::size_t buffered() const { return buffer_.size(); }
    void reset() { buffer_.clear(); }

private:
    bool parseValue(std::size_t& pos, RespValue& out) const;
    bool readLine(std::size_t& pos, std::string& line) const;
    static std::int64_t parseInteger(const std::string& line);

    std::string buffer_;
};

/**
 * @brief Закодировать команду как массив bulk-строк
 */
std::string encodeCommand(const std::vector<std::string>& args);

} // namespace tiercache::adapters::secondary::redis
