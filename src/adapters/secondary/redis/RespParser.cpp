#include "adapters/secondary/redis/RespParser.hpp"
#include "domain/CacheErrors.hpp"

namespace tiercache::adapters::secondary::redis {

namespace {
constexpr std::int64_t kMaxBulkLength = 512LL * 1024 * 1024;
constexpr std::int64_t kMaxArrayLength = 1024 * 1024;
}

void RespParser::feed(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

void RespParser::feed(const std::string& data) {
    buffer_ += data;
}

std::optional<RespValue> RespParser::next() {
    if (buffer_.empty()) return std::nullopt;

    std::size_t pos = 0;
    RespValue value;
    if (!parseValue(pos, value)) return std::nullopt;

    buffer_.erase(0, pos);
    return value;
}

bool RespParser::readLine(std::size_t& pos, std::string& line) const {
    auto crlf = buffer_.find("\r\n", pos);
    if (crlf == std::string::npos) return false;
    line = buffer_.substr(pos, crlf - pos);
    pos = crlf + 2;
    return true;
}

std::int64_t RespParser::parseInteger(const std::string& line) {
    try {
        std::size_t consumed = 0;
        auto value = std::stoll(line, &consumed);
        if (consumed != line.size()) {
            throw domain::RemoteStoreException("redis: malformed integer '" + line + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw domain::RemoteStoreException("redis: malformed integer '" + line + "'");
    } catch (const std::out_of_range&) {
        throw domain::RemoteStoreException("redis: integer out of range '" + line + "'");
    }
}

bool RespParser::parseValue(std::size_t& pos, RespValue& out) const {
    if (pos >= buffer_.size()) return false;

    const char marker = buffer_[pos];
    std::size_t cursor = pos + 1;
    std::string line;
    if (!readLine(cursor, line)) return false;

    switch (marker) {
        case '+':
            out = RespValue::simple(std::move(line));
            break;
        case '-':
            out = RespValue::error(std::move(line));
            break;
        case ':':
            out = RespValue::fromInteger(parseInteger(line));
            break;
        case '$': {
            auto len = parseInteger(line);
            if (len == -1) {
                out = RespValue::null();
                break;
            }
            if (len < 0 || len > kMaxBulkLength) {
                throw domain::RemoteStoreException("redis: invalid bulk length " + line);
            }
            auto size = static_cast<std::size_t>(len);
            if (cursor + size + 2 > buffer_.size()) return false;
            if (buffer_.compare(cursor + size, 2, "\r\n") != 0) {
                throw domain::RemoteStoreException("redis: bulk string not terminated by CRLF");
            }
            out = RespValue::bulk(buffer_.substr(cursor, size));
            cursor += size + 2;
            break;
        }
        case '*': {
            auto count = parseInteger(line);
            if (count == -1) {
                out = RespValue::null();
                break;
            }
            if (count < 0 || count > kMaxArrayLength) {
                throw domain::RemoteStoreException("redis: invalid array length " + line);
            }
            std::vector<RespValue> items;
            items.reserve(static_cast<std::size_t>(count));
            for (std::int64_t i = 0; i < count; ++i) {
                RespValue item;
                if (!parseValue(cursor, item)) return false;
                items.push_back(std::move(item));
            }
            out = RespValue::array(std::move(items));
            break;
        }
        default:
            throw domain::RemoteStoreException(
                std::string("redis: unexpected reply type '") + marker + "'");
    }

    pos = cursor;
    return true;
}

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

} // namespace tiercache::adapters::secondary::redis
