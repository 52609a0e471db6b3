#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tiercache::adapters::secondary::redis {

/**
 * @brief Ответ Redis в формате RESP2
 */
struct RespValue {
    enum class Type {
        SimpleString,  // +OK
        Error,         // -ERR ...
        Integer,       // :1
        BulkString,    // $3\r\nfoo
        Null,          // $-1 / *-1
        Array          // *N
    };

    Type type = Type::Null;
    std::string str;
    std::int64_t integer = 0;
    std::vector<RespValue> elements;

    static RespValue simple(std::string s) {
        RespValue v;
        v.type = Type::SimpleString;
        v.str = std::move(s);
        return v;
    }

    static RespValue error(std::string s) {
        RespValue v;
        v.type = Type::Error;
        v.str = std::move(s);
        return v;
    }

    static RespValue fromInteger(std::int64_t i) {
        RespValue v;
        v.type = Type::Integer;
        v.integer = i;
        return v;
    }

    static RespValue bulk(std::string s) {
        RespValue v;
        v.type = Type::BulkString;
        v.str = std::move(s);
        return v;
    }

    static RespValue null() { return RespValue{}; }

    static RespValue array(std::vector<RespValue> items) {
        RespValue v;
        v.type = Type::Array;
        v.elements = std::move(items);
        return v;
    }

    bool isNull() const { return type == Type::Null; }
    bool isError() const { return type == Type::Error; }
};

} // namespace tiercache::adapters::secondary::redis
