#pragma once

#include <string>
#include <utility>

namespace tiercache::domain {

/**
 * @brief Откуда пришло значение при чтении
 */
enum class Source {
    Local,
    Remote,
    Miss
};

inline const char* toString(Source source) {
    switch (source) {
        case Source::Local: return "local";
        case Source::Remote: return "remote";
        case Source::Miss: return "miss";
    }
    return "unknown";
}

/**
 * @brief Результат чтения из двухуровневого кэша
 */
struct ReadResult {
    Source source = Source::Miss;
    std::string bytes;

    static ReadResult miss() { return ReadResult{}; }

    static ReadResult local(std::string b) {
        return ReadResult{Source::Local, std::move(b)};
    }

    static ReadResult remote(std::string b) {
        return ReadResult{Source::Remote, std::move(b)};
    }

    bool found() const { return source != Source::Miss; }
};

} // namespace tiercache::domain
