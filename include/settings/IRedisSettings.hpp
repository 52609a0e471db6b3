#pragma once

#include <string>

namespace tiercache::settings {

class IRedisSettings {
public:
    virtual ~IRedisSettings() = default;

    virtual bool isEnabled() const = 0;
    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
};

} // namespace tiercache::settings
