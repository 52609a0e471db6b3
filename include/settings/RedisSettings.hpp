#pragma once

#include "settings/IRedisSettings.hpp"
#include <cstdlib>
#include <string>

namespace tiercache::settings {

/**
 * @brief Настройки подключения к Redis
 *
 * Читает из ENV:
 * - REDIS_ENABLED (default: true; "0"/"false" отключает удалённый уровень)
 * - REDIS_HOST (default: "localhost")
 * - REDIS_PORT (default: 6379)
 */
class RedisSettings : public IRedisSettings {
public:
    RedisSettings() {
        if (const char* enabled = std::getenv("REDIS_ENABLED")) {
            std::string value = enabled;
            enabled_ = !(value == "0" || value == "false" || value == "no");
        }
        if (const char* host = std::getenv("REDIS_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("REDIS_PORT")) {
            port_ = std::stoi(port);
        }
    }

    bool isEnabled() const override { return enabled_; }
    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }

private:
    bool enabled_ = true;
    std::string host_ = "localhost";
    int port_ = 6379;
};

} // namespace tiercache::settings
