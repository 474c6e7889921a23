#include "api/config.hpp"

#include <QtGlobal>

namespace nutty::api {
namespace {

bool env_flag(const char* name) {
    const auto value = qEnvironmentVariable(name).trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true") ||
           value == QStringLiteral("yes") || value == QStringLiteral("on");
}

} // namespace

Config Config::from_environment() {
    Config config;
    config.log_file = qEnvironmentVariable("NUTTY_LOG_FILE");
    config.debug = env_flag("NUTTY_DEBUG");
    config.zone_id = qEnvironmentVariable("NUTTY_TZ").trimmed();
    return config;
}

} // namespace nutty::api
