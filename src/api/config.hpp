#pragma once

#include <QString>

namespace nutty::api {

// Process configuration. Everything comes from the environment so the CLI,
// tests and embedding services configure it the same way; command-line
// flags override individual fields for one run.
//
//   NUTTY_LOG_FILE  append log lines to this file
//   NUTTY_DEBUG     "1" / "true" enables nutty.* debug logging
//   NUTTY_TZ        IANA zone id used to present identifier timestamps
struct Config {
    QString log_file;
    bool debug = false;
    QString zone_id;

    [[nodiscard]] static Config from_environment();
};

} // namespace nutty::api
