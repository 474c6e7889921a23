#pragma once

#include <QDateTime>
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(nuttyApiLog)
Q_DECLARE_LOGGING_CATEGORY(nuttyCliLog)

namespace nutty::api {

struct Config;

// Installs a Qt message handler that writes every message to stderr and,
// when config.log_file is set, appends it to that file. Debug output of the
// nutty.* categories is enabled only when config.debug is true.
void install_logging(const Config& config);

// One log line: "<utc iso time> <level tag> <category> <message>\n".
[[nodiscard]] QString format_log_line(QtMsgType type,
                                      const char* category,
                                      const QString& message,
                                      const QDateTime& when);

} // namespace nutty::api
