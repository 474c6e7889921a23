#include "api/logging.hpp"

#include "api/config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QTextStream>

#include <cstdio>

Q_LOGGING_CATEGORY(nuttyApiLog, "nutty.api")
Q_LOGGING_CATEGORY(nuttyCliLog, "nutty.cli")

namespace nutty::api {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "nutty: cannot open log file %s\n", qPrintable(path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    const auto line = format_log_line(type, ctx.category, msg,
                                      QDateTime::currentDateTimeUtc());
    const auto bytes = line.toUtf8();

    auto& s = state();
    QMutexLocker lock(&s.mu);

    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
}

} // namespace

QString format_log_line(QtMsgType type,
                        const char* category,
                        const QString& message,
                        const QDateTime& when) {
    const auto ts = when.toUTC().toString(Qt::ISODateWithMs);
    const auto cat = category ? QString::fromLatin1(category) : QString{};
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(ts, QString::fromLatin1(level_tag(type)), cat, message);
}

void install_logging(const Config& config) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        open_log_file(s, config.log_file);
    }

    QLoggingCategory::setFilterRules(config.debug
        ? QStringLiteral("nutty.*.debug=true\n")
        : QStringLiteral("nutty.*.debug=false\n"));

    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

} // namespace nutty::api
