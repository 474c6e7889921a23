#include "api/qt_time_zone.hpp"

#include <QDateTime>

namespace nutty::api {

std::string QtTimeZone::id() const {
    return zone_.id().toStdString();
}

ZoneOffset QtTimeZone::offset_at(Timestamp instant) const {
    const auto when = QDateTime::fromMSecsSinceEpoch(instant.millis(), QTimeZone::utc());
    return ZoneOffset{
        std::chrono::seconds{zone_.offsetFromUtc(when)},
        zone_.abbreviation(when).toStdString()
    };
}

Result<std::shared_ptr<const TimeZone>> resolve_time_zone(const QByteArray& id) {
    using R = Result<std::shared_ptr<const TimeZone>>;

    // The built-in zones live for the whole process; the no-op deleter
    // lets them share the return type with owned Qt zones.
    const auto borrowed = [](const TimeZone& zone) {
        return std::shared_ptr<const TimeZone>(&zone, [](const TimeZone*) {});
    };

    const auto trimmed = id.trimmed();
    if (trimmed.isEmpty() || trimmed == "local") {
        return R::ok(borrowed(TimeZone::local()));
    }
    if (trimmed == "UTC" || trimmed == "Z") {
        return R::ok(borrowed(TimeZone::utc()));
    }

    QTimeZone zone(trimmed);
    if (!zone.isValid()) {
        return R::err(Error{ErrorKind::Configuration,
                            "Unknown time zone: " + trimmed.toStdString()});
    }
    return R::ok(std::make_shared<QtTimeZone>(std::move(zone)));
}

} // namespace nutty::api
