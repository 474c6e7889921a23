#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QTimeZone>

#include <memory>

namespace nutty::api {

// TimeZone backed by Qt's zone database, so identifier timestamps can be
// presented in any IANA zone rather than only the process-local one.
class QtTimeZone final : public TimeZone {
public:
    explicit QtTimeZone(QTimeZone zone) : zone_(std::move(zone)) {}

    [[nodiscard]] std::string id() const override;
    [[nodiscard]] ZoneOffset offset_at(Timestamp instant) const override;

private:
    QTimeZone zone_;
};

// Resolves "UTC", "local" or an IANA id ("Europe/Berlin"). An empty id
// means the process-local zone.
[[nodiscard]] Result<std::shared_ptr<const TimeZone>> resolve_time_zone(const QByteArray& id);

} // namespace nutty::api
