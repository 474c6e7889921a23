#pragma once

#include "core/result.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nutty {

/**
 * Arbitrary-precision signed integer used by the base-58 codec.
 */
using BigInt = boost::multiprecision::cpp_int;

/**
 * Timestamp - A point in time, stored as milliseconds since the Unix epoch.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as RFC 3339 in UTC, e.g. "2025-05-02T23:17:13.976Z".
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

/**
 * Offset and abbreviation of a zone at one instant.
 */
struct ZoneOffset {
    std::chrono::seconds utc_offset{0};
    std::string abbreviation;

    bool operator==(const ZoneOffset&) const = default;
};

/**
 * TimeZone - Resolves the UTC offset in effect at an instant.
 *
 * Identifier timestamps are rendered in the zone of whoever decodes them,
 * so the zone is passed in rather than read from the process environment
 * deep inside the derivation.
 */
class TimeZone {
public:
    virtual ~TimeZone() = default;

    [[nodiscard]] virtual std::string id() const = 0;
    [[nodiscard]] virtual ZoneOffset offset_at(Timestamp instant) const = 0;

    /**
     * The process-local zone (TZ / /etc/localtime as seen by localtime_r).
     */
    [[nodiscard]] static const TimeZone& local();

    [[nodiscard]] static const TimeZone& utc();
};

/**
 * The C library's view of the local zone.
 */
class LocalTimeZone final : public TimeZone {
public:
    [[nodiscard]] std::string id() const override;
    [[nodiscard]] ZoneOffset offset_at(Timestamp instant) const override;
};

/**
 * A zone with a constant offset. Used for UTC and for deterministic tests.
 */
class FixedOffsetTimeZone final : public TimeZone {
public:
    FixedOffsetTimeZone(std::string id, std::chrono::seconds offset)
        : id_(std::move(id)), offset_(offset) {}

    [[nodiscard]] std::string id() const override { return id_; }
    [[nodiscard]] ZoneOffset offset_at(Timestamp) const override {
        return ZoneOffset{offset_, id_};
    }

private:
    std::string id_;
    std::chrono::seconds offset_;
};

/**
 * ZonedTimestamp - An instant together with the offset of the zone it is
 * presented in. Two values for the same instant in different zones compare
 * equal on instant() but render different wall-clock times.
 */
class ZonedTimestamp {
public:
    ZonedTimestamp() = default;
    ZonedTimestamp(Timestamp instant, std::string zone_id, ZoneOffset offset)
        : instant_(instant), zone_id_(std::move(zone_id)), offset_(std::move(offset)) {}

    [[nodiscard]] static ZonedTimestamp in_zone(Timestamp instant, const TimeZone& zone) {
        return ZonedTimestamp(instant, zone.id(), zone.offset_at(instant));
    }

    [[nodiscard]] Timestamp instant() const noexcept { return instant_; }
    [[nodiscard]] const std::string& zone_id() const noexcept { return zone_id_; }
    [[nodiscard]] const ZoneOffset& offset() const noexcept { return offset_; }

    /**
     * Wall-clock time in this zone as RFC 3339 with a numeric offset,
     * e.g. "2025-05-03T01:17:13.976+02:00".
     */
    [[nodiscard]] std::string to_rfc3339() const;

    bool operator==(const ZonedTimestamp&) const = default;

private:
    Timestamp instant_;
    std::string zone_id_;
    ZoneOffset offset_;
};

/**
 * UUID - 128-bit identifier stored as 16 big-endian bytes.
 *
 * New identifiers are version 7: a 48-bit millisecond timestamp prefix
 * followed by version, variant and random bits, so they sort by creation
 * time.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    static constexpr int BIT_SIZE = 128;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new version 7 UUID for the current time.
     */
    [[nodiscard]] static Uuid generate_v7();

    /**
     * Generate a version 7 UUID stamped with the given time. Timestamps
     * outside [0, 2^48) are clamped to that range.
     */
    [[nodiscard]] static Uuid generate_v7(Timestamp at);

    /**
     * Parse the canonical hex form; hyphens are optional.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Build a UUID from its big-endian integer value. Fails with
     * ErrorKind::Codec when the value is negative or wider than 128 bits.
     */
    [[nodiscard]] static Res<Uuid> from_integer(const BigInt& value);

    [[nodiscard]] BigInt to_integer() const;

    /**
     * Hyphenated lowercase form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * The leading 48 bits, read as a Unix epoch in milliseconds.
     */
    [[nodiscard]] int64_t timestamp_millis() const noexcept;

    /**
     * The trailing `bits` bits (at most 64) as an unsigned value.
     */
    [[nodiscard]] uint64_t low_bits(int bits) const noexcept;

    [[nodiscard]] constexpr int version() const noexcept { return bytes_[6] >> 4; }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

} // namespace nutty

namespace std {
    template<>
    struct hash<nutty::Uuid> {
        size_t operator()(const nutty::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
