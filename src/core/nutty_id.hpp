#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace nutty {

/// Number of trailing UUID bits folded into a short code.
inline constexpr int SHORT_CODE_BITS = 41;

inline constexpr size_t SHORT_CODE_LENGTH = 7;

/// Largest short code: 2^41 - 1 in base 58.
inline constexpr std::string_view SHORT_CODE_MAX = "zmM9z4E";

/// Base-58 width of the full 128-bit value in the wire form.
inline constexpr size_t WIRE_UUID_LENGTH = 22;

inline constexpr char WIRE_SEPARATOR = ':';

inline constexpr size_t WIRE_LENGTH = WIRE_UUID_LENGTH + 1 + SHORT_CODE_LENGTH;

/**
 * ShortCode - The 7-character "dissociated" form of a Nutty ID.
 *
 * Derived from the low 41 bits of a UUID. Many UUIDs share a short code and
 * the rest of the UUID cannot be recovered from it, so finding the owning
 * block means asking the store. Supports comparison and validation only.
 */
class ShortCode {
public:
    /**
     * Validate and wrap a bare short code. Fails with
     * ErrorKind::MalformedIdentifier when `is_valid` is false.
     */
    [[nodiscard]] static Res<ShortCode> parse(std::string_view text);

    /**
     * Exactly 7 base-58 characters and not above "zmM9z4E", so codes that
     * could never come out of 41 bits are rejected too.
     */
    [[nodiscard]] static bool is_valid(std::string_view text) noexcept;

    [[nodiscard]] static Res<ShortCode> from_uuid(const Uuid& uuid);

    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    auto operator<=>(const ShortCode&) const = default;
    bool operator==(const ShortCode&) const = default;

private:
    explicit ShortCode(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/**
 * NuttyId - A UUIDv7 together with its short code and creation time.
 *
 * Only the UUID is authoritative; the short code and timestamp are
 * recomputed from it whenever a NuttyId is built. The timestamp is
 * presented in the zone supplied at construction (the local zone by
 * default), so the same identifier decoded on two machines can show two
 * wall-clock times for one instant.
 */
class NuttyId {
public:
    /**
     * Create an identifier from a freshly generated UUIDv7.
     */
    [[nodiscard]] static NuttyId now();

    [[nodiscard]] static NuttyId now(Timestamp at, const TimeZone& zone);

    /**
     * Derive the short code and timestamp from an existing UUID.
     */
    [[nodiscard]] static Res<NuttyId> from_uuid(const Uuid& uuid,
                                                const TimeZone& zone = TimeZone::local());

    /**
     * Parse "<22 base-58 chars>:<short code>". The short code is recomputed
     * from the decoded UUID and must match the transmitted one.
     */
    [[nodiscard]] static Res<NuttyId> from_wire_string(std::string_view text,
                                                       const TimeZone& zone = TimeZone::local());

    /**
     * Shape check for the wire form, without decoding.
     */
    [[nodiscard]] static bool is_wire_string(std::string_view text) noexcept;

    [[nodiscard]] std::string to_wire_string() const;

    [[nodiscard]] const Uuid& uuid() const noexcept { return uuid_; }
    [[nodiscard]] const ShortCode& short_code() const noexcept { return short_code_; }
    [[nodiscard]] const ZonedTimestamp& timestamp() const noexcept { return timestamp_; }

    /**
     * The same identifier with its timestamp presented in another zone.
     */
    [[nodiscard]] NuttyId in_zone(const TimeZone& zone) const;

    // Identity is the UUID; presentation zone does not matter.
    bool operator==(const NuttyId& other) const noexcept { return uuid_ == other.uuid_; }
    std::strong_ordering operator<=>(const NuttyId& other) const noexcept {
        return uuid_ <=> other.uuid_;
    }

private:
    NuttyId(Uuid uuid, ShortCode short_code, ZonedTimestamp timestamp)
        : uuid_(uuid), short_code_(std::move(short_code)), timestamp_(std::move(timestamp)) {}

    Uuid uuid_;
    ShortCode short_code_;
    ZonedTimestamp timestamp_;
};

} // namespace nutty
