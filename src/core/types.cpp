#include "core/types.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <type_traits>

namespace nutty {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

constexpr int64_t kMaxUuidMillis = (int64_t{1} << 48) - 1;

int64_t floor_div(int64_t a, int64_t b) {
    const auto q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

// Breaks `millis` (already shifted into the target zone) into calendar
// fields and writes "YYYY-MM-DDTHH:MM:SS.mmm".
void write_wall_clock(std::ostringstream& oss, int64_t millis) {
    const auto seconds = floor_div(millis, 1000);
    const auto ms = millis - seconds * 1000;

    const auto t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// Timestamp / zones
// ============================================================================

std::string Timestamp::to_iso_string() const {
    std::ostringstream oss;
    write_wall_clock(oss, millis_);
    oss << 'Z';
    return oss.str();
}

const TimeZone& TimeZone::local() {
    static const LocalTimeZone zone;
    return zone;
}

const TimeZone& TimeZone::utc() {
    static const FixedOffsetTimeZone zone("UTC", std::chrono::seconds{0});
    return zone;
}

std::string LocalTimeZone::id() const {
    const char* tz = std::getenv("TZ");
    if (tz != nullptr && *tz != '\0') {
        return tz;
    }
    return "localtime";
}

ZoneOffset LocalTimeZone::offset_at(Timestamp instant) const {
    const auto t = static_cast<std::time_t>(floor_div(instant.millis(), 1000));
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) {
        return ZoneOffset{std::chrono::seconds{0}, "UTC"};
    }
    return ZoneOffset{
        std::chrono::seconds{tm.tm_gmtoff},
        tm.tm_zone != nullptr ? std::string(tm.tm_zone) : std::string{}
    };
}

std::string ZonedTimestamp::to_rfc3339() const {
    const auto offset_seconds = offset_.utc_offset.count();

    std::ostringstream oss;
    write_wall_clock(oss, instant_.millis() + offset_seconds * 1000);

    const auto magnitude = offset_seconds < 0 ? -offset_seconds : offset_seconds;
    oss << (offset_seconds < 0 ? '-' : '+')
        << std::setfill('0') << std::setw(2) << magnitude / 3600 << ':'
        << std::setfill('0') << std::setw(2) << (magnitude % 3600) / 60;
    return oss.str();
}

// ============================================================================
// Uuid
// ============================================================================

Uuid Uuid::generate_v7() {
    return generate_v7(Timestamp::now());
}

Uuid Uuid::generate_v7(Timestamp at) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    auto millis = at.millis();
    if (millis < 0) millis = 0;
    if (millis > kMaxUuidMillis) millis = kMaxUuidMillis;
    const auto ms = static_cast<uint64_t>(millis);

    Bytes bytes{};
    for (size_t i = 0; i < 6; ++i) {
        bytes[i] = static_cast<uint8_t>(ms >> (40 - 8 * i));
    }

    const auto rand_a = dist(gen);
    const auto rand_b = dist(gen);
    bytes[6] = static_cast<uint8_t>(rand_a >> 8);
    bytes[7] = static_cast<uint8_t>(rand_a);
    for (size_t i = 0; i < 8; ++i) {
        bytes[8 + i] = static_cast<uint8_t>(rand_b >> (56 - 8 * i));
    }

    // Version 7 (time-ordered)
    bytes[6] = (bytes[6] & 0x0F) | 0x70;
    // Variant (RFC 4122)
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    Bytes bytes{};
    size_t nibbles = 0;

    for (char c : str) {
        if (c == '-') continue;
        const int v = hex_value(c);
        if (v < 0 || nibbles >= BYTE_SIZE * 2) return std::nullopt;

        auto& byte = bytes[nibbles / 2];
        byte = static_cast<uint8_t>((nibbles % 2 == 0) ? (v << 4) : (byte | v));
        ++nibbles;
    }

    if (nibbles != BYTE_SIZE * 2) return std::nullopt;
    return Uuid(bytes);
}

Res<Uuid> Uuid::from_integer(const BigInt& value) {
    static const BigInt limit = BigInt(1) << BIT_SIZE;

    if (value < 0) {
        return Res<Uuid>::err(Error{ErrorKind::Codec, "UUID value must not be negative"});
    }
    if (value >= limit) {
        return Res<Uuid>::err(Error{ErrorKind::Codec, "UUID value does not fit in 128 bits"});
    }

    Bytes bytes{};
    BigInt rest = value;
    for (size_t i = BYTE_SIZE; i-- > 0;) {
        bytes[i] = static_cast<uint8_t>(static_cast<unsigned>(rest & 0xFF));
        rest >>= 8;
    }
    return Res<Uuid>::ok(Uuid(bytes));
}

BigInt Uuid::to_integer() const {
    BigInt value = 0;
    for (auto b : bytes_) {
        value <<= 8;
        value |= b;
    }
    return value;
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }

    return oss.str();
}

int64_t Uuid::timestamp_millis() const noexcept {
    uint64_t ms = 0;
    for (size_t i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return static_cast<int64_t>(ms);
}

uint64_t Uuid::low_bits(int bits) const noexcept {
    uint64_t tail = 0;
    for (size_t i = 8; i < BYTE_SIZE; ++i) {
        tail = (tail << 8) | bytes_[i];
    }
    if (bits >= 64) return tail;
    if (bits <= 0) return 0;
    return tail & ((uint64_t{1} << bits) - 1);
}

} // namespace nutty
