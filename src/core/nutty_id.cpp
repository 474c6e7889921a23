#include "core/nutty_id.hpp"

#include "core/base58.hpp"

#include <algorithm>
#include <stdexcept>

namespace nutty {

namespace {

bool all_base58(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), base58::is_alphabet_char);
}

Error malformed(std::string message) {
    return Error{ErrorKind::MalformedIdentifier, std::move(message)};
}

} // namespace

// ============================================================================
// ShortCode
// ============================================================================

bool ShortCode::is_valid(std::string_view text) noexcept {
    if (text.size() != SHORT_CODE_LENGTH) return false;
    if (!all_base58(text)) return false;
    // Alphabet is in ASCII order, so for equal lengths string order is
    // numeric order.
    return text <= SHORT_CODE_MAX;
}

Res<ShortCode> ShortCode::parse(std::string_view text) {
    if (!is_valid(text)) {
        return Res<ShortCode>::err(
            malformed("Invalid Nutty ID format: '" + std::string(text) + "'"));
    }
    return Res<ShortCode>::ok(ShortCode(std::string(text)));
}

Res<ShortCode> ShortCode::from_uuid(const Uuid& uuid) {
    return base58::encode(BigInt(uuid.low_bits(SHORT_CODE_BITS)), SHORT_CODE_LENGTH)
        .map([](const std::string& code) { return ShortCode(code); });
}

// ============================================================================
// NuttyId
// ============================================================================

NuttyId NuttyId::now() {
    return now(Timestamp::now(), TimeZone::local());
}

NuttyId NuttyId::now(Timestamp at, const TimeZone& zone) {
    auto result = from_uuid(Uuid::generate_v7(at), zone);
    if (result.is_err()) {
        // 41 bits always fit in 7 base-58 digits.
        throw std::logic_error("NuttyId::from_uuid failed with a generated UUID: " +
                               result.unwrap_err().message);
    }
    return std::move(result).unwrap();
}

Res<NuttyId> NuttyId::from_uuid(const Uuid& uuid, const TimeZone& zone) {
    return ShortCode::from_uuid(uuid).map([&](const ShortCode& code) {
        const Timestamp created(uuid.timestamp_millis());
        return NuttyId(uuid, code, ZonedTimestamp::in_zone(created, zone));
    });
}

bool NuttyId::is_wire_string(std::string_view text) noexcept {
    return text.size() == WIRE_LENGTH &&
           text[WIRE_UUID_LENGTH] == WIRE_SEPARATOR &&
           all_base58(text.substr(0, WIRE_UUID_LENGTH)) &&
           all_base58(text.substr(WIRE_UUID_LENGTH + 1));
}

Res<NuttyId> NuttyId::from_wire_string(std::string_view text, const TimeZone& zone) {
    if (!is_wire_string(text)) {
        return Res<NuttyId>::err(malformed(
            "Invalid stringified Nutty ID: '" + std::string(text) +
            "' (expected 22 base58 characters, ':' and 7 base58 characters)"));
    }

    const auto uuid_part = text.substr(0, WIRE_UUID_LENGTH);
    const auto transmitted = text.substr(WIRE_UUID_LENGTH + 1);

    auto uuid = base58::decode(uuid_part).and_then(Uuid::from_integer);
    if (uuid.is_err()) {
        return Res<NuttyId>::err(Error{
            ErrorKind::Codec, "Invalid UUID encoding: " + uuid.unwrap_err().message});
    }

    auto derived = from_uuid(uuid.unwrap(), zone);
    if (derived.is_err()) {
        return Res<NuttyId>::err(Error{
            ErrorKind::Codec, "Failed to encode NID: " + derived.unwrap_err().message});
    }

    const auto& expected = derived.unwrap().short_code().value();
    if (expected != transmitted) {
        return Res<NuttyId>::err(Error{
            ErrorKind::ChecksumMismatch,
            "NID mismatch: expected " + expected + ", got " + std::string(transmitted)});
    }

    return derived;
}

std::string NuttyId::to_wire_string() const {
    auto encoded = base58::encode(uuid_.to_integer(), WIRE_UUID_LENGTH);
    if (encoded.is_err()) {
        throw std::logic_error("Failed to base-58 encode UUID: " + encoded.unwrap_err().message);
    }
    return encoded.unwrap() + WIRE_SEPARATOR + short_code_.value();
}

NuttyId NuttyId::in_zone(const TimeZone& zone) const {
    return NuttyId(uuid_, short_code_, ZonedTimestamp::in_zone(timestamp_.instant(), zone));
}

} // namespace nutty
