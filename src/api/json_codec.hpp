#pragma once

#include "core/content_block.hpp"
#include "core/fractional_index.hpp"
#include "core/nutty_id.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace nutty::api {

// JSON forms of identifiers, order keys and content blocks as carried by
// the HTTP API. Encoders cannot fail; decoders return ErrorKind::Transport
// for shape problems and pass through the domain error (checksum mismatch,
// invalid character, ...) for bad values, prefixed with the field name.

[[nodiscard]] QJsonValue to_json(const NuttyId& id);
[[nodiscard]] Res<NuttyId> nutty_id_from_json(const QJsonValue& value,
                                              const TimeZone& zone = TimeZone::local());

[[nodiscard]] QJsonValue to_json(const FractionalIndex& index);
[[nodiscard]] Res<FractionalIndex> fractional_index_from_json(const QJsonValue& value);

// RFC 3339 with milliseconds and a "Z" suffix on output. Any RFC 3339
// offset is accepted on input, but one is required; sub-millisecond digits
// are rounded.
[[nodiscard]] QJsonValue to_json(Timestamp timestamp);
[[nodiscard]] Res<Timestamp> timestamp_from_json(const QJsonValue& value);

// {"kind": "Page", "title": ...} | {"kind": "Heading" | "Paragraph", "markdown": ...}
[[nodiscard]] QJsonObject to_json(const blocks::BlockContent& content);
[[nodiscard]] Res<blocks::BlockContent> block_content_from_json(const QJsonValue& value);

// {"nutty_id", "parent_id" (string or null), "f_index", "content",
//  "created_at", "updated_at"}
[[nodiscard]] QJsonObject to_json(const blocks::ContentBlock& block);
[[nodiscard]] Res<blocks::ContentBlock> content_block_from_json(const QJsonValue& value,
                                                                const TimeZone& zone = TimeZone::local());

// ---------------------------------------------------------------------------
// Response envelopes
// ---------------------------------------------------------------------------

struct ApiError {
    std::optional<QString> code;
    QStringList trace;
    std::optional<QString> message;
    std::optional<QString> summary;

    bool operator==(const ApiError&) const = default;
};

[[nodiscard]] ApiError to_api_error(const Error& error);

[[nodiscard]] QJsonObject to_json(const ApiError& error);
[[nodiscard]] Res<ApiError> api_error_from_json(const QJsonValue& value);

// {"data": <value or null>}
[[nodiscard]] QJsonObject single_response(const QJsonValue& data);

// {"data": [...]}
[[nodiscard]] QJsonObject multiple_response(const QJsonArray& data);

// {"errors": [...]}
[[nodiscard]] QJsonObject error_response(const std::vector<ApiError>& errors);

[[nodiscard]] QByteArray encode_blocks_response(const std::vector<blocks::ContentBlock>& blocks);

// Accepts a single ({"data": {...}} or {"data": null}) or multiple
// ({"data": [...]}) response. An {"errors": [...]} body becomes a Transport
// error carrying the first error's message.
[[nodiscard]] Res<std::vector<blocks::ContentBlock>> decode_blocks_response(
    const QByteArray& body,
    const TimeZone& zone = TimeZone::local());

} // namespace nutty::api
