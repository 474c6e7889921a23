#include "api/json_codec.hpp"

#include "api/logging.hpp"

#include <QDateTime>
#include <QJsonDocument>

namespace nutty::api {
namespace {

Error transport(const QString& message) {
    return Error{ErrorKind::Transport, message.toStdString()};
}

Error in_field(const char* field, const Error& error) {
    return Error{error.kind, std::string(field) + ": " + error.message};
}

Res<QString> string_field(const QJsonObject& obj, const char* field) {
    const auto value = obj.value(QLatin1String(field));
    if (!value.isString()) {
        return Res<QString>::err(transport(
            QStringLiteral("%1: expected a string").arg(QLatin1String(field))));
    }
    return Res<QString>::ok(value.toString());
}

std::optional<QString> optional_string(const QJsonObject& obj, const char* field) {
    const auto value = obj.value(QLatin1String(field));
    if (value.isString()) {
        return value.toString();
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

QJsonValue to_json(const NuttyId& id) {
    return QString::fromStdString(id.to_wire_string());
}

Res<NuttyId> nutty_id_from_json(const QJsonValue& value, const TimeZone& zone) {
    if (!value.isString()) {
        return Res<NuttyId>::err(transport(QStringLiteral("expected a stringified Nutty ID")));
    }
    return NuttyId::from_wire_string(value.toString().toStdString(), zone);
}

QJsonValue to_json(const FractionalIndex& index) {
    return QString::fromStdString(index.value());
}

Res<FractionalIndex> fractional_index_from_json(const QJsonValue& value) {
    if (!value.isString()) {
        return Res<FractionalIndex>::err(transport(QStringLiteral("expected an index string")));
    }
    // Every byte of a multi-byte UTF-8 sequence is >= 0x80, so non-ASCII
    // input is rejected by the range check.
    const auto bytes = value.toString().toUtf8();
    return FractionalIndex::from_string(std::string_view(bytes.constData(),
                                                         static_cast<size_t>(bytes.size())));
}

QJsonValue to_json(Timestamp timestamp) {
    return QString::fromStdString(timestamp.to_iso_string());
}

Res<Timestamp> timestamp_from_json(const QJsonValue& value) {
    if (!value.isString()) {
        return Res<Timestamp>::err(transport(QStringLiteral("expected an RFC 3339 string")));
    }
    const auto text = value.toString();
    const auto parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return Res<Timestamp>::err(transport(QStringLiteral("invalid timestamp '%1'").arg(text)));
    }
    // No "Z" or offset: Qt falls back to local time, which is not an instant.
    if (parsed.timeSpec() == Qt::LocalTime) {
        return Res<Timestamp>::err(
            transport(QStringLiteral("timestamp '%1' has no UTC offset").arg(text)));
    }
    return Res<Timestamp>::ok(Timestamp(parsed.toMSecsSinceEpoch()));
}

// ============================================================================
// Block content / content blocks
// ============================================================================

QJsonObject to_json(const blocks::BlockContent& content) {
    QJsonObject obj;
    const auto kind = blocks::get_kind(content);
    obj["kind"] = QString::fromUtf8(blocks::kind_name(kind).data(),
                                    static_cast<qsizetype>(blocks::kind_name(kind).size()));

    const auto text = QString::fromStdString(blocks::get_text(content));
    if (kind == blocks::BlockKind::Page) {
        obj["title"] = text;
    } else {
        obj["markdown"] = text;
    }
    return obj;
}

Res<blocks::BlockContent> block_content_from_json(const QJsonValue& value) {
    using R = Res<blocks::BlockContent>;

    if (!value.isObject()) {
        return R::err(transport(QStringLiteral("expected a content object")));
    }
    const auto obj = value.toObject();

    const auto kind_name = obj.value(QStringLiteral("kind")).toString().toStdString();
    const auto kind = blocks::parse_kind(kind_name);
    if (!kind) {
        return R::err(transport(QStringLiteral("unknown content kind '%1'")
                                    .arg(QString::fromStdString(kind_name))));
    }

    switch (*kind) {
        case blocks::BlockKind::Page:
            return string_field(obj, "title").map([](const QString& title) -> blocks::BlockContent {
                return blocks::Page{title.toStdString()};
            });
        case blocks::BlockKind::Heading:
            return string_field(obj, "markdown").map([](const QString& md) -> blocks::BlockContent {
                return blocks::Heading{md.toStdString()};
            });
        case blocks::BlockKind::Paragraph:
            return string_field(obj, "markdown").map([](const QString& md) -> blocks::BlockContent {
                return blocks::Paragraph{md.toStdString()};
            });
    }
    return R::err(transport(QStringLiteral("unknown content kind")));
}

QJsonObject to_json(const blocks::ContentBlock& block) {
    QJsonObject obj;
    obj["nutty_id"] = to_json(block.id);
    obj["parent_id"] = block.parent_id ? to_json(*block.parent_id) : QJsonValue(QJsonValue::Null);
    obj["f_index"] = to_json(block.f_index);
    obj["content"] = to_json(block.content);
    obj["created_at"] = to_json(block.created_at);
    obj["updated_at"] = to_json(block.updated_at);
    return obj;
}

Res<blocks::ContentBlock> content_block_from_json(const QJsonValue& value, const TimeZone& zone) {
    using R = Res<blocks::ContentBlock>;

    if (!value.isObject()) {
        return R::err(transport(QStringLiteral("expected a content block object")));
    }
    const auto obj = value.toObject();

    auto id = nutty_id_from_json(obj.value(QStringLiteral("nutty_id")), zone);
    if (id.is_err()) return R::err(in_field("nutty_id", id.unwrap_err()));

    std::optional<NuttyId> parent_id;
    const auto parent_value = obj.value(QStringLiteral("parent_id"));
    if (!parent_value.isNull() && !parent_value.isUndefined()) {
        auto parent = nutty_id_from_json(parent_value, zone);
        if (parent.is_err()) return R::err(in_field("parent_id", parent.unwrap_err()));
        parent_id = parent.unwrap();
    }

    auto f_index = fractional_index_from_json(obj.value(QStringLiteral("f_index")));
    if (f_index.is_err()) return R::err(in_field("f_index", f_index.unwrap_err()));

    auto content = block_content_from_json(obj.value(QStringLiteral("content")));
    if (content.is_err()) return R::err(in_field("content", content.unwrap_err()));

    auto created_at = timestamp_from_json(obj.value(QStringLiteral("created_at")));
    if (created_at.is_err()) return R::err(in_field("created_at", created_at.unwrap_err()));

    auto updated_at = timestamp_from_json(obj.value(QStringLiteral("updated_at")));
    if (updated_at.is_err()) return R::err(in_field("updated_at", updated_at.unwrap_err()));

    return R::ok(blocks::ContentBlock{
        .id = std::move(id).unwrap(),
        .parent_id = std::move(parent_id),
        .f_index = std::move(f_index).unwrap(),
        .content = std::move(content).unwrap(),
        .created_at = created_at.unwrap(),
        .updated_at = updated_at.unwrap()
    });
}

// ============================================================================
// Envelopes
// ============================================================================

ApiError to_api_error(const Error& error) {
    ApiError api;
    api.code = QString::fromLatin1(kind_name(error.kind).data(),
                                   static_cast<qsizetype>(kind_name(error.kind).size()));
    api.message = QString::fromStdString(error.message);
    return api;
}

QJsonObject to_json(const ApiError& error) {
    QJsonObject obj;
    if (error.code) obj["code"] = *error.code;
    obj["trace"] = QJsonArray::fromStringList(error.trace);
    if (error.message) obj["message"] = *error.message;
    if (error.summary) obj["summary"] = *error.summary;
    return obj;
}

Res<ApiError> api_error_from_json(const QJsonValue& value) {
    if (!value.isObject()) {
        return Res<ApiError>::err(transport(QStringLiteral("expected an error object")));
    }
    const auto obj = value.toObject();

    const auto trace = obj.value(QStringLiteral("trace"));
    if (!trace.isArray()) {
        return Res<ApiError>::err(transport(QStringLiteral("trace: expected an array")));
    }

    ApiError error;
    error.code = optional_string(obj, "code");
    error.message = optional_string(obj, "message");
    error.summary = optional_string(obj, "summary");
    for (const auto& line : trace.toArray()) {
        error.trace.append(line.toString());
    }
    return Res<ApiError>::ok(std::move(error));
}

QJsonObject single_response(const QJsonValue& data) {
    QJsonObject obj;
    obj["data"] = data.isUndefined() ? QJsonValue(QJsonValue::Null) : data;
    return obj;
}

QJsonObject multiple_response(const QJsonArray& data) {
    QJsonObject obj;
    obj["data"] = data;
    return obj;
}

QJsonObject error_response(const std::vector<ApiError>& errors) {
    QJsonArray list;
    for (const auto& error : errors) {
        list.append(to_json(error));
    }
    QJsonObject obj;
    obj["errors"] = list;
    return obj;
}

QByteArray encode_blocks_response(const std::vector<blocks::ContentBlock>& blocks) {
    QJsonArray data;
    for (const auto& block : blocks) {
        data.append(to_json(block));
    }
    return QJsonDocument(multiple_response(data)).toJson(QJsonDocument::Compact);
}

Res<std::vector<blocks::ContentBlock>> decode_blocks_response(const QByteArray& body,
                                                              const TimeZone& zone) {
    using R = Res<std::vector<blocks::ContentBlock>>;

    const auto doc = QJsonDocument::fromJson(body);
    if (doc.isNull() || !doc.isObject()) {
        return R::err(transport(QStringLiteral("invalid json")));
    }
    const auto root = doc.object();

    if (root.contains(QStringLiteral("errors"))) {
        const auto errors = root.value(QStringLiteral("errors")).toArray();
        if (errors.isEmpty()) {
            return R::err(transport(QStringLiteral("error response without errors")));
        }
        auto first = api_error_from_json(errors.first());
        if (first.is_err()) return R::err(in_field("errors", first.unwrap_err()));

        const auto& api = first.unwrap();
        qCDebug(nuttyApiLog) << "error response code=" << api.code.value_or(QString{})
                             << "message=" << api.message.value_or(QString{});
        return R::err(transport(api.message.value_or(api.summary.value_or(
            QStringLiteral("request failed")))));
    }

    if (!root.contains(QStringLiteral("data"))) {
        return R::err(transport(QStringLiteral("response has neither data nor errors")));
    }

    const auto data = root.value(QStringLiteral("data"));
    std::vector<blocks::ContentBlock> out;

    if (data.isNull()) {
        return R::ok(std::move(out));
    }
    if (data.isObject()) {
        auto block = content_block_from_json(data, zone);
        if (block.is_err()) return R::err(in_field("data", block.unwrap_err()));
        out.push_back(std::move(block).unwrap());
        return R::ok(std::move(out));
    }
    if (!data.isArray()) {
        return R::err(transport(QStringLiteral("data: expected an object, array or null")));
    }

    const auto items = data.toArray();
    out.reserve(static_cast<size_t>(items.size()));
    for (qsizetype i = 0; i < items.size(); ++i) {
        auto block = content_block_from_json(items.at(i), zone);
        if (block.is_err()) {
            qCWarning(nuttyApiLog) << "rejected content block at index" << i << ":"
                                   << block.unwrap_err().message.c_str();
            return R::err(in_field("data", block.unwrap_err()));
        }
        out.push_back(std::move(block).unwrap());
    }
    return R::ok(std::move(out));
}

} // namespace nutty::api
