#include "cli/commands.hpp"

#include "api/json_codec.hpp"
#include "api/logging.hpp"
#include "core/base58.hpp"
#include "core/fractional_index.hpp"
#include "core/nutty_id.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

namespace nutty::cli {
namespace {

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

const TimeZone& zone_of(const CommandOptions& options) {
    return options.zone ? *options.zone : TimeZone::local();
}

CommandOutput usage_error(const QString& message) {
    return CommandOutput{EXIT_USAGE, {}, QStringLiteral("error: %1\n\n%2").arg(message, usage_text())};
}

CommandOutput failure(const Error& error, const CommandOptions& options) {
    qCDebug(nuttyCliLog) << "command failed:" << qs(std::string(kind_name(error.kind)))
                         << qs(error.message);
    if (options.json) {
        const auto body = api::error_response({api::to_api_error(error)});
        return CommandOutput{EXIT_FAILED,
                             QString::fromUtf8(QJsonDocument(body).toJson(QJsonDocument::Compact)) +
                                 QLatin1Char('\n'),
                             {}};
    }
    return CommandOutput{EXIT_FAILED, {}, QStringLiteral("error: %1\n").arg(qs(error.message))};
}

CommandOutput success(const QString& text, const QJsonObject& json, const CommandOptions& options) {
    if (options.json) {
        return CommandOutput{EXIT_OK,
                             QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact)) +
                                 QLatin1Char('\n'),
                             {}};
    }
    return CommandOutput{EXIT_OK, text + QLatin1Char('\n'), {}};
}

CommandOutput describe(const NuttyId& id, const CommandOptions& options) {
    const auto& ts = id.timestamp();

    QJsonObject json;
    json["nutty_id"] = api::to_json(id);
    json["uuid"] = qs(id.uuid().to_string());
    json["short_code"] = qs(id.short_code().value());
    json["timestamp"] = qs(ts.to_rfc3339());
    json["zone"] = qs(ts.zone_id());

    const auto text = QStringLiteral("nutty_id    %1\nuuid        %2\nshort_code  %3\ntimestamp   %4 (%5)")
        .arg(qs(id.to_wire_string()), qs(id.uuid().to_string()), qs(id.short_code().value()),
             qs(ts.to_rfc3339()), qs(ts.zone_id()));
    return success(text, json, options);
}

// Decimal digits with an optional leading '-'. Checked up front because
// cpp_int's string constructor throws on anything else.
bool is_decimal(const QString& text) {
    const auto digits = text.startsWith(QLatin1Char('-')) ? text.mid(1) : text;
    return !digits.isEmpty() &&
           std::all_of(digits.begin(), digits.end(), [](QChar c) { return c.isDigit() && c.unicode() < 128; });
}

// ---------------------------------------------------------------------------

CommandOutput run_id(const QStringList& args, const CommandOptions& options) {
    const auto& zone = zone_of(options);
    const auto command = args.value(1);

    if (command == QStringLiteral("new") && args.size() == 2) {
        return describe(NuttyId::now(Timestamp::now(), zone), options);
    }

    if (command == QStringLiteral("decode") && args.size() == 3) {
        const auto result = NuttyId::from_wire_string(args[2].toStdString(), zone);
        if (result.is_err()) return failure(result.unwrap_err(), options);
        return describe(result.unwrap(), options);
    }

    if (command == QStringLiteral("from-uuid") && args.size() == 3) {
        const auto uuid = Uuid::parse(args[2].toStdString());
        if (!uuid) {
            return failure(Error{ErrorKind::MalformedIdentifier,
                                 "Invalid UUID: '" + args[2].toStdString() + "'"}, options);
        }
        const auto result = NuttyId::from_uuid(*uuid, zone);
        if (result.is_err()) return failure(result.unwrap_err(), options);
        return describe(result.unwrap(), options);
    }

    if (command == QStringLiteral("check") && args.size() == 3) {
        const bool valid = ShortCode::is_valid(args[2].toStdString());
        QJsonObject json;
        json["short_code"] = args[2];
        json["valid"] = valid;
        auto out = success(valid ? QStringLiteral("valid") : QStringLiteral("invalid"), json, options);
        out.exit_code = valid ? EXIT_OK : EXIT_FAILED;
        return out;
    }

    return usage_error(QStringLiteral("unknown or incomplete 'id' command"));
}

CommandOutput run_index(const QStringList& args, const CommandOptions& options) {
    const auto command = args.value(1);

    const auto single = [&](const FractionalIndex& index) {
        QJsonObject json;
        json["f_index"] = api::to_json(index);
        return success(qs(index.value()), json, options);
    };

    if (command == QStringLiteral("start") && args.size() == 2) {
        return single(FractionalIndex::start());
    }
    if (command == QStringLiteral("end") && args.size() == 2) {
        return single(FractionalIndex::end());
    }

    if ((command == QStringLiteral("between") || command == QStringLiteral("compare")) &&
        args.size() == 4) {
        const auto a = FractionalIndex::from_string(args[2].toStdString());
        if (a.is_err()) return failure(a.unwrap_err(), options);
        const auto b = FractionalIndex::from_string(args[3].toStdString());
        if (b.is_err()) return failure(b.unwrap_err(), options);

        if (command == QStringLiteral("compare")) {
            const int order = a.unwrap().compare(b.unwrap());
            QJsonObject json;
            json["order"] = order;
            return success(QString::number(order), json, options);
        }

        const auto mid = FractionalIndex::between(a.unwrap(), b.unwrap());
        if (mid.is_err()) return failure(mid.unwrap_err(), options);
        return single(mid.unwrap());
    }

    return usage_error(QStringLiteral("unknown or incomplete 'index' command"));
}

CommandOutput run_base58(const QStringList& args, const CommandOptions& options) {
    const auto command = args.value(1);

    if (command == QStringLiteral("encode") && (args.size() == 3 || args.size() == 4)) {
        if (!is_decimal(args[2])) {
            return usage_error(QStringLiteral("'%1' is not a decimal integer").arg(args[2]));
        }
        size_t width = 1;
        if (args.size() == 4) {
            bool ok = false;
            width = args[3].toUInt(&ok);
            if (!ok || width > MAX_ENCODE_WIDTH) {
                return usage_error(QStringLiteral("'%1' is not a valid width").arg(args[3]));
            }
        }

        const auto digits = args[2].toStdString();
        const auto encoded = base58::encode(BigInt(digits.c_str()), width);
        if (encoded.is_err()) return failure(encoded.unwrap_err(), options);

        QJsonObject json;
        json["value"] = args[2];
        json["base58"] = qs(encoded.unwrap());
        return success(qs(encoded.unwrap()), json, options);
    }

    if (command == QStringLiteral("decode") && args.size() == 3) {
        const auto decoded = base58::decode(args[2].toStdString());
        if (decoded.is_err()) return failure(decoded.unwrap_err(), options);

        // JSON numbers lose precision past 2^53, so the value travels as a string.
        const auto text = qs(decoded.unwrap().str());
        QJsonObject json;
        json["base58"] = args[2];
        json["value"] = text;
        return success(text, json, options);
    }

    return usage_error(QStringLiteral("unknown or incomplete 'base58' command"));
}

} // namespace

QString usage_text() {
    return QStringLiteral(
        "usage: nutty [--json] [--zone <id>] [--debug] <group> <command> [args]\n"
        "options go before <group>; everything after it is passed to the command\n"
        "\n"
        "  id new                      generate a fresh identifier\n"
        "  id decode <wire>            verify and describe '<22 chars>:<short code>'\n"
        "  id from-uuid <uuid>         derive the identifier of an existing UUID\n"
        "  id check <short code>       validate a bare 7-character short code\n"
        "  index start | end           the extreme order keys\n"
        "  index between <a> <b>       an order key strictly between a and b\n"
        "  index compare <a> <b>       -1, 0 or 1\n"
        "  base58 encode <int> [width] base-58 encode a decimal integer, width <= 1024\n"
        "  base58 decode <text>        decode base-58 to a decimal integer\n");
}

ParserOptions configure_parser(QCommandLineParser& parser) {
    parser.setApplicationDescription(QStringLiteral("Nutty identifiers and fractional indices"));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.addHelpOption();
    parser.addVersionOption();

    ParserOptions options{
        QCommandLineOption(QStringList{QStringLiteral("json")},
                           QStringLiteral("Output JSON instead of plain text.")),
        QCommandLineOption(QStringList{QStringLiteral("zone")},
                           QStringLiteral("Time zone used to present timestamps (overrides NUTTY_TZ)."),
                           QStringLiteral("id")),
        QCommandLineOption(QStringList{QStringLiteral("debug")},
                           QStringLiteral("Enable debug logging (also sets NUTTY_DEBUG=1).")),
    };
    parser.addOption(options.json);
    parser.addOption(options.zone);
    parser.addOption(options.debug);

    parser.addPositionalArgument(QStringLiteral("group"),
                                 QStringLiteral("Command group: id, index or base58."));
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command within the group, followed by its arguments."));
    return options;
}

CommandOutput run_command(const QStringList& args, const CommandOptions& options) {
    qCDebug(nuttyCliLog) << "run" << args;

    const auto group = args.value(0);
    if (group == QStringLiteral("id")) return run_id(args, options);
    if (group == QStringLiteral("index")) return run_index(args, options);
    if (group == QStringLiteral("base58")) return run_base58(args, options);

    if (group.isEmpty()) {
        return usage_error(QStringLiteral("missing command"));
    }
    return usage_error(QStringLiteral("unknown command group '%1'").arg(group));
}

} // namespace nutty::cli
