#include <catch2/catch_test_macros.hpp>

#include <QCommandLineParser>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "cli/commands.hpp"

using namespace nutty;

namespace {

cli::CommandOptions utc_options(bool json = false) {
    return cli::CommandOptions{
        .json = json,
        .zone = std::make_shared<FixedOffsetTimeZone>("UTC", std::chrono::seconds{0}),
    };
}

QJsonObject parse_json(const QString& out) {
    const auto doc = QJsonDocument::fromJson(out.toUtf8());
    REQUIRE(doc.isObject());
    return doc.object();
}

} // namespace

TEST_CASE("CLI: id decode describes an identifier", "[cli][id]") {
    const auto output = cli::run_command({"id", "decode", "1CNjZEV7a6mVR14vf8UtLA:jzBBXYW"}, utc_options());

    REQUIRE(output.exit_code == cli::EXIT_OK);
    REQUIRE(output.err.isEmpty());
    REQUIRE(output.out == QStringLiteral(
        "nutty_id    1CNjZEV7a6mVR14vf8UtLA:jzBBXYW\n"
        "uuid        0196934a-2c78-7e03-884f-bd7d01cb50ab\n"
        "short_code  jzBBXYW\n"
        "timestamp   2025-05-02T23:17:13.976+00:00 (UTC)\n"));
}

TEST_CASE("CLI: id decode in a fixed zone", "[cli][id]") {
    const cli::CommandOptions options{
        .json = true,
        .zone = std::make_shared<FixedOffsetTimeZone>("Asia/Kolkata",
                                                      std::chrono::hours{5} + std::chrono::minutes{30}),
    };
    const auto output = cli::run_command({"id", "decode", "1CNjZEV7a6mVR14vf8UtLA:jzBBXYW"}, options);

    REQUIRE(output.exit_code == cli::EXIT_OK);
    const auto obj = parse_json(output.out);
    REQUIRE(obj.value("timestamp").toString() == QStringLiteral("2025-05-03T04:47:13.976+05:30"));
    REQUIRE(obj.value("zone").toString() == QStringLiteral("Asia/Kolkata"));
    REQUIRE(obj.value("short_code").toString() == QStringLiteral("jzBBXYW"));
}

TEST_CASE("CLI: id decode reports checksum failures", "[cli][id]") {
    SECTION("Plain text") {
        const auto output = cli::run_command({"id", "decode", "1CNjZEV7a6mVR14vf8UtLA:jzBBXYX"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_FAILED);
        REQUIRE(output.out.isEmpty());
        REQUIRE(output.err == QStringLiteral("error: NID mismatch: expected jzBBXYW, got jzBBXYX\n"));
    }

    SECTION("JSON envelope") {
        const auto output = cli::run_command({"id", "decode", "1CNjZEV7a6mVR14vf8UtLA:jzBBXYX"}, utc_options(true));
        REQUIRE(output.exit_code == cli::EXIT_FAILED);

        const auto errors = parse_json(output.out).value("errors").toArray();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors.at(0).toObject().value("code").toString() == QStringLiteral("checksum_mismatch"));
    }
}

TEST_CASE("CLI: id from-uuid and new", "[cli][id]") {
    SECTION("from-uuid") {
        const auto output = cli::run_command({"id", "from-uuid", "0196934a-2c78-7e03-884f-bd7d01cb50ab"},
                                             utc_options(true));
        REQUIRE(output.exit_code == cli::EXIT_OK);
        REQUIRE(parse_json(output.out).value("nutty_id").toString() ==
                QStringLiteral("1CNjZEV7a6mVR14vf8UtLA:jzBBXYW"));
    }

    SECTION("from-uuid rejects malformed input") {
        const auto output = cli::run_command({"id", "from-uuid", "xyz"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_FAILED);
        REQUIRE(output.err.startsWith(QStringLiteral("error: Invalid UUID")));
    }

    SECTION("new produces a decodable identifier") {
        const auto created = cli::run_command({"id", "new"}, utc_options(true));
        REQUIRE(created.exit_code == cli::EXIT_OK);

        const auto wire = parse_json(created.out).value("nutty_id").toString();
        const auto decoded = cli::run_command({"id", "decode", wire}, utc_options(true));
        REQUIRE(decoded.exit_code == cli::EXIT_OK);
        REQUIRE(parse_json(decoded.out).value("nutty_id").toString() == wire);
    }
}

TEST_CASE("CLI: id check", "[cli][id]") {
    auto valid = cli::run_command({"id", "check", "jzBBXYW"}, utc_options());
    REQUIRE(valid.exit_code == cli::EXIT_OK);
    REQUIRE(valid.out == QStringLiteral("valid\n"));

    auto invalid = cli::run_command({"id", "check", "zzzzzzz"}, utc_options());
    REQUIRE(invalid.exit_code == cli::EXIT_FAILED);
    REQUIRE(invalid.out == QStringLiteral("invalid\n"));
}

TEST_CASE("CLI: index commands", "[cli][index]") {
    REQUIRE(cli::run_command({"index", "start"}, utc_options()).out == QStringLiteral("!\n"));
    REQUIRE(cli::run_command({"index", "end"}, utc_options()).out == QStringLiteral("~\n"));
    REQUIRE(cli::run_command({"index", "between", "!", "~"}, utc_options()).out == QStringLiteral("OP\n"));
    REQUIRE(cli::run_command({"index", "compare", "a", "b"}, utc_options()).out == QStringLiteral("-1\n"));
    REQUIRE(cli::run_command({"index", "compare", "a!", "a"}, utc_options()).out == QStringLiteral("0\n"));
    REQUIRE(cli::run_command({"index", "compare", "b", "a"}, utc_options()).out == QStringLiteral("1\n"));

    SECTION("JSON output") {
        const auto output = cli::run_command({"index", "between", "a", "b"}, utc_options(true));
        REQUIRE(parse_json(output.out).value("f_index").toString() == QStringLiteral("aP"));
    }

    SECTION("Degenerate interval") {
        const auto output = cli::run_command({"index", "between", "a", "a"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_FAILED);
        REQUIRE(output.err == QStringLiteral("error: Identical indices: a === a\n"));
    }

    SECTION("Invalid character") {
        const auto output = cli::run_command({"index", "compare", "a b", "a"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_FAILED);
        REQUIRE(output.err.startsWith(QStringLiteral("error: Invalid character")));
    }
}

TEST_CASE("CLI: base58 commands", "[cli][base58]") {
    REQUIRE(cli::run_command({"base58", "encode", "1852570767862"}, utc_options()).out ==
            QStringLiteral("qfWLRgy\n"));
    REQUIRE(cli::run_command({"base58", "encode", "0", "7"}, utc_options()).out ==
            QStringLiteral("1111111\n"));
    REQUIRE(cli::run_command({"base58", "decode", "qfWLRgy"}, utc_options()).out ==
            QStringLiteral("1852570767862\n"));

    SECTION("Values beyond 64 bits") {
        REQUIRE(cli::run_command({"base58", "encode", "340282366920938463463374607431768211455"},
                                 utc_options()).out == QStringLiteral("YcVfxkQb6JRzqk5kF2tNLv\n"));
        REQUIRE(cli::run_command({"base58", "decode", "YcVfxkQb6JRzqk5kF2tNLv"}, utc_options(true)).out
                    .contains(QStringLiteral("\"340282366920938463463374607431768211455\"")));
    }

    SECTION("Negative values fail in the codec") {
        const auto output = cli::run_command({"base58", "encode", "-5"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_FAILED);
        REQUIRE(output.err == QStringLiteral("error: Invalid input: value must be non-negative\n"));
    }

    SECTION("Non-numeric input is a usage error") {
        REQUIRE(cli::run_command({"base58", "encode", "12a"}, utc_options()).exit_code == cli::EXIT_USAGE);
        REQUIRE(cli::run_command({"base58", "encode", "12", "wide"}, utc_options()).exit_code ==
                cli::EXIT_USAGE);
    }

    SECTION("Width is capped") {
        REQUIRE(cli::run_command({"base58", "encode", "1", "1024"}, utc_options()).out.size() == 1025);
        const auto output = cli::run_command({"base58", "encode", "1", "4000000000"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_USAGE);
        REQUIRE(output.err.startsWith(QStringLiteral("error: '4000000000' is not a valid width")));
    }

    SECTION("Invalid base58 text") {
        const auto output = cli::run_command({"base58", "decode", "0OIl"}, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_FAILED);
        REQUIRE(output.err == QStringLiteral("error: Invalid character '0' in base58 string\n"));
    }
}

TEST_CASE("CLI: usage errors", "[cli]") {
    for (const auto& args : {QStringList{}, QStringList{"frobnicate"}, QStringList{"id"},
                             QStringList{"index", "between", "a"}, QStringList{"base58", "decode"}}) {
        const auto output = cli::run_command(args, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_USAGE);
        REQUIRE(output.out.isEmpty());
        REQUIRE(output.err.contains(QStringLiteral("usage: nutty")));
    }
}

TEST_CASE("CLI: parser leaves command arguments alone", "[cli]") {
    QCommandLineParser parser;
    const auto options = cli::configure_parser(parser);

    SECTION("Keys starting with '-' are positional") {
        REQUIRE(parser.parse({"nutty", "--json", "index", "between", "-a", "b"}));
        REQUIRE(parser.isSet(options.json));
        const auto args = parser.positionalArguments();
        REQUIRE(args == QStringList{"index", "between", "-a", "b"});

        const auto output = cli::run_command(args, utc_options());
        REQUIRE(output.exit_code == cli::EXIT_OK);
        REQUIRE(output.out == QStringLiteral("Gp\n"));
    }

    SECTION("Negative numbers reach the codec") {
        REQUIRE(parser.parse({"nutty", "base58", "encode", "-5"}));
        REQUIRE(parser.positionalArguments() == QStringList{"base58", "encode", "-5"});
    }

    SECTION("Options before the group still parse") {
        REQUIRE(parser.parse({"nutty", "--zone", "UTC", "id", "new"}));
        REQUIRE(parser.value(options.zone) == QStringLiteral("UTC"));
        REQUIRE(parser.positionalArguments() == QStringList{"id", "new"});
    }
}
