#pragma once

#include "core/types.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

#include <cstddef>
#include <memory>

namespace nutty::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILED = 1;
inline constexpr int EXIT_USAGE = 2;

// Widest padding `base58 encode` accepts.
inline constexpr size_t MAX_ENCODE_WIDTH = 1024;

struct CommandOptions {
    bool json = false;
    // Zone used to present identifier timestamps; null means local.
    std::shared_ptr<const TimeZone> zone;
};

struct CommandOutput {
    int exit_code = EXIT_OK;
    QString out;
    QString err;
};

// Runs one `nutty` command given its positional arguments, e.g.
// {"index", "between", "!", "~"}. Never touches stdout/stderr itself so it
// can be driven from tests.
[[nodiscard]] CommandOutput run_command(const QStringList& args, const CommandOptions& options);

[[nodiscard]] QString usage_text();

struct ParserOptions {
    QCommandLineOption json;
    QCommandLineOption zone;
    QCommandLineOption debug;
};

// Adds nutty's options and positional arguments to `parser`. Options are only
// recognised before the command group, so arguments such as the order key
// "-a" reach the command untouched.
ParserOptions configure_parser(QCommandLineParser& parser);

} // namespace nutty::cli
