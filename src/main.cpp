#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "api/config.hpp"
#include "api/logging.hpp"
#include "api/qt_time_zone.hpp"
#include "cli/commands.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("nutty");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    const auto cliOptions = nutty::cli::configure_parser(parser);
    parser.process(app);

    auto config = nutty::api::Config::from_environment();
    if (parser.isSet(cliOptions.debug)) {
        qputenv("NUTTY_DEBUG", "1");
        config.debug = true;
    }
    if (parser.isSet(cliOptions.zone)) {
        config.zone_id = parser.value(cliOptions.zone);
    }

    nutty::api::install_logging(config);
    qCDebug(nuttyCliLog) << "zone" << config.zone_id << "log file" << config.log_file;

    const auto zone = nutty::api::resolve_time_zone(config.zone_id.toUtf8());
    if (zone.is_err()) {
        QTextStream(stderr) << "error: " << QString::fromStdString(zone.unwrap_err().message)
                            << QLatin1Char('\n');
        return nutty::cli::EXIT_USAGE;
    }

    const nutty::cli::CommandOptions options{
        .json = parser.isSet(cliOptions.json),
        .zone = zone.unwrap(),
    };

    const auto output = nutty::cli::run_command(parser.positionalArguments(), options);
    if (!output.out.isEmpty()) {
        QTextStream(stdout) << output.out;
    }
    if (!output.err.isEmpty()) {
        QTextStream(stderr) << output.err;
    }
    return output.exit_code;
}
