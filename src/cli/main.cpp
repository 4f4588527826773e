#include <QCoreApplication>

#include "cli/ArchCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("archscope"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    // Trace mode is switched on by ArchCli once the configuration is known.
    archscope::logging::initLogging(QCoreApplication::applicationName(), false);
    ALOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              archscope::logging::defaultWho(),
              archscope::logging::newCorrelationId(),
              (nlohmann::json{{"argc", argc},
                              {"version", QCoreApplication::applicationVersion().toStdString()}}));

    archscope::ArchCli cli;
    return cli.run(argc, argv);
}
