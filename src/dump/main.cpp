#include <QCoreApplication>
#include <QStringList>

#include <vector>

#include "dump/ReportDump.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("TWREPORT_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    twreport::logging::initLogging(QStringLiteral("twreport-dump"), trace);
    TWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("report_dump_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               twreport::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    twreport::ReportDump dump;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return dump.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
