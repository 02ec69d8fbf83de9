#include "dump/ReportDump.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "parser/report_parser.hpp"

namespace twreport {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  twreport-dump [--timezone ID] [--trace] < REPORT\n"
        "  twreport-dump --help\n"
        "\n"
        "Reads a Timewarrior extension report from standard input and prints\n"
        "its configuration and sessions. Install it in ~/.timewarrior/extensions\n"
        "to run it as `timew twreport-dump`.\n");
}

std::string formatDuration(std::chrono::seconds duration)
{
    const auto total = duration.count();
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m "
        + std::to_string(seconds) + "s";
}

std::string joinTags(const std::vector<std::string> &tags)
{
    std::string out;
    for (const auto &tag : tags) {
        if (!out.empty()) {
            out += ", ";
        }
        out += tag;
    }
    return out;
}

} // namespace

int ReportDump::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.contains(QStringLiteral("--help"))) {
        std::cout << usageText().toStdString();
        return 0;
    }

    QTimeZone zone = QTimeZone::systemTimeZone();
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--timezone")) {
            // Repeated flags are applied in order, so the last zone wins.
            if (i + 1 >= args.size() || args.at(i + 1).isEmpty()) {
                std::cerr << usageText().toStdString();
                return 1;
            }
            const QString zoneId = args.at(++i);
            zone = QTimeZone(zoneId.toUtf8());
            if (!zone.isValid()) {
                std::cerr << "Invalid time zone: " << zoneId.toStdString() << std::endl;
                return 1;
            }
            continue;
        }
        std::cerr << usageText().toStdString();
        return 1;
    }

    return dumpReport(zone);
}

int ReportDump::dumpReport(const QTimeZone &zone)
{
    const logging::CorrelationScope correlation(
        logging::newCorrelationId(QStringLiteral("dump")));

    try {
        const TimewarriorReport report = readReportFromStdin(zone);
        TWLOG_INFO(QStringLiteral("ReportDump"),
                   QStringLiteral("dumpReport"),
                   QStringLiteral("report_dump"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("stdin"),
                   twreport::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"sessions", report.sessions().size()},
                                  {"zone", zone.id().toStdString()}});
        render(report);
    } catch (const ReportError &error) {
        TWLOG_ERROR(QStringLiteral("ReportDump"),
                    QStringLiteral("dumpReport"),
                    QStringLiteral("report_dump_failed"),
                    QStringLiteral("user_invocation"),
                    QStringLiteral("stdin"),
                    twreport::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"kind", toErrorKindString(error.kind())}});
        std::cerr << error.what() << std::endl;
        return 1;
    }
    return 0;
}

void ReportDump::render(const TimewarriorReport &report) const
{
    std::cout << "# Timewarrior Report\n\n";
    std::cout << "## Configuration\n\n";

    std::vector<std::pair<std::string, std::string>> entries(report.config().begin(),
                                                             report.config().end());
    std::sort(entries.begin(), entries.end());
    if (entries.empty()) {
        std::cout << "No configuration entries.\n";
    }
    for (const auto &[key, value] : entries) {
        std::cout << "- " << key << ": " << value << "\n";
    }

    std::cout << "\n## Sessions\n\n";
    std::cout << "Total sessions: " << report.sessions().size() << "\n\n";

    for (const auto &session : report.sessions()) {
        std::cout << "- @" << session.id << " [" << toLocalDisplayString(session.start)
                  << " -> ";
        if (session.isOpen()) {
            std::cout << "open]";
        } else {
            std::cout << toLocalDisplayString(*session.end) << "] ("
                      << formatDuration(session.duration(*session.end)) << ")";
        }
        if (!session.tags.empty()) {
            std::cout << " tags: " << joinTags(session.tags);
        }
        std::cout << "\n";
        if (session.annotation.has_value()) {
            std::cout << "  - annotation: " << *session.annotation << "\n";
        }
    }
}

} // namespace twreport
