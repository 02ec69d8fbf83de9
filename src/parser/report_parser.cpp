#include "parser/report_parser.hpp"

#include <cctype>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include <QByteArrayView>
#include <QStringDecoder>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "parser/input_splitter.hpp"
#include "parser/session_decoder.hpp"

namespace twreport {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

bool isValidUtf8(const std::string &text)
{
    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString decoded = decoder.decode(QByteArrayView(text.data(), text.size()));
    return !decoder.hasError();
}

// A caller that already tagged its work keeps its id; otherwise each parse
// gets a fresh one so its debug, info and warn lines can be grouped.
std::optional<logging::CorrelationScope> parseCorrelation()
{
    if (!logging::currentCorrelationId().isEmpty()) {
        return std::nullopt;
    }
    return std::make_optional<logging::CorrelationScope>(
        logging::newCorrelationId(QStringLiteral("parse")));
}

void logParseFailure(const QString &where, const ReportError &error)
{
    TWLOG_WARN(QStringLiteral("ReportParser"),
               where,
               QStringLiteral("parse_report_failed"),
               QStringLiteral("extension_input"),
               QStringLiteral("timew_report"),
               twreport::logging::defaultWho(),
               QString(),
               nlohmann::json{{"kind", toErrorKindString(error.kind())},
                              {"message", error.message()}});
}

} // namespace

TimewarriorReport parseReport(const std::string &input, const QTimeZone &zone)
{
    const auto correlation = parseCorrelation();

    TWLOG_DEBUG(QStringLiteral("ReportParser"),
                QStringLiteral("parseReport"),
                QStringLiteral("parse_report"),
                QStringLiteral("extension_input"),
                QStringLiteral("timew_report"),
                twreport::logging::defaultWho(),
                QString(),
                nlohmann::json{{"bytes", input.size()},
                               {"zone", zone.id().toStdString()}});

    try {
        const ReportSections sections = splitReportInput(input);
        ConfigMap config = parseConfigHeader(sections.header);
        std::vector<Session> sessions = decodeSessions(sections.body, zone);

        TWLOG_INFO(QStringLiteral("ReportParser"),
                   QStringLiteral("parseReport"),
                   QStringLiteral("parse_report_complete"),
                   QStringLiteral("extension_input"),
                   QStringLiteral("timew_report"),
                   twreport::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"configEntries", config.size()},
                                  {"sessions", sessions.size()}});
        return TimewarriorReport(std::move(config), std::move(sessions));
    } catch (const ReportError &error) {
        logParseFailure(QStringLiteral("parseReport"), error);
        throw;
    }
}

TimewarriorReport readReport(std::istream &in, const QTimeZone &zone)
{
    const auto correlation = parseCorrelation();

    // Lines may end in "\r\n"; both terminators are dropped before joining.
    std::string text;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        text += '\n';
        text += line;
    }

    // getline sets failbit at a clean end of input too; only badbit or a
    // failure before eof means the stream broke.
    if (in.bad() || (in.fail() && !in.eof())) {
        const ReportError error(ReportErrorKind::Io,
                                "failed to read report input after "
                                    + std::to_string(text.size()) + " bytes");
        logParseFailure(QStringLiteral("readReport"), error);
        throw error;
    }

    if (!isValidUtf8(text)) {
        const ReportError error(ReportErrorKind::Io, "report input is not valid UTF-8");
        logParseFailure(QStringLiteral("readReport"), error);
        throw error;
    }

    return parseReport(trim(text), zone);
}

TimewarriorReport readReportFromStdin(const QTimeZone &zone)
{
    return readReport(std::cin, zone);
}

} // namespace twreport
