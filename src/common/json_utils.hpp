#pragma once

#include <optional>
#include <regex>
#include <string>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include <nlohmann/json.hpp>

#include "common/report_error.hpp"

namespace twreport {

// Timewarrior writes every timestamp as YYYYMMDDTHHMMSSZ in UTC.
inline constexpr const char *kTimewTimestampLayout = "YYYYMMDDTHHMMSSZ";
inline constexpr const char *kTimewTimestampPattern = R"(^(\d{8})T(\d{6})Z$)";

inline QDateTime parseTimewTimestamp(const std::string &value, const QTimeZone &zone)
{
    static const std::regex pattern(kTimewTimestampPattern);

    std::smatch match;
    if (!std::regex_match(value, match, pattern)) {
        throw ReportError(ReportErrorKind::Decode,
                          "invalid timestamp '" + value + "', expected "
                              + kTimewTimestampLayout);
    }

    const QDate date = QDate::fromString(QString::fromStdString(match[1].str()),
                                         QStringLiteral("yyyyMMdd"));
    const QTime time = QTime::fromString(QString::fromStdString(match[2].str()),
                                         QStringLiteral("HHmmss"));
    if (!date.isValid() || !time.isValid()) {
        throw ReportError(ReportErrorKind::Decode,
                          "invalid timestamp '" + value
                              + "', not a valid calendar date and time");
    }

    return QDateTime(date, time, QTimeZone::utc()).toTimeZone(zone);
}

inline std::optional<QDateTime> parseOptionalTimewTimestamp(const nlohmann::json &object,
                                                            const char *key,
                                                            const QTimeZone &zone)
{
    if (!object.contains(key)) {
        return std::nullopt;
    }
    return parseTimewTimestamp(object.at(key).get<std::string>(), zone);
}

// Local wall-clock rendering used by report output.
inline std::string toLocalDisplayString(const QDateTime &timestamp)
{
    return timestamp.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss t")).toStdString();
}

} // namespace twreport
