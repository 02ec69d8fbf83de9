#pragma once

#include <istream>
#include <string>

#include <QTimeZone>

#include "common/models.hpp"
#include "common/report_error.hpp"

namespace twreport {

/**
 * Parse a complete Timewarrior report: configuration header, blank line,
 * JSON session array.
 *
 * - input: report text with surrounding whitespace already trimmed.
 * - zone: time zone the session timestamps are converted into.
 *
 * Returns the assembled report or throws ReportError; nothing partial is
 * ever returned.
 */
TimewarriorReport parseReport(const std::string &input,
                              const QTimeZone &zone = QTimeZone::systemTimeZone());

// Read the stream to its end, join the lines with '\n', trim, then parse.
// A stream failure other than reaching the end throws ReportError (Io).
TimewarriorReport readReport(std::istream &in,
                             const QTimeZone &zone = QTimeZone::systemTimeZone());

// Convenience for extensions: the report Timewarrior pipes into stdin.
TimewarriorReport readReportFromStdin(const QTimeZone &zone = QTimeZone::systemTimeZone());

} // namespace twreport
