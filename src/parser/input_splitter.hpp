#pragma once

#include <string>

#include "common/models.hpp"

namespace twreport {

struct ReportSections {
    std::string header;
    // Everything after the first blank line; never split further.
    std::string body;
};

/**
 * Split already-trimmed report text at the first "\n\n".
 *
 * Throws ReportError (MalformedInput) when the text has no blank line.
 */
ReportSections splitReportInput(const std::string &input);

/**
 * Parse the header section into the configuration map.
 *
 * - Each non-blank line is "key: value", split on the first ": ".
 * - A later duplicate of a key replaces the earlier value.
 *
 * Throws ReportError (MalformedInput) for a line without ": ".
 */
ConfigMap parseConfigHeader(const std::string &header);

} // namespace twreport
