#pragma once

#include <string>
#include <vector>

#include <QTimeZone>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace twreport {

// Decode one session object. Timestamps are converted from UTC into zone.
// Throws ReportError (Decode) or nlohmann::json::exception on a shape mismatch.
Session sessionFromJson(const nlohmann::json &j, const QTimeZone &zone);

/**
 * Decode the body section, a JSON array of session objects, keeping the
 * order in which Timewarrior listed them.
 *
 * Every failure, including JSON syntax errors, is reported as a
 * ReportError of kind Decode.
 */
std::vector<Session> decodeSessions(const std::string &body, const QTimeZone &zone);

} // namespace twreport
