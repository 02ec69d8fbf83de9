#include "parser/session_decoder.hpp"

#include <stdexcept>

#include "common/json_utils.hpp"
#include "common/report_error.hpp"

namespace twreport {

Session sessionFromJson(const nlohmann::json &j, const QTimeZone &zone)
{
    if (!j.is_object()) {
        throw ReportError(ReportErrorKind::Decode,
                          std::string("expected a session object, got ") + j.type_name());
    }

    Session session;

    // Negative and fractional ids would otherwise be cast silently by get<>().
    const auto &id = j.at("id");
    if (!id.is_number_unsigned()) {
        throw ReportError(ReportErrorKind::Decode,
                          "field 'id' must be a non-negative integer, got " + id.dump());
    }
    session.id = id.get<std::uint64_t>();

    session.start = parseTimewTimestamp(j.at("start").get<std::string>(), zone);
    session.end = parseOptionalTimewTimestamp(j, "end", zone);
    session.tags = j.at("tags").get<std::vector<std::string>>();

    if (j.contains("annotation") && !j.at("annotation").is_null()) {
        session.annotation = j.at("annotation").get<std::string>();
    }

    return session;
}

std::vector<Session> decodeSessions(const std::string &body, const QTimeZone &zone)
{
    if (!zone.isValid()) {
        throw std::invalid_argument("decodeSessions requires a valid time zone");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception &e) {
        throw ReportError(ReportErrorKind::Decode, e.what());
    }

    if (!document.is_array()) {
        throw ReportError(ReportErrorKind::Decode,
                          std::string("expected a JSON array of sessions, got ")
                              + document.type_name());
    }

    std::vector<Session> sessions;
    sessions.reserve(document.size());
    for (size_t index = 0; index < document.size(); ++index) {
        const std::string where = "session at index " + std::to_string(index) + ": ";
        try {
            sessions.push_back(sessionFromJson(document.at(index), zone));
        } catch (const nlohmann::json::exception &e) {
            throw ReportError(ReportErrorKind::Decode, where + e.what());
        } catch (const ReportError &e) {
            throw ReportError(e.kind(), where + e.message());
        }
    }

    return sessions;
}

} // namespace twreport
