#pragma once

#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace twreport {

inline std::string toErrorKindString(ReportErrorKind kind)
{
    switch (kind) {
    case ReportErrorKind::Io:
        return "io";
    case ReportErrorKind::Decode:
        return "decode";
    case ReportErrorKind::MalformedInput:
        return "malformed_input";
    }
    return "decode";
}

inline std::string errorKindLabel(ReportErrorKind kind)
{
    switch (kind) {
    case ReportErrorKind::Io:
        return "IO error";
    case ReportErrorKind::Decode:
        return "Decode error";
    case ReportErrorKind::MalformedInput:
        return "Malformed input";
    }
    return "Decode error";
}

// The only exception type that leaves the parsing API. what() carries the
// kind label followed by the diagnostic, message() the diagnostic alone.
class ReportError : public std::runtime_error
{
public:
    ReportError(ReportErrorKind kind, const std::string &message)
        : std::runtime_error(errorKindLabel(kind) + ": " + message)
        , m_kind(kind)
        , m_message(message)
    {
    }

    ReportErrorKind kind() const noexcept { return m_kind; }
    const std::string &message() const noexcept { return m_message; }

private:
    ReportErrorKind m_kind;
    std::string m_message;
};

} // namespace twreport
