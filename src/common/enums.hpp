#pragma once

namespace twreport {

enum class ReportErrorKind {
    Io,
    Decode,
    MalformedInput
};

} // namespace twreport
