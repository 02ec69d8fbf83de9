#include "parser/input_splitter.hpp"

#include <sstream>

#include "common/report_error.hpp"

namespace twreport {

namespace {

const std::string kSectionSeparator = "\n\n";
const std::string kKeyValueSeparator = ": ";

bool isBlank(const std::string &line)
{
    return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

ReportSections splitReportInput(const std::string &input)
{
    const size_t pos = input.find(kSectionSeparator);
    if (pos == std::string::npos) {
        throw ReportError(ReportErrorKind::MalformedInput,
                          "missing blank line between configuration and sessions");
    }

    ReportSections sections;
    sections.header = input.substr(0, pos);
    sections.body = input.substr(pos + kSectionSeparator.size());
    return sections;
}

ConfigMap parseConfigHeader(const std::string &header)
{
    ConfigMap config;

    std::istringstream stream(header);
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(stream, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) {
            continue;
        }

        const size_t pos = line.find(kKeyValueSeparator);
        if (pos == std::string::npos) {
            throw ReportError(ReportErrorKind::MalformedInput,
                              "configuration line " + std::to_string(lineNumber)
                                  + " has no ': ' separator: '" + line + "'");
        }

        config[line.substr(0, pos)] = line.substr(pos + kKeyValueSeparator.size());
    }

    return config;
}

} // namespace twreport
