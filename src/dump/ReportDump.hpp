#pragma once

#include <QTimeZone>

#include "common/models.hpp"

namespace twreport {

class ReportDump
{
public:
    // Reads the report from std::cin and prints it to std::cout.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int dumpReport(const QTimeZone &zone);
    void render(const TimewarriorReport &report) const;
};

} // namespace twreport
