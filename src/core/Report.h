#pragma once

#include <string>
#include <vector>

#include "core/Logger.h"

namespace rs {

struct Report {
    LogLevel Type = LogLevel::Info;
    std::string Message;
};

// User-facing messages produced while an operator runs. Every report is also
// forwarded to the Logger.
class ReportList {
public:
    void Add(LogLevel type, const std::string& message);
    void Info(const std::string& message) { Add(LogLevel::Info, message); }
    void Warning(const std::string& message) { Add(LogLevel::Warning, message); }
    void Error(const std::string& message) { Add(LogLevel::Error, message); }

    const std::vector<Report>& GetReports() const { return m_Reports; }
    bool HasErrors() const;
    void Clear() { m_Reports.clear(); }

private:
    std::vector<Report> m_Reports;
};

} // namespace rs
