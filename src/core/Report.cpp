#include "core/Report.h"

#include <algorithm>

namespace rs {

void ReportList::Add(LogLevel type, const std::string& message) {
    m_Reports.push_back({type, message});
    switch (type) {
        case LogLevel::Info: Logger::Log(message); break;
        case LogLevel::Warning: Logger::LogWarning(message); break;
        case LogLevel::Error: Logger::LogError(message); break;
    }
}

bool ReportList::HasErrors() const {
    return std::any_of(m_Reports.begin(), m_Reports.end(),
                       [](const Report& r) { return r.Type == LogLevel::Error; });
}

} // namespace rs
