#include "core/NameTemplate.h"
#include "core/Logger.h"

namespace rs {

std::string FormatNameTemplate(const std::string& pattern, const TemplateArgs& args) {
    std::string out;
    out.reserve(pattern.size() + 16);

    size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];
        if (c == '{' && i + 1 < pattern.size() && pattern[i + 1] == '{') { out += '{'; i += 2; continue; }
        if (c == '}' && i + 1 < pattern.size() && pattern[i + 1] == '}') { out += '}'; i += 2; continue; }
        if (c != '{') { out += c; ++i; continue; }

        const size_t close = pattern.find('}', i + 1);
        if (close == std::string::npos) {
            Logger::LogWarning("[NameTemplate] Unterminated field in \"" + pattern + "\"");
            out.append(pattern, i, std::string::npos);
            break;
        }

        const std::string key = pattern.substr(i + 1, close - i - 1);
        auto it = args.find(key);
        if (it != args.end()) {
            out += it->second;
        } else {
            Logger::LogWarning("[NameTemplate] Unknown field {" + key + "} in \"" + pattern + "\"");
            out.append(pattern, i, close - i + 1);
        }
        i = close + 1;
    }
    return out;
}

std::string FormatBoneName(const std::string& pattern,
                           const std::string& boneName,
                           const std::string& armatureName,
                           const std::string& objectName) {
    return FormatNameTemplate(pattern, {
        {"bone_name", boneName},
        {"armature_name", armatureName},
        {"object_name", objectName},
    });
}

} // namespace rs
