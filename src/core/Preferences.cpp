#include "core/Preferences.h"
#include "core/Logger.h"

#include <fstream>

using json = nlohmann::json;

namespace rs {

void to_json(json& j, const Preferences& p) {
    j = json{
        {"objectName", p.ObjectName},
        {"armatureName", p.ArmatureName},
        {"emptyName", p.EmptyName},
        {"copyName", p.CopyName},
        {"parentName", p.ParentName},
        {"spaceName", p.SpaceName},
        {"localArmatureObjectName", p.LocalArmatureObjectName},
    };
}

void from_json(const json& j, Preferences& p) {
    const Preferences defaults;
    p.ObjectName = j.value("objectName", defaults.ObjectName);
    p.ArmatureName = j.value("armatureName", defaults.ArmatureName);
    p.EmptyName = j.value("emptyName", defaults.EmptyName);
    p.CopyName = j.value("copyName", defaults.CopyName);
    p.ParentName = j.value("parentName", defaults.ParentName);
    p.SpaceName = j.value("spaceName", defaults.SpaceName);
    p.LocalArmatureObjectName = j.value("localArmatureObjectName", defaults.LocalArmatureObjectName);
}

bool Preferences::Load(const std::filesystem::path& path, Preferences& out) {
    if (!std::filesystem::exists(path)) {
        Logger::LogError("[Preferences] File does not exist: " + path.string());
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::LogError("[Preferences] Failed to open preferences file: " + path.string());
        return false;
    }

    json j;
    try {
        file >> j;
        out = j.get<Preferences>();
    }
    catch (const json::exception& e) {
        Logger::LogError(std::string("[Preferences] JSON error: ") + e.what());
        return false;
    }

    Logger::Log("[Preferences] Loaded: " + path.string());
    return true;
}

bool Preferences::Save(const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out) {
        Logger::LogError("[Preferences] Failed to save preferences to: " + path.string());
        return false;
    }

    out << json(*this).dump(4);
    return true;
}

} // namespace rs
