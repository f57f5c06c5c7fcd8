#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace rs {

// Naming conventions for everything the space switching tools create.
// Name templates are expanded with FormatNameTemplate.
struct Preferences {
    // Object and armature holding the temporary bones
    std::string ObjectName = "SpaceSwitching";
    std::string ArmatureName = "SpaceSwitchingArmature";

    // Unconstrained temporary bone
    std::string EmptyName = "Empty";

    // {bone_name}, {armature_name}, {object_name} of the selected source bone
    std::string CopyName = "{bone_name}_Copy";
    // Same keys, filled from the source bone of a connected chain
    std::string ParentName = "{bone_name}_Parent";
    // Same keys, filled from the target space bone
    std::string SpaceName = "{bone_name}_Space";

    // {object}, {armature} of the source object
    std::string LocalArmatureObjectName = "{object}_Local";

    static bool Load(const std::filesystem::path& path, Preferences& out);
    bool Save(const std::filesystem::path& path) const;
};

void to_json(nlohmann::json& j, const Preferences& p);
void from_json(const nlohmann::json& j, Preferences& p);

} // namespace rs
