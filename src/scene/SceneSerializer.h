#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "scene/Scene.h"

namespace rs {
namespace scene {

using json = nlohmann::json;

// JSON scene files: frame settings, 3D cursor, mode, objects with their
// armature, pose channels, constraints and action. Constraint targets are
// stored by object name.
class SceneSerializer {
public:
    static json Serialize(const Scene& scene);
    // Populates an empty scene. Returns false on malformed data.
    static bool Deserialize(const json& data, Scene& scene);
    static bool SaveToFile(const Scene& scene, const std::string& filepath);
    static bool LoadFromFile(const std::string& filepath, Scene& scene);

    static json SerializeArmature(const rig::Armature& armature);
    static void DeserializeArmature(const json& data, rig::Armature& armature);

    static json SerializePoseBone(const rig::PoseBone& pchan);
    static void DeserializePoseBone(const json& data, rig::PoseBone& pchan);

    static json SerializeConstraint(const rig::Constraint& constraint);
    // Target objects are looked up in scene, so every object must exist first.
    static bool DeserializeConstraint(const json& data, Scene& scene, rig::Constraint& constraint);

    static json SerializeAction(const animation::Action& action);
    static void DeserializeAction(const json& data, animation::Action& action);

private:
    static json SerializeVec3(const glm::vec3& v);
    static glm::vec3 DeserializeVec3(const json& data, const glm::vec3& fallback);
    static json SerializeVec4(const glm::vec4& v);
    static glm::vec4 DeserializeVec4(const json& data, const glm::vec4& fallback);
    static json SerializeMat4(const glm::mat4& m);
    static glm::mat4 DeserializeMat4(const json& data);
};

} // namespace scene
} // namespace rs
