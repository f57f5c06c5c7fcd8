#pragma once

#include <memory>
#include <string>

#include <glm/glm.hpp>

#include "animation/Action.h"
#include "rig/Armature.h"
#include "rig/Pose.h"

namespace rs {
namespace scene {

enum class ObjectType { Armature, Empty };

const char* ObjectTypeName(ObjectType type);
bool ParseObjectType(const std::string& name, ObjectType& out);

class Object {
public:
    Object() = default;
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    std::string Name = "Object";
    ObjectType Type = ObjectType::Empty;

    std::shared_ptr<rig::Armature> Data; // armature objects only
    rig::Pose Pose;
    std::shared_ptr<animation::Action> Action; // optional

    glm::mat4 WorldMatrix{1.0f};

    bool Select = false;
    bool HideViewport = false;
    bool ShowInFront = false;
    bool IsLinked = false; // data comes from a library and cannot be edited

    bool IsArmature() const { return Type == ObjectType::Armature && Data != nullptr; }
};

} // namespace scene
} // namespace rs
