#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "math/Rotation.h"
#include "rig/Constraint.h"

namespace rs {
namespace rig {

class Armature;

// Viewport display settings of a pose bone.
struct PoseBoneDisplay {
    std::string CustomShape;            // object name, empty for none
    glm::vec3 CustomShapeTranslation{0.0f};
    glm::vec3 CustomShapeRotationEuler{0.0f};
    glm::vec3 CustomShapeScaleXYZ{1.0f};
    std::string CustomShapeTransform;   // bone name, empty for none
    bool UseCustomShapeBoneSize = true; // "Scale to Bone Length"
};

// Animated channels of one bone, relative to its rest pose.
struct PoseBone {
    std::string Name;

    glm::vec3 Location{0.0f};
    glm::quat RotationQuaternion{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 RotationEuler{0.0f};
    glm::vec4 RotationAxisAngle{0.0f, 0.0f, 1.0f, 0.0f}; // angle, x, y, z
    glm::vec3 Scale{1.0f};
    math::RotationMode RotationMode = math::RotationMode::Quaternion;

    PoseBoneDisplay Display;
    std::vector<std::unique_ptr<Constraint>> Constraints;

    // Evaluated armature space matrix, written by the pose evaluator.
    glm::mat4 PoseMatrix{1.0f};

    glm::mat3 RotationMatrix() const;
    // Channels as a matrix: T * R * S.
    glm::mat4 MatrixBasis() const;
    // Decomposes m into the channels, writing rotation in the current mode.
    void SetMatrixBasis(const glm::mat4& m);
    // Changes mode and converts the current rotation into it.
    void SetRotationMode(math::RotationMode mode);

    Constraint& AddConstraint(ConstraintType type);
    bool RemoveConstraint(const Constraint* constraint);

    // Keyable properties: location, rotation_quaternion, rotation_euler,
    // rotation_axis_angle, scale. Zero for unknown properties.
    static int ChannelSize(const std::string& property);
    bool GetChannel(const std::string& property, int index, float& out) const;
    bool SetChannel(const std::string& property, int index, float value);

    std::unique_ptr<PoseBone> Clone() const;
};

class Pose {
public:
    std::vector<std::unique_ptr<PoseBone>>& GetBones() { return m_Bones; }
    const std::vector<std::unique_ptr<PoseBone>>& GetBones() const { return m_Bones; }

    PoseBone* FindBone(const std::string& name);
    const PoseBone* FindBone(const std::string& name) const;

    // Makes the pose match the armature's bone list and order. Bones that
    // survive keep their channels and constraints.
    void Rebuild(const Armature& armature);

    std::unique_ptr<Pose> Clone() const;

private:
    std::vector<std::unique_ptr<PoseBone>> m_Bones;
};

} // namespace rig
} // namespace rs
