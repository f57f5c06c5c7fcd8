#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>

#include <glm/glm.hpp>

#include "rig/Armature.h"
#include "rig/Constraint.h"
#include "rig/Pose.h"

namespace rs {
namespace scene {

class Scene;
class Object;

// Resolves pose matrices of every armature object: parenting first, then the
// bone's constraints in order. Bones another bone depends on (its parent or a
// constraint target, in any object) are evaluated on demand.
class PoseEvaluator {
public:
    explicit PoseEvaluator(Scene& scene) : m_Scene(scene) {}

    void EvaluateAll();
    void EvaluateObject(Object& obj);

    // Armature space matrix of the bone's parent chain and rest pose, i.e.
    // its pose matrix for an identity basis. Parent pose matrices must be
    // up to date.
    static glm::mat4 ParentContribution(const rig::Armature& arm, const rig::Pose& pose, int boneIndex);
    // Basis that reproduces poseMatrix under the current parent pose.
    static glm::mat4 PoseToLocal(const rig::Armature& arm, const rig::Pose& pose, int boneIndex,
                                 const glm::mat4& poseMatrix);

private:
    enum class State { Running, Done };

    void EvaluateBone(Object& obj, int boneIndex);
    void ApplyConstraint(Object& obj, int boneIndex, const rig::Constraint& c);
    // World matrix of a constraint target. False when it cannot be resolved.
    bool ResolveTarget(const rig::TargetRef& target, glm::mat4& outWorld, float& outLength);

    Scene& m_Scene;
    std::unordered_map<const rig::PoseBone*, State> m_States;
    std::unordered_set<const rig::PoseBone*> m_ReportedCycles;
};

} // namespace scene
} // namespace rs
