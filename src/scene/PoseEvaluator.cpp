#include "scene/PoseEvaluator.h"

#include <glm/gtc/matrix_transform.hpp>

#include "animation/ik/IKSolvers.h"
#include "core/Logger.h"
#include "math/Rotation.h"
#include "scene/Scene.h"

namespace rs {
namespace scene {

namespace {
glm::vec3 TailOf(const glm::mat4& m, float length)
{
    return glm::vec3(m * glm::vec4(0.0f, length, 0.0f, 1.0f));
}
}

glm::mat4 PoseEvaluator::ParentContribution(const rig::Armature& arm, const rig::Pose& pose, int boneIndex)
{
    const rig::Bone& bone = arm.GetBones()[boneIndex];
    if (bone.ParentIndex < 0) return bone.ArmatureMatrix;
    const rig::Bone& parent = arm.GetBones()[bone.ParentIndex];
    const glm::mat4& parentPose = pose.GetBones()[bone.ParentIndex]->PoseMatrix;
    return parentPose * glm::inverse(parent.ArmatureMatrix) * bone.ArmatureMatrix;
}

glm::mat4 PoseEvaluator::PoseToLocal(const rig::Armature& arm, const rig::Pose& pose, int boneIndex,
                                     const glm::mat4& poseMatrix)
{
    return glm::inverse(ParentContribution(arm, pose, boneIndex)) * poseMatrix;
}

void PoseEvaluator::EvaluateAll()
{
    m_States.clear();
    for (const auto& o : m_Scene.GetObjects())
        EvaluateObject(*o);
}

void PoseEvaluator::EvaluateObject(Object& obj)
{
    if (!obj.IsArmature() || obj.Data->IsEditing()) return;
    const int count = static_cast<int>(obj.Data->GetBones().size());
    if (static_cast<int>(obj.Pose.GetBones().size()) != count) return;
    for (int i = 0; i < count; ++i) EvaluateBone(obj, i);
}

void PoseEvaluator::EvaluateBone(Object& obj, int boneIndex)
{
    rig::PoseBone& pb = *obj.Pose.GetBones()[boneIndex];
    auto it = m_States.find(&pb);
    if (it != m_States.end()) {
        if (it->second == State::Running && m_ReportedCycles.insert(&pb).second)
            Logger::LogWarning("[PoseEvaluator] Dependency cycle through " + obj.Name + ":" + pb.Name);
        return;
    }
    m_States[&pb] = State::Running;

    const rig::Armature& arm = *obj.Data;
    const rig::Bone& bone = arm.GetBones()[boneIndex];
    if (bone.ParentIndex >= 0) EvaluateBone(obj, bone.ParentIndex);

    glm::mat4 basis = pb.MatrixBasis();
    // Connected bones cannot move away from the parent's tail.
    if (bone.Connected) basis[3] = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    pb.PoseMatrix = ParentContribution(arm, obj.Pose, boneIndex) * basis;

    for (const auto& c : pb.Constraints) {
        if (!c->Enabled) continue;
        ApplyConstraint(obj, boneIndex, *c);
    }

    m_States[&pb] = State::Done;
}

bool PoseEvaluator::ResolveTarget(const rig::TargetRef& target, glm::mat4& outWorld, float& outLength)
{
    Object* obj = target.Object;
    if (!obj) return false;
    if (target.Bone.empty()) {
        outWorld = obj->WorldMatrix;
        outLength = 0.0f;
        return true;
    }
    if (!obj->IsArmature() || obj->Data->IsEditing()) return false;
    const int index = obj->Data->FindBoneIndex(target.Bone);
    if (index < 0 || index >= static_cast<int>(obj->Pose.GetBones().size())) return false;
    EvaluateBone(*obj, index);
    outWorld = obj->WorldMatrix * obj->Pose.GetBones()[index]->PoseMatrix;
    outLength = obj->Data->GetBones()[index].Length();
    return true;
}

void PoseEvaluator::ApplyConstraint(Object& obj, int boneIndex, const rig::Constraint& c)
{
    glm::mat4 targetWorld(1.0f);
    float targetLength = 0.0f;
    if (!ResolveTarget(c.Target, targetWorld, targetLength)) return;

    rig::PoseBone& pb = *obj.Pose.GetBones()[boneIndex];
    const glm::mat4 objInv = glm::inverse(obj.WorldMatrix);
    glm::mat4 world = obj.WorldMatrix * pb.PoseMatrix;

    switch (c.Type()) {
        case rig::ConstraintType::CopyTransforms:
            world = targetWorld;
            break;
        case rig::ConstraintType::CopyLocation: {
            const float headTail = c.As<rig::CopyLocationData>()->HeadTail;
            const glm::vec3 head(targetWorld[3]);
            const glm::vec3 tail = TailOf(targetWorld, targetLength);
            world[3] = glm::vec4(head + (tail - head) * headTail, 1.0f);
            break;
        }
        case rig::ConstraintType::CopyRotation: {
            glm::vec3 t, s, tt, ts;
            glm::mat3 r, tr;
            math::DecomposeTRS(world, t, r, s);
            math::DecomposeTRS(targetWorld, tt, tr, ts);
            world = math::ComposeTRS(t, tr, s);
            break;
        }
        case rig::ConstraintType::IK: {
            const rig::IKData& ik = *c.As<rig::IKData>();
            const rig::Armature& arm = *obj.Data;
            const int parentIndex = arm.GetBones()[boneIndex].ParentIndex;
            if (ik.ChainCount < 2 || parentIndex < 0) {
                Logger::LogWarning("[PoseEvaluator] IK on " + pb.Name + " needs a two bone chain");
                return;
            }

            rig::PoseBone& parent = *obj.Pose.GetBones()[parentIndex];
            const glm::mat4 upperWorld = obj.WorldMatrix * parent.PoseMatrix;

            animation::ik::TwoBoneInputs in;
            in.rootPos = glm::vec3(upperWorld[3]);
            in.midPos = glm::vec3(world[3]);
            in.endPos = TailOf(world, arm.GetBones()[boneIndex].Length());
            in.targetPos = glm::vec3(targetWorld[3]);
            glm::mat4 poleWorld(1.0f);
            float poleLength = 0.0f;
            if (ResolveTarget(ik.PoleTarget, poleWorld, poleLength)) {
                in.hasPole = true;
                in.polePos = glm::vec3(poleWorld[3]);
                in.poleAngle = ik.PoleAngle;
            }

            animation::ik::TwoBoneResult result;
            if (!animation::ik::SolveTwoBone(in, result)) return;

            const glm::mat4 upperSolved = glm::translate(glm::mat4(1.0f), in.rootPos)
                * glm::mat4_cast(result.upperRot) * glm::translate(glm::mat4(1.0f), -in.rootPos) * upperWorld;
            parent.PoseMatrix = objInv * upperSolved;
            world = glm::translate(glm::mat4(1.0f), result.midDesired)
                * glm::mat4_cast(result.lowerRot) * glm::translate(glm::mat4(1.0f), -in.midPos) * world;
            break;
        }
    }

    pb.PoseMatrix = objInv * world;
}

} // namespace scene
} // namespace rs
