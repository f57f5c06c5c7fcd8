#include "spaceswitch/TwoBoneIK.h"

#include <stdexcept>

#include "core/Logger.h"
#include "scene/EditSession.h"
#include "spaceswitch/TempArmature.h"

namespace rs {
namespace spaceswitch {

std::optional<TwoBoneIKResult> BuildTwoBoneIK(scene::Scene& scene,
                                              const Preferences& prefs,
                                              const PoseSelection& selection,
                                              float length,
                                              float poleAngle,
                                              const FrameRange& frames)
{
    std::optional<PoseBoneRef> source = selection.Active;
    if (!source && !selection.Bones.empty()) source = selection.Bones.front();
    if (!source || !source->ResolveBone()) {
        Logger::LogWarning("[SpaceSwitch] No bone to build IK for");
        return std::nullopt;
    }

    DeselectBones(selection.Bones);

    scene::Object& container = GetOrCreateContainer(scene, prefs);
    std::string targetName, poleName;
    {
        scene::HierarchyEditSession session(scene, container);
        rig::Armature& arm = session.Armature();

        rig::EditBone& target = arm.NewEditBone("ik_target");
        target.Head = glm::vec3(0.0f);
        target.Tail = glm::vec3(0.0f, length, 0.0f);
        target.Deform = false;
        target.Select = true;
        target.Tag = rig::BoneTag::Empty;
        targetName = target.Name;

        rig::EditBone& pole = arm.NewEditBone("ik_pole_target");
        pole.Head = glm::vec3(0.0f);
        pole.Tail = glm::vec3(0.0f, length, 0.0f);
        pole.Deform = false;
        pole.Select = true;
        pole.Tag = rig::BoneTag::Empty;
        poleName = pole.Name;

        session.End();
    }

    TwoBoneIKResult result{ PoseBoneRef{ &container, targetName }, PoseBoneRef{ &container, poleName } };
    rig::PoseBone* target = result.Target.Resolve();
    rig::PoseBone* pole = result.PoleTarget.Resolve();
    if (!target || !pole) throw std::runtime_error("IK target bones missing after edit");

    rig::Constraint& targetLoc = target->AddConstraint(rig::ConstraintType::CopyLocation);
    targetLoc.Target = { source->Owner, source->Bone };
    targetLoc.As<rig::CopyLocationData>()->HeadTail = 1.0f;

    rig::Constraint& poleLoc = pole->AddConstraint(rig::ConstraintType::CopyLocation);
    poleLoc.Target = { source->Owner, source->Bone };

    BakeChannels channels;
    channels.Location = true;
    CustomBake(scene, frames.Frames(), { result.Target, result.PoleTarget }, channels);

    target->RemoveConstraint(&targetLoc);
    pole->RemoveConstraint(&poleLoc);

    rig::PoseBone* src = source->Resolve();
    if (!src) throw std::runtime_error("Bone " + DescribeBone(*source) + " missing after edit");
    rig::Constraint& ik = src->AddConstraint(rig::ConstraintType::IK);
    ik.Target = { &container, targetName };
    rig::IKData& data = *ik.As<rig::IKData>();
    data.PoleTarget = { &container, poleName };
    data.ChainCount = 2;
    data.PoleAngle = poleAngle;

    scene.Update();
    Logger::Log("[SpaceSwitch] Built two bone IK on " + DescribeBone(*source));
    return result;
}

} // namespace spaceswitch
} // namespace rs
