#include "spaceswitch/Selection.h"

#include <algorithm>

namespace rs {
namespace spaceswitch {

rig::PoseBone* PoseBoneRef::Resolve() const
{
    if (!Owner || !Owner->IsArmature()) return nullptr;
    return Owner->Pose.FindBone(Bone);
}

rig::Bone* PoseBoneRef::ResolveBone() const
{
    if (!Owner || !Owner->IsArmature()) return nullptr;
    return Owner->Data->FindBone(Bone);
}

bool PoseSelection::Contains(const PoseBoneRef& ref) const
{
    return std::find(Bones.begin(), Bones.end(), ref) != Bones.end();
}

PoseSelection GatherPoseSelection(scene::Scene& scene)
{
    PoseSelection selection;
    if (scene.GetMode() != scene::Mode::Pose) return selection;

    for (scene::Object* obj : scene.GetObjectsInMode()) {
        if (!obj->IsArmature()) continue;
        for (const rig::Bone& b : obj->Data->GetBones())
            if (b.Select && !b.Hide) selection.Bones.push_back({ obj, b.Name });
    }

    scene::Object* active = scene.GetActiveObject();
    if (active && active->IsArmature() && scene.IsInMode(active)) {
        const std::string& name = active->Data->GetActiveBone();
        if (!name.empty() && active->Data->FindBone(name)) selection.Active = PoseBoneRef{ active, name };
    }
    return selection;
}

void ApplyPoseSelection(scene::Scene& scene, const PoseSelection& selection)
{
    for (const PoseBoneRef& ref : selection.Bones)
        if (rig::Bone* b = ref.ResolveBone()) b->Select = true;

    if (selection.Active) {
        const PoseBoneRef& active = *selection.Active;
        if (active.ResolveBone()) {
            scene.SetActiveObject(active.Owner);
            active.Owner->Data->SetActiveBone(active.Bone);
        }
    }
}

void DeselectBones(const std::vector<PoseBoneRef>& bones)
{
    for (const PoseBoneRef& ref : bones)
        if (rig::Bone* b = ref.ResolveBone()) b->Select = false;
}

std::string DescribeBone(const PoseBoneRef& ref)
{
    return (ref.Owner ? ref.Owner->Name : std::string("<none>")) + ":" + ref.Bone;
}

} // namespace spaceswitch
} // namespace rs
