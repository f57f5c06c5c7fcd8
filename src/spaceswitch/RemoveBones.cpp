#include "spaceswitch/RemoveBones.h"

#include <algorithm>

#include "core/Errors.h"
#include "core/Logger.h"
#include "scene/EditSession.h"
#include "spaceswitch/TempArmature.h"

namespace rs {
namespace spaceswitch {

namespace {

template <typename T>
void PushUnique(std::vector<T>& list, const T& value)
{
    if (std::find(list.begin(), list.end(), value) == list.end()) list.push_back(value);
}

bool IsConstrainedToAny(const rig::PoseBone& pb, const PoseBoneRef& temp)
{
    for (const auto& c : pb.Constraints)
        if (c->IsConstrainedTo(temp.Owner, temp.Bone)) return true;
    return false;
}

} // namespace

PoseSelection RemoveTemporaries(scene::Scene& scene,
                                const Preferences& prefs,
                                const PoseSelection& selection,
                                bool apply,
                                const std::optional<FrameRange>& frames)
{
    if (apply && !frames)
        throw InvalidArgumentError("Applying temporary bones needs a frame range");

    const std::vector<scene::Object*> armatures = ArmatureObjects(scene);

    if (apply) {
        std::vector<PoseBoneRef> toBake;
        for (const PoseBoneRef& temp : selection.Bones) {
            for (scene::Object* obj : armatures)
                for (const auto& pb : obj->Pose.GetBones())
                    if (IsConstrainedToAny(*pb, temp)) PushUnique(toBake, PoseBoneRef{ obj, pb->Name });
        }
        if (!toBake.empty())
            CustomBake(scene, frames->Frames(), toBake, BakeChannels::All());
    }

    std::vector<PoseBoneRef> toRemove;
    PoseSelection restored;

    for (const PoseBoneRef& temp : selection.Bones) {
        const rig::Bone* bone = temp.ResolveBone();
        if (!bone) {
            Logger::LogWarning("[SpaceSwitch] Bone " + DescribeBone(temp) + " no longer exists");
            continue;
        }
        PushUnique(toRemove, temp);
        if (!bone->Parent.empty()) {
            PushUnique(toRemove, PoseBoneRef{ temp.Owner, bone->Parent });
            // Connected copies sit under two anchors.
            const rig::Bone* parent = temp.Owner->Data->FindBone(bone->Parent);
            if (parent && !parent->Parent.empty())
                PushUnique(toRemove, PoseBoneRef{ temp.Owner, parent->Parent });
        }

        for (scene::Object* obj : armatures) {
            for (auto& pb : obj->Pose.GetBones()) {
                bool wasConstrained = false;
                auto& constraints = pb->Constraints;
                for (auto it = constraints.begin(); it != constraints.end();) {
                    if ((*it)->IsConstrainedTo(temp.Owner, temp.Bone)) {
                        it = constraints.erase(it);
                        wasConstrained = true;
                    } else {
                        ++it;
                    }
                }
                if (!wasConstrained) continue;

                const PoseBoneRef src{ obj, pb->Name };
                // Hidden when the temporary bone was created.
                if (rig::Bone* srcBone = src.ResolveBone()) srcBone->Hide = false;
                PushUnique(restored.Bones, src);
                if (selection.Active && *selection.Active == temp) restored.Active = src;
            }
        }
    }

    scene::Object& container = GetOrCreateContainer(scene, prefs);

    // Removing a bone keeps its animation.
    for (const PoseBoneRef& ref : toRemove)
        if (ref.Owner == &container) RemoveBoneCurves(container, ref.Bone);

    size_t removed = 0;
    {
        scene::HierarchyEditSession session(scene, container);
        rig::Armature& arm = session.Armature();
        for (const PoseBoneRef& ref : toRemove) {
            if (ref.Owner != &container) {
                Logger::LogWarning("[SpaceSwitch] " + DescribeBone(ref) + " is not a temporary bone, not removed");
                continue;
            }
            rig::EditBone* eb = arm.FindEditBone(ref.Bone);
            if (!eb) {
                Logger::LogWarning("[SpaceSwitch] " + DescribeBone(ref) + " already removed");
                continue;
            }
            arm.RemoveEditBone(eb);
            ++removed;
        }
        session.End();
    }

    ApplyPoseSelection(scene, restored);
    scene.Update();

    Logger::Log("[SpaceSwitch] Removed " + std::to_string(removed) + " temporary bone(s)"
                + (apply ? ", applied " : ", released ") + std::to_string(restored.Bones.size()) + " source bone(s)");
    return restored;
}

} // namespace spaceswitch
} // namespace rs
