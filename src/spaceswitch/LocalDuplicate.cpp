#include "spaceswitch/LocalDuplicate.h"

#include <utility>
#include <vector>

#include "core/Logger.h"
#include "core/NameTemplate.h"

namespace rs {
namespace spaceswitch {

namespace {
std::vector<PoseBoneRef> AllPoseBones(scene::Object& obj)
{
    std::vector<PoseBoneRef> refs;
    for (const auto& pb : obj.Pose.GetBones()) refs.push_back({ &obj, pb->Name });
    return refs;
}
}

scene::Object* MakeLocalDuplicate(scene::Scene& scene,
                                  const Preferences& prefs,
                                  scene::Object& source,
                                  const FrameRange& frames,
                                  ReportList& reports)
{
    if (!source.IsArmature()) {
        reports.Error("Object " + source.Name + " is not an armature.");
        return nullptr;
    }

    // A visible source is duplicated visible. It may be hidden from an earlier run.
    source.HideViewport = false;

    // One constraint per bone, all to the same object, means an earlier duplicate exists.
    scene::Object* previous = nullptr;
    std::vector<std::pair<rig::PoseBone*, const rig::Constraint*>> sourceConstraints;
    for (auto& pb : source.Pose.GetBones()) {
        if (pb->Constraints.size() > 1) {
            reports.Error("Unable to determine existing local object because bone " + pb->Name
                          + " has more than one constraint.");
            return nullptr;
        }
        if (pb->Constraints.size() == 1) {
            const rig::Constraint& c = *pb->Constraints.front();
            if (!previous) {
                previous = c.Target.Object;
            } else if (previous != c.Target.Object) {
                reports.Error("Unable to determine existing local object because " + source.Name
                              + " is constrained to more than one target.");
                return nullptr;
            }
            sourceConstraints.emplace_back(pb.get(), &c);
        }
    }

    const std::vector<int> frameList = frames.Frames();

    if (previous) {
        // Keep the previous duplicate's motion before deleting it.
        CustomBake(scene, frameList, AllPoseBones(source), BakeChannels::All());
        Logger::Log("[LocalDuplicate] Replacing '" + previous->Name + "'");
        scene.RemoveObject(previous);
    }

    // Also when the previous duplicate was deleted by hand.
    for (auto& [pb, c] : sourceConstraints) pb->RemoveConstraint(c);

    scene::Object* dest = scene.DuplicateObject(&source);
    if (!dest || dest == &source) {
        reports.Error("Failed to duplicate source object.");
        return nullptr;
    }

    scene.MakeLocal(*dest);
    const std::string name = FormatNameTemplate(prefs.LocalArmatureObjectName,
                                                { {"object", source.Name}, {"armature", source.Data->Name} });
    scene.RenameObject(*dest, name);

    std::vector<std::pair<rig::PoseBone*, const rig::Constraint*>> destConstraints;
    for (auto& pb : dest->Pose.GetBones()) {
        rig::Constraint& c = pb->AddConstraint(rig::ConstraintType::CopyTransforms);
        c.Target = { &source, pb->Name };
        destConstraints.emplace_back(pb.get(), &c);
    }

    scene.SetActiveObject(dest);
    CustomBake(scene, frameList, AllPoseBones(*dest), BakeChannels::All());

    for (auto& [pb, c] : destConstraints) pb->RemoveConstraint(c);

    for (auto& pb : source.Pose.GetBones()) {
        rig::Constraint& c = pb->AddConstraint(rig::ConstraintType::CopyTransforms);
        c.Target = { dest, pb->Name };
    }

    // Keeps the user from selecting it by accident.
    source.HideViewport = true;
    scene.Update();

    reports.Info("Local armature " + dest->Name + " created from " + source.Name + ".");
    return dest;
}

} // namespace spaceswitch
} // namespace rs
