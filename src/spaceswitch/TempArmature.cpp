#include "spaceswitch/TempArmature.h"

#include <stdexcept>

#include "animation/Action.h"
#include "core/Logger.h"
#include "scene/EditSession.h"

namespace rs {
namespace spaceswitch {

scene::Object* FindContainer(scene::Scene& scene, const Preferences& prefs)
{
    scene::Object* obj = scene.FindObject(prefs.ObjectName);
    return obj && obj->IsArmature() ? obj : nullptr;
}

scene::Object& GetOrCreateContainer(scene::Scene& scene, const Preferences& prefs)
{
    if (scene::Object* existing = scene.FindObject(prefs.ObjectName)) {
        if (!existing->IsArmature())
            throw std::runtime_error("Object '" + prefs.ObjectName + "' exists but is not an armature");
        return *existing;
    }
    scene::Object& obj = scene.CreateArmatureObject(prefs.ObjectName, prefs.ArmatureName);
    obj.ShowInFront = true;
    Logger::Log("[SpaceSwitch] Created container '" + obj.Name + "'");
    return obj;
}

std::vector<scene::Object*> ArmatureObjects(scene::Scene& scene)
{
    return scene.GetArmatureObjects();
}

size_t RemoveBoneCurves(scene::Object& obj, const std::string& boneName)
{
    if (!obj.Action) return 0;
    return obj.Action->RemoveCurvesWithPrefix(animation::PoseBonePath(boneName));
}

std::vector<std::string> FindTagInvariantViolations(scene::Scene& scene, const Preferences& prefs)
{
    std::vector<std::string> violations;
    const scene::Object* container = FindContainer(scene, prefs);
    for (scene::Object* obj : scene.GetArmatureObjects()) {
        const bool isContainer = obj == container;
        for (const rig::Bone& b : obj->Data->GetBones()) {
            if (isContainer && b.Tag == rig::BoneTag::None)
                violations.push_back(obj->Name + ":" + b.Name + " is untagged inside the container");
            else if (!isContainer && b.Tag != rig::BoneTag::None)
                violations.push_back(obj->Name + ":" + b.Name + " is tagged " + rig::BoneTagName(b.Tag) + " outside the container");
        }
    }
    return violations;
}

PoseBoneRef AddEmptyBone(scene::Scene& scene, const Preferences& prefs, const PoseSelection& selection, float length)
{
    DeselectBones(selection.Bones);

    scene::Object& container = GetOrCreateContainer(scene, prefs);
    std::string name;
    {
        scene::HierarchyEditSession session(scene, container);
        rig::EditBone& eb = session.Armature().NewEditBone(prefs.EmptyName);
        eb.Head = scene.CursorLocation;
        eb.Tail = scene.CursorLocation + glm::vec3(0.0f, length, 0.0f);
        eb.Deform = false;
        eb.Select = true;
        eb.Tag = rig::BoneTag::Empty;
        name = eb.Name;
        session.End();
    }

    container.Data->SetActiveBone(name);
    Logger::Log("[SpaceSwitch] Added empty bone '" + name + "'");
    return PoseBoneRef{ &container, name };
}

} // namespace spaceswitch
} // namespace rs
