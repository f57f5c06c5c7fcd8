#pragma once

#include <optional>
#include <string>
#include <vector>

#include "scene/Scene.h"

namespace rs {
namespace spaceswitch {

// A pose bone addressed by owner object and name. Bone and pose bone
// pointers do not survive an edit session, so resolve again after each one.
struct PoseBoneRef {
    scene::Object* Owner = nullptr;
    std::string Bone;

    rig::PoseBone* Resolve() const;
    rig::Bone* ResolveBone() const;

    bool operator==(const PoseBoneRef& other) const { return Owner == other.Owner && Bone == other.Bone; }
    bool operator!=(const PoseBoneRef& other) const { return !(*this == other); }
};

struct PoseSelection {
    std::vector<PoseBoneRef> Bones;
    std::optional<PoseBoneRef> Active;

    bool Empty() const { return Bones.empty(); }
    bool Contains(const PoseBoneRef& ref) const;
};

// Selected, visible bones of every object in pose mode, plus the active bone
// of the active object. Empty outside pose mode.
PoseSelection GatherPoseSelection(scene::Scene& scene);

// Selects every bone in selection and makes the active one active (object
// and bone). Does not deselect anything.
void ApplyPoseSelection(scene::Scene& scene, const PoseSelection& selection);

// Deselects every bone in the given list.
void DeselectBones(const std::vector<PoseBoneRef>& bones);

std::string DescribeBone(const PoseBoneRef& ref);

} // namespace spaceswitch
} // namespace rs
