#pragma once

#include <string>
#include <vector>

#include "core/Preferences.h"
#include "scene/Scene.h"
#include "spaceswitch/Selection.h"

namespace rs {
namespace spaceswitch {

// The armature object holding every temporary bone, created on first use and
// never deleted. Throws std::runtime_error when an object of that name exists
// but is not an armature.
scene::Object& GetOrCreateContainer(scene::Scene& scene, const Preferences& prefs);
scene::Object* FindContainer(scene::Scene& scene, const Preferences& prefs);

// Every armature object, including ones sharing armature data.
std::vector<scene::Object*> ArmatureObjects(scene::Scene& scene);

// Removing a bone keeps its animation, so callers drop its curves themselves.
size_t RemoveBoneCurves(scene::Object& obj, const std::string& boneName);

// Bones breaking the tagging rule: untagged bones in the container or tagged
// bones anywhere else. Empty when consistent.
std::vector<std::string> FindTagInvariantViolations(scene::Scene& scene, const Preferences& prefs);

// Adds an unconstrained temporary bone at the 3D cursor pointing along +Y,
// selected and active. Returns the new bone.
PoseBoneRef AddEmptyBone(scene::Scene& scene, const Preferences& prefs, const PoseSelection& selection, float length);

} // namespace spaceswitch
} // namespace rs
