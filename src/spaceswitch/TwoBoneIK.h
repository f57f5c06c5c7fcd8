#pragma once

#include <optional>

#include "core/Preferences.h"
#include "scene/Scene.h"
#include "spaceswitch/Bake.h"
#include "spaceswitch/Selection.h"

namespace rs {
namespace spaceswitch {

struct TwoBoneIKResult {
    PoseBoneRef Target;     // follows the source tail
    PoseBoneRef PoleTarget; // follows the source head
};

// Adds "ik_target" and "ik_pole_target" to the container, bakes their
// location from the tail and head of the active bone (or the only selected
// one) over frames and puts a two bone IK constraint on that bone. The result
// is approximate. Returns std::nullopt when there is no source bone.
std::optional<TwoBoneIKResult> BuildTwoBoneIK(scene::Scene& scene,
                                              const Preferences& prefs,
                                              const PoseSelection& selection,
                                              float length,
                                              float poleAngle,
                                              const FrameRange& frames);

} // namespace spaceswitch
} // namespace rs
