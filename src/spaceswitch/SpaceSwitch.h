#pragma once

#include <optional>
#include <vector>

#include "core/Preferences.h"
#include "scene/Scene.h"
#include "spaceswitch/Bake.h"
#include "spaceswitch/Selection.h"

namespace rs {
namespace spaceswitch {

struct SpaceSwitchResult {
    std::vector<PoseBoneRef> Copies; // parallel to the switched sources
    PoseSelection Selection;         // copies, with the copy of the active source active
};

// Moves the selected bones into the space of dest (world space when dest is
// empty): builds a temporary copy of each bone in the container, bakes the
// source motion into the copies over frames and constrains the sources to
// them. The sources are hidden and deselected, the copies selected.
//
// dest is dropped from the sources if present. Returns std::nullopt, with
// nothing changed, when no sources remain.
// Throws InternalInconsistencyError when the created bones and captured
// constraints do not match the sources one to one.
std::optional<SpaceSwitchResult> SpaceSwitch(scene::Scene& scene,
                                             const Preferences& prefs,
                                             const PoseSelection& selection,
                                             const std::optional<PoseBoneRef>& dest,
                                             const FrameRange& frames);

} // namespace spaceswitch
} // namespace rs
