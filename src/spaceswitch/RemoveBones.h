#pragma once

#include <optional>

#include "core/Preferences.h"
#include "scene/Scene.h"
#include "spaceswitch/Bake.h"
#include "spaceswitch/Selection.h"

namespace rs {
namespace spaceswitch {

// Deletes the selected temporary bones together with their parent and
// grandparent anchors, their curves, and every constraint pointing at them.
// The formerly constrained source bones are shown and selected again; the
// source constrained to the active temporary bone becomes active.
//
// With apply set, every source bone constrained to a selected temporary bone
// is first baked over frames so it keeps its current motion. apply without
// frames throws InvalidArgumentError.
//
// Returns the restored source selection.
PoseSelection RemoveTemporaries(scene::Scene& scene,
                                const Preferences& prefs,
                                const PoseSelection& selection,
                                bool apply,
                                const std::optional<FrameRange>& frames);

} // namespace spaceswitch
} // namespace rs
