#pragma once

#include "core/Preferences.h"
#include "core/Report.h"
#include "scene/Scene.h"
#include "spaceswitch/Bake.h"

namespace rs {
namespace spaceswitch {

// Gives a linked armature an editable local twin. The source is duplicated,
// the duplicate made local and renamed by LocalArmatureObjectName, the
// source motion baked into it, and the source constrained to it and hidden.
//
// Running it again on the same source first bakes the previous duplicate's
// motion back into the source, deletes that duplicate and then proceeds as
// above, so no animation is lost.
//
// Ambiguous previous state (a bone with several constraints, or constraints
// to different objects) and a failed duplication are reported as errors and
// return nullptr.
scene::Object* MakeLocalDuplicate(scene::Scene& scene,
                                  const Preferences& prefs,
                                  scene::Object& source,
                                  const FrameRange& frames,
                                  ReportList& reports);

} // namespace spaceswitch
} // namespace rs
