#pragma once

#include <vector>

#include <glm/glm.hpp>

#include "scene/Scene.h"
#include "spaceswitch/Selection.h"

namespace rs {
namespace spaceswitch {

// Inclusive frame span.
struct FrameRange {
    int Start = 1;
    int End = 250;

    std::vector<int> Frames() const;
};

struct BakeChannels {
    bool Location = false;
    bool Rotation = false;
    bool Scale = false;

    bool Empty() const { return !Location && !Rotation && !Scale; }
    static BakeChannels All() { return { true, true, true }; }
};

// [bone][frame] -> local basis reproducing the evaluated pose.
using SampledTransforms = std::vector<std::vector<glm::mat4>>;

// Steps through frames, fully evaluating the scene at each one, and records
// each bone's basis. No keys are written. The current frame is changed and
// not restored.
SampledTransforms SampleVisualTransforms(scene::Scene& scene,
                                         const std::vector<PoseBoneRef>& bones,
                                         const std::vector<int>& frames);

// Keys the sampled transforms into each bone's action, grouped by bone name.
// Connected bones never get location keys. Quaternion and Euler rotations are
// kept continuous from frame to frame.
void BakeChannelsFromSamples(scene::Scene& scene,
                             const std::vector<PoseBoneRef>& bones,
                             const std::vector<int>& frames,
                             const SampledTransforms& samples,
                             BakeChannels channels);

// Bakes the visual (parented and constrained) motion of bones over frames
// into keyframes. Throws InvalidArgumentError when no channel is requested.
// The current frame is restored afterwards, also on error.
void CustomBake(scene::Scene& scene,
                const std::vector<int>& frames,
                const std::vector<PoseBoneRef>& bones,
                BakeChannels channels);

} // namespace spaceswitch
} // namespace rs
