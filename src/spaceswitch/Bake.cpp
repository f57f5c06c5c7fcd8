#include "spaceswitch/Bake.h"

#include <optional>

#include "core/Errors.h"
#include "core/Logger.h"
#include "math/Rotation.h"
#include "scene/PoseEvaluator.h"

namespace rs {
namespace spaceswitch {

namespace {

class FrameRestore {
public:
    explicit FrameRestore(scene::Scene& scene) : m_Scene(scene), m_Frame(scene.GetFrame()) {}
    ~FrameRestore() { m_Scene.SetFrame(m_Frame); }

    FrameRestore(const FrameRestore&) = delete;
    FrameRestore& operator=(const FrameRestore&) = delete;

private:
    scene::Scene& m_Scene;
    int m_Frame;
};

} // namespace

std::vector<int> FrameRange::Frames() const
{
    std::vector<int> frames;
    if (End < Start) return frames;
    frames.reserve(static_cast<size_t>(End - Start + 1));
    for (int f = Start; f <= End; ++f) frames.push_back(f);
    return frames;
}

SampledTransforms SampleVisualTransforms(scene::Scene& scene,
                                         const std::vector<PoseBoneRef>& bones,
                                         const std::vector<int>& frames)
{
    SampledTransforms samples(bones.size());
    for (auto& s : samples) s.reserve(frames.size());

    for (int frame : frames) {
        scene.SetFrame(frame);
        for (size_t i = 0; i < bones.size(); ++i) {
            const PoseBoneRef& ref = bones[i];
            const rig::PoseBone* pb = ref.Resolve();
            const int index = ref.Owner && ref.Owner->IsArmature() ? ref.Owner->Data->FindBoneIndex(ref.Bone) : -1;
            if (!pb || index < 0) {
                samples[i].push_back(glm::mat4(1.0f));
                continue;
            }
            samples[i].push_back(scene::PoseEvaluator::PoseToLocal(*ref.Owner->Data, ref.Owner->Pose, index, pb->PoseMatrix));
        }
    }
    return samples;
}

void BakeChannelsFromSamples(scene::Scene& scene,
                             const std::vector<PoseBoneRef>& bones,
                             const std::vector<int>& frames,
                             const SampledTransforms& samples,
                             BakeChannels channels)
{
    for (size_t i = 0; i < bones.size(); ++i) {
        const PoseBoneRef& ref = bones[i];
        rig::PoseBone* pb = ref.Resolve();
        const rig::Bone* bone = ref.ResolveBone();
        if (!pb || !bone) {
            Logger::LogError("[Bake] Bone " + DescribeBone(ref) + " not found, skipped");
            continue;
        }

        std::optional<glm::quat> quatPrev;
        std::optional<glm::vec3> eulerPrev;

        for (size_t f = 0; f < frames.size(); ++f) {
            const float frame = static_cast<float>(frames[f]);
            pb->SetMatrixBasis(samples[i][f]);

            // Head of a connected bone follows the parent's tail.
            if (channels.Location && !bone->Connected)
                scene.InsertKeyframe(*ref.Owner, *pb, "location", -1, frame, pb->Name);

            if (channels.Rotation) {
                switch (pb->RotationMode) {
                    case math::RotationMode::Quaternion:
                        if (quatPrev) pb->RotationQuaternion = math::MakeCompatibleQuat(pb->RotationQuaternion, *quatPrev);
                        quatPrev = pb->RotationQuaternion;
                        scene.InsertKeyframe(*ref.Owner, *pb, "rotation_quaternion", -1, frame, pb->Name);
                        break;
                    case math::RotationMode::AxisAngle:
                        scene.InsertKeyframe(*ref.Owner, *pb, "rotation_axis_angle", -1, frame, pb->Name);
                        break;
                    default:
                        if (eulerPrev) pb->RotationEuler = math::MakeCompatibleEuler(pb->RotationEuler, *eulerPrev);
                        eulerPrev = pb->RotationEuler;
                        scene.InsertKeyframe(*ref.Owner, *pb, "rotation_euler", -1, frame, pb->Name);
                        break;
                }
            }

            if (channels.Scale)
                scene.InsertKeyframe(*ref.Owner, *pb, "scale", -1, frame, pb->Name);
        }
    }
}

void CustomBake(scene::Scene& scene,
                const std::vector<int>& frames,
                const std::vector<PoseBoneRef>& bones,
                BakeChannels channels)
{
    if (channels.Empty())
        throw InvalidArgumentError("No channels enabled");

    FrameRestore restore(scene);

    // Keys written while sampling would change the motion of later frames.
    const SampledTransforms samples = SampleVisualTransforms(scene, bones, frames);
    BakeChannelsFromSamples(scene, bones, frames, samples, channels);
}

} // namespace spaceswitch
} // namespace rs
