#include "spaceswitch/SpaceSwitch.h"

#include <algorithm>

#include "core/Errors.h"
#include "core/Logger.h"
#include "core/NameTemplate.h"
#include "scene/EditSession.h"
#include "spaceswitch/TempArmature.h"

namespace rs {
namespace spaceswitch {

namespace {

// What the builder needs from a source bone, captured before any edit session.
struct SourceInfo {
    PoseBoneRef Ref;
    float Length = 0.0f;
    bool Connected = false;
    std::string Parent;
};

std::string BoneTemplate(const std::string& pattern, const PoseBoneRef& ref)
{
    return FormatBoneName(pattern, ref.Bone, ref.Owner->Data->Name, ref.Owner->Name);
}

} // namespace

std::optional<SpaceSwitchResult> SpaceSwitch(scene::Scene& scene,
                                             const Preferences& prefs,
                                             const PoseSelection& selection,
                                             const std::optional<PoseBoneRef>& dest,
                                             const FrameRange& frames)
{
    std::vector<PoseBoneRef> sources = selection.Bones;
    if (dest)
        sources.erase(std::remove(sources.begin(), sources.end(), *dest), sources.end());

    if (sources.empty()) {
        Logger::Log("[SpaceSwitch] Nothing to switch, the only selected bone is the target space");
        return std::nullopt;
    }

    float destLength = 0.0f;
    if (dest) {
        const rig::Bone* destBone = dest->ResolveBone();
        if (!destBone) throw std::runtime_error("Target bone " + DescribeBone(*dest) + " not found");
        destLength = destBone->Length();
    }

    std::vector<SourceInfo> infos;
    infos.reserve(sources.size());
    for (const PoseBoneRef& ref : sources) {
        const rig::Bone* bone = ref.ResolveBone();
        if (!bone) throw std::runtime_error("Bone " + DescribeBone(ref) + " not found");
        SourceInfo info;
        info.Ref = ref;
        info.Length = bone->Length();
        info.Connected = bone->Connected && !bone->Parent.empty();
        info.Parent = bone->Parent;
        infos.push_back(info);
    }

    // Copies get selected instead.
    DeselectBones(selection.Bones);
    // Hidden until the copy is removed.
    for (const SourceInfo& info : infos)
        if (rig::Bone* b = info.Ref.ResolveBone()) b->Hide = true;

    scene::Object& container = GetOrCreateContainer(scene, prefs);

    std::vector<std::string> tempNames;
    {
        scene::HierarchyEditSession session(scene, container);
        rig::Armature& arm = session.Armature();

        for (const SourceInfo& info : infos) {
            rig::EditBone& copy = arm.NewEditBone(BoneTemplate(prefs.CopyName, info.Ref));
            copy.Head = glm::vec3(0.0f);
            copy.Tail = glm::vec3(0.0f, info.Length, 0.0f);
            copy.Deform = false;
            copy.Select = true;
            copy.Tag = rig::BoneTag::Copy;
            if (const rig::Bone* src = info.Ref.ResolveBone()) copy.ShowWire = src->ShowWire;
            tempNames.push_back(copy.Name);

            if (info.Connected) {
                // Always two anchors, even for world space: the outer one
                // pivots at its head on the source parent's tail, so the copy
                // can stay connected and never needs location keys.
                const PoseBoneRef parentRef{ info.Ref.Owner, info.Parent };
                rig::EditBone& outer = arm.NewEditBone(BoneTemplate(prefs.ParentName, info.Ref));
                outer.Head = glm::vec3(0.0f);
                outer.Tail = glm::vec3(0.0f, 1.0f, 0.0f);
                outer.Deform = false;
                outer.Hide = true;
                outer.Tag = rig::BoneTag::Space;

                rig::EditBone& inner = arm.NewEditBone(BoneTemplate(prefs.SpaceName, dest ? *dest : parentRef));
                inner.Head = glm::vec3(0.0f, -1.0f, 0.0f);
                inner.Tail = glm::vec3(0.0f);
                inner.Deform = false;
                inner.Hide = true;
                inner.Tag = rig::BoneTag::Space;
                inner.Parent = &outer;

                copy.Parent = &inner;
                copy.Connected = true;
            } else if (dest) {
                rig::EditBone& space = arm.NewEditBone(BoneTemplate(prefs.SpaceName, *dest));
                space.Head = glm::vec3(0.0f);
                space.Tail = glm::vec3(0.0f, destLength, 0.0f);
                space.Deform = false;
                space.Hide = true;
                space.Tag = rig::BoneTag::Space;
                copy.Parent = &space;
            }
        }
        session.End();
    }

    if (tempNames.size() != infos.size())
        throw InternalInconsistencyError("edit bones list mismatch");

    std::vector<PoseBoneRef> copies;
    std::vector<rig::Constraint*> captures;
    PoseSelection result;

    for (size_t i = 0; i < infos.size(); ++i) {
        const SourceInfo& info = infos[i];
        const PoseBoneRef copyRef{ &container, tempNames[i] };
        rig::PoseBone* copy = copyRef.Resolve();
        const rig::Bone* copyBone = copyRef.ResolveBone();
        const rig::PoseBone* src = info.Ref.Resolve();
        if (!copy || !copyBone || !src) continue;
        copies.push_back(copyRef);
        result.Bones.push_back(copyRef);

        if (info.Connected && math::IsEuler(src->RotationMode)) {
            // Euler order of the source means little in the new space.
            copy->RotationMode = math::RotationMode::Quaternion;
        } else {
            copy->RotationMode = src->RotationMode;
            copy->RotationAxisAngle = src->RotationAxisAngle;
        }

        // The source is hidden, so the copy stands in for it in the viewport.
        // Channel locks are not copied.
        copy->Display = src->Display;

        rig::Constraint& capture = copy->AddConstraint(rig::ConstraintType::CopyTransforms);
        capture.Target = { info.Ref.Owner, info.Ref.Bone };
        captures.push_back(&capture);

        if (selection.Active && *selection.Active == info.Ref) {
            container.Data->SetActiveBone(copyRef.Bone);
            result.Active = copyRef;
        }

        if (copyBone->Parent.empty()) continue;

        // Outermost anchor carries the constraints.
        PoseBoneRef anchorRef{ &container, copyBone->Parent };
        if (info.Connected) {
            const rig::Bone* inner = anchorRef.ResolveBone();
            if (!inner || inner->Parent.empty()) throw InternalInconsistencyError("connected anchor chain incomplete");
            anchorRef.Bone = inner->Parent;
        }
        rig::PoseBone* anchor = anchorRef.Resolve();
        if (!anchor) throw InternalInconsistencyError("anchor " + anchorRef.Bone + " missing");

        if (info.Connected) {
            rig::Constraint& loc = anchor->AddConstraint(rig::ConstraintType::CopyLocation);
            loc.Target = { info.Ref.Owner, info.Parent };
            loc.As<rig::CopyLocationData>()->HeadTail = 1.0f;
        } else if (dest) {
            rig::Constraint& loc = anchor->AddConstraint(rig::ConstraintType::CopyLocation);
            loc.Target = { dest->Owner, dest->Bone };
        }
        if (dest) {
            // Rotation mode of the target is not copied.
            rig::Constraint& rot = anchor->AddConstraint(rig::ConstraintType::CopyRotation);
            rot.Target = { dest->Owner, dest->Bone };
        }
    }

    CustomBake(scene, frames.Frames(), copies, BakeChannels::All());

    if (infos.size() != copies.size() || infos.size() != captures.size())
        throw InternalInconsistencyError("reverse constraints list mismatch");

    for (size_t i = 0; i < infos.size(); ++i) {
        rig::PoseBone* copy = copies[i].Resolve();
        rig::PoseBone* src = infos[i].Ref.Resolve();
        if (!copy || !src) throw InternalInconsistencyError("bone lost while baking");
        copy->RemoveConstraint(captures[i]);

        if (!infos[i].Connected) {
            rig::Constraint& loc = src->AddConstraint(rig::ConstraintType::CopyLocation);
            loc.Target = { copies[i].Owner, copies[i].Bone };
        }
        rig::Constraint& rot = src->AddConstraint(rig::ConstraintType::CopyRotation);
        rot.Target = { copies[i].Owner, copies[i].Bone };
    }

    scene.Update();

    Logger::Log("[SpaceSwitch] Switched " + std::to_string(copies.size()) + " bone(s) to "
                + (dest ? DescribeBone(*dest) + " space" : std::string("world space")));

    SpaceSwitchResult out;
    out.Copies = std::move(copies);
    out.Selection = std::move(result);
    return out;
}

} // namespace spaceswitch
} // namespace rs
