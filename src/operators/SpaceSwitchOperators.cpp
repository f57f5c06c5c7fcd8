#include "operators/SpaceSwitchOperators.h"

#include <limits>

#include "spaceswitch/LocalDuplicate.h"
#include "spaceswitch/RemoveBones.h"
#include "spaceswitch/SpaceSwitch.h"
#include "spaceswitch/TempArmature.h"
#include "spaceswitch/TwoBoneIK.h"

namespace rs {
namespace operators {

namespace {

bool InPoseMode(const OperatorContext& ctx)
{
    return ctx.Mode() == scene::Mode::Pose;
}

// Bones that already follow a constraint cannot get another one.
bool AllUnconstrained(const spaceswitch::PoseSelection& selection)
{
    for (const auto& ref : selection.Bones) {
        const rig::PoseBone* pb = ref.Resolve();
        if (pb && !pb->Constraints.empty()) return false;
    }
    return true;
}

bool AllTagged(const spaceswitch::PoseSelection& selection, bool copiesOnly)
{
    for (const auto& ref : selection.Bones) {
        const rig::Bone* b = ref.ResolveBone();
        if (!b) return false;
        if (copiesOnly ? b->Tag != rig::BoneTag::Copy : b->Tag == rig::BoneTag::None) return false;
    }
    return true;
}

void ReportSwitch(OperatorContext& ctx, const std::optional<spaceswitch::SpaceSwitchResult>& result)
{
    if (!result)
        ctx.Reports.Info("Nothing to switch.");
    else
        ctx.Reports.Info("Switched " + std::to_string(result->Copies.size()) + " bone(s).");
}

} // namespace

// ---------------- Bake Pose ------------------
bool BakePoseOperator::Poll(const OperatorContext& ctx) const
{
    // Needs an action to bake into.
    const scene::Object* active = ctx.Scene.GetActiveObject();
    return InPoseMode(ctx) && !ctx.Selection().Empty() && active && active->Action;
}

OperatorStatus BakePoseOperator::Execute(OperatorContext& ctx)
{
    const spaceswitch::PoseSelection selection = ctx.Selection();
    spaceswitch::CustomBake(ctx.Scene, m_Frames.Frames(), selection.Bones, Channels);
    ctx.Reports.Info("Baked " + std::to_string(selection.Bones.size()) + " bone(s).");
    return OperatorStatus::Finished;
}

void BakePoseOperator::SetProperties(const json& props)
{
    json rest = props;
    if (ReadProperty(props, "do_location", Channels.Location)) rest.erase("do_location");
    if (ReadProperty(props, "do_rotation", Channels.Rotation)) rest.erase("do_rotation");
    if (ReadProperty(props, "do_scale", Channels.Scale)) rest.erase("do_scale");
    FrameRangeOperator::SetProperties(rest);
}

json BakePoseOperator::GetProperties() const
{
    json j = FrameRangeOperator::GetProperties();
    j["do_location"] = Channels.Location;
    j["do_rotation"] = Channels.Rotation;
    j["do_scale"] = Channels.Scale;
    return j;
}

// ---------------- Add Empty ------------------
bool AddEmptyOperator::Poll(const OperatorContext& ctx) const
{
    return InPoseMode(ctx);
}

OperatorStatus AddEmptyOperator::Execute(OperatorContext& ctx)
{
    const spaceswitch::PoseBoneRef bone = spaceswitch::AddEmptyBone(ctx.Scene, ctx.Prefs, ctx.Selection(), Length);
    ctx.Reports.Info("Added " + bone.Bone + ".");
    return OperatorStatus::Finished;
}

void AddEmptyOperator::SetProperties(const json& props)
{
    json rest = props;
    if (ReadProperty(props, "length", Length, 0.0f)) rest.erase("length");
    Operator::SetProperties(rest);
}

json AddEmptyOperator::GetProperties() const
{
    return json{{"length", Length}};
}

// ---------------- Delete / Apply ------------------
bool DeleteBoneOperator::Poll(const OperatorContext& ctx) const
{
    if (!InPoseMode(ctx)) return false;
    // Only when every selected bone will be deleted.
    const spaceswitch::PoseSelection selection = ctx.Selection();
    return AllTagged(selection, false) && !selection.Empty();
}

OperatorStatus DeleteBoneOperator::Execute(OperatorContext& ctx)
{
    spaceswitch::RemoveTemporaries(ctx.Scene, ctx.Prefs, ctx.Selection(), false, std::nullopt);
    return OperatorStatus::Finished;
}

bool ApplyBoneOperator::Poll(const OperatorContext& ctx) const
{
    if (!InPoseMode(ctx)) return false;
    // Only when every selected bone will be baked.
    const spaceswitch::PoseSelection selection = ctx.Selection();
    return AllTagged(selection, true) && !selection.Empty();
}

OperatorStatus ApplyBoneOperator::Execute(OperatorContext& ctx)
{
    spaceswitch::RemoveTemporaries(ctx.Scene, ctx.Prefs, ctx.Selection(), true, m_Frames);
    return OperatorStatus::Finished;
}

// ---------------- Space switching ------------------
bool SelectionToWorldOperator::Poll(const OperatorContext& ctx) const
{
    if (!InPoseMode(ctx)) return false;
    const spaceswitch::PoseSelection selection = ctx.Selection();
    return AllUnconstrained(selection) && !selection.Bones.empty();
}

OperatorStatus SelectionToWorldOperator::Execute(OperatorContext& ctx)
{
    ReportSwitch(ctx, spaceswitch::SpaceSwitch(ctx.Scene, ctx.Prefs, ctx.Selection(), std::nullopt, m_Frames));
    return OperatorStatus::Finished;
}

bool SelectionToActiveOperator::Poll(const OperatorContext& ctx) const
{
    if (!InPoseMode(ctx)) return false;
    // The active bone is the space, so at least one other bone is needed.
    const spaceswitch::PoseSelection selection = ctx.Selection();
    return AllUnconstrained(selection) && selection.Bones.size() > 1;
}

OperatorStatus SelectionToActiveOperator::Execute(OperatorContext& ctx)
{
    const spaceswitch::PoseSelection selection = ctx.Selection();
    if (!selection.Active) {
        ctx.Reports.Error("Cannot switch because there is no active bone.");
        return OperatorStatus::Cancelled;
    }
    ReportSwitch(ctx, spaceswitch::SpaceSwitch(ctx.Scene, ctx.Prefs, selection, selection.Active, m_Frames));
    return OperatorStatus::Finished;
}

bool SelectionToTargetOperator::Poll(const OperatorContext& ctx) const
{
    if (!InPoseMode(ctx)) return false;
    const spaceswitch::PoseSelection selection = ctx.Selection();
    return AllUnconstrained(selection) && !selection.Bones.empty();
}

void SelectionToTargetOperator::Invoke(const OperatorContext& ctx)
{
    FrameRangeOperator::Invoke(ctx);
    const scene::Object* active = ctx.Scene.GetActiveObject();
    Target = active ? active->Name : std::string();
    Subtarget = active && active->Data ? active->Data->GetActiveBone() : std::string();
}

OperatorStatus SelectionToTargetOperator::Execute(OperatorContext& ctx)
{
    if (Target.empty()) {
        ctx.Reports.Error("Cannot switch because Target was not set.");
        return OperatorStatus::Cancelled;
    }
    if (Subtarget.empty()) {
        ctx.Reports.Error("Cannot switch because Bone was not set.");
        return OperatorStatus::Cancelled;
    }

    scene::Object* target = ctx.Scene.FindObject(Target);
    if (!target || !target->IsArmature()) {
        ctx.Reports.Error("Cannot switch because Target " + Target + " is not an armature.");
        return OperatorStatus::Cancelled;
    }
    if (!target->Pose.FindBone(Subtarget)) {
        ctx.Reports.Error("Cannot switch because Bone " + Subtarget + " does not exist in " + Target + ".");
        return OperatorStatus::Cancelled;
    }

    const spaceswitch::PoseBoneRef dest{ target, Subtarget };
    ReportSwitch(ctx, spaceswitch::SpaceSwitch(ctx.Scene, ctx.Prefs, ctx.Selection(), dest, m_Frames));
    return OperatorStatus::Finished;
}

void SelectionToTargetOperator::SetProperties(const json& props)
{
    json rest = props;
    if (ReadProperty(props, "target", Target)) rest.erase("target");
    if (ReadProperty(props, "subtarget", Subtarget)) rest.erase("subtarget");
    FrameRangeOperator::SetProperties(rest);
}

json SelectionToTargetOperator::GetProperties() const
{
    json j = FrameRangeOperator::GetProperties();
    j["target"] = Target;
    j["subtarget"] = Subtarget;
    return j;
}

// ---------------- Two-bone IK ------------------
bool BuildTwoBoneIKOperator::Poll(const OperatorContext& ctx) const
{
    if (!InPoseMode(ctx)) return false;
    const spaceswitch::PoseSelection selection = ctx.Selection();
    return AllUnconstrained(selection) && selection.Bones.size() == 1;
}

OperatorStatus BuildTwoBoneIKOperator::Execute(OperatorContext& ctx)
{
    auto result = spaceswitch::BuildTwoBoneIK(ctx.Scene, ctx.Prefs, ctx.Selection(), Length, PoleAngle, m_Frames);
    if (!result) {
        ctx.Reports.Error("Cannot build IK because no bone is selected.");
        return OperatorStatus::Cancelled;
    }
    ctx.Reports.Info("Built IK with targets " + result->Target.Bone + " and " + result->PoleTarget.Bone + ".");
    return OperatorStatus::Finished;
}

void BuildTwoBoneIKOperator::SetProperties(const json& props)
{
    json rest = props;
    if (ReadProperty(props, "length", Length, 0.0f)) rest.erase("length");
    // Any angle is allowed.
    if (ReadProperty(props, "pole_angle", PoleAngle, -std::numeric_limits<float>::max())) rest.erase("pole_angle");
    FrameRangeOperator::SetProperties(rest);
}

json BuildTwoBoneIKOperator::GetProperties() const
{
    json j = FrameRangeOperator::GetProperties();
    j["length"] = Length;
    j["pole_angle"] = PoleAngle;
    return j;
}

// ---------------- Make Local ------------------
bool MakeLocalArmatureOperator::Poll(const OperatorContext& ctx) const
{
    const scene::Object* active = ctx.Scene.GetActiveObject();
    return ctx.Mode() == scene::Mode::Object && active && active->IsArmature();
}

OperatorStatus MakeLocalArmatureOperator::Execute(OperatorContext& ctx)
{
    scene::Object* source = ctx.Scene.GetActiveObject();
    scene::Object* dest = spaceswitch::MakeLocalDuplicate(ctx.Scene, ctx.Prefs, *source, m_Frames, ctx.Reports);
    return dest ? OperatorStatus::Finished : OperatorStatus::Cancelled;
}

void RegisterSpaceSwitchingOperators(OperatorRegistry& registry)
{
    registry.Register<BakePoseOperator>();
    registry.Register<AddEmptyOperator>();
    registry.Register<DeleteBoneOperator>();
    registry.Register<ApplyBoneOperator>();
    registry.Register<SelectionToWorldOperator>();
    registry.Register<SelectionToActiveOperator>();
    registry.Register<SelectionToTargetOperator>();
    registry.Register<BuildTwoBoneIKOperator>();
    registry.Register<MakeLocalArmatureOperator>();
}

} // namespace operators
} // namespace rs
