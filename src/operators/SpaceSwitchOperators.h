#pragma once

#include <string>

#include "operators/Operator.h"

namespace rs {
namespace operators {

// Bake the visual transform of the selected bones into their actions.
class BakePoseOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.bake_pose"; }
    const char* Label() const override { return "Bake Pose"; }
    const char* Description() const override { return "Bake visual transforms of the selected bones into keyframes"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
    void SetProperties(const json& props) override;
    json GetProperties() const override;

    spaceswitch::BakeChannels Channels{ true, true, false };
};

class AddEmptyOperator : public Operator {
public:
    const char* IdName() const override { return "rigspace.add_empty"; }
    const char* Label() const override { return "Add Empty"; }
    const char* Description() const override { return "Add a temporary bone at the 3D cursor"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
    void SetProperties(const json& props) override;
    json GetProperties() const override;

    float Length = 1.0f;
};

class DeleteBoneOperator : public Operator {
public:
    const char* IdName() const override { return "rigspace.delete_bone"; }
    const char* Label() const override { return "Delete Bone"; }
    const char* Description() const override { return "Delete temporary bones without baking the bones constrained to them"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
};

class ApplyBoneOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.apply_bone"; }
    const char* Label() const override { return "Apply Bone"; }
    const char* Description() const override { return "Bake the bones constrained to temporary bones, then delete the temporary bones"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
};

class SelectionToWorldOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.selection_to_world"; }
    const char* Label() const override { return "Switch to World"; }
    const char* Description() const override { return "Switch the selected bones to world space"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
};

class SelectionToActiveOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.selection_to_active"; }
    const char* Label() const override { return "Switch to Active"; }
    const char* Description() const override { return "Switch the selected bones to the space of the active bone"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
};

class SelectionToTargetOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.selection_to_target"; }
    const char* Label() const override { return "Switch to Target"; }
    const char* Description() const override { return "Switch the selected bones to the space of a named bone"; }

    bool Poll(const OperatorContext& ctx) const override;
    void Invoke(const OperatorContext& ctx) override;
    OperatorStatus Execute(OperatorContext& ctx) override;
    void SetProperties(const json& props) override;
    json GetProperties() const override;

    std::string Target;    // object name
    std::string Subtarget; // bone name
};

class BuildTwoBoneIKOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.build_two_bone_ik"; }
    const char* Label() const override { return "Build Two-Bone IK"; }
    const char* Description() const override { return "Bake IK and pole targets in world space and constrain the bone to them"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
    void SetProperties(const json& props) override;
    json GetProperties() const override;

    float Length = 1.0f;
    float PoleAngle = 0.0f; // radians
};

class MakeLocalArmatureOperator : public FrameRangeOperator {
public:
    const char* IdName() const override { return "rigspace.make_local_armature"; }
    const char* Label() const override { return "Make Local Armature"; }
    const char* Description() const override { return "Constrain a linked armature to an editable local duplicate"; }

    bool Poll(const OperatorContext& ctx) const override;
    OperatorStatus Execute(OperatorContext& ctx) override;
};

void RegisterSpaceSwitchingOperators(OperatorRegistry& registry);

} // namespace operators
} // namespace rs
