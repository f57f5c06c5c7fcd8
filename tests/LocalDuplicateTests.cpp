#include <gtest/gtest.h>

#include "operators/SpaceSwitchOperators.h"
#include "spaceswitch/LocalDuplicate.h"
#include "TestScenes.h"

using namespace rs;

namespace {

const spaceswitch::FrameRange kFrames{ 1, 10 };

class LocalDuplicateTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        source = &test::MakeRig(scene);
        test::AnimateZ90(scene, *source, "Arm");
        source->IsLinked = true;
        source->Select = true;
        scene.SetActiveObject(source);

        for (int f : kFrames.Frames()) {
            scene.SetFrame(f);
            before.push_back(test::WorldPose(*source, "Forearm"));
        }
        scene.SetFrame(1);
    }

    void ExpectMotionPreserved()
    {
        for (size_t i = 0; i < before.size(); ++i) {
            scene.SetFrame(kFrames.Start + static_cast<int>(i));
            EXPECT_TRUE(test::Near(test::WorldPose(*source, "Forearm"), before[i], 1e-3f)) << "frame " << kFrames.Start + i;
        }
    }

    size_t ArmatureCount() { return scene.GetArmatureObjects().size(); }

    scene::Scene scene;
    Preferences prefs;
    ReportList reports;
    scene::Object* source = nullptr;
    std::vector<glm::mat4> before;
};

} // namespace

TEST_F(LocalDuplicateTest, ConstrainsSourceToEditableCopy)
{
    scene::Object* dest = spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports);
    ASSERT_NE(dest, nullptr);
    EXPECT_FALSE(reports.HasErrors());

    EXPECT_EQ(dest->Name, "Rig_Local");
    EXPECT_FALSE(dest->IsLinked);
    EXPECT_FALSE(dest->HideViewport);
    EXPECT_TRUE(source->HideViewport);
    EXPECT_NE(dest->Data, source->Data);
    EXPECT_EQ(scene.GetActiveObject(), dest);

    for (const auto& pb : source->Pose.GetBones()) {
        ASSERT_EQ(pb->Constraints.size(), 1u) << pb->Name;
        EXPECT_EQ(pb->Constraints[0]->Type(), rig::ConstraintType::CopyTransforms);
        EXPECT_TRUE(pb->Constraints[0]->IsConstrainedTo(dest, pb->Name));
    }
    for (const auto& pb : dest->Pose.GetBones())
        EXPECT_TRUE(pb->Constraints.empty()) << pb->Name;

    EXPECT_EQ(test::CountKeyedCurves(*dest, "Root", "location"), 3u);
    ExpectMotionPreserved();
}

TEST_F(LocalDuplicateTest, SecondRunReplacesTheFirstDuplicate)
{
    scene::Object* first = spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports);
    ASSERT_NE(first, nullptr);
    ASSERT_EQ(ArmatureCount(), 2u);

    scene::Object* second = spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(ArmatureCount(), 2u);
    EXPECT_EQ(second->Name, "Rig_Local");
    EXPECT_FALSE(reports.HasErrors());

    for (const auto& pb : source->Pose.GetBones()) {
        ASSERT_EQ(pb->Constraints.size(), 1u);
        EXPECT_TRUE(pb->Constraints[0]->IsConstrainedTo(second, pb->Name));
    }
    ExpectMotionPreserved();
}

TEST_F(LocalDuplicateTest, RecoversWhenDuplicateWasDeletedByHand)
{
    scene::Object* first = spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports);
    ASSERT_NE(first, nullptr);
    scene.RemoveObject(first);

    scene::Object* second = spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(ArmatureCount(), 2u);
    for (const auto& pb : source->Pose.GetBones())
        EXPECT_EQ(pb->Constraints.size(), 1u);
}

TEST_F(LocalDuplicateTest, RefusesBonesWithSeveralConstraints)
{
    rig::PoseBone& arm = *source->Pose.FindBone("Arm");
    arm.AddConstraint(rig::ConstraintType::CopyLocation);
    arm.AddConstraint(rig::ConstraintType::CopyRotation);

    EXPECT_EQ(spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports), nullptr);
    EXPECT_TRUE(reports.HasErrors());
    EXPECT_EQ(ArmatureCount(), 1u);
}

TEST_F(LocalDuplicateTest, RefusesConstraintsToDifferentObjects)
{
    scene::Object& a = scene.CreateEmptyObject("A");
    scene::Object& b = scene.CreateEmptyObject("B");
    source->Pose.FindBone("Root")->AddConstraint(rig::ConstraintType::CopyTransforms).Target = { &a, "" };
    source->Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyTransforms).Target = { &b, "" };

    EXPECT_EQ(spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports), nullptr);
    ASSERT_FALSE(reports.GetReports().empty());
    EXPECT_NE(reports.GetReports().back().Message.find("more than one target"), std::string::npos);
}

TEST_F(LocalDuplicateTest, NameTemplateFromPreferences)
{
    prefs.LocalArmatureObjectName = "{armature}_Edit";
    scene::Object* dest = spaceswitch::MakeLocalDuplicate(scene, prefs, *source, kFrames, reports);
    ASSERT_NE(dest, nullptr);
    EXPECT_EQ(dest->Name, "RigData_Edit");
}

TEST_F(LocalDuplicateTest, OperatorRunsInObjectMode)
{
    operators::OperatorContext ctx{ scene, prefs, reports };
    operators::MakeLocalArmatureOperator op;
    scene.FrameEnd = 10;
    EXPECT_EQ(operators::CallOperator(op, ctx), operators::OperatorStatus::Finished);
    EXPECT_NE(scene.FindObject("Rig_Local"), nullptr);
}
