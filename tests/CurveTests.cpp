#include <gtest/gtest.h>

#include "animation/Action.h"
#include "animation/Curves.h"

using namespace rs::animation;

TEST(FCurve, SamplesLinearlyAndHoldsEnds)
{
    FCurve curve;
    curve.InsertKey(10.0f, 2.0f);
    curve.InsertKey(0.0f, 0.0f);

    EXPECT_FLOAT_EQ(curve.Sample(-5.0f), 0.0f);
    EXPECT_FLOAT_EQ(curve.Sample(5.0f), 1.0f);
    EXPECT_FLOAT_EQ(curve.Sample(2.5f), 0.5f);
    EXPECT_FLOAT_EQ(curve.Sample(50.0f), 2.0f);
}

TEST(FCurve, InsertKeyReplacesSameFrame)
{
    FCurve curve;
    curve.InsertKey(1.0f, 1.0f);
    curve.InsertKey(3.0f, 3.0f);
    curve.InsertKey(2.0f, 2.0f);
    curve.InsertKey(2.00001f, 5.0f);

    ASSERT_EQ(curve.keys.size(), 3u);
    EXPECT_FLOAT_EQ(curve.keys[1].t, 2.0f);
    EXPECT_FLOAT_EQ(curve.keys[1].v, 5.0f);
    EXPECT_FLOAT_EQ(curve.FirstFrame(), 1.0f);
    EXPECT_FLOAT_EQ(curve.LastFrame(), 3.0f);
}

TEST(FCurve, RemoveKey)
{
    FCurve curve;
    curve.InsertKey(1.0f, 1.0f);
    curve.InsertKey(4.0f, 4.0f);
    EXPECT_TRUE(curve.RemoveKey(1.0f));
    EXPECT_FALSE(curve.RemoveKey(1.0f));
    ASSERT_NE(curve.FindKey(4.0f), nullptr);
    EXPECT_EQ(curve.FindKey(2.0f), nullptr);
    EXPECT_FLOAT_EQ(curve.Sample(0.0f), 4.0f);
}

TEST(Action, PoseBonePathEscapesAndParses)
{
    const std::string path = PoseBonePath("Odd \"name\"", "location");
    EXPECT_EQ(path, "pose.bones[\"Odd \\\"name\\\"\"].location");

    std::string bone, property;
    ASSERT_TRUE(ParsePoseBonePath(path, bone, property));
    EXPECT_EQ(bone, "Odd \"name\"");
    EXPECT_EQ(property, "location");
    EXPECT_FALSE(ParsePoseBonePath("location", bone, property));
    EXPECT_FALSE(ParsePoseBonePath("pose.bones[\"Arm\"]", bone, property));
}

TEST(Action, RemoveCurvesOnlyForThatBone)
{
    Action action;
    action.EnsureCurve(PoseBonePath("Arm", "location"), 0, "Arm").InsertKey(1.0f, 0.0f);
    action.EnsureCurve(PoseBonePath("Arm", "location"), 1, "Arm");
    action.EnsureCurve(PoseBonePath("Arm.001", "location"), 0, "Arm.001");

    EXPECT_EQ(&action.EnsureCurve(PoseBonePath("Arm", "location"), 0, "Arm"),
              action.FindCurve(PoseBonePath("Arm", "location"), 0));
    EXPECT_EQ(action.RemoveCurvesWithPrefix(PoseBonePath("Arm")), 2u);
    ASSERT_EQ(action.Curves.size(), 1u);
    EXPECT_EQ(action.Curves[0]->Group, "Arm.001");
}

TEST(Action, FrameRangeAndClone)
{
    Action action;
    action.Name = "RigAction";
    float start = 0.0f, end = 0.0f;
    EXPECT_FALSE(action.GetFrameRange(start, end));

    action.EnsureCurve(PoseBonePath("A", "scale"), 0, "A").InsertKey(3.0f, 1.0f);
    FCurve& b = action.EnsureCurve(PoseBonePath("B", "scale"), 0, "B");
    b.InsertKey(-2.0f, 1.0f);
    b.InsertKey(7.0f, 1.0f);
    ASSERT_TRUE(action.GetFrameRange(start, end));
    EXPECT_FLOAT_EQ(start, -2.0f);
    EXPECT_FLOAT_EQ(end, 7.0f);

    auto copy = action.Clone();
    copy->Curves[0]->InsertKey(20.0f, 0.0f);
    EXPECT_EQ(action.Curves[0]->keys.size(), 1u);
    EXPECT_EQ(copy->Name, "RigAction");
}
