#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <glm/gtc/matrix_transform.hpp>

#include "animation/ik/IKSolvers.h"
#include "core/Logger.h"
#include "scene/PoseEvaluator.h"
#include "TestScenes.h"

using namespace rs;

namespace {

glm::vec3 Head(const scene::Object& obj, const std::string& bone)
{
    return glm::vec3(test::WorldPose(obj, bone)[3]);
}

glm::vec3 Tail(const scene::Object& obj, const std::string& bone)
{
    const float length = obj.Data->FindBone(bone)->Length();
    return glm::vec3(test::WorldPose(obj, bone) * glm::vec4(0.0f, length, 0.0f, 1.0f));
}

void ExpectNearVec(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
{
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
    EXPECT_NEAR(a.z, b.z, eps);
}

// Armature with a single root bone from head to head + (0,1,0).
scene::Object& MakeMarker(scene::Scene& scene, const std::string& name, const glm::vec3& head)
{
    scene::Object& obj = scene.CreateArmatureObject(name);
    obj.Data->BeginEdit();
    rig::EditBone& b = obj.Data->NewEditBone("Root");
    b.Head = head;
    b.Tail = head + glm::vec3(0.0f, 1.0f, 0.0f);
    obj.Data->EndEdit();
    scene.Update();
    return obj;
}

class LogCapture {
public:
    LogCapture()
    {
        Logger::SetCallback([this](const std::string& msg, LogLevel level) {
            if (level == LogLevel::Warning) Warnings.push_back(msg);
        });
    }
    ~LogCapture() { Logger::ResetCallback(); }

    std::vector<std::string> Warnings;
};

} // namespace

TEST(PoseEvaluator, ParentRotationMovesChildren)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    character.Pose.FindBone("Root")->RotationQuaternion = glm::angleAxis(glm::half_pi<float>(), glm::vec3(0, 0, 1));
    scene.Update();

    ExpectNearVec(Head(character, "Arm"), glm::vec3(-1.0f, 0.0f, 0.0f));
    ExpectNearVec(Tail(character, "Forearm"), glm::vec3(-3.0f, 0.0f, 0.0f));
}

TEST(PoseEvaluator, ConnectedBonesIgnoreLocation)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    character.Pose.FindBone("Forearm")->Location = glm::vec3(5.0f);
    character.Pose.FindBone("Arm")->Location = glm::vec3(1.0f, 0.0f, 0.0f);
    scene.Update();

    ExpectNearVec(Head(character, "Arm"), glm::vec3(1.0f, 1.0f, 0.0f));
    ExpectNearVec(Head(character, "Forearm"), Tail(character, "Arm"));
}

TEST(PoseEvaluator, ObjectTransformAppliesToWorldPose)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    character.WorldMatrix = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, 4.0f));
    scene.Update();
    ExpectNearVec(Head(character, "Arm"), glm::vec3(0.0f, 1.0f, 4.0f));
}

TEST(PoseEvaluator, CopyLocationFollowsTargetTail)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& marker = MakeMarker(scene, "Marker", glm::vec3(10.0f, 0.0f, 0.0f));

    rig::Constraint& c = character.Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyLocation);
    c.Target = { &marker, "Root" };
    c.As<rig::CopyLocationData>()->HeadTail = 1.0f;
    scene.Update();
    ExpectNearVec(Head(character, "Arm"), glm::vec3(10.0f, 1.0f, 0.0f));

    c.As<rig::CopyLocationData>()->HeadTail = 0.5f;
    scene.Update();
    ExpectNearVec(Head(character, "Arm"), glm::vec3(10.0f, 0.5f, 0.0f));
    // The child follows the constrained parent.
    ExpectNearVec(Head(character, "Forearm"), glm::vec3(10.0f, 1.5f, 0.0f));
}

TEST(PoseEvaluator, CopyRotationKeepsOwnLocation)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& marker = MakeMarker(scene, "Marker", glm::vec3(10.0f, 0.0f, 0.0f));
    marker.Pose.FindBone("Root")->RotationQuaternion = glm::angleAxis(glm::half_pi<float>(), glm::vec3(0, 0, 1));

    rig::Constraint& c = character.Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyRotation);
    c.Target = { &marker, "Root" };
    scene.Update();

    ExpectNearVec(Head(character, "Arm"), glm::vec3(0.0f, 1.0f, 0.0f));
    ExpectNearVec(Tail(character, "Arm"), glm::vec3(-1.0f, 1.0f, 0.0f));
}

TEST(PoseEvaluator, CopyTransformsOfObjectWithoutBone)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& empty = scene.CreateEmptyObject("Empty");
    empty.WorldMatrix = glm::translate(glm::mat4(1.0f), glm::vec3(3.0f, 2.0f, 1.0f));

    character.Pose.FindBone("Root")->AddConstraint(rig::ConstraintType::CopyTransforms).Target = { &empty, "" };
    scene.Update();
    ExpectNearVec(Head(character, "Root"), glm::vec3(3.0f, 2.0f, 1.0f));
}

TEST(PoseEvaluator, DisabledAndUnresolvedConstraintsAreSkipped)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& marker = MakeMarker(scene, "Marker", glm::vec3(10.0f, 0.0f, 0.0f));

    rig::Constraint& off = character.Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyLocation);
    off.Target = { &marker, "Root" };
    off.Enabled = false;
    character.Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyLocation).Target = { &marker, "Missing" };
    scene.Update();
    ExpectNearVec(Head(character, "Arm"), glm::vec3(0.0f, 1.0f, 0.0f));
}

TEST(PoseEvaluator, DependencyCycleIsReportedOnce)
{
    LogCapture log;
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    character.Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyLocation).Target = { &character, "Forearm" };

    scene.Update();

    size_t cycles = 0;
    for (const auto& w : log.Warnings)
        if (w.find("cycle") != std::string::npos) ++cycles;
    EXPECT_EQ(cycles, 1u);
}

TEST(PoseEvaluator, PoseToLocalInvertsParentContribution)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    rig::PoseBone& arm = *character.Pose.FindBone("Arm");
    character.Pose.FindBone("Root")->RotationQuaternion = glm::angleAxis(0.4f, glm::vec3(1, 0, 0));
    arm.RotationQuaternion = glm::angleAxis(0.7f, glm::vec3(0, 0, 1));
    arm.Location = glm::vec3(0.2f, 0.0f, -0.3f);
    scene.Update();

    const int index = character.Data->FindBoneIndex("Arm");
    glm::mat4 basis = scene::PoseEvaluator::PoseToLocal(*character.Data, character.Pose, index, arm.PoseMatrix);
    EXPECT_TRUE(test::Near(basis, arm.MatrixBasis()));
}

TEST(TwoBoneIK, ReachesTargetInsideRange)
{
    animation::ik::TwoBoneInputs in;
    in.rootPos = glm::vec3(0.0f);
    in.midPos = glm::vec3(0.0f, 1.0f, 0.0f);
    in.endPos = glm::vec3(0.0f, 2.0f, 0.0f);
    in.targetPos = glm::vec3(1.0f, 0.5f, 0.0f);

    animation::ik::TwoBoneResult out;
    ASSERT_TRUE(animation::ik::SolveTwoBone(in, out));
    EXPECT_NEAR(out.error, 0.0f, 1e-4f);
    EXPECT_NEAR(glm::length(out.midDesired - in.rootPos), 1.0f, 1e-4f);
    EXPECT_NEAR(glm::length(in.targetPos - out.midDesired), 1.0f, 1e-4f);
}

TEST(TwoBoneIK, ClampsUnreachableTarget)
{
    animation::ik::TwoBoneInputs in;
    in.midPos = glm::vec3(0.0f, 1.0f, 0.0f);
    in.endPos = glm::vec3(0.0f, 2.0f, 0.0f);
    in.targetPos = glm::vec3(5.0f, 0.0f, 0.0f);

    animation::ik::TwoBoneResult out;
    ASSERT_TRUE(animation::ik::SolveTwoBone(in, out));
    EXPECT_NEAR(out.error, 3.0f, 1e-4f);
    ExpectNearVec(out.midDesired, glm::vec3(1.0f, 0.0f, 0.0f));
}

TEST(TwoBoneIK, PoleChoosesBendSide)
{
    animation::ik::TwoBoneInputs in;
    in.midPos = glm::vec3(0.0f, 1.0f, 0.0f);
    in.endPos = glm::vec3(0.0f, 2.0f, 0.0f);
    in.targetPos = glm::vec3(0.0f, 1.5f, 0.0f);
    in.hasPole = true;
    in.polePos = glm::vec3(0.0f, 0.0f, 3.0f);

    animation::ik::TwoBoneResult out;
    ASSERT_TRUE(animation::ik::SolveTwoBone(in, out));
    EXPECT_GT(out.midDesired.z, 0.1f);

    in.poleAngle = glm::pi<float>();
    ASSERT_TRUE(animation::ik::SolveTwoBone(in, out));
    EXPECT_LT(out.midDesired.z, -0.1f);
}

TEST(TwoBoneIK, ZeroLengthChainFails)
{
    animation::ik::TwoBoneInputs in;
    in.endPos = glm::vec3(0.0f, 1.0f, 0.0f);
    animation::ik::TwoBoneResult out;
    EXPECT_FALSE(animation::ik::SolveTwoBone(in, out));
}

TEST(PoseEvaluator, IKConstraintPlacesChainOnTarget)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& target = MakeMarker(scene, "Target", glm::vec3(1.0f, 1.5f, 0.0f));

    rig::Constraint& ik = character.Pose.FindBone("Forearm")->AddConstraint(rig::ConstraintType::IK);
    ik.Target = { &target, "Root" };
    scene.Update();

    ExpectNearVec(Head(character, "Arm"), glm::vec3(0.0f, 1.0f, 0.0f));
    ExpectNearVec(Tail(character, "Forearm"), glm::vec3(1.0f, 1.5f, 0.0f));
    ExpectNearVec(Tail(character, "Arm"), Head(character, "Forearm"));
    EXPECT_NEAR(glm::length(Tail(character, "Arm") - Head(character, "Arm")), 1.0f, 1e-4f);
}
