#include <gtest/gtest.h>

#include <glm/gtc/constants.hpp>

#include "core/Errors.h"
#include "spaceswitch/Bake.h"
#include "TestScenes.h"

using namespace rs;

namespace {

constexpr float kSpin = glm::radians(350.0f);

// Marker bone spinning about Z from 0 at frame 1 to 350 degrees at frame 10.
scene::Object& MakeSpinner(scene::Scene& scene)
{
    scene::Object& obj = scene.CreateArmatureObject("Spinner");
    obj.Data->BeginEdit();
    obj.Data->NewEditBone("Root");
    obj.Data->EndEdit();
    scene.Update();

    rig::PoseBone& pb = *obj.Pose.FindBone("Root");
    pb.RotationMode = math::RotationMode::EulerXYZ;
    pb.RotationEuler = glm::vec3(0.0f);
    scene.InsertKeyframe(obj, pb, "rotation_euler", -1, 1.0f, "Root");
    pb.RotationEuler = glm::vec3(0.0f, 0.0f, kSpin);
    scene.InsertKeyframe(obj, pb, "rotation_euler", -1, 10.0f, "Root");
    scene.SetFrame(1);
    return obj;
}

std::vector<spaceswitch::PoseBoneRef> Refs(scene::Object& obj, std::initializer_list<const char*> names)
{
    std::vector<spaceswitch::PoseBoneRef> refs;
    for (const char* n : names) refs.push_back({ &obj, n });
    return refs;
}

const spaceswitch::FrameRange kFrames{ 1, 10 };

} // namespace

TEST(Bake, FrameRangeIsInclusive)
{
    EXPECT_EQ(kFrames.Frames().size(), 10u);
    EXPECT_TRUE((spaceswitch::FrameRange{ 5, 4 }).Frames().empty());
}

TEST(Bake, NoChannelsIsRejectedBeforeTouchingTheScene)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene.SetFrame(3);

    EXPECT_THROW(spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Arm" }), spaceswitch::BakeChannels{}),
                 InvalidArgumentError);
    EXPECT_FALSE(character.Action);
    EXPECT_EQ(scene.GetFrame(), 3);
}

TEST(Bake, RestoresCurrentFrame)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    test::AnimateZ90(scene, character, "Arm");
    scene.SetFrame(4);

    spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Root" }), spaceswitch::BakeChannels::All());
    EXPECT_EQ(scene.GetFrame(), 4);
    EXPECT_NEAR(character.Pose.FindBone("Arm")->RotationEuler.z, glm::half_pi<float>() / 3.0f, 1e-4f);
}

TEST(Bake, KeysVisualTransformOfConstrainedBone)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& spinner = MakeSpinner(scene);
    spinner.WorldMatrix[3] = glm::vec4(2.0f, 0.0f, 0.0f, 1.0f);

    rig::PoseBone& arm = *character.Pose.FindBone("Arm");
    rig::Constraint& c = arm.AddConstraint(rig::ConstraintType::CopyTransforms);
    c.Target = { &spinner, "Root" };

    std::vector<glm::mat4> expected;
    for (int f : kFrames.Frames()) {
        scene.SetFrame(f);
        expected.push_back(test::WorldPose(character, "Arm"));
    }
    scene.SetFrame(1);

    spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Arm" }), spaceswitch::BakeChannels::All());
    arm.RemoveConstraint(&c);

    EXPECT_EQ(test::CountKeyedCurves(character, "Arm", "location"), 3u);
    EXPECT_EQ(test::CountKeyedCurves(character, "Arm", "rotation_quaternion"), 4u);
    EXPECT_EQ(test::CountKeyedCurves(character, "Arm", "scale"), 3u);

    const std::vector<int> frames = kFrames.Frames();
    for (size_t i = 0; i < frames.size(); ++i) {
        scene.SetFrame(frames[i]);
        EXPECT_TRUE(test::Near(test::WorldPose(character, "Arm"), expected[i])) << "frame " << frames[i];
    }
}

TEST(Bake, ConnectedBonesGetNoLocationKeys)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    test::AnimateZ90(scene, character, "Arm");

    spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Forearm" }), spaceswitch::BakeChannels::All());

    EXPECT_EQ(test::CountKeyedCurves(character, "Forearm", "location"), 0u);
    EXPECT_EQ(test::CountKeyedCurves(character, "Forearm", "rotation_quaternion"), 4u);
    EXPECT_EQ(test::CountKeyedCurves(character, "Forearm", "scale"), 3u);
    const animation::FCurve* w = character.Action->FindCurve(animation::PoseBonePath("Forearm", "rotation_quaternion"), 0);
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->Group, "Forearm");
    EXPECT_EQ(w->keys.size(), 10u);
}

TEST(Bake, OnlyRequestedChannelsAreKeyed)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    spaceswitch::BakeChannels channels;
    channels.Scale = true;

    spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Root", "Arm" }), channels);
    ASSERT_TRUE(character.Action);
    EXPECT_EQ(character.Action->Curves.size(), 6u);
    EXPECT_EQ(test::CountKeyedCurves(character, "Root", "scale"), 3u);
}

TEST(Bake, QuaternionKeysStayInOneHemisphere)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& spinner = MakeSpinner(scene);
    character.Pose.FindBone("Arm")->AddConstraint(rig::ConstraintType::CopyRotation).Target = { &spinner, "Root" };

    spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Arm" }), spaceswitch::BakeChannels::All());

    const std::string path = animation::PoseBonePath("Arm", "rotation_quaternion");
    std::vector<glm::quat> keys;
    for (int f : kFrames.Frames()) {
        glm::quat q;
        for (int i = 0; i < 4; ++i)
            math::SetQuatComponent(q, i, character.Action->FindCurve(path, i)->FindKey(static_cast<float>(f))->v);
        keys.push_back(q);
    }
    for (size_t i = 1; i < keys.size(); ++i)
        EXPECT_GE(glm::dot(keys[i - 1], keys[i]), 0.0f) << "key " << i;
}

TEST(Bake, EulerKeysAreContinuous)
{
    scene::Scene scene;
    scene::Object& character = test::MakeRig(scene);
    scene::Object& spinner = MakeSpinner(scene);
    rig::PoseBone& arm = *character.Pose.FindBone("Arm");
    arm.RotationMode = math::RotationMode::EulerXYZ;
    arm.AddConstraint(rig::ConstraintType::CopyRotation).Target = { &spinner, "Root" };

    spaceswitch::CustomBake(scene, kFrames.Frames(), Refs(character, { "Arm" }), spaceswitch::BakeChannels::All());

    const animation::FCurve* z = character.Action->FindCurve(animation::PoseBonePath("Arm", "rotation_euler"), 2);
    ASSERT_NE(z, nullptr);
    ASSERT_EQ(z->keys.size(), 10u);
    for (size_t i = 1; i < z->keys.size(); ++i)
        EXPECT_LT(std::abs(z->keys[i].v - z->keys[i - 1].v), glm::pi<float>());
    EXPECT_NEAR(z->keys.back().v, kSpin, 1e-3f);
}
