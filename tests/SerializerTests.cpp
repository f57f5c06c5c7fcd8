#include <gtest/gtest.h>

#include <filesystem>

#include "scene/SceneSerializer.h"
#include "spaceswitch/SpaceSwitch.h"
#include "spaceswitch/TempArmature.h"
#include "TestScenes.h"

using namespace rs;
using json = nlohmann::json;

namespace {

// Rig with Arm switched to world space, saved in pose mode at frame 4.
void BuildSwitchedScene(scene::Scene& scene, const Preferences& prefs)
{
    scene::Object& character = test::MakeRig(scene);
    test::AnimateZ90(scene, character, "Arm");
    character.Pose.FindBone("Arm")->Display.CustomShape = "WidgetCircle";
    test::EnterPose(scene, character, { "Arm" }, "Arm");
    spaceswitch::SpaceSwitch(scene, prefs, spaceswitch::GatherPoseSelection(scene), std::nullopt, { 1, 10 });
    scene.SetFrame(4);
    scene.CursorLocation = glm::vec3(0.5f, 0.0f, -1.0f);
}

} // namespace

TEST(SceneSerializer, RoundTripKeepsRigState)
{
    Preferences prefs;
    scene::Scene original;
    BuildSwitchedScene(original, prefs);
    const glm::mat4 armWorld = test::WorldPose(*original.FindObject("Rig"), "Arm");

    const json data = scene::SceneSerializer::Serialize(original);
    EXPECT_EQ(data["mode"], "POSE");
    EXPECT_EQ(data["objects"].size(), 2u);

    scene::Scene loaded;
    ASSERT_TRUE(scene::SceneSerializer::Deserialize(data, loaded));

    EXPECT_EQ(loaded.GetMode(), scene::Mode::Pose);
    EXPECT_EQ(loaded.GetFrame(), 4);
    EXPECT_EQ(loaded.CursorLocation, glm::vec3(0.5f, 0.0f, -1.0f));

    scene::Object* character = loaded.FindObject("Rig");
    scene::Object* container = spaceswitch::FindContainer(loaded, prefs);
    ASSERT_NE(character, nullptr);
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(loaded.GetActiveObject(), container);
    EXPECT_EQ(container->Data->Name, "SpaceSwitchingArmature");
    EXPECT_EQ(container->Data->GetActiveBone(), "Arm_Copy");
    EXPECT_EQ(container->Data->FindBone("Arm_Copy")->Tag, rig::BoneTag::Copy);
    EXPECT_TRUE(character->Data->FindBone("Forearm")->Connected);
    EXPECT_TRUE(character->Data->FindBone("Arm")->Hide);

    const rig::PoseBone* arm = character->Pose.FindBone("Arm");
    EXPECT_EQ(arm->RotationMode, math::RotationMode::EulerXYZ);
    EXPECT_EQ(arm->Display.CustomShape, "WidgetCircle");
    ASSERT_EQ(arm->Constraints.size(), 2u);
    EXPECT_TRUE(arm->Constraints[0]->IsConstrainedTo(container, "Arm_Copy"));
    EXPECT_EQ(arm->Constraints[1]->Type(), rig::ConstraintType::CopyRotation);

    ASSERT_TRUE(container->Action);
    EXPECT_EQ(container->Action->Curves.size(), original.FindObject("SpaceSwitching")->Action->Curves.size());
    EXPECT_TRUE(test::Near(test::WorldPose(*character, "Arm"), armWorld));
    EXPECT_TRUE(spaceswitch::GatherPoseSelection(loaded).Active.has_value());
}

TEST(SceneSerializer, IKConstraintKeepsPoleTarget)
{
    scene::Scene original;
    scene::Object& character = test::MakeRig(original);
    rig::Constraint& c = character.Pose.FindBone("Forearm")->AddConstraint(rig::ConstraintType::IK);
    c.Target = { &character, "Root" };
    rig::IKData& ik = *c.As<rig::IKData>();
    ik.PoleTarget = { &character, "Root" };
    ik.PoleAngle = 0.25f;

    scene::Scene loaded;
    ASSERT_TRUE(scene::SceneSerializer::Deserialize(scene::SceneSerializer::Serialize(original), loaded));
    scene::Object* obj = loaded.FindObject("Rig");
    const rig::Constraint& back = *obj->Pose.FindBone("Forearm")->Constraints.at(0);
    const rig::IKData* backIk = back.As<rig::IKData>();
    ASSERT_NE(backIk, nullptr);
    EXPECT_TRUE(backIk->PoleTarget.Refers(obj, "Root"));
    EXPECT_FLOAT_EQ(backIk->PoleAngle, 0.25f);
    EXPECT_EQ(backIk->ChainCount, 2);
}

TEST(SceneSerializer, EditModeLoadsAsObjectMode)
{
    scene::Scene original;
    scene::Object& character = test::MakeRig(original);
    character.Select = true;
    original.SetActiveObject(&character);
    json data = scene::SceneSerializer::Serialize(original);
    data["mode"] = "EDIT";

    scene::Scene loaded;
    ASSERT_TRUE(scene::SceneSerializer::Deserialize(data, loaded));
    EXPECT_EQ(loaded.GetMode(), scene::Mode::Object);
}

TEST(SceneSerializer, RejectsMalformedInput)
{
    scene::Scene loaded;
    EXPECT_FALSE(scene::SceneSerializer::Deserialize(json{ {"version", 1} }, loaded));

    json badConstraint = json::parse(R"({
        "objects": [ { "name": "Rig", "type": "ARMATURE",
                       "armature": { "name": "Rig", "bones": [ { "name": "Root" } ] },
                       "pose": [ { "name": "Root", "constraints": [ { "type": "CHILD_OF" } ] } ] } ]
    })");
    ASSERT_TRUE(scene::SceneSerializer::Deserialize(badConstraint, loaded));
    EXPECT_TRUE(loaded.FindObject("Rig")->Pose.FindBone("Root")->Constraints.empty());

    scene::Scene notEmpty;
    test::MakeRig(notEmpty);
    EXPECT_FALSE(scene::SceneSerializer::Deserialize(badConstraint, notEmpty));
}

TEST(SceneSerializer, FileRoundTrip)
{
    Preferences prefs;
    scene::Scene original;
    BuildSwitchedScene(original, prefs);

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "rigspace_serializer_test.json";
    ASSERT_TRUE(scene::SceneSerializer::SaveToFile(original, path.string()));

    scene::Scene loaded;
    ASSERT_TRUE(scene::SceneSerializer::LoadFromFile(path.string(), loaded));
    EXPECT_EQ(loaded.GetObjects().size(), 2u);
    std::filesystem::remove(path);

    scene::Scene missing;
    EXPECT_FALSE(scene::SceneSerializer::LoadFromFile((path.string() + ".missing"), missing));
}
