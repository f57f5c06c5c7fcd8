#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/NameTemplate.h"
#include "core/Preferences.h"

using namespace rs;
namespace fs = std::filesystem;

TEST(NameTemplate, ExpandsKnownFields)
{
    EXPECT_EQ(FormatNameTemplate("{bone_name}_Copy", { {"bone_name", "Arm"} }), "Arm_Copy");
    EXPECT_EQ(FormatNameTemplate("{a}-{b}", { {"a", "x"}, {"b", "y"} }), "x-y");
    EXPECT_EQ(FormatNameTemplate("Plain", {}), "Plain");
}

TEST(NameTemplate, EscapedBraces)
{
    EXPECT_EQ(FormatNameTemplate("{{x}}", { {"x", "unused"} }), "{x}");
    EXPECT_EQ(FormatNameTemplate("{{{bone_name}}}", { {"bone_name", "Arm"} }), "{Arm}");
}

TEST(NameTemplate, UnknownAndUnterminatedFieldsAreKept)
{
    EXPECT_EQ(FormatNameTemplate("{foo}_Copy", { {"bone_name", "Arm"} }), "{foo}_Copy");
    EXPECT_EQ(FormatNameTemplate("Arm_{bone", { {"bone", "x"} }), "Arm_{bone");
}

TEST(NameTemplate, BoneNameKeys)
{
    EXPECT_EQ(FormatBoneName("{object_name}.{armature_name}.{bone_name}", "Arm", "RigData", "Rig"), "Rig.RigData.Arm");
    EXPECT_EQ(FormatBoneName(Preferences().SpaceName, "Root", "RigData", "Rig"), "Root_Space");
}

class PreferencesFile : public ::testing::Test {
protected:
    void SetUp() override
    {
        path = fs::temp_directory_path() / "rigspace_prefs_test.json";
        fs::remove(path);
    }
    void TearDown() override { fs::remove(path); }

    void Write(const std::string& text)
    {
        std::ofstream out(path);
        out << text;
    }

    fs::path path;
};

TEST_F(PreferencesFile, SaveThenLoad)
{
    Preferences prefs;
    prefs.ObjectName = "Temp";
    prefs.CopyName = "{bone_name}.ctrl";
    ASSERT_TRUE(prefs.Save(path));

    Preferences loaded;
    ASSERT_TRUE(Preferences::Load(path, loaded));
    EXPECT_EQ(loaded.ObjectName, "Temp");
    EXPECT_EQ(loaded.CopyName, "{bone_name}.ctrl");
    EXPECT_EQ(loaded.ArmatureName, "SpaceSwitchingArmature");
}

TEST_F(PreferencesFile, MissingKeysUseDefaults)
{
    Write(R"({ "emptyName": "Locator" })");

    Preferences loaded;
    loaded.ObjectName = "Stale";
    ASSERT_TRUE(Preferences::Load(path, loaded));
    EXPECT_EQ(loaded.EmptyName, "Locator");
    EXPECT_EQ(loaded.ObjectName, "SpaceSwitching");
    EXPECT_EQ(loaded.ParentName, "{bone_name}_Parent");
    EXPECT_EQ(loaded.LocalArmatureObjectName, "{object}_Local");
}

TEST_F(PreferencesFile, MissingFile)
{
    Preferences loaded;
    EXPECT_FALSE(Preferences::Load(path, loaded));
}

TEST_F(PreferencesFile, InvalidJson)
{
    Write("{ \"objectName\": ");
    Preferences loaded;
    EXPECT_FALSE(Preferences::Load(path, loaded));

    Write(R"({ "objectName": 3 })");
    EXPECT_FALSE(Preferences::Load(path, loaded));
}
