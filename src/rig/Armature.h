#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace rs {
namespace rig {

// Provenance of a bone. Everything the space switching tools create carries a
// tag other than None; user bones never do.
enum class BoneTag { None, Empty, Space, Copy };

const char* BoneTagName(BoneTag tag);
bool ParseBoneTag(const std::string& name, BoneTag& out);

// Rest state of a bone, in armature space.
struct Bone {
    std::string Name;
    std::string Parent;      // empty for root bones
    int ParentIndex = -1;

    glm::vec3 Head{0.0f};
    glm::vec3 Tail{0.0f, 1.0f, 0.0f};
    float Roll = 0.0f;

    bool Connected = false;  // head locked to the parent's tail
    bool Deform = true;
    bool Hide = false;
    bool Select = false;
    bool ShowWire = false;
    BoneTag Tag = BoneTag::None;

    glm::mat4 ArmatureMatrix{1.0f}; // rest matrix, recomputed on EndEdit

    float Length() const { return glm::length(Tail - Head); }
};

// Structural edit form of a bone. Only exists between BeginEdit and EndEdit.
struct EditBone {
    std::string Name;
    EditBone* Parent = nullptr;

    glm::vec3 Head{0.0f};
    glm::vec3 Tail{0.0f, 1.0f, 0.0f};
    float Roll = 0.0f;

    bool Connected = false;
    bool Deform = true;
    bool Hide = false;
    bool Select = false;
    bool ShowWire = false;
    BoneTag Tag = BoneTag::None;

    float Length() const { return glm::length(Tail - Head); }
};

class Armature {
public:
    explicit Armature(std::string name = "Armature") : Name(std::move(name)) {}

    std::string Name;

    // Parents always come before their children.
    const std::vector<Bone>& GetBones() const { return m_Bones; }
    std::vector<Bone>& GetBones() { return m_Bones; }
    Bone* FindBone(const std::string& name);
    const Bone* FindBone(const std::string& name) const;
    int FindBoneIndex(const std::string& name) const;

    // Empty when no bone is active.
    const std::string& GetActiveBone() const { return m_ActiveBone; }
    void SetActiveBone(const std::string& name) { m_ActiveBone = name; }

    bool IsEditing() const { return m_Editing; }
    void BeginEdit();
    // Appends a bone. A name already in use gets a ".001" style suffix; read
    // the final name back from the returned bone.
    EditBone& NewEditBone(const std::string& name);
    EditBone* FindEditBone(const std::string& name);
    // Children of the removed bone are re-parented to its parent and lose
    // their connection.
    void RemoveEditBone(EditBone* bone);
    std::vector<EditBone*> GetEditBones();
    // Writes edit bones back as rest bones and recomputes rest matrices.
    void EndEdit();

    std::unique_ptr<Armature> Clone() const;

private:
    std::string UniqueEditName(const std::string& base) const;
    void RebuildRestMatrices();

    std::vector<Bone> m_Bones;
    std::string m_ActiveBone;

    bool m_Editing = false;
    std::vector<std::unique_ptr<EditBone>> m_EditBones;
};

} // namespace rig
} // namespace rs
