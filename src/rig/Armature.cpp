#include "rig/Armature.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <functional>
#include <unordered_map>
#include <unordered_set>

#include <glm/gtc/matrix_transform.hpp>

#include "core/Logger.h"
#include "math/Rotation.h"

namespace rs {
namespace rig {

namespace {
const char* s_TagNames[] = { "NONE", "EMPTY", "SPACE", "COPY" };

// "Bone.004" -> "Bone"
std::string StripNumericSuffix(const std::string& name)
{
    const size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) return name;
    for (size_t i = dot + 1; i < name.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return name;
    return name.substr(0, dot);
}
}

const char* BoneTagName(BoneTag tag)
{
    return s_TagNames[static_cast<int>(tag)];
}

bool ParseBoneTag(const std::string& name, BoneTag& out)
{
    for (int i = 0; i < 4; ++i) {
        if (name == s_TagNames[i]) { out = static_cast<BoneTag>(i); return true; }
    }
    return false;
}

Bone* Armature::FindBone(const std::string& name)
{
    for (auto& b : m_Bones) if (b.Name == name) return &b;
    return nullptr;
}

const Bone* Armature::FindBone(const std::string& name) const
{
    for (const auto& b : m_Bones) if (b.Name == name) return &b;
    return nullptr;
}

int Armature::FindBoneIndex(const std::string& name) const
{
    for (size_t i = 0; i < m_Bones.size(); ++i)
        if (m_Bones[i].Name == name) return static_cast<int>(i);
    return -1;
}

void Armature::BeginEdit()
{
    if (m_Editing) return;
    m_EditBones.clear();
    m_EditBones.reserve(m_Bones.size());
    for (const Bone& b : m_Bones) {
        auto eb = std::make_unique<EditBone>();
        eb->Name = b.Name;
        eb->Parent = b.ParentIndex >= 0 ? m_EditBones[b.ParentIndex].get() : nullptr;
        eb->Head = b.Head;
        eb->Tail = b.Tail;
        eb->Roll = b.Roll;
        eb->Connected = b.Connected;
        eb->Deform = b.Deform;
        eb->Hide = b.Hide;
        eb->Select = b.Select;
        eb->ShowWire = b.ShowWire;
        eb->Tag = b.Tag;
        m_EditBones.push_back(std::move(eb));
    }
    m_Editing = true;
}

std::string Armature::UniqueEditName(const std::string& base) const
{
    auto taken = [this](const std::string& n) {
        for (const auto& eb : m_EditBones) if (eb->Name == n) return true;
        return false;
    };
    const std::string requested = base.empty() ? std::string("Bone") : base;
    if (!taken(requested)) return requested;

    const std::string stem = StripNumericSuffix(requested);
    for (int i = 1;; ++i) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), ".%03d", i);
        std::string candidate = stem + suffix;
        if (!taken(candidate)) return candidate;
    }
}

EditBone& Armature::NewEditBone(const std::string& name)
{
    if (!m_Editing) BeginEdit();
    auto eb = std::make_unique<EditBone>();
    eb->Name = UniqueEditName(name);
    m_EditBones.push_back(std::move(eb));
    return *m_EditBones.back();
}

EditBone* Armature::FindEditBone(const std::string& name)
{
    for (auto& eb : m_EditBones) if (eb->Name == name) return eb.get();
    return nullptr;
}

void Armature::RemoveEditBone(EditBone* bone)
{
    if (!bone) return;
    for (auto& eb : m_EditBones) {
        if (eb->Parent == bone) {
            eb->Parent = bone->Parent;
            eb->Connected = false;
        }
    }
    if (m_ActiveBone == bone->Name) m_ActiveBone.clear();
    m_EditBones.erase(std::remove_if(m_EditBones.begin(), m_EditBones.end(),
                                     [bone](const std::unique_ptr<EditBone>& eb) { return eb.get() == bone; }),
                      m_EditBones.end());
}

std::vector<EditBone*> Armature::GetEditBones()
{
    std::vector<EditBone*> out;
    out.reserve(m_EditBones.size());
    for (auto& eb : m_EditBones) out.push_back(eb.get());
    return out;
}

void Armature::EndEdit()
{
    if (!m_Editing) return;

    // Parents first, otherwise keep edit order.
    std::vector<const EditBone*> ordered;
    std::unordered_set<const EditBone*> placed;
    std::function<void(const EditBone*)> place = [&](const EditBone* eb) {
        if (placed.count(eb)) return;
        placed.insert(eb);
        if (eb->Parent) place(eb->Parent);
        ordered.push_back(eb);
    };
    for (const auto& eb : m_EditBones) place(eb.get());

    std::unordered_map<const EditBone*, int> indexOf;
    std::vector<Bone> bones;
    bones.reserve(ordered.size());
    for (const EditBone* eb : ordered) {
        Bone b;
        b.Name = eb->Name;
        b.ParentIndex = eb->Parent ? indexOf.at(eb->Parent) : -1;
        b.Parent = eb->Parent ? eb->Parent->Name : std::string();
        b.Connected = eb->Parent != nullptr && eb->Connected;
        b.Head = b.Connected ? eb->Parent->Tail : eb->Head;
        b.Tail = eb->Tail;
        b.Roll = eb->Roll;
        b.Deform = eb->Deform;
        b.Hide = eb->Hide;
        b.Select = eb->Select;
        b.ShowWire = eb->ShowWire;
        b.Tag = eb->Tag;
        if (b.Length() < 1e-6f)
            Logger::LogWarning("[Armature] Bone '" + b.Name + "' in '" + Name + "' has zero length");
        indexOf[eb] = static_cast<int>(bones.size());
        bones.push_back(std::move(b));
    }

    m_Bones = std::move(bones);
    if (!m_ActiveBone.empty() && !FindBone(m_ActiveBone)) m_ActiveBone.clear();
    m_EditBones.clear();
    m_Editing = false;
    RebuildRestMatrices();
}

void Armature::RebuildRestMatrices()
{
    for (Bone& b : m_Bones) {
        glm::mat4 m(math::BoneOrientation(b.Tail - b.Head, b.Roll));
        m[3] = glm::vec4(b.Head, 1.0f);
        b.ArmatureMatrix = m;
    }
}

std::unique_ptr<Armature> Armature::Clone() const
{
    auto copy = std::make_unique<Armature>(Name);
    copy->m_Bones = m_Bones;
    copy->m_ActiveBone = m_ActiveBone;
    return copy;
}

} // namespace rig
} // namespace rs
