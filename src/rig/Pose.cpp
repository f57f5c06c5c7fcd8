#include "rig/Pose.h"

#include <algorithm>
#include <cstdio>
#include <unordered_map>

#include "rig/Armature.h"

namespace rs {
namespace rig {

glm::mat3 PoseBone::RotationMatrix() const
{
    switch (RotationMode) {
        case math::RotationMode::Quaternion:
            return glm::mat3_cast(glm::normalize(RotationQuaternion));
        case math::RotationMode::AxisAngle:
            return math::AxisAngleToMat3(RotationAxisAngle);
        default:
            return math::EulerToMat3(RotationEuler, RotationMode);
    }
}

glm::mat4 PoseBone::MatrixBasis() const
{
    return math::ComposeTRS(Location, RotationMatrix(), Scale);
}

void PoseBone::SetMatrixBasis(const glm::mat4& m)
{
    glm::vec3 t, s;
    glm::mat3 r;
    math::DecomposeTRS(m, t, r, s);
    Location = t;
    Scale = s;
    switch (RotationMode) {
        case math::RotationMode::Quaternion:
            RotationQuaternion = glm::normalize(glm::quat_cast(r));
            break;
        case math::RotationMode::AxisAngle:
            RotationAxisAngle = math::Mat3ToAxisAngle(r);
            break;
        default:
            RotationEuler = math::Mat3ToEuler(r, RotationMode);
            break;
    }
}

void PoseBone::SetRotationMode(math::RotationMode mode)
{
    if (mode == RotationMode) return;
    const glm::mat3 r = RotationMatrix();
    RotationMode = mode;
    switch (mode) {
        case math::RotationMode::Quaternion:
            RotationQuaternion = glm::normalize(glm::quat_cast(r));
            break;
        case math::RotationMode::AxisAngle:
            RotationAxisAngle = math::Mat3ToAxisAngle(r);
            break;
        default:
            RotationEuler = math::Mat3ToEuler(r, mode);
            break;
    }
}

Constraint& PoseBone::AddConstraint(ConstraintType type)
{
    auto c = std::make_unique<Constraint>();
    c->Data = MakeConstraintData(type);
    // Unique display name per bone, e.g. "Copy Location.001"
    static const char* s_Labels[] = { "Copy Transforms", "Copy Location", "Copy Rotation", "IK" };
    const std::string base = s_Labels[static_cast<int>(type)];
    std::string name = base;
    for (int i = 1;; ++i) {
        bool taken = false;
        for (const auto& existing : Constraints) if (existing->Name == name) { taken = true; break; }
        if (!taken) break;
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), ".%03d", i);
        name = base + suffix;
    }
    c->Name = name;
    Constraints.push_back(std::move(c));
    return *Constraints.back();
}

bool PoseBone::RemoveConstraint(const Constraint* constraint)
{
    auto it = std::find_if(Constraints.begin(), Constraints.end(),
                           [constraint](const std::unique_ptr<Constraint>& c) { return c.get() == constraint; });
    if (it == Constraints.end()) return false;
    Constraints.erase(it);
    return true;
}

int PoseBone::ChannelSize(const std::string& property)
{
    if (property == "location" || property == "rotation_euler" || property == "scale") return 3;
    if (property == "rotation_quaternion" || property == "rotation_axis_angle") return 4;
    return 0;
}

bool PoseBone::GetChannel(const std::string& property, int index, float& out) const
{
    if (index < 0 || index >= ChannelSize(property)) return false;
    if (property == "location") out = Location[index];
    else if (property == "rotation_euler") out = RotationEuler[index];
    else if (property == "scale") out = Scale[index];
    else if (property == "rotation_quaternion") out = math::QuatComponent(RotationQuaternion, index);
    else out = RotationAxisAngle[index];
    return true;
}

bool PoseBone::SetChannel(const std::string& property, int index, float value)
{
    if (index < 0 || index >= ChannelSize(property)) return false;
    if (property == "location") Location[index] = value;
    else if (property == "rotation_euler") RotationEuler[index] = value;
    else if (property == "scale") Scale[index] = value;
    else if (property == "rotation_quaternion") math::SetQuatComponent(RotationQuaternion, index, value);
    else RotationAxisAngle[index] = value;
    return true;
}

std::unique_ptr<PoseBone> PoseBone::Clone() const
{
    auto copy = std::make_unique<PoseBone>();
    copy->Name = Name;
    copy->Location = Location;
    copy->RotationQuaternion = RotationQuaternion;
    copy->RotationEuler = RotationEuler;
    copy->RotationAxisAngle = RotationAxisAngle;
    copy->Scale = Scale;
    copy->RotationMode = RotationMode;
    copy->Display = Display;
    copy->PoseMatrix = PoseMatrix;
    for (const auto& c : Constraints) copy->Constraints.push_back(std::make_unique<Constraint>(*c));
    return copy;
}

PoseBone* Pose::FindBone(const std::string& name)
{
    for (auto& pb : m_Bones) if (pb->Name == name) return pb.get();
    return nullptr;
}

const PoseBone* Pose::FindBone(const std::string& name) const
{
    for (const auto& pb : m_Bones) if (pb->Name == name) return pb.get();
    return nullptr;
}

void Pose::Rebuild(const Armature& armature)
{
    std::unordered_map<std::string, std::unique_ptr<PoseBone>> existing;
    for (auto& pb : m_Bones) existing[pb->Name] = std::move(pb);

    std::vector<std::unique_ptr<PoseBone>> bones;
    bones.reserve(armature.GetBones().size());
    for (const Bone& b : armature.GetBones()) {
        auto it = existing.find(b.Name);
        if (it != existing.end()) {
            bones.push_back(std::move(it->second));
        } else {
            auto pb = std::make_unique<PoseBone>();
            pb->Name = b.Name;
            pb->PoseMatrix = b.ArmatureMatrix;
            bones.push_back(std::move(pb));
        }
    }
    m_Bones = std::move(bones);
}

std::unique_ptr<Pose> Pose::Clone() const
{
    auto copy = std::make_unique<Pose>();
    for (const auto& pb : m_Bones) copy->m_Bones.push_back(pb->Clone());
    return copy;
}

} // namespace rig
} // namespace rs
