#include "rig/Constraint.h"

namespace rs {
namespace rig {

namespace {
const char* s_TypeNames[] = { "COPY_TRANSFORMS", "COPY_LOCATION", "COPY_ROTATION", "IK" };
}

const char* ConstraintTypeName(ConstraintType type)
{
    return s_TypeNames[static_cast<int>(type)];
}

bool ParseConstraintType(const std::string& name, ConstraintType& out)
{
    for (int i = 0; i < 4; ++i) {
        if (name == s_TypeNames[i]) { out = static_cast<ConstraintType>(i); return true; }
    }
    return false;
}

ConstraintData MakeConstraintData(ConstraintType type)
{
    switch (type) {
        case ConstraintType::CopyLocation: return CopyLocationData{};
        case ConstraintType::CopyRotation: return CopyRotationData{};
        case ConstraintType::IK: return IKData{};
        case ConstraintType::CopyTransforms: break;
    }
    return CopyTransformsData{};
}

std::vector<ConstraintEdge> Constraint::Edges() const
{
    std::vector<ConstraintEdge> edges;
    edges.push_back({ TargetRole::Target, &Target });
    if (const IKData* ik = As<IKData>())
        edges.push_back({ TargetRole::Pole, &ik->PoleTarget });
    return edges;
}

bool Constraint::IsConstrainedTo(const scene::Object* obj, const std::string& bone) const
{
    for (const ConstraintEdge& e : Edges())
        if (e.Target->Refers(obj, bone)) return true;
    return false;
}

bool Constraint::ReferencesObject(const scene::Object* obj) const
{
    for (const ConstraintEdge& e : Edges())
        if (e.Target->Object == obj) return true;
    return false;
}

void Constraint::ClearObjectReferences(const scene::Object* obj)
{
    if (Target.Object == obj) Target.Object = nullptr;
    if (IKData* ik = As<IKData>())
        if (ik->PoleTarget.Object == obj) ik->PoleTarget.Object = nullptr;
}

void Constraint::RemapObject(const scene::Object* from, scene::Object* to)
{
    if (Target.Object == from) Target.Object = to;
    if (IKData* ik = As<IKData>())
        if (ik->PoleTarget.Object == from) ik->PoleTarget.Object = to;
}

} // namespace rig
} // namespace rs
