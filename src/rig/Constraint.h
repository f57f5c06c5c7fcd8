#pragma once

#include <string>
#include <variant>
#include <vector>

namespace rs { namespace scene { class Object; } }

namespace rs {
namespace rig {

// Order matches the alternatives of ConstraintData.
enum class ConstraintType { CopyTransforms, CopyLocation, CopyRotation, IK };

const char* ConstraintTypeName(ConstraintType type);
bool ParseConstraintType(const std::string& name, ConstraintType& out);

// Target of a constraint: an armature object and a bone in it. An empty bone
// name addresses the object itself.
struct TargetRef {
    scene::Object* Object = nullptr;
    std::string Bone;

    bool IsSet() const { return Object != nullptr; }
    bool Refers(const scene::Object* obj, const std::string& bone) const {
        return Object != nullptr && Object == obj && Bone == bone;
    }
};

struct CopyTransformsData {};

struct CopyLocationData {
    float HeadTail = 0.0f; // 0 = target head, 1 = target tail
};

struct CopyRotationData {};

struct IKData {
    TargetRef PoleTarget;
    int ChainCount = 2;
    float PoleAngle = 0.0f; // radians
};

using ConstraintData = std::variant<CopyTransformsData, CopyLocationData, CopyRotationData, IKData>;

enum class TargetRole { Target, Pole };

struct ConstraintEdge {
    TargetRole Role = TargetRole::Target;
    const TargetRef* Target = nullptr;
};

struct Constraint {
    std::string Name;
    TargetRef Target;
    ConstraintData Data;
    bool Enabled = true;

    ConstraintType Type() const { return static_cast<ConstraintType>(Data.index()); }

    template <typename T> T* As() { return std::get_if<T>(&Data); }
    template <typename T> const T* As() const { return std::get_if<T>(&Data); }

    // Every (role, target) pair this constraint reads from.
    std::vector<ConstraintEdge> Edges() const;
    // True if any edge points at bone of obj.
    bool IsConstrainedTo(const scene::Object* obj, const std::string& bone) const;
    bool ReferencesObject(const scene::Object* obj) const;
    // Clears every edge pointing at obj.
    void ClearObjectReferences(const scene::Object* obj);
    // Repoints every edge from one object to another.
    void RemapObject(const scene::Object* from, scene::Object* to);
};

ConstraintData MakeConstraintData(ConstraintType type);

} // namespace rig
} // namespace rs
