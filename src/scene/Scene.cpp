#include "scene/Scene.h"

#include <algorithm>
#include <cstdio>

#include "core/Logger.h"
#include "scene/PoseEvaluator.h"

namespace rs {
namespace scene {

namespace {
std::string StripNumericSuffix(const std::string& name)
{
    const size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) return name;
    for (size_t i = dot + 1; i < name.size(); ++i)
        if (name[i] < '0' || name[i] > '9') return name;
    return name.substr(0, dot);
}

std::string NumberedName(const std::string& stem, int n)
{
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), ".%03d", n);
    return stem + suffix;
}

bool PoseMatchesArmature(const rig::Pose& pose, const rig::Armature& arm)
{
    const auto& bones = arm.GetBones();
    const auto& pbones = pose.GetBones();
    if (bones.size() != pbones.size()) return false;
    for (size_t i = 0; i < bones.size(); ++i)
        if (bones[i].Name != pbones[i]->Name) return false;
    return true;
}
}

const char* ObjectTypeName(ObjectType type)
{
    return type == ObjectType::Armature ? "ARMATURE" : "EMPTY";
}

bool ParseObjectType(const std::string& name, ObjectType& out)
{
    if (name == "ARMATURE") { out = ObjectType::Armature; return true; }
    if (name == "EMPTY") { out = ObjectType::Empty; return true; }
    return false;
}

const char* ModeName(Mode mode)
{
    switch (mode) {
        case Mode::Object: return "OBJECT";
        case Mode::Edit: return "EDIT";
        case Mode::Pose: return "POSE";
    }
    return "OBJECT";
}

bool ParseMode(const std::string& name, Mode& out)
{
    if (name == "OBJECT") { out = Mode::Object; return true; }
    if (name == "EDIT") { out = Mode::Edit; return true; }
    if (name == "POSE") { out = Mode::Pose; return true; }
    return false;
}

std::string Scene::UniqueObjectName(const std::string& name, const Object* ignore) const
{
    auto taken = [&](const std::string& n) {
        for (const auto& o : m_Objects)
            if (o.get() != ignore && o->Name == n) return true;
        return false;
    };
    const std::string requested = name.empty() ? std::string("Object") : name;
    if (!taken(requested)) return requested;
    const std::string stem = StripNumericSuffix(requested);
    for (int i = 1;; ++i) {
        std::string candidate = NumberedName(stem, i);
        if (!taken(candidate)) return candidate;
    }
}

Object& Scene::CreateArmatureObject(const std::string& name, const std::string& armatureName)
{
    auto obj = std::make_unique<Object>();
    obj->Name = UniqueObjectName(name);
    obj->Type = ObjectType::Armature;
    obj->Data = std::make_shared<rig::Armature>(armatureName.empty() ? obj->Name : armatureName);
    m_Objects.push_back(std::move(obj));
    return *m_Objects.back();
}

Object& Scene::CreateEmptyObject(const std::string& name)
{
    auto obj = std::make_unique<Object>();
    obj->Name = UniqueObjectName(name);
    obj->Type = ObjectType::Empty;
    m_Objects.push_back(std::move(obj));
    return *m_Objects.back();
}

Object* Scene::FindObject(const std::string& name)
{
    for (auto& o : m_Objects) if (o->Name == name) return o.get();
    return nullptr;
}

const Object* Scene::FindObject(const std::string& name) const
{
    for (const auto& o : m_Objects) if (o->Name == name) return o.get();
    return nullptr;
}

std::vector<Object*> Scene::GetArmatureObjects()
{
    std::vector<Object*> out;
    for (auto& o : m_Objects) if (o->IsArmature()) out.push_back(o.get());
    return out;
}

std::vector<Object*> Scene::GetSelectedObjects()
{
    std::vector<Object*> out;
    for (auto& o : m_Objects) if (o->Select) out.push_back(o.get());
    return out;
}

bool Scene::IsInMode(const Object* obj) const
{
    return std::find(m_ObjectsInMode.begin(), m_ObjectsInMode.end(), obj) != m_ObjectsInMode.end();
}

bool Scene::RemoveObject(Object* obj)
{
    auto it = std::find_if(m_Objects.begin(), m_Objects.end(),
                           [obj](const std::unique_ptr<Object>& o) { return o.get() == obj; });
    if (it == m_Objects.end()) return false;

    if (m_Mode == Mode::Edit && IsInMode(obj)) LeaveMode();

    for (auto& o : m_Objects) {
        if (o.get() == obj) continue;
        for (auto& pb : o->Pose.GetBones())
            for (auto& c : pb->Constraints) c->ClearObjectReferences(obj);
    }
    m_ObjectsInMode.erase(std::remove(m_ObjectsInMode.begin(), m_ObjectsInMode.end(), obj), m_ObjectsInMode.end());
    if (m_ActiveObject == obj) m_ActiveObject = nullptr;

    Logger::Log("[Scene] Removed object '" + obj->Name + "'");
    m_Objects.erase(it);
    return true;
}

Object* Scene::DuplicateObject(Object* obj)
{
    if (!obj) return nullptr;
    if (m_Mode == Mode::Edit) {
        Logger::LogError("[Scene] Cannot duplicate '" + obj->Name + "' in edit mode");
        return nullptr;
    }

    auto copy = std::make_unique<Object>();
    copy->Name = UniqueObjectName(obj->Name);
    copy->Type = obj->Type;
    copy->WorldMatrix = obj->WorldMatrix;
    copy->HideViewport = obj->HideViewport;
    copy->ShowInFront = obj->ShowInFront;
    copy->IsLinked = obj->IsLinked;

    if (obj->Data) {
        std::shared_ptr<rig::Armature> data = obj->Data->Clone();
        const std::string stem = StripNumericSuffix(obj->Data->Name);
        for (int i = 1;; ++i) {
            const std::string candidate = NumberedName(stem, i);
            bool taken = false;
            for (const auto& o : m_Objects)
                if (o->Data && o->Data->Name == candidate) { taken = true; break; }
            if (!taken) { data->Name = candidate; break; }
        }
        copy->Data = data;
    }

    copy->Pose = std::move(*obj->Pose.Clone());
    for (auto& pb : copy->Pose.GetBones())
        for (auto& c : pb->Constraints) c->RemapObject(obj, copy.get());

    if (obj->Action) {
        std::shared_ptr<animation::Action> action = obj->Action->Clone();
        action->Name = NumberedName(StripNumericSuffix(obj->Action->Name), 1);
        copy->Action = action;
    }

    for (auto& o : m_Objects) o->Select = false;
    copy->Select = true;

    Object* result = copy.get();
    m_Objects.push_back(std::move(copy));
    m_ActiveObject = result;
    Logger::Log("[Scene] Duplicated '" + obj->Name + "' as '" + result->Name + "'");
    return result;
}

std::string Scene::RenameObject(Object& obj, const std::string& name)
{
    obj.Name = UniqueObjectName(name, &obj);
    return obj.Name;
}

void Scene::LeaveMode()
{
    if (m_Mode == Mode::Edit) {
        std::vector<rig::Armature*> ended;
        for (Object* o : m_ObjectsInMode) {
            if (!o->Data || std::find(ended.begin(), ended.end(), o->Data.get()) != ended.end()) continue;
            o->Data->EndEdit();
            ended.push_back(o->Data.get());
        }
        // Objects sharing edited data pick up the new bone list.
        for (auto& o : m_Objects)
            if (o->Data && std::find(ended.begin(), ended.end(), o->Data.get()) != ended.end())
                o->Pose.Rebuild(*o->Data);
    }
    const bool wasObjectMode = m_Mode == Mode::Object;
    m_Mode = Mode::Object;
    m_ObjectsInMode.clear();
    if (!wasObjectMode) Update();
}

bool Scene::SetMode(Mode mode)
{
    if (mode == Mode::Object) {
        LeaveMode();
        return true;
    }

    if (mode == Mode::Edit && m_Mode == Mode::Edit) return true;

    if (!m_ActiveObject || !m_ActiveObject->IsArmature()) {
        Logger::LogError(std::string("[Scene] Cannot enter ") + ModeName(mode) + " mode: active object is not an armature");
        return false;
    }

    std::vector<Object*> objects;
    objects.push_back(m_ActiveObject);
    for (auto& o : m_Objects)
        if (o->Select && o->IsArmature() && o.get() != m_ActiveObject) objects.push_back(o.get());

    if (mode == Mode::Edit) {
        for (Object* o : objects) {
            if (o->IsLinked) {
                Logger::LogError("[Scene] Cannot enter edit mode: '" + o->Name + "' is linked");
                return false;
            }
        }
    }

    LeaveMode();

    // Scene order, not selection order.
    std::vector<Object*> ordered;
    for (auto& o : m_Objects)
        if (std::find(objects.begin(), objects.end(), o.get()) != objects.end()) ordered.push_back(o.get());

    if (mode == Mode::Edit) {
        for (Object* o : ordered) o->Data->BeginEdit();
    }
    m_Mode = mode;
    m_ObjectsInMode = ordered;
    return true;
}

void Scene::SetFrame(int frame)
{
    m_Frame = frame;
    EvaluateActions(static_cast<float>(frame));
    Update();
}

void Scene::EvaluateActions(float frame)
{
    std::string bone, property;
    for (auto& o : m_Objects) {
        if (!o->IsArmature() || !o->Action) continue;
        for (const auto& curve : o->Action->Curves) {
            if (curve->keys.empty()) continue;
            if (!animation::ParsePoseBonePath(curve->DataPath, bone, property)) continue;
            rig::PoseBone* pb = o->Pose.FindBone(bone);
            if (!pb) continue;
            pb->SetChannel(property, curve->ArrayIndex, curve->Sample(frame));
        }
    }
}

void Scene::Update()
{
    for (auto& o : m_Objects) {
        if (!o->IsArmature() || o->Data->IsEditing()) continue;
        if (!PoseMatchesArmature(o->Pose, *o->Data)) o->Pose.Rebuild(*o->Data);
    }
    PoseEvaluator evaluator(*this);
    evaluator.EvaluateAll();
}

bool Scene::InsertKeyframe(Object& obj, const rig::PoseBone& pchan, const std::string& property,
                           int index, float frame, const std::string& group)
{
    const int size = rig::PoseBone::ChannelSize(property);
    if (size == 0) {
        Logger::LogError("[Scene] Cannot key unknown property '" + property + "' of " + pchan.Name);
        return false;
    }
    if (index >= size) {
        Logger::LogError("[Scene] Index " + std::to_string(index) + " out of range for " + property);
        return false;
    }

    if (!obj.Action) {
        obj.Action = std::make_shared<animation::Action>();
        obj.Action->Name = obj.Name + "Action";
    }

    const std::string path = animation::PoseBonePath(pchan.Name, property);
    const int first = index < 0 ? 0 : index;
    const int last = index < 0 ? size - 1 : index;
    for (int i = first; i <= last; ++i) {
        float value = 0.0f;
        pchan.GetChannel(property, i, value);
        obj.Action->EnsureCurve(path, i, group).InsertKey(frame, value);
    }
    return true;
}

} // namespace scene
} // namespace rs
