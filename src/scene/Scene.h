#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "scene/Object.h"

namespace rs {
namespace scene {

enum class Mode { Object, Edit, Pose };

const char* ModeName(Mode mode);
bool ParseMode(const std::string& name, Mode& out);

class Scene {
public:
    Scene() = default;
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // Objects. Requested names that are taken get a ".001" style suffix.
    Object& CreateArmatureObject(const std::string& name, const std::string& armatureName = "");
    Object& CreateEmptyObject(const std::string& name);
    Object* FindObject(const std::string& name);
    const Object* FindObject(const std::string& name) const;
    const std::vector<std::unique_ptr<Object>>& GetObjects() const { return m_Objects; }
    std::vector<Object*> GetArmatureObjects();
    // Deletes obj and clears every constraint reference to it.
    bool RemoveObject(Object* obj);
    // Deep copy of obj (armature data, pose, constraints and action). The copy
    // becomes the only selected object and the active one.
    Object* DuplicateObject(Object* obj);
    void MakeLocal(Object& obj) { obj.IsLinked = false; }
    // Returns the name actually assigned.
    std::string RenameObject(Object& obj, const std::string& name);

    Object* GetActiveObject() { return m_ActiveObject; }
    const Object* GetActiveObject() const { return m_ActiveObject; }
    void SetActiveObject(Object* obj) { m_ActiveObject = obj; }
    std::vector<Object*> GetSelectedObjects();

    // Mode state machine. Edit needs an active armature and fails when any
    // selected armature is linked. Pose takes the selected armatures plus the
    // active one. Returns false when the switch is not possible.
    Mode GetMode() const { return m_Mode; }
    bool SetMode(Mode mode);
    const std::vector<Object*>& GetObjectsInMode() const { return m_ObjectsInMode; }
    bool IsInMode(const Object* obj) const;

    // Time
    int GetFrame() const { return m_Frame; }
    // Evaluates actions at frame, then updates poses.
    void SetFrame(int frame);
    int FrameStart = 1;
    int FrameEnd = 250;

    glm::vec3 CursorLocation{0.0f};

    // Re-evaluates every armature pose (parenting and constraints).
    void Update();

    // Keys the current value of pchan.<property>[index] at frame. index -1
    // keys every component. The object's action is created on demand.
    bool InsertKeyframe(Object& obj, const rig::PoseBone& pchan, const std::string& property,
                        int index, float frame, const std::string& group);

private:
    std::string UniqueObjectName(const std::string& name, const Object* ignore = nullptr) const;
    void EvaluateActions(float frame);
    void LeaveMode();

    std::vector<std::unique_ptr<Object>> m_Objects;
    Object* m_ActiveObject = nullptr;

    Mode m_Mode = Mode::Object;
    std::vector<Object*> m_ObjectsInMode;

    int m_Frame = 1;
};

} // namespace scene
} // namespace rs
