#pragma once

#include <vector>

#include "scene/Scene.h"

namespace rs {
namespace scene {

// Structural edit of one armature object while other armatures are posed.
//
// The constructor leaves the current mode, deselects the objects that were
// in it, makes the container the selected active object and enters edit
// mode. End() (or the destructor) returns to object mode, reselects the
// original objects with their active bone cleared and re-enters pose mode if
// that was the mode before. Bone selection is left alone.
//
// Edit bone pointers are only valid until End().
class HierarchyEditSession {
public:
    HierarchyEditSession(Scene& scene, Object& container);
    ~HierarchyEditSession();

    HierarchyEditSession(const HierarchyEditSession&) = delete;
    HierarchyEditSession& operator=(const HierarchyEditSession&) = delete;

    rig::Armature& Armature() { return *m_Container.Data; }
    Object& Container() { return m_Container; }

    void End();
    bool IsActive() const { return !m_Ended; }

private:
    Scene& m_Scene;
    Object& m_Container;
    std::vector<Object*> m_Originals;
    Mode m_PriorMode = Mode::Object;
    bool m_Ended = false;
};

} // namespace scene
} // namespace rs
