#include "scene/EditSession.h"

#include <stdexcept>

#include "core/Logger.h"

namespace rs {
namespace scene {

HierarchyEditSession::HierarchyEditSession(Scene& scene, Object& container)
    : m_Scene(scene), m_Container(container)
{
    m_Originals = m_Scene.GetObjectsInMode();
    m_PriorMode = m_Scene.GetMode();

    m_Scene.SetMode(Mode::Object);

    // A selected linked armature would block edit mode.
    for (Object* o : m_Originals) o->Select = false;

    m_Container.Select = true;
    m_Scene.SetActiveObject(&m_Container);

    if (!m_Scene.SetMode(Mode::Edit)) {
        End();
        throw std::runtime_error("Could not enter edit mode on '" + m_Container.Name + "'");
    }
}

HierarchyEditSession::~HierarchyEditSession()
{
    End();
}

void HierarchyEditSession::End()
{
    if (m_Ended) return;
    m_Ended = true;

    m_Scene.SetMode(Mode::Object);

    // Reselect so their pose bones are reachable again.
    for (Object* o : m_Originals) {
        o->Select = true;
        if (o->Data) o->Data->SetActiveBone("");
    }

    if (m_PriorMode == Mode::Pose && !m_Scene.SetMode(Mode::Pose))
        Logger::LogError("[HierarchyEditSession] Could not return to pose mode");
}

} // namespace scene
} // namespace rs
