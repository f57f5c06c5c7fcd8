#include "scene/SceneSerializer.h"

#include <fstream>

#include "core/Logger.h"

namespace rs {
namespace scene {

// Helper functions
json SceneSerializer::SerializeVec3(const glm::vec3& v) {
    return json::array({v.x, v.y, v.z});
}

glm::vec3 SceneSerializer::DeserializeVec3(const json& data, const glm::vec3& fallback) {
    if (!data.is_array() || data.size() != 3) return fallback;
    return glm::vec3(data[0].get<float>(), data[1].get<float>(), data[2].get<float>());
}

json SceneSerializer::SerializeVec4(const glm::vec4& v) {
    return json::array({v.x, v.y, v.z, v.w});
}

glm::vec4 SceneSerializer::DeserializeVec4(const json& data, const glm::vec4& fallback) {
    if (!data.is_array() || data.size() != 4) return fallback;
    return glm::vec4(data[0].get<float>(), data[1].get<float>(), data[2].get<float>(), data[3].get<float>());
}

// Column major, 16 floats
json SceneSerializer::SerializeMat4(const glm::mat4& m) {
    json arr = json::array();
    for (int c = 0; c < 4; ++c)
        for (int r = 0; r < 4; ++r) arr.push_back(m[c][r]);
    return arr;
}

glm::mat4 SceneSerializer::DeserializeMat4(const json& data) {
    glm::mat4 m(1.0f);
    if (!data.is_array() || data.size() != 16) return m;
    for (int c = 0; c < 4; ++c)
        for (int r = 0; r < 4; ++r) m[c][r] = data[c * 4 + r].get<float>();
    return m;
}

// ---------------- Armature ------------------
json SceneSerializer::SerializeArmature(const rig::Armature& armature) {
    json j;
    j["name"] = armature.Name;
    j["activeBone"] = armature.GetActiveBone();
    json bones = json::array();
    for (const rig::Bone& b : armature.GetBones()) {
        json jb;
        jb["name"] = b.Name;
        jb["parent"] = b.Parent;
        jb["head"] = SerializeVec3(b.Head);
        jb["tail"] = SerializeVec3(b.Tail);
        jb["roll"] = b.Roll;
        jb["connected"] = b.Connected;
        jb["deform"] = b.Deform;
        jb["hide"] = b.Hide;
        jb["select"] = b.Select;
        jb["showWire"] = b.ShowWire;
        jb["tag"] = rig::BoneTagName(b.Tag);
        bones.push_back(std::move(jb));
    }
    j["bones"] = std::move(bones);
    return j;
}

void SceneSerializer::DeserializeArmature(const json& data, rig::Armature& armature) {
    armature.Name = data.value("name", armature.Name);
    armature.BeginEdit();
    if (data.contains("bones")) {
        // Parents may be listed after their children, so link in a second pass.
        std::vector<std::pair<rig::EditBone*, std::string>> parents;
        for (const auto& jb : data["bones"]) {
            rig::EditBone& eb = armature.NewEditBone(jb.value("name", "Bone"));
            eb.Head = DeserializeVec3(jb.value("head", json()), glm::vec3(0.0f));
            eb.Tail = DeserializeVec3(jb.value("tail", json()), glm::vec3(0.0f, 1.0f, 0.0f));
            eb.Roll = jb.value("roll", 0.0f);
            eb.Connected = jb.value("connected", false);
            eb.Deform = jb.value("deform", true);
            eb.Hide = jb.value("hide", false);
            eb.Select = jb.value("select", false);
            eb.ShowWire = jb.value("showWire", false);
            if (!rig::ParseBoneTag(jb.value("tag", "NONE"), eb.Tag)) {
                Logger::LogWarning("[SceneSerializer] Unknown bone tag on " + eb.Name);
                eb.Tag = rig::BoneTag::None;
            }
            parents.emplace_back(&eb, jb.value("parent", ""));
        }
        for (auto& [eb, parentName] : parents) {
            if (parentName.empty()) continue;
            eb->Parent = armature.FindEditBone(parentName);
            if (!eb->Parent) Logger::LogWarning("[SceneSerializer] Missing parent '" + parentName + "' of " + eb->Name);
        }
    }
    armature.EndEdit();
    armature.SetActiveBone(data.value("activeBone", ""));
}

// ---------------- Pose ------------------
json SceneSerializer::SerializePoseBone(const rig::PoseBone& pchan) {
    json j;
    j["name"] = pchan.Name;
    j["rotationMode"] = math::RotationModeName(pchan.RotationMode);
    j["location"] = SerializeVec3(pchan.Location);
    const glm::quat& q = pchan.RotationQuaternion;
    j["rotationQuaternion"] = json::array({q.w, q.x, q.y, q.z});
    j["rotationEuler"] = SerializeVec3(pchan.RotationEuler);
    j["rotationAxisAngle"] = SerializeVec4(pchan.RotationAxisAngle);
    j["scale"] = SerializeVec3(pchan.Scale);

    const rig::PoseBoneDisplay& d = pchan.Display;
    j["display"] = json{
        {"customShape", d.CustomShape},
        {"customShapeTranslation", SerializeVec3(d.CustomShapeTranslation)},
        {"customShapeRotationEuler", SerializeVec3(d.CustomShapeRotationEuler)},
        {"customShapeScale", SerializeVec3(d.CustomShapeScaleXYZ)},
        {"customShapeTransform", d.CustomShapeTransform},
        {"useCustomShapeBoneSize", d.UseCustomShapeBoneSize},
    };

    json constraints = json::array();
    for (const auto& c : pchan.Constraints) constraints.push_back(SerializeConstraint(*c));
    j["constraints"] = std::move(constraints);
    return j;
}

void SceneSerializer::DeserializePoseBone(const json& data, rig::PoseBone& pchan) {
    if (!math::ParseRotationMode(data.value("rotationMode", "QUATERNION"), pchan.RotationMode)) {
        Logger::LogWarning("[SceneSerializer] Unknown rotation mode on " + pchan.Name);
        pchan.RotationMode = math::RotationMode::Quaternion;
    }
    pchan.Location = DeserializeVec3(data.value("location", json()), glm::vec3(0.0f));
    const glm::vec4 q = DeserializeVec4(data.value("rotationQuaternion", json()), glm::vec4(1.0f, 0.0f, 0.0f, 0.0f));
    pchan.RotationQuaternion = glm::quat(q.x, q.y, q.z, q.w);
    pchan.RotationEuler = DeserializeVec3(data.value("rotationEuler", json()), glm::vec3(0.0f));
    pchan.RotationAxisAngle = DeserializeVec4(data.value("rotationAxisAngle", json()), glm::vec4(0.0f, 0.0f, 1.0f, 0.0f));
    pchan.Scale = DeserializeVec3(data.value("scale", json()), glm::vec3(1.0f));

    if (data.contains("display")) {
        const json& jd = data["display"];
        rig::PoseBoneDisplay& d = pchan.Display;
        d.CustomShape = jd.value("customShape", "");
        d.CustomShapeTranslation = DeserializeVec3(jd.value("customShapeTranslation", json()), glm::vec3(0.0f));
        d.CustomShapeRotationEuler = DeserializeVec3(jd.value("customShapeRotationEuler", json()), glm::vec3(0.0f));
        d.CustomShapeScaleXYZ = DeserializeVec3(jd.value("customShapeScale", json()), glm::vec3(1.0f));
        d.CustomShapeTransform = jd.value("customShapeTransform", "");
        d.UseCustomShapeBoneSize = jd.value("useCustomShapeBoneSize", true);
    }
}

// ---------------- Constraints ------------------
json SceneSerializer::SerializeConstraint(const rig::Constraint& c) {
    json j;
    j["type"] = rig::ConstraintTypeName(c.Type());
    j["name"] = c.Name;
    j["enabled"] = c.Enabled;
    j["target"] = c.Target.Object ? c.Target.Object->Name : std::string();
    j["subtarget"] = c.Target.Bone;
    if (const auto* loc = c.As<rig::CopyLocationData>()) {
        j["headTail"] = loc->HeadTail;
    } else if (const auto* ik = c.As<rig::IKData>()) {
        j["poleTarget"] = ik->PoleTarget.Object ? ik->PoleTarget.Object->Name : std::string();
        j["poleSubtarget"] = ik->PoleTarget.Bone;
        j["chainCount"] = ik->ChainCount;
        j["poleAngle"] = ik->PoleAngle;
    }
    return j;
}

bool SceneSerializer::DeserializeConstraint(const json& data, Scene& scene, rig::Constraint& c) {
    rig::ConstraintType type;
    const std::string typeName = data.value("type", "");
    if (!rig::ParseConstraintType(typeName, type)) {
        Logger::LogError("[SceneSerializer] Unknown constraint type '" + typeName + "'");
        return false;
    }
    c.Data = rig::MakeConstraintData(type);
    c.Name = data.value("name", std::string(rig::ConstraintTypeName(type)));
    c.Enabled = data.value("enabled", true);

    auto resolve = [&scene](const std::string& name) -> Object* {
        if (name.empty()) return nullptr;
        Object* obj = scene.FindObject(name);
        if (!obj) Logger::LogWarning("[SceneSerializer] Constraint target '" + name + "' not found");
        return obj;
    };
    c.Target.Object = resolve(data.value("target", ""));
    c.Target.Bone = data.value("subtarget", "");

    if (auto* loc = c.As<rig::CopyLocationData>()) {
        loc->HeadTail = data.value("headTail", 0.0f);
    } else if (auto* ik = c.As<rig::IKData>()) {
        ik->PoleTarget.Object = resolve(data.value("poleTarget", ""));
        ik->PoleTarget.Bone = data.value("poleSubtarget", "");
        ik->ChainCount = data.value("chainCount", 2);
        ik->PoleAngle = data.value("poleAngle", 0.0f);
    }
    return true;
}

// ---------------- Action ------------------
json SceneSerializer::SerializeAction(const animation::Action& action) {
    json j;
    j["name"] = action.Name;
    json curves = json::array();
    for (const auto& c : action.Curves) {
        json jc;
        jc["dataPath"] = c->DataPath;
        jc["index"] = c->ArrayIndex;
        jc["group"] = c->Group;
        json keys = json::array();
        for (const auto& k : c->keys) keys.push_back(json{{"t", k.t}, {"v", k.v}});
        jc["keys"] = std::move(keys);
        curves.push_back(std::move(jc));
    }
    j["fcurves"] = std::move(curves);
    return j;
}

void SceneSerializer::DeserializeAction(const json& data, animation::Action& action) {
    action.Name = data.value("name", "Action");
    if (!data.contains("fcurves")) return;
    for (const auto& jc : data["fcurves"]) {
        animation::FCurve& curve = action.EnsureCurve(jc.value("dataPath", ""), jc.value("index", 0), jc.value("group", ""));
        if (!jc.contains("keys")) continue;
        for (const auto& k : jc["keys"]) curve.InsertKey(k.value("t", 0.0f), k.value("v", 0.0f));
    }
}

// ---------------- Scene ------------------
json SceneSerializer::Serialize(const Scene& scene) {
    json j;
    j["version"] = 1;
    j["frame"] = json{{"current", scene.GetFrame()}, {"start", scene.FrameStart}, {"end", scene.FrameEnd}};
    j["cursor"] = SerializeVec3(scene.CursorLocation);
    j["mode"] = ModeName(scene.GetMode());
    j["activeObject"] = scene.GetActiveObject() ? scene.GetActiveObject()->Name : std::string();

    json objects = json::array();
    for (const auto& o : scene.GetObjects()) {
        json jo;
        jo["name"] = o->Name;
        jo["type"] = ObjectTypeName(o->Type);
        jo["matrixWorld"] = SerializeMat4(o->WorldMatrix);
        jo["select"] = o->Select;
        jo["hideViewport"] = o->HideViewport;
        jo["showInFront"] = o->ShowInFront;
        jo["linked"] = o->IsLinked;
        if (o->Data) {
            jo["armature"] = SerializeArmature(*o->Data);
            json pose = json::array();
            for (const auto& pb : o->Pose.GetBones()) pose.push_back(SerializePoseBone(*pb));
            jo["pose"] = std::move(pose);
        }
        if (o->Action) jo["action"] = SerializeAction(*o->Action);
        objects.push_back(std::move(jo));
    }
    j["objects"] = std::move(objects);
    return j;
}

bool SceneSerializer::Deserialize(const json& data, Scene& scene) {
    if (!scene.GetObjects().empty()) {
        Logger::LogError("[SceneSerializer] Deserialize expects an empty scene");
        return false;
    }
    if (!data.is_object() || !data.contains("objects") || !data["objects"].is_array()) {
        Logger::LogError("[SceneSerializer] Missing objects array");
        return false;
    }

    try {
        if (data.contains("frame")) {
            const json& jf = data["frame"];
            scene.FrameStart = jf.value("start", 1);
            scene.FrameEnd = jf.value("end", 250);
        }
        scene.CursorLocation = DeserializeVec3(data.value("cursor", json()), glm::vec3(0.0f));

        // First pass: objects and armatures, so constraints can find their targets.
        std::vector<std::pair<Object*, const json*>> loaded;
        for (const auto& jo : data["objects"]) {
            ObjectType type = ObjectType::Empty;
            if (!ParseObjectType(jo.value("type", "EMPTY"), type)) {
                Logger::LogWarning("[SceneSerializer] Unknown object type, loading as empty");
            }
            const std::string name = jo.value("name", "Object");
            Object& obj = type == ObjectType::Armature ? scene.CreateArmatureObject(name) : scene.CreateEmptyObject(name);
            if (obj.Name != name)
                Logger::LogWarning("[SceneSerializer] Duplicate object name '" + name + "' renamed to '" + obj.Name + "'");
            obj.WorldMatrix = DeserializeMat4(jo.value("matrixWorld", json()));
            obj.Select = jo.value("select", false);
            obj.HideViewport = jo.value("hideViewport", false);
            obj.ShowInFront = jo.value("showInFront", false);
            obj.IsLinked = jo.value("linked", false);
            if (obj.Data && jo.contains("armature")) {
                DeserializeArmature(jo["armature"], *obj.Data);
                obj.Pose.Rebuild(*obj.Data);
            }
            if (jo.contains("action")) {
                obj.Action = std::make_shared<animation::Action>();
                DeserializeAction(jo["action"], *obj.Action);
            }
            loaded.emplace_back(&obj, &jo);
        }

        // Second pass: pose channels and constraints.
        for (auto& [obj, jo] : loaded) {
            if (!obj->Data || !jo->contains("pose")) continue;
            for (const auto& jp : (*jo)["pose"]) {
                const std::string boneName = jp.value("name", "");
                rig::PoseBone* pb = obj->Pose.FindBone(boneName);
                if (!pb) {
                    Logger::LogWarning("[SceneSerializer] Pose bone '" + boneName + "' has no bone in " + obj->Name);
                    continue;
                }
                DeserializePoseBone(jp, *pb);
                if (!jp.contains("constraints")) continue;
                for (const auto& jc : jp["constraints"]) {
                    auto c = std::make_unique<rig::Constraint>();
                    if (DeserializeConstraint(jc, scene, *c)) pb->Constraints.push_back(std::move(c));
                }
            }
        }

        const std::string active = data.value("activeObject", "");
        scene.SetActiveObject(active.empty() ? nullptr : scene.FindObject(active));

        Mode mode = Mode::Object;
        if (!ParseMode(data.value("mode", "OBJECT"), mode))
            Logger::LogWarning("[SceneSerializer] Unknown mode, using object mode");
        if (mode == Mode::Edit) {
            Logger::LogWarning("[SceneSerializer] Scene was saved in edit mode, loading in object mode");
            mode = Mode::Object;
        }

        int frame = 1;
        if (data.contains("frame")) frame = data["frame"].value("current", 1);
        scene.SetFrame(frame);

        if (mode == Mode::Pose && !scene.SetMode(Mode::Pose))
            Logger::LogWarning("[SceneSerializer] Could not restore pose mode");
    }
    catch (const json::exception& e) {
        Logger::LogError(std::string("[SceneSerializer] JSON error: ") + e.what());
        return false;
    }
    return true;
}

bool SceneSerializer::SaveToFile(const Scene& scene, const std::string& filepath) {
    std::ofstream out(filepath);
    if (!out) {
        Logger::LogError("[SceneSerializer] Failed to save scene to: " + filepath);
        return false;
    }
    out << Serialize(scene).dump(4);
    Logger::Log("[SceneSerializer] Saved: " + filepath);
    return true;
}

bool SceneSerializer::LoadFromFile(const std::string& filepath, Scene& scene) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::LogError("[SceneSerializer] Failed to open scene file: " + filepath);
        return false;
    }

    json j;
    try {
        file >> j;
    }
    catch (const json::parse_error& e) {
        Logger::LogError(std::string("[SceneSerializer] JSON parse error: ") + e.what());
        return false;
    }

    if (!Deserialize(j, scene)) return false;
    Logger::Log("[SceneSerializer] Loaded: " + filepath);
    return true;
}

} // namespace scene
} // namespace rs
