#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Preferences.h"
#include "core/Report.h"
#include "scene/Scene.h"
#include "spaceswitch/Bake.h"
#include "spaceswitch/Selection.h"

namespace rs {
namespace operators {

using json = nlohmann::json;

enum class OperatorStatus { Finished, Cancelled };

struct OperatorContext {
    scene::Scene& Scene;
    const Preferences& Prefs;
    ReportList& Reports;

    spaceswitch::PoseSelection Selection() const { return spaceswitch::GatherPoseSelection(Scene); }
    scene::Mode Mode() const { return Scene.GetMode(); }
};

// A user-facing command. Poll gates availability on mode and selection,
// Invoke fills defaults from the scene, properties can then be overridden
// before Execute.
class Operator {
public:
    virtual ~Operator() = default;

    virtual const char* IdName() const = 0;
    virtual const char* Label() const = 0;
    virtual const char* Description() const = 0;

    virtual bool Poll(const OperatorContext& ctx) const = 0;
    virtual void Invoke(const OperatorContext& /*ctx*/) {}
    virtual OperatorStatus Execute(OperatorContext& ctx) = 0;

    // Unknown keys are ignored with a warning.
    virtual void SetProperties(const json& props);
    virtual json GetProperties() const { return json::object(); }

protected:
    // Consumes key from props if present. Returns true when it was.
    static bool ReadProperty(const json& props, const char* key, int& value, int minValue, int maxValue);
    static bool ReadProperty(const json& props, const char* key, float& value, float minValue);
    static bool ReadProperty(const json& props, const char* key, bool& value);
    static bool ReadProperty(const json& props, const char* key, std::string& value);
};

// Start and end frame, shared by every baking operator.
class FrameRangeOperator : public Operator {
public:
    static constexpr int kMinStartFrame = 0;
    static constexpr int kMinEndFrame = 1;
    static constexpr int kMaxFrame = 300000;

    void Invoke(const OperatorContext& ctx) override;
    void SetProperties(const json& props) override;
    json GetProperties() const override;

    spaceswitch::FrameRange Frames() const { return m_Frames; }

protected:
    spaceswitch::FrameRange m_Frames;
};

// Runs Poll, optionally Invoke, applies props and runs Execute. Runtime
// failures are reported and cancel the operator; internal inconsistencies
// propagate.
OperatorStatus CallOperator(Operator& op, OperatorContext& ctx, const json& props = json::object(), bool invoke = true);

class OperatorRegistry {
public:
    using OperatorFactory = std::function<std::unique_ptr<Operator>()>;

    static OperatorRegistry& Instance() {
        static OperatorRegistry instance;
        return instance;
    }

    void Register(const std::string& idName, OperatorFactory factory) {
        m_Factories[idName] = std::move(factory);
    }

    template <typename T>
    void Register() {
        T prototype;
        Register(prototype.IdName(), []() { return std::make_unique<T>(); });
    }

    // Sorted by id name
    const std::map<std::string, OperatorFactory>& GetRegistry() const {
        return m_Factories;
    }

    // nullptr for unknown ids
    std::unique_ptr<Operator> Create(const std::string& idName) const {
        auto it = m_Factories.find(idName);
        if (it != m_Factories.end())
            return it->second();
        return nullptr;
    }

private:
    std::map<std::string, OperatorFactory> m_Factories;
};

} // namespace operators
} // namespace rs
