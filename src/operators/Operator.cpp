#include "operators/Operator.h"

#include <algorithm>

#include "core/Errors.h"
#include "core/Logger.h"

namespace rs {
namespace operators {

void Operator::SetProperties(const json& props)
{
    for (auto it = props.begin(); it != props.end(); ++it)
        Logger::LogWarning(std::string("[Operator] ") + IdName() + " has no property '" + it.key() + "'");
}

bool Operator::ReadProperty(const json& props, const char* key, int& value, int minValue, int maxValue)
{
    auto it = props.find(key);
    if (it == props.end()) return false;
    if (!it->is_number()) throw std::runtime_error(std::string("Property '") + key + "' must be a number");
    // Clamp before narrowing so out of range numbers saturate.
    const double v = std::clamp(it->get<double>(), static_cast<double>(minValue), static_cast<double>(maxValue));
    value = static_cast<int>(v);
    return true;
}

bool Operator::ReadProperty(const json& props, const char* key, float& value, float minValue)
{
    auto it = props.find(key);
    if (it == props.end()) return false;
    if (!it->is_number()) throw std::runtime_error(std::string("Property '") + key + "' must be a number");
    value = std::max(it->get<float>(), minValue);
    return true;
}

bool Operator::ReadProperty(const json& props, const char* key, bool& value)
{
    auto it = props.find(key);
    if (it == props.end()) return false;
    if (!it->is_boolean()) throw std::runtime_error(std::string("Property '") + key + "' must be true or false");
    value = it->get<bool>();
    return true;
}

bool Operator::ReadProperty(const json& props, const char* key, std::string& value)
{
    auto it = props.find(key);
    if (it == props.end()) return false;
    value = it->is_string() ? it->get<std::string>() : it->dump();
    return true;
}

void FrameRangeOperator::Invoke(const OperatorContext& ctx)
{
    m_Frames.Start = std::clamp(ctx.Scene.FrameStart, kMinStartFrame, kMaxFrame);
    m_Frames.End = std::clamp(ctx.Scene.FrameEnd, kMinEndFrame, kMaxFrame);
}

void FrameRangeOperator::SetProperties(const json& props)
{
    json rest = props;
    if (ReadProperty(props, "frame_start", m_Frames.Start, kMinStartFrame, kMaxFrame)) rest.erase("frame_start");
    if (ReadProperty(props, "frame_end", m_Frames.End, kMinEndFrame, kMaxFrame)) rest.erase("frame_end");
    Operator::SetProperties(rest);
}

json FrameRangeOperator::GetProperties() const
{
    return json{{"frame_start", m_Frames.Start}, {"frame_end", m_Frames.End}};
}

OperatorStatus CallOperator(Operator& op, OperatorContext& ctx, const json& props, bool invoke)
{
    if (!op.Poll(ctx)) {
        ctx.Reports.Error(std::string(op.Label()) + ": not available in the current mode or selection.");
        return OperatorStatus::Cancelled;
    }

    try {
        if (invoke) op.Invoke(ctx);
        op.SetProperties(props);
        return op.Execute(ctx);
    }
    catch (const InvalidArgumentError& e) {
        ctx.Reports.Error(std::string(op.Label()) + ": " + e.what());
    }
    catch (const std::runtime_error& e) {
        ctx.Reports.Error(std::string(op.Label()) + ": " + e.what());
    }
    return OperatorStatus::Cancelled;
}

} // namespace operators
} // namespace rs
