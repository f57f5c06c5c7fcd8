#include "animation/Action.h"

#include <algorithm>

namespace rs {
namespace animation {

namespace {
const char* kPoseBonesPrefix = "pose.bones[\"";
}

const FCurve* Action::FindCurve(const std::string& dataPath, int index) const
{
    for (const auto& c : Curves)
        if (c->DataPath == dataPath && c->ArrayIndex == index) return c.get();
    return nullptr;
}

FCurve* Action::FindCurve(const std::string& dataPath, int index)
{
    for (auto& c : Curves)
        if (c->DataPath == dataPath && c->ArrayIndex == index) return c.get();
    return nullptr;
}

FCurve& Action::EnsureCurve(const std::string& dataPath, int index, const std::string& group)
{
    if (FCurve* existing = FindCurve(dataPath, index)) return *existing;
    auto curve = std::make_unique<FCurve>();
    curve->DataPath = dataPath;
    curve->ArrayIndex = index;
    curve->Group = group;
    Curves.push_back(std::move(curve));
    return *Curves.back();
}

size_t Action::RemoveCurvesWithPrefix(const std::string& prefix)
{
    const size_t before = Curves.size();
    Curves.erase(std::remove_if(Curves.begin(), Curves.end(),
                                [&](const std::unique_ptr<FCurve>& c) {
                                    return c->DataPath.compare(0, prefix.size(), prefix) == 0;
                                }),
                 Curves.end());
    return before - Curves.size();
}

std::vector<const FCurve*> Action::CurvesWithPrefix(const std::string& prefix) const
{
    std::vector<const FCurve*> out;
    for (const auto& c : Curves)
        if (c->DataPath.compare(0, prefix.size(), prefix) == 0) out.push_back(c.get());
    return out;
}

bool Action::GetFrameRange(float& outStart, float& outEnd) const
{
    bool any = false;
    for (const auto& c : Curves) {
        if (c->keys.empty()) continue;
        if (!any) {
            outStart = c->FirstFrame();
            outEnd = c->LastFrame();
            any = true;
        } else {
            outStart = std::min(outStart, c->FirstFrame());
            outEnd = std::max(outEnd, c->LastFrame());
        }
    }
    return any;
}

std::unique_ptr<Action> Action::Clone() const
{
    auto copy = std::make_unique<Action>();
    copy->Name = Name;
    copy->Curves.reserve(Curves.size());
    for (const auto& c : Curves) copy->Curves.push_back(std::make_unique<FCurve>(*c));
    return copy;
}

std::string PoseBonePath(const std::string& boneName)
{
    std::string out = kPoseBonesPrefix;
    for (char ch : boneName) {
        if (ch == '"' || ch == '\\') out += '\\';
        out += ch;
    }
    out += "\"]";
    return out;
}

std::string PoseBonePath(const std::string& boneName, const std::string& property)
{
    return PoseBonePath(boneName) + "." + property;
}

bool ParsePoseBonePath(const std::string& path, std::string& outBone, std::string& outProperty)
{
    const std::string prefix = kPoseBonesPrefix;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;

    std::string name;
    size_t i = prefix.size();
    for (; i < path.size(); ++i) {
        const char ch = path[i];
        if (ch == '\\' && i + 1 < path.size()) { name += path[++i]; continue; }
        if (ch == '"') break;
        name += ch;
    }
    // expect "]."
    if (i + 2 >= path.size() || path[i + 1] != ']' || path[i + 2] != '.') return false;

    outBone = name;
    outProperty = path.substr(i + 3);
    return !outProperty.empty();
}

} // namespace animation
} // namespace rs
