#pragma once

#include <memory>
#include <string>
#include <vector>

#include "animation/Curves.h"

namespace rs {
namespace animation {

// Keyed pose channel data of one armature object. Curves are addressed by
// data path and array index.
struct Action {
    std::string Name;
    std::vector<std::unique_ptr<FCurve>> Curves;

    const FCurve* FindCurve(const std::string& dataPath, int index) const;
    FCurve* FindCurve(const std::string& dataPath, int index);
    // Returns the existing curve or appends a new one in the given group.
    FCurve& EnsureCurve(const std::string& dataPath, int index, const std::string& group);

    // Removes every curve whose data path starts with prefix; returns the count.
    size_t RemoveCurvesWithPrefix(const std::string& prefix);
    std::vector<const FCurve*> CurvesWithPrefix(const std::string& prefix) const;

    // Frame span covered by keys. False when the action holds no keys.
    bool GetFrameRange(float& outStart, float& outEnd) const;

    std::unique_ptr<Action> Clone() const;
};

// pose.bones["<name>"] with quotes and backslashes in the name escaped.
std::string PoseBonePath(const std::string& boneName);
// pose.bones["<name>"].<property>
std::string PoseBonePath(const std::string& boneName, const std::string& property);
// Splits a pose bone data path. False when path does not address a pose bone property.
bool ParsePoseBonePath(const std::string& path, std::string& outBone, std::string& outProperty);

} // namespace animation
} // namespace rs
