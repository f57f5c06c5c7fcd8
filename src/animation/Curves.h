#pragma once

#include <vector>
#include <string>
#include <cstdint>

// Scalar keyframe curves driving one component of a pose channel. Linear
// between keys, constant before the first and after the last.

namespace rs {
namespace animation {

using KeyID = std::uint64_t;

struct KeyFloat { KeyID id = 0; float t = 0.0f; float v = 0.0f; };

// Simple segment cache for monotonic key times
struct SegmentCache { mutable int last = 0; };

struct FCurve {
    std::string DataPath;   // e.g. pose.bones["Arm"].location
    int ArrayIndex = 0;
    std::string Group;      // keyframes are grouped by bone name

    std::vector<KeyFloat> keys; // sorted by t
    mutable SegmentCache cache;

    float Sample(float t) const;

    // Inserts a key at frame t, replacing the value of an existing key at
    // the same frame. Keeps keys sorted.
    KeyFloat& InsertKey(float t, float v);
    const KeyFloat* FindKey(float t) const;
    bool RemoveKey(float t);

    float FirstFrame() const { return keys.empty() ? 0.0f : keys.front().t; }
    float LastFrame() const { return keys.empty() ? 0.0f : keys.back().t; }

private:
    KeyID m_NextKeyID = 1;
};

} // namespace animation
} // namespace rs
