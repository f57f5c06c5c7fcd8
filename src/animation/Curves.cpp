#include "animation/Curves.h"

#include <algorithm>
#include <cmath>

namespace rs {
namespace animation {

namespace {
constexpr float kFrameEpsilon = 1e-4f;

template <typename KeyT>
static int findSegment(const std::vector<KeyT>& keys, float t, int hint)
{
    const int n = static_cast<int>(keys.size());
    if (n <= 1) return 0;
    // fast-forward/backtrack from hint
    int i = std::clamp(hint, 0, n - 2);
    if (keys[i].t <= t && t <= keys[i+1].t) return i;
    // binary search
    int lo = 0, hi = n - 2;
    while (lo <= hi) {
        int mid = (lo + hi) / 2;
        if (keys[mid].t <= t) {
            if (t <= keys[mid + 1].t) return mid;
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }
    return std::clamp(lo, 0, n - 2);
}
}

float FCurve::Sample(float t) const
{
    if (keys.empty()) return 0.0f;
    if (keys.size() == 1 || t <= keys.front().t) return keys.front().v;
    if (t >= keys.back().t) return keys.back().v;
    int seg = findSegment(keys, t, cache.last);
    cache.last = seg;
    const auto& k0 = keys[seg];
    const auto& k1 = keys[seg + 1];
    const float dt = (k1.t - k0.t);
    if (dt <= 1e-6f) return k1.v;
    const float a = (t - k0.t) / dt;
    return k0.v * (1.0f - a) + k1.v * a;
}

KeyFloat& FCurve::InsertKey(float t, float v)
{
    auto it = std::lower_bound(keys.begin(), keys.end(), t - kFrameEpsilon,
                               [](const KeyFloat& k, float time) { return k.t < time; });
    if (it != keys.end() && std::fabs(it->t - t) <= kFrameEpsilon) {
        it->v = v;
        return *it;
    }
    KeyFloat key;
    key.id = m_NextKeyID++;
    key.t = t;
    key.v = v;
    return *keys.insert(it, key);
}

const KeyFloat* FCurve::FindKey(float t) const
{
    for (const auto& k : keys)
        if (std::fabs(k.t - t) <= kFrameEpsilon) return &k;
    return nullptr;
}

bool FCurve::RemoveKey(float t)
{
    auto it = std::find_if(keys.begin(), keys.end(),
                           [t](const KeyFloat& k) { return std::fabs(k.t - t) <= kFrameEpsilon; });
    if (it == keys.end()) return false;
    keys.erase(it);
    cache.last = 0;
    return true;
}

} // namespace animation
} // namespace rs
