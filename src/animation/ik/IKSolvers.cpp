// IKSolvers.cpp
// Two-bone IK using law of cosines, bend plane from the pole target or the
// current chain.

#include "animation/ik/IKSolvers.h"

#include "math/Rotation.h"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/norm.hpp>
#include <glm/gtx/quaternion.hpp>

#include <cmath>

namespace rs { namespace animation { namespace ik {

namespace {
glm::vec3 PerpendicularTo(const glm::vec3& v, const glm::vec3& fwd) {
    return v - fwd * glm::dot(v, fwd);
}
}

bool SolveTwoBone(const TwoBoneInputs& in, TwoBoneResult& out)
{
    const glm::vec3 root = in.rootPos;
    const glm::vec3 mid  = in.midPos;
    const glm::vec3 end  = in.endPos;
    const glm::vec3 target = in.targetPos;

    float upper = in.upperLen > 0.0f ? in.upperLen : glm::length(mid - root);
    float lower = in.lowerLen > 0.0f ? in.lowerLen : glm::length(end - mid);
    if (upper <= 1e-6f || lower <= 1e-6f) return false;

    const float maxReach = upper + lower;
    const float minReach = std::fabs(upper - lower);
    glm::vec3 rootToTarget = target - root;
    float dist = glm::length(rootToTarget);
    float tdist = glm::clamp(dist, std::max(minReach, 1e-6f), maxReach);

    // Desired plane: defined by root->target and pole (if provided), else the current bend
    glm::vec3 fwd = (dist > 1e-6f) ? (rootToTarget / dist) : glm::normalize(mid - root);
    glm::vec3 up(0.0f);
    if (in.hasPole) up = PerpendicularTo(in.polePos - root, fwd);
    if (glm::length2(up) < 1e-10f) up = PerpendicularTo(mid - root, fwd);
    if (glm::length2(up) < 1e-10f) up = PerpendicularTo(glm::vec3(0,0,1), fwd);
    if (glm::length2(up) < 1e-10f) up = PerpendicularTo(glm::vec3(1,0,0), fwd);
    up = glm::normalize(up);
    if (in.hasPole && in.poleAngle != 0.0f)
        up = glm::normalize(glm::angleAxis(in.poleAngle, fwd) * up);

    // Angle at the root, opposite the lower segment
    float a = upper; float b = lower; float c = tdist;
    float cosAtRoot = glm::clamp((a*a + c*c - b*b)/(2.0f*a*c), -1.0f, 1.0f);
    float rootAngle = std::acos(cosAtRoot);
    glm::vec3 midDesired = root + fwd * (std::cos(rootAngle) * a) + up * (std::sin(rootAngle) * a);
    glm::vec3 endDesired = root + fwd * c; // at the target, or as far as the chain reaches

    out.upperRot = glm::normalize(math::RotationBetween(mid - root, midDesired - root));
    out.lowerRot = glm::normalize(math::RotationBetween(end - mid, endDesired - midDesired));
    out.midDesired = midDesired;
    out.error = glm::length(target - endDesired);
    return true;
}

} } }
