// IKSolvers.h
#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace rs { namespace animation { namespace ik {

struct TwoBoneInputs {
    glm::vec3 rootPos{0.0f};   // head of the upper bone
    glm::vec3 midPos{0.0f};    // head of the lower bone
    glm::vec3 endPos{0.0f};    // tail of the lower bone
    glm::vec3 targetPos{0.0f};
    glm::vec3 polePos{0.0f};
    bool hasPole = false;
    float poleAngle = 0.0f;    // radians, rotates the bend plane about root->target
    float upperLen = 0.0f;
    float lowerLen = 0.0f;
};

struct TwoBoneResult {
    // World space rotations taking the current segment directions onto the
    // solved ones. The upper pivots about rootPos, the lower is moved to midDesired.
    glm::quat upperRot{1,0,0,0};
    glm::quat lowerRot{1,0,0,0};
    glm::vec3 midDesired{0.0f};
    float error = 0.0f;
};

// Analytic two-bone solve (law of cosines). Returns false for a degenerate
// chain (zero length segment).
bool SolveTwoBone(const TwoBoneInputs& in, TwoBoneResult& out);

} } }
