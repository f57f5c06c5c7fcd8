#include "math/Rotation.h"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/constants.hpp>
#include <glm/gtx/matrix_decompose.hpp>
#include <glm/gtx/norm.hpp>
#include <glm/gtx/quaternion.hpp>

#include <cfloat>
#include <cmath>

namespace rs {
namespace math {

namespace {

struct RotOrderInfo { int axis[3]; bool parity; };

// Axis permutation and parity per Euler order, indexed by RotationMode.
const RotOrderInfo& OrderInfo(RotationMode order) {
    static const RotOrderInfo s_Orders[] = {
        {{0, 1, 2}, false}, // XYZ
        {{0, 2, 1}, true},  // XZY
        {{1, 0, 2}, true},  // YXZ
        {{1, 2, 0}, false}, // YZX
        {{2, 0, 1}, false}, // ZXY
        {{2, 1, 0}, true},  // ZYX
    };
    switch (order) {
        case RotationMode::EulerXZY: return s_Orders[1];
        case RotationMode::EulerYXZ: return s_Orders[2];
        case RotationMode::EulerYZX: return s_Orders[3];
        case RotationMode::EulerZXY: return s_Orders[4];
        case RotationMode::EulerZYX: return s_Orders[5];
        default: return s_Orders[0];
    }
}

float AbsSum(const glm::vec3& v) { return std::fabs(v.x) + std::fabs(v.y) + std::fabs(v.z); }

} // namespace

const char* RotationModeName(RotationMode mode) {
    switch (mode) {
        case RotationMode::Quaternion: return "QUATERNION";
        case RotationMode::EulerXYZ: return "XYZ";
        case RotationMode::EulerXZY: return "XZY";
        case RotationMode::EulerYXZ: return "YXZ";
        case RotationMode::EulerYZX: return "YZX";
        case RotationMode::EulerZXY: return "ZXY";
        case RotationMode::EulerZYX: return "ZYX";
        case RotationMode::AxisAngle: return "AXIS_ANGLE";
    }
    return "QUATERNION";
}

bool ParseRotationMode(const std::string& name, RotationMode& out) {
    static const RotationMode s_All[] = {
        RotationMode::Quaternion, RotationMode::EulerXYZ, RotationMode::EulerXZY, RotationMode::EulerYXZ,
        RotationMode::EulerYZX, RotationMode::EulerZXY, RotationMode::EulerZYX, RotationMode::AxisAngle,
    };
    for (RotationMode mode : s_All) {
        if (name == RotationModeName(mode)) { out = mode; return true; }
    }
    return false;
}

glm::mat3 EulerToMat3(const glm::vec3& eul, RotationMode order) {
    const RotOrderInfo& R = OrderInfo(order);
    const int i = R.axis[0], j = R.axis[1], k = R.axis[2];

    float ti = eul[i], tj = eul[j], th = eul[k];
    if (R.parity) { ti = -ti; tj = -tj; th = -th; }

    const float ci = std::cos(ti), cj = std::cos(tj), ch = std::cos(th);
    const float si = std::sin(ti), sj = std::sin(tj), sh = std::sin(th);
    const float cc = ci * ch, cs = ci * sh, sc = si * ch, ss = si * sh;

    glm::mat3 M(1.0f);
    M[i][i] = cj * ch;
    M[j][i] = sj * sc - cs;
    M[k][i] = sj * cc + ss;
    M[i][j] = cj * sh;
    M[j][j] = sj * ss + cc;
    M[k][j] = sj * cs - sc;
    M[i][k] = -sj;
    M[j][k] = cj * si;
    M[k][k] = cj * ci;
    return M;
}

glm::vec3 Mat3ToEuler(const glm::mat3& m, RotationMode order) {
    const RotOrderInfo& R = OrderInfo(order);
    const int i = R.axis[0], j = R.axis[1], k = R.axis[2];

    glm::vec3 eul1(0.0f), eul2(0.0f);
    const float cy = std::hypot(m[i][i], m[i][j]);
    if (cy > 16.0f * FLT_EPSILON) {
        eul1[i] = std::atan2(m[j][k], m[k][k]);
        eul1[j] = std::atan2(-m[i][k], cy);
        eul1[k] = std::atan2(m[i][j], m[i][i]);

        eul2[i] = std::atan2(-m[j][k], -m[k][k]);
        eul2[j] = std::atan2(-m[i][k], -cy);
        eul2[k] = std::atan2(-m[i][j], -m[i][i]);
    } else {
        // Gimbal lock: first and last axis coincide, put everything on the first.
        eul1[i] = std::atan2(-m[k][j], m[j][j]);
        eul1[j] = std::atan2(-m[i][k], cy);
        eul1[k] = 0.0f;
        eul2 = eul1;
    }

    if (R.parity) { eul1 = -eul1; eul2 = -eul2; }

    return AbsSum(eul1) > AbsSum(eul2) ? eul2 : eul1;
}

glm::mat3 AxisAngleToMat3(const glm::vec4& axisAngle) {
    glm::vec3 axis(axisAngle.y, axisAngle.z, axisAngle.w);
    if (glm::length2(axis) < 1e-12f) return glm::mat3(1.0f);
    return glm::mat3_cast(glm::angleAxis(axisAngle.x, glm::normalize(axis)));
}

glm::vec4 Mat3ToAxisAngle(const glm::mat3& m) {
    glm::quat q = glm::normalize(glm::quat_cast(m));
    if (q.w < 0.0f) q = -q;
    const float angle = 2.0f * std::acos(glm::clamp(q.w, -1.0f, 1.0f));
    const glm::vec3 v(q.x, q.y, q.z);
    if (glm::length2(v) < 1e-12f) return glm::vec4(0.0f, 0.0f, 1.0f, 0.0f);
    const glm::vec3 axis = glm::normalize(v);
    return glm::vec4(angle, axis.x, axis.y, axis.z);
}

glm::vec3 MakeCompatibleEuler(const glm::vec3& eul, const glm::vec3& prev) {
    const float turn = glm::two_pi<float>();
    glm::vec3 out = eul;
    for (int a = 0; a < 3; ++a) {
        const float turns = std::round((prev[a] - eul[a]) / turn);
        out[a] = eul[a] + turns * turn;
    }
    return out;
}

glm::quat MakeCompatibleQuat(const glm::quat& q, const glm::quat& prev) {
    const glm::vec4 a(q.w, q.x, q.y, q.z);
    const glm::vec4 p(prev.w, prev.x, prev.y, prev.z);
    if (glm::distance2(a, p) > glm::distance2(-a, p)) return -q;
    return q;
}

float QuatComponent(const glm::quat& q, int index) {
    switch (index) {
        case 0: return q.w;
        case 1: return q.x;
        case 2: return q.y;
        default: return q.z;
    }
}

void SetQuatComponent(glm::quat& q, int index, float value) {
    switch (index) {
        case 0: q.w = value; break;
        case 1: q.x = value; break;
        case 2: q.y = value; break;
        default: q.z = value; break;
    }
}

glm::quat RotationBetween(const glm::vec3& a, const glm::vec3& b) {
    glm::vec3 na = glm::length2(a) > 1e-12f ? glm::normalize(a) : glm::vec3(0,1,0);
    glm::vec3 nb = glm::length2(b) > 1e-12f ? glm::normalize(b) : glm::vec3(0,1,0);
    float d = glm::clamp(glm::dot(na, nb), -1.0f, 1.0f);
    if (d > 1.0f - 1e-6f) return glm::quat(1,0,0,0);
    if (d < -1.0f + 1e-6f) {
        // 180-deg: choose arbitrary orthogonal axis
        glm::vec3 axis = std::fabs(na.x) < 0.99f ? glm::normalize(glm::cross(na, glm::vec3(1,0,0)))
                                                 : glm::normalize(glm::cross(na, glm::vec3(0,1,0)));
        return glm::angleAxis(glm::pi<float>(), axis);
    }
    glm::vec3 axis = glm::normalize(glm::cross(na, nb));
    return glm::angleAxis(std::acos(d), axis);
}

glm::mat3 BoneOrientation(const glm::vec3& dir, float roll) {
    const glm::mat3 align = glm::mat3_cast(RotationBetween(glm::vec3(0,1,0), dir));
    if (roll == 0.0f) return align;
    return align * glm::mat3_cast(glm::angleAxis(roll, glm::vec3(0,1,0)));
}

void DecomposeTRS(const glm::mat4& m, glm::vec3& T, glm::mat3& R, glm::vec3& S) {
    glm::quat q;
    glm::vec3 skew;
    glm::vec4 perspective;
    const bool ok = glm::decompose(m, S, q, T, skew, perspective);
    if (!ok || glm::any(glm::isnan(glm::vec4(q.x, q.y, q.z, q.w)))) {
        // Zero scale axis: keep translation and scale, rotation is undefined.
        T = glm::vec3(m[3]);
        S = glm::vec3(glm::length(glm::vec3(m[0])), glm::length(glm::vec3(m[1])), glm::length(glm::vec3(m[2])));
        R = glm::mat3(1.0f);
        return;
    }
    R = glm::mat3_cast(glm::normalize(q));
}

glm::mat4 ComposeTRS(const glm::vec3& T, const glm::mat3& R, const glm::vec3& S) {
    glm::mat4 m(1.0f);
    m[0] = glm::vec4(R[0] * S.x, 0.0f);
    m[1] = glm::vec4(R[1] * S.y, 0.0f);
    m[2] = glm::vec4(R[2] * S.z, 0.0f);
    m[3] = glm::vec4(T, 1.0f);
    return m;
}

} // namespace math
} // namespace rs
