#pragma once

#include <string>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace rs {
namespace math {

// Rotation representations a pose channel can be keyed in.
enum class RotationMode {
    Quaternion,
    EulerXYZ,
    EulerXZY,
    EulerYXZ,
    EulerYZX,
    EulerZXY,
    EulerZYX,
    AxisAngle
};

inline bool IsEuler(RotationMode mode) {
    return mode != RotationMode::Quaternion && mode != RotationMode::AxisAngle;
}

const char* RotationModeName(RotationMode mode);
bool ParseRotationMode(const std::string& name, RotationMode& out);

// Euler triples are stored per axis (x, y, z) whatever the order. The order
// only decides how the three axis rotations are multiplied; XYZ applies X
// first, i.e. M = Rz * Ry * Rx.
glm::mat3 EulerToMat3(const glm::vec3& eul, RotationMode order);
// Of the two triples producing the matrix, returns the one with the smaller
// absolute sum. The matrix must be orthonormal.
glm::vec3 Mat3ToEuler(const glm::mat3& m, RotationMode order);

// Axis-angle is stored as (angle, x, y, z).
glm::mat3 AxisAngleToMat3(const glm::vec4& axisAngle);
glm::vec4 Mat3ToAxisAngle(const glm::mat3& m);

// Shifts each component by whole turns so it lies as close as possible to
// the same component of prev.
glm::vec3 MakeCompatibleEuler(const glm::vec3& eul, const glm::vec3& prev);
// Returns q or -q, whichever is closer to prev in 4D.
glm::quat MakeCompatibleQuat(const glm::quat& q, const glm::quat& prev);

// Quaternion component access in w, x, y, z order.
float QuatComponent(const glm::quat& q, int index);
void SetQuatComponent(glm::quat& q, int index, float value);

// Shortest-arc rotation taking direction a onto direction b.
glm::quat RotationBetween(const glm::vec3& a, const glm::vec3& b);

// Orientation of a bone pointing along dir (+Y axis), rolled about that axis.
glm::mat3 BoneOrientation(const glm::vec3& dir, float roll);

// Splits m into translation, orthonormal rotation and per-axis scale. A
// negative determinant is carried by negative scale.
void DecomposeTRS(const glm::mat4& m, glm::vec3& T, glm::mat3& R, glm::vec3& S);
glm::mat4 ComposeTRS(const glm::vec3& T, const glm::mat3& R, const glm::vec3& S);

} // namespace math
} // namespace rs
