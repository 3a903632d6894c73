#pragma once
#include "fv/math/Vec3.hpp"

namespace fv {

// Column-major 4x4 matrix, laid out the way glUniformMatrix4fv expects
// with transpose = GL_FALSE.
struct Mat4 {
  float m[16] = {1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,0,1};

  float& at(int row, int col) { return m[col * 4 + row]; }
  float at(int row, int col) const { return m[col * 4 + row]; }
};

Mat4 multiply(const Mat4& a, const Mat4& b);

// OpenGL-style perspective, NDC z in [-1, 1]. fovY in degrees.
Mat4 perspective(double fovYDeg, double aspect, double zNear, double zFar);

// Right-handed view matrix looking from eye toward center.
Mat4 lookAt(const Vec3& eye, const Vec3& center, const Vec3& up);

// Apply to a point (w = 1) and return the homogeneous result divided by w.
Vec3 transformPoint(const Mat4& mat, const Vec3& p);

} // namespace fv
