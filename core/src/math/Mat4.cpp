#include "fv/math/Mat4.hpp"
#include <cmath>

namespace fv {

Mat4 multiply(const Mat4& a, const Mat4& b) {
  Mat4 r;
  for (int row = 0; row < 4; row++) {
    for (int col = 0; col < 4; col++) {
      float sum = 0.0f;
      for (int k = 0; k < 4; k++) sum += a.at(row, k) * b.at(k, col);
      r.at(row, col) = sum;
    }
  }
  return r;
}

Mat4 perspective(double fovYDeg, double aspect, double zNear, double zFar) {
  const double kPi = 3.14159265358979323846;
  double f = 1.0 / std::tan(fovYDeg * kPi / 360.0);
  if (aspect <= 0.0) aspect = 1.0;

  Mat4 r;
  for (float& v : r.m) v = 0.0f;
  r.at(0, 0) = static_cast<float>(f / aspect);
  r.at(1, 1) = static_cast<float>(f);
  r.at(2, 2) = static_cast<float>((zFar + zNear) / (zNear - zFar));
  r.at(2, 3) = static_cast<float>(2.0 * zFar * zNear / (zNear - zFar));
  r.at(3, 2) = -1.0f;
  return r;
}

Mat4 lookAt(const Vec3& eye, const Vec3& center, const Vec3& up) {
  Vec3 f = normalize(center - eye);
  Vec3 s = normalize(cross(f, up));
  Vec3 u = cross(s, f);

  Mat4 r;
  r.at(0, 0) = static_cast<float>(s.x);
  r.at(0, 1) = static_cast<float>(s.y);
  r.at(0, 2) = static_cast<float>(s.z);
  r.at(1, 0) = static_cast<float>(u.x);
  r.at(1, 1) = static_cast<float>(u.y);
  r.at(1, 2) = static_cast<float>(u.z);
  r.at(2, 0) = static_cast<float>(-f.x);
  r.at(2, 1) = static_cast<float>(-f.y);
  r.at(2, 2) = static_cast<float>(-f.z);
  r.at(0, 3) = static_cast<float>(-dot(s, eye));
  r.at(1, 3) = static_cast<float>(-dot(u, eye));
  r.at(2, 3) = static_cast<float>(dot(f, eye));
  return r;
}

Vec3 transformPoint(const Mat4& mat, const Vec3& p) {
  double in[4] = {p.x, p.y, p.z, 1.0};
  double out[4] = {0, 0, 0, 0};
  for (int row = 0; row < 4; row++) {
    for (int k = 0; k < 4; k++) out[row] += static_cast<double>(mat.at(row, k)) * in[k];
  }
  if (std::fabs(out[3]) < 1e-12) return {out[0], out[1], out[2]};
  return {out[0] / out[3], out[1] / out[3], out[2] / out[3]};
}

} // namespace fv
