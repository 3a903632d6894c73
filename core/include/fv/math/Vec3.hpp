#pragma once
#include <cmath>

namespace fv {

struct Vec3 {
  double x{0}, y{0}, z{0};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(const Vec3& a, double s) { return {a.x * s, a.y * s, a.z * s}; }

inline double dot(const Vec3& a, const Vec3& b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
  return {a.y * b.z - a.z * b.y,
          a.z * b.x - a.x * b.z,
          a.x * b.y - a.y * b.x};
}

inline double length(const Vec3& v) { return std::sqrt(dot(v, v)); }

// Returns v unchanged when it has (near) zero length.
inline Vec3 normalize(const Vec3& v) {
  double len = length(v);
  if (len < 1e-12) return v;
  return v * (1.0 / len);
}

// Rotate v around a unit axis by angle (radians), Rodrigues' formula.
inline Vec3 rotateAround(const Vec3& v, const Vec3& axis, double angle) {
  double c = std::cos(angle);
  double s = std::sin(angle);
  return v * c + cross(axis, v) * s + axis * (dot(axis, v) * (1.0 - c));
}

} // namespace fv
