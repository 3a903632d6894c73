#include "fv/mesh/Mesh.hpp"

#include <cmath>

namespace fv {

double ScalarField::maxAbs() const {
  double m = 0.0;
  for (double v : values) {
    if (!std::isfinite(v)) continue;
    double a = std::fabs(v);
    if (a > m) m = a;
  }
  return m;
}

void Bounds::expand(const Vec3& p) {
  if (!valid) {
    min = p;
    max = p;
    valid = true;
    return;
  }
  min.x = std::fmin(min.x, p.x); max.x = std::fmax(max.x, p.x);
  min.y = std::fmin(min.y, p.y); max.y = std::fmax(max.y, p.y);
  min.z = std::fmin(min.z, p.z); max.z = std::fmax(max.z, p.z);
}

Vec3 Bounds::center() const {
  if (!valid) return {};
  return (min + max) * 0.5;
}

double Bounds::diagonal() const {
  if (!valid) return 0.0;
  return length(max - min);
}

} // namespace fv
