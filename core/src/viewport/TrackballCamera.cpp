#include "fv/viewport/TrackballCamera.hpp"
#include <cmath>

namespace fv {

static constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

void TrackballCamera::resetToBounds(const Bounds& b) {
  Vec3 center = b.center();
  double radius = b.diagonal() * 0.5;
  if (radius <= 0.0) radius = 0.5;

  double halfAngle = config_.viewAngleDeg * 0.5 * kDegToRad;
  double dist = radius / std::sin(halfAngle);

  focal_ = center;
  position_ = center + Vec3{0.0, 0.0, dist};
  viewUp_ = {0.0, 1.0, 0.0};
  radius_ = radius;
}

void TrackballCamera::azimuth(double degrees) {
  Vec3 offset = position_ - focal_;
  Vec3 axis = normalize(viewUp_);
  position_ = focal_ + rotateAround(offset, axis, degrees * kDegToRad);
}

void TrackballCamera::elevation(double degrees) {
  Vec3 offset = position_ - focal_;
  Vec3 right = normalize(cross(viewUp_, offset));
  // Rotating about +right by a positive angle moves the camera down.
  double a = -degrees * kDegToRad;
  position_ = focal_ + rotateAround(offset, right, a);
  viewUp_ = rotateAround(viewUp_, right, a);
  orthogonalizeViewUp();
}

void TrackballCamera::dolly(double factor) {
  if (factor <= 0.0) return;
  Vec3 offset = position_ - focal_;
  position_ = focal_ + offset * (1.0 / factor);
}

void TrackballCamera::panPixels(double dx, double dy, int viewportH) {
  if (viewportH <= 0) return;
  Vec3 offset = position_ - focal_;
  Vec3 right = normalize(cross(viewUp_, offset));
  Vec3 up = normalize(viewUp_);

  // World units covered by one pixel at the focal plane.
  double halfAngle = config_.viewAngleDeg * 0.5 * kDegToRad;
  double worldPerPx = 2.0 * length(offset) * std::tan(halfAngle) /
                      static_cast<double>(viewportH);

  // Scene follows the cursor: drag right moves the camera left.
  Vec3 motion = right * (-dx * worldPerPx) + up * (dy * worldPerPx);
  focal_ = focal_ + motion;
  position_ = position_ + motion;
}

bool TrackballCamera::processInput(const InputState& in, int viewportW, int viewportH) {
  if (viewportW <= 0 || viewportH <= 0) return false;
  bool moved = false;

  if (in.rotateDx != 0 || in.rotateDy != 0) {
    double w = static_cast<double>(viewportW);
    double h = static_cast<double>(viewportH);
    azimuth(-20.0 / w * in.rotateDx * config_.rotateFactor);
    // Window y grows downward.
    elevation(20.0 / h * in.rotateDy * config_.rotateFactor);
    moved = true;
  }

  if (in.panDx != 0 || in.panDy != 0) {
    panPixels(in.panDx, in.panDy, viewportH);
    moved = true;
  }

  if (in.dollyDy != 0) {
    double centerY = static_cast<double>(viewportH) * 0.5;
    dolly(std::pow(1.1, config_.dollyFactor * in.dollyDy / centerY));
    moved = true;
  }

  if (in.scrollDelta != 0) {
    dolly(std::pow(1.1, 0.2 * config_.dollyFactor * in.scrollDelta));
    moved = true;
  }

  return moved;
}

Mat4 TrackballCamera::viewMatrix() const {
  return lookAt(position_, focal_, viewUp_);
}

Mat4 TrackballCamera::projectionMatrix(double aspect) const {
  return perspective(config_.viewAngleDeg, aspect, nearPlane(), farPlane());
}

double TrackballCamera::nearPlane() const {
  double d = distance();
  double n = d - radius_ * 1.01;
  double minNear = (d + radius_ * 1.01) * 0.001;
  return n < minNear ? minNear : n;
}

double TrackballCamera::farPlane() const {
  return distance() + radius_ * 1.01;
}

void TrackballCamera::orthogonalizeViewUp() {
  Vec3 offset = position_ - focal_;
  Vec3 right = normalize(cross(viewUp_, offset));
  viewUp_ = normalize(cross(offset, right));
}

} // namespace fv
