#pragma once
#include "fv/math/Mat4.hpp"
#include "fv/math/Vec3.hpp"
#include "fv/mesh/Mesh.hpp"
#include "fv/viewport/InputState.hpp"

namespace fv {

struct TrackballConfig {
  double rotateFactor{10.0};  // degrees per 1/20 of the viewport per drag
  double dollyFactor{10.0};   // drag and wheel dolly motion factor
  double viewAngleDeg{30.0};
};

// Free rotate / pan / dolly camera orbiting a focal point.
class TrackballCamera {
public:
  void setConfig(const TrackballConfig& cfg) { config_ = cfg; }
  const TrackballConfig& config() const { return config_; }

  // Frame the bounds: focal point at the center, camera on +Z looking
  // down -Z, far enough back that the bounding sphere fits the view angle.
  void resetToBounds(const Bounds& b);

  void azimuth(double degrees);
  void elevation(double degrees);
  void dolly(double factor);                 // > 1 moves toward the focal point
  void panPixels(double dx, double dy, int viewportH);

  // Map accumulated mouse motion onto the camera. Returns true if moved.
  bool processInput(const InputState& in, int viewportW, int viewportH);

  Mat4 viewMatrix() const;
  Mat4 projectionMatrix(double aspect) const;

  const Vec3& position() const { return position_; }
  const Vec3& focalPoint() const { return focal_; }
  const Vec3& viewUp() const { return viewUp_; }
  double distance() const { return length(position_ - focal_); }
  double nearPlane() const;
  double farPlane() const;

private:
  void orthogonalizeViewUp();

  TrackballConfig config_;
  Vec3 position_{0, 0, 1};
  Vec3 focal_{0, 0, 0};
  Vec3 viewUp_{0, 1, 0};
  double radius_{0.5};
};

} // namespace fv
