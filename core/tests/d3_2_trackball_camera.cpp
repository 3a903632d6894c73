// D3.2: TrackballCamera: reset, rotate, dolly, pan, matrices
#include "fv/viewport/TrackballCamera.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

static fv::Bounds cube() {
  fv::Bounds b;
  b.expand({-1, -1, -1});
  b.expand({1, 1, 1});
  return b;
}

int main() {
  const double kPi = 3.14159265358979323846;
  const double expectedDist = std::sqrt(3.0) / std::sin(15.0 * kPi / 180.0);

  // ---- Test 1: reset frames the bounds ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    requireNear(cam.focalPoint().x, 0.0, 1e-12, "focal at center");
    requireNear(cam.position().z, expectedDist, 1e-9, "on +Z at fitting distance");
    requireNear(cam.position().x, 0.0, 1e-12, "x = 0");
    requireNear(cam.viewUp().y, 1.0, 1e-12, "up +Y");
    requireTrue(cam.nearPlane() > 0.0 && cam.nearPlane() < cam.farPlane(), "clip planes");
    requireTrue(cam.nearPlane() < expectedDist - std::sqrt(3.0), "near in front of the mesh");
    requireTrue(cam.farPlane() > expectedDist + std::sqrt(3.0), "far behind the mesh");
    std::printf("  Test 1 (reset): PASS\n");
  }

  // ---- Test 2: azimuth ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    cam.azimuth(90.0);
    requireNear(cam.position().x, expectedDist, 1e-9, "swung to +X");
    requireNear(cam.position().z, 0.0, 1e-9, "off the Z axis");
    requireNear(cam.distance(), expectedDist, 1e-9, "distance kept");
    std::printf("  Test 2 (azimuth): PASS\n");
  }

  // ---- Test 3: elevation keeps view-up orthogonal ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    cam.elevation(90.0);
    requireNear(cam.position().y, expectedDist, 1e-9, "raised to +Y");
    fv::Vec3 offset = cam.position() - cam.focalPoint();
    requireNear(fv::dot(cam.viewUp(), offset), 0.0, 1e-9, "view-up orthogonal");
    requireNear(fv::length(cam.viewUp()), 1.0, 1e-9, "view-up unit");
    std::printf("  Test 3 (elevation): PASS\n");
  }

  // ---- Test 4: dolly ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    cam.dolly(2.0);
    requireNear(cam.distance(), expectedDist / 2.0, 1e-9, "halved");
    cam.dolly(0.0);
    cam.dolly(-1.0);
    requireNear(cam.distance(), expectedDist / 2.0, 1e-9, "non-positive factors ignored");
    std::printf("  Test 4 (dolly): PASS\n");
  }

  // ---- Test 5: pan ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    cam.panPixels(10.0, 0.0, 600);
    requireTrue(cam.focalPoint().x < 0.0, "drag right moves the camera left");
    requireNear(cam.focalPoint().y, 0.0, 1e-12, "no vertical motion");
    requireNear(cam.distance(), expectedDist, 1e-9, "distance kept");
    std::printf("  Test 5 (pan): PASS\n");
  }

  // ---- Test 6: input mapping ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    fv::InputState idle;
    requireTrue(!cam.processInput(idle, 800, 600), "no motion");

    fv::InputState wheel;
    wheel.scrollDelta = 1.0;
    requireTrue(cam.processInput(wheel, 800, 600), "wheel moves");
    requireNear(cam.distance(), expectedDist / std::pow(1.1, 2.0), 1e-9, "wheel dolly 1.1^(0.2*10)");

    fv::TrackballCamera cam2;
    cam2.resetToBounds(cube());
    fv::InputState drag;
    drag.rotateDx = 40.0;  // 40 px on an 800 px viewport → 10 degrees
    requireTrue(cam2.processInput(drag, 800, 600), "drag moves");
    double angle = -10.0 * kPi / 180.0;
    requireNear(cam2.position().x, expectedDist * std::sin(angle), 1e-9, "azimuth -10 degrees");

    fv::InputState zero;
    zero.scrollDelta = 1.0;
    requireTrue(!cam2.processInput(zero, 0, 600), "empty viewport ignored");
    std::printf("  Test 6 (input mapping): PASS\n");
  }

  // ---- Test 7: matrices ----
  {
    fv::TrackballCamera cam;
    cam.resetToBounds(cube());
    fv::Vec3 eyeSpace = fv::transformPoint(cam.viewMatrix(), cam.focalPoint());
    requireNear(eyeSpace.x, 0.0, 1e-4, "focal centered x");
    requireNear(eyeSpace.y, 0.0, 1e-4, "focal centered y");
    requireNear(eyeSpace.z, -expectedDist, 1e-4, "focal down -Z");

    fv::Mat4 vp = fv::multiply(cam.projectionMatrix(800.0 / 600.0), cam.viewMatrix());
    fv::Vec3 ndc = fv::transformPoint(vp, {0, 0, 1});
    requireNear(ndc.x, 0.0, 1e-4, "ndc x");
    requireTrue(ndc.z > -1.0 && ndc.z < 1.0, "front face inside the depth range");
    fv::Vec3 corner = fv::transformPoint(vp, {1, 1, 1});
    requireTrue(std::fabs(corner.x) < 1.0 && std::fabs(corner.y) < 1.0, "corner on screen");
    std::printf("  Test 7 (matrices): PASS\n");
  }

  std::printf("D3.2 trackball_camera: ALL PASS\n");
  return 0;
}
