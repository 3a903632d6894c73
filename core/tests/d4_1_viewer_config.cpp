// D4.1: ViewerConfig JSON round-trip and partial overrides
#include "fv/session/ViewerConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: defaults ----
  {
    fv::ViewerConfig cfg;
    requireTrue(cfg.windowWidth == 800 && cfg.windowHeight == 600, "800x600");
    requireTrue(cfg.scale.start == (fv::Color{1.0, 0.5, 0.5, 1.0}), "light red start");
    requireTrue(cfg.scale.end == fv::ColorScale::defaultEnd(), "green end");
    requireTrue(cfg.background == (fv::Color{0.0, 0.0, 0.0, 1.0}), "black background");
    requireTrue(cfg.camera.viewAngleDeg == 30.0, "30 degree view angle");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: round-trip ----
  {
    fv::ViewerConfig a;
    a.windowWidth = 1024;
    a.windowHeight = 768;
    a.title = "Cortex";
    a.background = {0.1, 0.2, 0.3, 1.0};
    a.surface = {0.5, 0.5, 0.25, 1.0};
    a.scale.middle = {1.0, 1.0, 1.0, 1.0};
    a.camera.rotateFactor = 5.0;
    a.camera.viewAngleDeg = 45.0;

    std::string json = fv::serializeViewerConfig(a);
    requireTrue(json.find("\"window\"") != std::string::npos, "window section");
    requireTrue(json.find("\"Cortex\"") != std::string::npos, "title written");

    fv::ViewerConfig b;
    requireTrue(fv::deserializeViewerConfig(json, b), "parses");
    requireTrue(b.windowWidth == 1024 && b.windowHeight == 768, "size");
    requireTrue(b.title == "Cortex", "title");
    requireTrue(b.background == a.background, "background");
    requireTrue(b.surface == a.surface, "surface");
    requireTrue(b.scale.start == a.scale.start, "scale start");
    requireTrue(b.scale.middle == a.scale.middle, "scale middle");
    requireTrue(b.camera.rotateFactor == 5.0, "rotate factor");
    requireTrue(b.camera.dollyFactor == 10.0, "dolly factor");
    requireTrue(b.camera.viewAngleDeg == 45.0, "view angle");
    std::printf("  Test 2 (round-trip): PASS\n");
  }

  // ---- Test 3: partial document ----
  {
    fv::ViewerConfig cfg;
    requireTrue(fv::deserializeViewerConfig(
        R"({"scale":{"end":[0,0,1]},"camera":{"dollyFactor":4}})", cfg), "parses");
    requireTrue(cfg.scale.end == (fv::Color{0.0, 0.0, 1.0, 1.0}), "end overridden");
    requireTrue(cfg.scale.start == (fv::Color{1.0, 0.5, 0.5, 1.0}), "start kept");
    requireTrue(cfg.camera.dollyFactor == 4.0, "dolly overridden");
    requireTrue(cfg.windowWidth == 800, "window kept");
    std::printf("  Test 3 (partial): PASS\n");
  }

  // ---- Test 4: invalid members are ignored ----
  {
    fv::ViewerConfig cfg;
    requireTrue(fv::deserializeViewerConfig(
        R"({"window":{"width":-5,"height":"tall"},"background":[1,0]})", cfg), "parses");
    requireTrue(cfg.windowWidth == 800 && cfg.windowHeight == 600, "bad size ignored");
    requireTrue(cfg.background == (fv::Color{0.0, 0.0, 0.0, 1.0}), "short color ignored");
    std::printf("  Test 4 (invalid members): PASS\n");
  }

  // ---- Test 5: malformed input ----
  {
    fv::ViewerConfig cfg;
    requireTrue(!fv::deserializeViewerConfig("{not json", cfg), "parse error");
    requireTrue(!fv::deserializeViewerConfig("[1,2,3]", cfg), "array root");
    requireTrue(cfg.windowWidth == 800, "untouched");
    std::printf("  Test 5 (malformed): PASS\n");
  }

  std::printf("D4.1 viewer_config: ALL PASS\n");
  return 0;
}
