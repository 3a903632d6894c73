// D1.1: ColorScale: diverging 512-entry table
// Tests:
//   1. Table size and anchor colors at the boundaries
//   2. Effective range is half the requested range
//   3. Interpolation in each half (forward / reversed weights)
//   4. Value → index mapping and saturation
//   5. Determinism
//   6. Degenerate (zero-width) range
//   7. Degenerate range at large magnitude
//   8. Non-finite values and ranges, entry clamping

#include "fv/color/ColorScale.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.12f, expected %.12f)\n", msg, a, b);
    std::exit(1);
  }
}

static void requireColorNear(const fv::Color& a, const fv::Color& b, const char* msg) {
  requireNear(a.r, b.r, 1e-12, msg);
  requireNear(a.g, b.g, 1e-12, msg);
  requireNear(a.b, b.b, 1e-12, msg);
  requireNear(a.a, b.a, 1e-12, msg);
}

int main() {
  const fv::Color start{1.0, 0.5, 0.5, 1.0};
  const fv::Color middle{0.9, 0.9, 0.9, 1.0};
  const fv::Color end{0.0, 1.0, 0.0, 1.0};

  // ---- Test 1: size and anchors ----
  {
    fv::ColorScale s = fv::ColorScale::build(-3.0, 3.0, start, middle, end);
    requireTrue(s.size() == 512, "512 entries");
    requireTrue(s.entry(0) == start, "entry 0 is start exactly");
    requireTrue(s.entry(511) == end, "entry 511 is end exactly");
    requireColorNear(s.entry(255), middle, "entry 255 is middle");
    requireColorNear(s.entry(256), middle, "entry 256 is middle");

    for (int i = 0; i < s.size(); i++) {
      requireTrue(s.entry(i).a == 1.0, "alpha opaque");
    }

    // Defaults: blue → light gray → green
    fv::ColorScale d = fv::ColorScale::build();
    requireTrue(d.entry(0) == fv::Color{0.0, 0.0, 1.0, 1.0}, "default start blue");
    requireTrue(d.entry(511) == fv::Color{0.0, 1.0, 0.0, 1.0}, "default end green");
    requireColorNear(d.entry(256), fv::Color{0.9, 0.9, 0.9, 1.0}, "default middle gray");
    requireTrue(d.minimum() == -1.0 && d.maximum() == 1.0, "default range");
    std::printf("  Test 1 (size + anchors): PASS\n");
  }

  // ---- Test 2: halved domain ----
  {
    fv::ColorScale s = fv::ColorScale::build(-4.0, 2.0);
    requireTrue(s.minimum() == -4.0 && s.maximum() == 2.0, "requested range kept");
    requireNear(s.tableMin(), -2.0, 1e-15, "tableMin = min * 0.5");
    requireNear(s.tableMax(), 1.0, 1e-15, "tableMax = max * 0.5");
    requireTrue(fv::ColorScale::kRangeScale == 0.5, "range scale constant");
    std::printf("  Test 2 (halved domain): PASS\n");
  }

  // ---- Test 3: interpolation per half ----
  {
    fv::ColorScale s = fv::ColorScale::build(-1.0, 1.0, start, middle, end);

    // Lower half, forward weight i/255 from start.
    const fv::Color& lo = s.entry(51);
    requireNear(lo.r, (middle.r - start.r) * 51 / 255.0 + start.r, 1e-15, "lower r");
    requireNear(lo.g, (middle.g - start.g) * 51 / 255.0 + start.g, 1e-15, "lower g");

    // Upper half, reversed weight (255-i)/255 from end.
    const fv::Color& hi = s.entry(256 + 51);
    requireNear(hi.r, (middle.r - end.r) * 204 / 255.0 + end.r, 1e-15, "upper r");
    requireNear(hi.g, (middle.g - end.g) * 204 / 255.0 + end.g, 1e-15, "upper g");

    // Moving away from the midpoint the upper half approaches end.
    requireTrue(s.entry(300).r > s.entry(400).r, "upper half red falls toward end");
    requireTrue(s.entry(100).g < s.entry(200).g, "lower half green rises toward middle");
    std::printf("  Test 3 (interpolation): PASS\n");
  }

  // ---- Test 4: value mapping ----
  {
    fv::ColorScale s = fv::ColorScale::build(-2.0, 2.0, start, middle, end);  // table [-1, 1]
    requireTrue(s.indexForValue(0.0) == 256, "zero maps to 256");
    requireTrue(s.indexForValue(-1.0) == 0, "table min maps to 0");
    requireTrue(s.indexForValue(1.0) == 511, "table max maps to 511");
    requireTrue(s.indexForValue(1.5) == 511, "above table max saturates");
    requireTrue(s.indexForValue(-2.0) == 0, "requested min saturates");
    requireTrue(s.indexForValue(-0.5) == 128, "quarter point");
    requireTrue(s.indexForValue(std::numeric_limits<double>::quiet_NaN()) == 0, "NaN → 0");
    requireTrue(s.mapValue(2.0) == end, "requested max colors as end");
    requireTrue(s.mapValue(-2.0) == start, "requested min colors as start");
    std::printf("  Test 4 (value mapping): PASS\n");
  }

  // ---- Test 5: determinism ----
  {
    fv::ColorScale a = fv::ColorScale::build(-0.7, 0.7, start, middle, end);
    fv::ColorScale b = fv::ColorScale::build(-0.7, 0.7, start, middle, end);
    for (int i = 0; i < a.size(); i++) {
      requireTrue(a.entry(i) == b.entry(i), "bit-identical entries");
    }
    requireTrue(a.tableMin() == b.tableMin() && a.tableMax() == b.tableMax(), "same range");
    std::printf("  Test 5 (determinism): PASS\n");
  }

  // ---- Test 6: zero-width range ----
  {
    fv::ColorScale s = fv::ColorScale::build(0.0, 0.0, start, middle, end);
    requireTrue(s.tableMax() > s.tableMin(), "range widened");
    requireTrue(s.mapValue(-1.0) == start, "below collapses to start");
    requireTrue(s.mapValue(1.0) == end, "above collapses to end");
    std::printf("  Test 6 (degenerate range): PASS\n");
  }

  // ---- Test 7: degenerate range at large magnitude ----
  {
    fv::ColorScale s = fv::ColorScale::build(4e4, 4e4, start, middle, end);
    requireTrue(s.tableMax() > s.tableMin(), "range widened past rounding");
    int idx = s.indexForValue(2e4);
    requireTrue(idx >= 0 && idx < s.size(), "index inside the table");
    requireTrue(s.mapValue(1e4) == start, "below collapses to start");
    requireTrue(s.mapValue(3e4) == end, "above collapses to end");

    fv::ColorScale n = fv::ColorScale::build(-4e4, -4e4, start, middle, end);
    requireTrue(n.tableMax() > n.tableMin(), "negative point widened");
    idx = n.indexForValue(-2e4);
    requireTrue(idx >= 0 && idx < n.size(), "negative point index inside the table");
    std::printf("  Test 7 (large degenerate range): PASS\n");
  }

  // ---- Test 8: non-finite values and ranges ----
  {
    const double inf = std::numeric_limits<double>::infinity();
    fv::ColorScale s = fv::ColorScale::build(-1.0, 1.0, start, middle, end);
    requireTrue(s.indexForValue(inf) == 511, "+inf saturates high");
    requireTrue(s.indexForValue(-inf) == 0, "-inf saturates low");
    requireTrue(s.mapValue(inf) == end, "+inf colors as end");

    fv::ColorScale w = fv::ColorScale::build(-inf, inf, start, middle, end);
    requireTrue(w.tableMin() == -0.5 && w.tableMax() == 0.5, "infinite range falls back");
    requireTrue(w.indexForValue(0.0) == 256, "fallback maps zero to the midpoint");

    requireTrue(s.entry(-7) == s.entry(0), "negative entry clamps to first");
    requireTrue(s.entry(100000) == s.entry(511), "large entry clamps to last");
    std::printf("  Test 8 (non-finite): PASS\n");
  }

  std::printf("D1.1 color_scale: ALL PASS\n");
  return 0;
}
