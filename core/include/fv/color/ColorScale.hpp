#pragma once
#include <array>
#include <cstddef>

namespace fv {

struct Color {
  double r{0}, g{0}, b{0}, a{1};
};

inline bool operator==(const Color& x, const Color& y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(const Color& x, const Color& y) { return !(x == y); }

// Diverging lookup table: `start` at the most negative value, `middle`
// around zero, `end` at the most positive value.
//
// Immutable once built. Lookup uses the table's own range, which is the
// requested range scaled by kRangeScale, so values beyond half the
// requested magnitude saturate to the end colors.
class ColorScale {
public:
  static constexpr int kNumColors = 512;
  static constexpr int kHalfColors = kNumColors / 2;
  static constexpr double kRangeScale = 0.5;
  // Smallest substituted width when the table range collapses to a point;
  // large magnitudes widen by a few ulps instead.
  static constexpr double kMinRangeWidth = 1e-12;

  static Color defaultStart()  { return {0.0, 0.0, 1.0, 1.0}; }
  static Color defaultMiddle() { return {0.9, 0.9, 0.9, 1.0}; }
  static Color defaultEnd()    { return {0.0, 1.0, 0.0, 1.0}; }

  static ColorScale build(double minimum = -1.0, double maximum = 1.0,
                          const Color& start = defaultStart(),
                          const Color& middle = defaultMiddle(),
                          const Color& end = defaultEnd());

  int size() const { return kNumColors; }
  // Out-of-range indices clamp to the first / last entry.
  const Color& entry(int i) const {
    if (i < 0) i = 0;
    if (i >= kNumColors) i = kNumColors - 1;
    return table_[static_cast<std::size_t>(i)];
  }

  // Range as requested by the caller.
  double minimum() const { return minimum_; }
  double maximum() const { return maximum_; }

  // Range the table actually spans.
  double tableMin() const { return tableMin_; }
  double tableMax() const { return tableMax_; }

  const Color& startColor() const { return start_; }
  const Color& middleColor() const { return middle_; }
  const Color& endColor() const { return end_; }

  // Table index for a value; out-of-range values (including +-inf) clamp,
  // NaN maps to 0. A non-finite requested range falls back to [-1, 1].
  int indexForValue(double v) const;
  const Color& mapValue(double v) const { return entry(indexForValue(v)); }

private:
  ColorScale() = default;

  std::array<Color, kNumColors> table_{};
  double minimum_{-1.0};
  double maximum_{1.0};
  double tableMin_{-0.5};
  double tableMax_{0.5};
  Color start_{};
  Color middle_{};
  Color end_{};
};

} // namespace fv
