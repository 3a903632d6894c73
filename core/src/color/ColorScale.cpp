#include "fv/color/ColorScale.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fv {

ColorScale ColorScale::build(double minimum, double maximum,
                             const Color& start, const Color& middle, const Color& end) {
  ColorScale s;
  s.minimum_ = minimum;
  s.maximum_ = maximum;
  s.tableMin_ = minimum * kRangeScale;
  s.tableMax_ = maximum * kRangeScale;
  if (!std::isfinite(s.tableMin_) || !std::isfinite(s.tableMax_)) {
    s.tableMin_ = -kRangeScale;
    s.tableMax_ = kRangeScale;
  }
  if (!(s.tableMax_ > s.tableMin_)) {
    // Relative width so the step survives rounding at large magnitudes.
    double width = std::max(kMinRangeWidth,
                            std::fabs(s.tableMin_) * 4.0 * std::numeric_limits<double>::epsilon());
    s.tableMax_ = s.tableMin_ + width;
  }
  s.start_ = start;
  s.middle_ = middle;
  s.end_ = end;

  // Lower half: start (i = 0) toward middle (i = 255), forward weight i/255.
  for (int i = kHalfColors - 1; i >= 0; i--) {
    double w = static_cast<double>(i);
    Color& c = s.table_[static_cast<std::size_t>(i)];
    c.r = (middle.r - start.r) * w / 255.0 + start.r;
    c.g = (middle.g - start.g) * w / 255.0 + start.g;
    c.b = (middle.b - start.b) * w / 255.0 + start.b;
    c.a = 1.0;
  }

  // Upper half: middle (i = 0) toward end (i = 255). The weight runs
  // backwards, (255 - i)/255, measured from `end` rather than `middle`.
  for (int i = 0; i < kHalfColors; i++) {
    double w = static_cast<double>(255 - i);
    Color& c = s.table_[static_cast<std::size_t>(kHalfColors + i)];
    c.r = (middle.r - end.r) * w / 255.0 + end.r;
    c.g = (middle.g - end.g) * w / 255.0 + end.g;
    c.b = (middle.b - end.b) * w / 255.0 + end.b;
    c.a = 1.0;
  }

  return s;
}

int ColorScale::indexForValue(double v) const {
  double t = (v - tableMin_) / (tableMax_ - tableMin_);
  // NaN fails both comparisons and lands on entry 0.
  if (!(t > 0.0)) return 0;
  if (t >= 1.0) return kNumColors - 1;
  return std::min(static_cast<int>(t * static_cast<double>(kNumColors)), kNumColors - 1);
}

} // namespace fv
