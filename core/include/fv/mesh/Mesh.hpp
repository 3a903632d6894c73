#pragma once
#include "fv/math/Vec3.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace fv {

// Three 0-based vertex indices. Signed so that negative input can be
// reported instead of wrapping.
using Triangle = std::array<std::int64_t, 3>;

// Row-major table: one row per vertex, one column per component
// (time point or channel).
struct ScalarField {
  std::size_t rows{0};
  std::size_t columns{0};
  std::vector<double> values;

  ScalarField() = default;
  ScalarField(std::size_t r, std::size_t c)
    : rows(r), columns(c), values(r * c, 0.0) {}
  ScalarField(std::size_t r, std::size_t c, std::vector<double> v)
    : rows(r), columns(c), values(std::move(v)) {}

  double at(std::size_t row, std::size_t col) const { return values[row * columns + col]; }
  double& at(std::size_t row, std::size_t col) { return values[row * columns + col]; }

  bool wellFormed() const { return columns >= 1 && values.size() == rows * columns; }

  // Largest |value| over the finite entries; 0 when there are none.
  double maxAbs() const;
};

struct Bounds {
  Vec3 min{};
  Vec3 max{};
  bool valid{false};

  void expand(const Vec3& p);
  Vec3 center() const;
  double diagonal() const;
};

} // namespace fv
