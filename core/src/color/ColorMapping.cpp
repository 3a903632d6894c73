#include "fv/color/ColorMapping.hpp"

namespace fv {

std::size_t effectiveColumn(const ScalarField& field, int selector) {
  if (selector <= 0 || field.columns == 0) return 0;
  auto col = static_cast<std::size_t>(selector);
  if (col >= field.columns) col = field.columns - 1;
  return col;
}

std::vector<float> mapComponent(const ScalarField& field, int selector,
                                const ColorScale& scale) {
  std::vector<float> out;
  if (!field.wellFormed()) return out;

  std::size_t col = effectiveColumn(field, selector);
  out.reserve(field.rows * 4);
  for (std::size_t row = 0; row < field.rows; row++) {
    const Color& c = scale.mapValue(field.at(row, col));
    out.push_back(static_cast<float>(c.r));
    out.push_back(static_cast<float>(c.g));
    out.push_back(static_cast<float>(c.b));
    out.push_back(static_cast<float>(c.a));
  }
  return out;
}

std::vector<float> uniformColors(std::size_t count, const Color& c) {
  std::vector<float> out;
  out.reserve(count * 4);
  for (std::size_t i = 0; i < count; i++) {
    out.push_back(static_cast<float>(c.r));
    out.push_back(static_cast<float>(c.g));
    out.push_back(static_cast<float>(c.b));
    out.push_back(static_cast<float>(c.a));
  }
  return out;
}

} // namespace fv
