#pragma once
#include "fv/color/ColorScale.hpp"
#include "fv/mesh/Mesh.hpp"

#include <cstddef>
#include <vector>

namespace fv {

// Column actually read for a component selector. Selectors past the last
// column read the last column; negative selectors read column 0.
std::size_t effectiveColumn(const ScalarField& field, int selector);

// Per-vertex RGBA (4 floats per row) for one component of the field,
// mapped through the scale using the scale's own table range.
std::vector<float> mapComponent(const ScalarField& field, int selector,
                                const ColorScale& scale);

// Same color for every vertex (meshes without a field).
std::vector<float> uniformColors(std::size_t count, const Color& c);

} // namespace fv
