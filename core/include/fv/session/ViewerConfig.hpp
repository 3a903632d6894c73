#pragma once
#include "fv/color/ColorScale.hpp"
#include "fv/mesh/MeshBuilder.hpp"
#include "fv/viewport/TrackballCamera.hpp"

#include <string>

namespace fv {

// Window, camera and color settings for a viewing session.
struct ViewerConfig {
  int windowWidth{800};
  int windowHeight{600};
  std::string title{"FieldView"};

  Color background{0.0, 0.0, 0.0, 1.0};

  // Diverging scale for meshes with a field. Start is a light red rather
  // than ColorScale's blue default.
  ScaleColors scale{{1.0, 0.5, 0.5, 1.0}, ColorScale::defaultMiddle(), ColorScale::defaultEnd()};

  // Surface color for meshes without a field.
  Color surface{1.0, 1.0, 1.0, 1.0};

  TrackballConfig camera;
};

// Serialize to a JSON string.
std::string serializeViewerConfig(const ViewerConfig& cfg);

// Parse JSON into cfg. Members that are absent keep their current value.
// Returns false on malformed JSON or a non-object root.
bool deserializeViewerConfig(const std::string& json, ViewerConfig& cfg);

} // namespace fv
