#include "fv/session/ViewerConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace fv {

static rapidjson::Value colorToJson(const Color& c, rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  arr.PushBack(c.r, alloc);
  arr.PushBack(c.g, alloc);
  arr.PushBack(c.b, alloc);
  return arr;
}

// Reads [r, g, b] (alpha stays 1). Leaves `out` untouched on any mismatch.
static void readColor(const rapidjson::Value& obj, const char* key, Color& out) {
  if (!obj.HasMember(key)) return;
  const auto& v = obj[key];
  if (!v.IsArray() || v.Size() != 3) return;
  for (rapidjson::SizeType i = 0; i < 3; i++) {
    if (!v[i].IsNumber()) return;
  }
  out.r = v[0].GetDouble();
  out.g = v[1].GetDouble();
  out.b = v[2].GetDouble();
}

static void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

std::string serializeViewerConfig(const ViewerConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value window(rapidjson::kObjectType);
  window.AddMember("width", cfg.windowWidth, alloc);
  window.AddMember("height", cfg.windowHeight, alloc);
  window.AddMember("title", rapidjson::Value(cfg.title.c_str(), alloc), alloc);
  doc.AddMember("window", window, alloc);

  doc.AddMember("background", colorToJson(cfg.background, alloc), alloc);
  doc.AddMember("surface", colorToJson(cfg.surface, alloc), alloc);

  rapidjson::Value scale(rapidjson::kObjectType);
  scale.AddMember("start", colorToJson(cfg.scale.start, alloc), alloc);
  scale.AddMember("middle", colorToJson(cfg.scale.middle, alloc), alloc);
  scale.AddMember("end", colorToJson(cfg.scale.end, alloc), alloc);
  doc.AddMember("scale", scale, alloc);

  rapidjson::Value camera(rapidjson::kObjectType);
  camera.AddMember("rotateFactor", cfg.camera.rotateFactor, alloc);
  camera.AddMember("dollyFactor", cfg.camera.dollyFactor, alloc);
  camera.AddMember("viewAngle", cfg.camera.viewAngleDeg, alloc);
  doc.AddMember("camera", camera, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeViewerConfig(const std::string& json, ViewerConfig& cfg) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("window") && doc["window"].IsObject()) {
    const auto& w = doc["window"];
    if (w.HasMember("width") && w["width"].IsInt() && w["width"].GetInt() > 0)
      cfg.windowWidth = w["width"].GetInt();
    if (w.HasMember("height") && w["height"].IsInt() && w["height"].GetInt() > 0)
      cfg.windowHeight = w["height"].GetInt();
    if (w.HasMember("title") && w["title"].IsString())
      cfg.title = w["title"].GetString();
  }

  readColor(doc, "background", cfg.background);
  readColor(doc, "surface", cfg.surface);

  if (doc.HasMember("scale") && doc["scale"].IsObject()) {
    const auto& s = doc["scale"];
    readColor(s, "start", cfg.scale.start);
    readColor(s, "middle", cfg.scale.middle);
    readColor(s, "end", cfg.scale.end);
  }

  if (doc.HasMember("camera") && doc["camera"].IsObject()) {
    const auto& c = doc["camera"];
    readDouble(c, "rotateFactor", cfg.camera.rotateFactor);
    readDouble(c, "dollyFactor", cfg.camera.dollyFactor);
    readDouble(c, "viewAngle", cfg.camera.viewAngleDeg);
  }

  return true;
}

} // namespace fv
