// Spike demo: a sphere with a spike wave travelling from pole to pole.
// Right/Left step through time points, q quits.
//
// Usage: fv_spike_demo [config.json]

#include "fv/DisplayMesh.hpp"
#include "fv/math/Waveform.hpp"
#include "fv/session/ViewerConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// UV sphere of unit radius.
static void makeSphere(int rings, int segments,
                       std::vector<fv::Vec3>& verts,
                       std::vector<fv::Triangle>& tris) {
  const double kPi = 3.14159265358979323846;
  for (int r = 0; r <= rings; r++) {
    double theta = kPi * static_cast<double>(r) / rings;
    for (int s = 0; s < segments; s++) {
      double phi = 2.0 * kPi * static_cast<double>(s) / segments;
      verts.push_back({std::sin(theta) * std::cos(phi),
                       std::sin(theta) * std::sin(phi),
                       std::cos(theta)});
    }
  }

  auto idx = [segments](int r, int s) {
    return static_cast<std::int64_t>(r * segments + (s % segments));
  };
  for (int r = 0; r < rings; r++) {
    for (int s = 0; s < segments; s++) {
      tris.push_back({idx(r, s), idx(r + 1, s), idx(r + 1, s + 1)});
      tris.push_back({idx(r, s), idx(r + 1, s + 1), idx(r, s + 1)});
    }
  }
}

int main(int argc, char** argv) {
  fv::ViewerConfig cfg;
  cfg.title = "FieldView: spike demo";
  if (argc > 1) {
    std::string json;
    if (!readFile(argv[1], json)) {
      std::fprintf(stderr, "Cannot read config %s\n", argv[1]);
      return 1;
    }
    if (!fv::deserializeViewerConfig(json, cfg)) {
      std::fprintf(stderr, "Malformed config %s\n", argv[1]);
      return 1;
    }
  }

  std::vector<fv::Vec3> verts;
  std::vector<fv::Triangle> tris;
  makeSphere(32, 64, verts, tris);

  // 60 time points over 300 ms. The spike peaks at the north pole at
  // 50 ms and reaches the south pole at 250 ms.
  constexpr int kTimePoints = 60;
  std::vector<double> times(kTimePoints);
  for (int t = 0; t < kTimePoints; t++) times[static_cast<std::size_t>(t)] = 0.3 * t / (kTimePoints - 1);

  fv::ScalarField field(verts.size(), kTimePoints);
  for (std::size_t v = 0; v < verts.size(); v++) {
    double peak = 0.05 + 0.1 * (1.0 - verts[v].z);
    std::vector<double> y = fv::generateSpike(times, peak);
    for (std::size_t t = 0; t < y.size(); t++) field.at(v, t) = y[t];
  }

  std::printf("%zu vertices, %zu triangles, %d time points\n",
              verts.size(), tris.size(), kTimePoints);
  std::printf("Right/Left: step time, drag: rotate, wheel: zoom, q: quit\n");

  fv::DisplayResult r = fv::displayMesh(verts, tris, &field, cfg);
  if (!r.ok) {
    std::fprintf(stderr, "FAIL: code=%s msg=%s\n", r.err.code.c_str(), r.err.message.c_str());
    return 1;
  }
  std::printf("Session closed after %u frames\n", r.framesRendered);
  return 0;
}
