#include "fv/math/Waveform.hpp"
#include <cmath>

namespace fv {

static constexpr double kUndershootDelay = 0.02;
static constexpr double kUndershootSigma = 0.02 / 3.0;

double spikeAt(double t, double peakLocation) {
  double d = t - peakLocation - kUndershootDelay;
  return std::exp(-100.0 * std::fabs(t - peakLocation))
       - 0.5 * std::exp(-(d * d) / (2.0 * kUndershootSigma * kUndershootSigma));
}

std::vector<double> generateSpike(const std::vector<double>& times, double peakLocation) {
  std::vector<double> y;
  y.reserve(times.size());
  for (double t : times) y.push_back(spikeAt(t, peakLocation));
  return y;
}

} // namespace fv
