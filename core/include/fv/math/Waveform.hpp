#pragma once
#include <vector>

namespace fv {

// Biphasic spike: a sharp exponential peak at peakLocation followed by a
// Gaussian undershoot 20 ms later.
//   y = exp(-100 |t - p|) - 0.5 exp(-(t - p - 0.02)^2 / (2 (0.02/3)^2))
double spikeAt(double t, double peakLocation);

std::vector<double> generateSpike(const std::vector<double>& times, double peakLocation);

} // namespace fv
