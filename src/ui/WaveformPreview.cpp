/* @file WaveformPreview.cpp
 * @brief simulated scope trace + text renderer
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numbers>

#include "ui/WaveformPreview.hpp"

using namespace dcbench::ui;

WaveformPreview::WaveformPreview(Settings settings) : settings_(settings), rng_(settings.seed) {}

std::vector<double> WaveformPreview::nextFrame() {
  const double sigma = std::abs(settings_.noise * settings_.amplitude);
  std::normal_distribution<double> noise(0.0, sigma > 0.0 ? sigma : 1.0);
  std::vector<double> frame(settings_.samples);
  const double n = static_cast<double>(std::max<std::size_t>(settings_.samples, 1));
  for (std::size_t i = 0; i < frame.size(); ++i) {
    double angle = 2.0 * std::numbers::pi * settings_.cycles * static_cast<double>(i) / n + phase_;
    frame[i] = settings_.amplitude * std::sin(angle) + (sigma > 0.0 ? noise(rng_) : 0.0);
  }
  phase_ = std::fmod(phase_ + settings_.scroll, 2.0 * std::numbers::pi);
  return frame;
}

double WaveformPreview::amplitudeFor(const std::string& raw, double fallback) {
  char* end = nullptr;
  const double v = std::strtod(raw.c_str(), &end);
  if (end == raw.c_str() || !std::isfinite(v) || v <= 0.0)
    return fallback;
  return v;
}

std::string WaveformPreview::render(const std::vector<double>& frame, double fullScale, int rows,
                                    int cols) {
  if (rows < 2 || cols < 1)
    return {};
  if (!std::isfinite(fullScale) || fullScale <= 0.0)
    fullScale = 1.0;

  std::vector<std::string> grid(static_cast<std::size_t>(rows), std::string(static_cast<std::size_t>(cols), ' '));
  const int zeroRow = (rows - 1) / 2;
  std::fill(grid[zeroRow].begin(), grid[zeroRow].end(), '-');

  if (!frame.empty()) {
    for (int c = 0; c < cols; ++c) {
      std::size_t idx = static_cast<std::size_t>(c) * frame.size() / static_cast<std::size_t>(cols);
      if (!std::isfinite(frame[idx]))
        continue;
      double v = std::clamp(frame[idx] / fullScale, -1.0, 1.0);
      int r = static_cast<int>(std::lround((1.0 - (v + 1.0) / 2.0) * (rows - 1)));
      grid[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)] = '*';
    }
  }

  std::string out;
  for (const auto& line : grid) {
    out += line;
    out += '\n';
  }
  return out;
}
