// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "wave_ring.hh"

#include <algorithm>

#include "even_odd.hh"

namespace ringkit {

std::pair<Vec2, Vec2> TangentPoints(Vec2 center, float radius, float angle, float distance) {
  Vec2 on_circle = PointOnCircle(center, radius, angle);
  Vec2 tangent = Vec2(-sinf(angle), cosf(angle));
  return {on_circle + tangent * distance, on_circle - tangent * distance};
}

WaveRing::WaveRing(float amplitude_ratio, int frequency, float outer_control_ratio,
                   float inner_control_ratio)
    : amplitude_ratio(std::clamp(amplitude_ratio, 0.1f, 0.95f)),
      frequency(std::clamp(frequency, 1, 60)),
      outer_control_ratio(outer_control_ratio),
      inner_control_ratio(inner_control_ratio) {}

SkPath WaveRing::PathIn(Rect rect) const {
  Vec2 center = rect.Center();
  float outer_radius = std::min(rect.Width(), rect.Height()) / 2;
  float inner_radius = outer_radius * amplitude_ratio;

  float theta = kTau / frequency;
  float half_theta = theta / 2;
  float c_dist_outer = kTau * outer_radius / frequency * outer_control_ratio;
  float c_dist_inner = kTau * inner_radius / frequency * inner_control_ratio;

  SkPath path;
  path.moveTo(center.x + outer_radius, center.y);
  for (int i = 0; i < frequency; ++i) {
    float a0 = theta * i;       // peak
    float a1 = a0 + half_theta;  // valley
    float a2 = a0 + theta;       // next peak
    Vec2 valley = PointOnCircle(center, inner_radius, a1);
    Vec2 next_peak = PointOnCircle(center, outer_radius, a2);
    Vec2 c0 = TangentPoints(center, outer_radius, a0, c_dist_outer).first;
    auto c1 = TangentPoints(center, inner_radius, a1, c_dist_inner);
    Vec2 c2 = TangentPoints(center, outer_radius, a2, c_dist_outer).second;
    path.cubicTo(c0, c1.second, valley);
    path.cubicTo(c1.first, c2, next_peak);
  }
  path.close();
  return path;
}

HollowWaveRing::HollowWaveRing(float amplitude_ratio, int frequency, float outer_control_ratio,
                               float inner_control_ratio, float thickness_ratio)
    : wave(amplitude_ratio, frequency, outer_control_ratio, inner_control_ratio),
      thickness_ratio(std::clamp(thickness_ratio, 0.01f, 0.99f)) {}

Rect HollowWaveRing::InnerRect(Rect rect) const {
  float thickness = std::min(rect.Width(), rect.Height()) / 2 * thickness_ratio;
  return rect.Inset(thickness);
}

SkPath HollowWaveRing::PathIn(Rect rect) const {
  return CombineEvenOdd({wave.PathIn(rect), wave.PathIn(InnerRect(rect))});
}

}  // namespace ringkit
