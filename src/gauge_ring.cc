// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "gauge_ring.hh"

#include <algorithm>

namespace ringkit {

GaugeRing::GaugeRing(int tick_count, float thickness_ratio)
    : tick_count(std::clamp(tick_count, 1, kMaxTickCount)), thickness_ratio(thickness_ratio) {}

SkPath GaugeRing::PathIn(Rect rect) const {
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  float radius = square.Width() / 2;
  float r_inner = radius * (1 - thickness_ratio);
  float da = kTau / tick_count;
  SkPath path;
  for (int i = 0; i < tick_count; ++i) {
    float a = i * da;
    path.moveTo(PointOnCircle(center, r_inner, a));
    path.lineTo(PointOnCircle(center, radius, a));
  }
  return path;
}

}  // namespace ringkit
