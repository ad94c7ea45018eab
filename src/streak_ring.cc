// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "streak_ring.hh"

#include <algorithm>

namespace ringkit {

OffsetStreakRing::OffsetStreakRing(float thickness_ratio, int streak_count, float streak_arc,
                                   float streak_offset, bool clockwise)
    : thickness_ratio(thickness_ratio),
      streak_count(std::clamp(streak_count, 1, kMaxStreakCount)),
      streak_arc(streak_arc),
      streak_offset(streak_offset),
      clockwise(clockwise) {}

std::vector<Arc> OffsetStreakRing::Arcs() const {
  std::vector<Arc> arcs;
  arcs.reserve(streak_count);
  float direction = clockwise ? 1 : -1;
  for (int i = 0; i < streak_count; ++i) {
    float a0 = streak_offset * (i + 1) * direction;
    // Arcs always grow towards larger angles. Only the offsets follow `clockwise`.
    arcs.push_back(Arc{.start = a0, .end = a0 + streak_arc, .clockwise = false});
  }
  return arcs;
}

float OffsetStreakRing::LayerRadius(int layer, float radius) const {
  float r0 = radius * (1 - thickness_ratio);
  float dr = (radius - r0) / streak_count;
  return r0 + dr * layer;
}

SkPath OffsetStreakRing::PathIn(Rect rect) const {
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  float radius = square.Width() / 2;
  SkPath path;
  auto arcs = Arcs();
  for (int i = 0; i < (int)arcs.size(); ++i) {
    float r = LayerRadius(i, radius);
    path.moveTo(PointOnCircle(center, r, arcs[i].start));
    AddArc(path, center, r, arcs[i]);
  }
  return path;
}

SparseStreakRing::SparseStreakRing(float thickness_ratio, std::vector<std::vector<Span>> streaks)
    : thickness_ratio(thickness_ratio), streaks(std::move(streaks)) {}

SparseStreakRing SparseStreakRing::Random(XorShift32& rng, float thickness_ratio,
                                          int layer_count, IntRange streaks_per_layer) {
  layer_count = std::clamp(layer_count, 0, kMaxStreakLayers);
  streaks_per_layer = streaks_per_layer.Clamp(1, kMaxStreakCount);
  std::vector<std::vector<Span>> streaks;
  streaks.reserve(layer_count);
  for (int layer = 0; layer < layer_count; ++layer) {
    int streak_count = streaks_per_layer.Roll(rng);
    float a_offset = rng.RollFloat(0, kTau);
    float slice = kTau / streak_count;
    auto& layer_streaks = streaks.emplace_back();
    for (int i = 0; i < streak_count; ++i) {
      float a0 = slice * i + a_offset;
      float a1 = a0 + slice;
      float start = a0 + rng.RollFloat(0, slice * 0.49f);
      float end = a1 - rng.RollFloat(0, slice * 0.49f);
      layer_streaks.push_back(Span{start, end});
    }
  }
  return SparseStreakRing(thickness_ratio, std::move(streaks));
}

SkPath SparseStreakRing::PathIn(Rect rect) const {
  SkPath path;
  if (streaks.empty()) {
    return path;
  }
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  float radius = square.Width() / 2;
  float r0 = radius * (1 - thickness_ratio);
  float dr = (radius - r0) / streaks.size();
  for (int layer = 0; layer < (int)streaks.size(); ++layer) {
    float r = r0 + dr * layer;
    for (const Span& streak : streaks[layer]) {
      path.moveTo(PointOnCircle(center, r, streak.start));
      AddArc(path, center, r, streak);
    }
  }
  return path;
}

}  // namespace ringkit
