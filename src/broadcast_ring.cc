// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "broadcast_ring.hh"

#include <algorithm>

namespace ringkit {

BroadcastRing::BroadcastRing(float thickness_ratio, int layer_count, std::vector<Span> spans)
    : thickness_ratio(thickness_ratio),
      layer_count(std::clamp(layer_count, 1, kMaxBroadcastLayers)),
      spans(std::move(spans)) {}

BroadcastRing BroadcastRing::Random(XorShift32& rng, float thickness_ratio, int layer_count,
                                    IntRange ray_count_range, Range span_width_ratio_range,
                                    bool uniform_spacing) {
  int ray_count = ray_count_range.Clamp(1, kMaxRayCount).Roll(rng);
  float angle_per_ray = kTau / ray_count;
  float offset = rng.RollFloat(0, kTau);
  std::vector<Span> spans;
  spans.reserve(ray_count);
  for (int i = 0; i < ray_count; ++i) {
    float ray_start = angle_per_ray * i + offset;
    if (uniform_spacing) {
      float half_width = span_width_ratio_range.Roll(rng) / 2 * angle_per_ray;
      spans.push_back(Span{ray_start - half_width, ray_start + half_width});
    } else {
      float width = span_width_ratio_range.Roll(rng) * angle_per_ray;
      float space = std::max(0.f, angle_per_ray - width);
      float span_start = rng.RollFloat(0, space) + ray_start;
      spans.push_back(Span{span_start, span_start + width});
    }
  }
  return BroadcastRing(thickness_ratio, layer_count, std::move(spans));
}

float BroadcastRing::LayerRadius(int layer, float radius) const {
  float r0 = radius * (1 - thickness_ratio);
  float dr = (radius - r0) / (layer_count + 1);
  return r0 + dr * layer;
}

SkPath BroadcastRing::PathIn(Rect rect) const {
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  float radius = square.Width() / 2;
  SkPath path;
  for (const Span& span : spans) {
    for (int layer = 0; layer < layer_count; ++layer) {
      float r = LayerRadius(layer, radius);
      path.moveTo(PointOnCircle(center, r, span.start));
      AddArc(path, center, r, span);
    }
  }
  return path;
}

}  // namespace ringkit
