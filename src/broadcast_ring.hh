// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <vector>

#include "angle_span.hh"
#include "math.hh"
#include "random.hh"

namespace ringkit {

// Groups of concentric arcs radiating outwards, like a broadcast / signal icon.
//
// Every span is drawn once per layer.
constexpr int kMaxBroadcastLayers = 100;
constexpr int kMaxRayCount = 360;

struct BroadcastRing {
  float thickness_ratio;
  int layer_count;
  std::vector<Span> spans;

  // `layer_count` is clamped to [1, kMaxBroadcastLayers].
  BroadcastRing(float thickness_ratio, int layer_count, std::vector<Span> spans);

  // Splits the circle into a random number of equal ray slots (`ray_count_range`), starting at a
  // random rotation. Each slot gets one span whose width is a random fraction
  // (`span_width_ratio_range`) of the slot. The ray count stays within [1, kMaxRayCount].
  //
  // With `uniform_spacing` the span is centered on the slot start. Otherwise it's placed at a random
  // position inside the slot.
  static BroadcastRing Random(XorShift32& rng, float thickness_ratio = 0.8f, int layer_count = 6,
                              IntRange ray_count_range = {2, 6},
                              Range span_width_ratio_range = {0.1f, 0.9f},
                              bool uniform_spacing = true);

  float LayerRadius(int layer, float radius) const;

  SkPath PathIn(Rect rect) const;
};

}  // namespace ringkit
