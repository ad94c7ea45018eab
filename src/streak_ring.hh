// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <vector>

#include "angle_span.hh"
#include "math.hh"
#include "random.hh"

namespace ringkit {

// Concentric arcs, each rotated a bit further than the previous one. Looks like a swirl.
//
// Every layer gets one arc of `streak_arc` radians. The innermost layer starts at `streak_offset`
// and each following layer adds another `streak_offset` (negated when `clockwise` is false).
constexpr int kMaxStreakCount = 360;
constexpr int kMaxStreakLayers = 100;

struct OffsetStreakRing {
  float thickness_ratio;
  int streak_count;
  float streak_arc;
  float streak_offset;
  bool clockwise;

  // `streak_count` is clamped to [1, kMaxStreakCount].
  OffsetStreakRing(float thickness_ratio = 0.25f, int streak_count = 8, float streak_arc = kPi,
                   float streak_offset = kPi * 0.2f, bool clockwise = true);

  // Angular extent of each layer, innermost first.
  std::vector<Arc> Arcs() const;

  // Radius of the given layer for a ring with the given outer radius.
  float LayerRadius(int layer, float radius) const;

  SkPath PathIn(Rect rect) const;
};

// Concentric layers, each with a few streaks that never touch each other.
struct SparseStreakRing {
  float thickness_ratio;
  // Streaks of each layer, innermost layer first.
  std::vector<std::vector<Span>> streaks;

  SparseStreakRing(float thickness_ratio, std::vector<std::vector<Span>> streaks);

  // Every layer picks its own streak count from `streaks_per_layer` and a random rotation. The
  // circle is split into equal slices & each streak is trimmed by up to 49% of the slice on both
  // ends, so neighboring streaks are always separated.
  //
  // `layer_count` is clamped to [0, kMaxStreakLayers] & `streaks_per_layer` to
  // [1, kMaxStreakCount].
  static SparseStreakRing Random(XorShift32& rng, float thickness_ratio = 0.25f,
                                 int layer_count = 6, IntRange streaks_per_layer = {1, 6});

  SkPath PathIn(Rect rect) const;
};

}  // namespace ringkit
