// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <utility>

#include "math.hh"

namespace ringkit {

// Disc whose edge follows a sine wave going around the circle.
//
// The wave is approximated with two cubic Bezier curves per period (peak -> valley -> peak). Control
// points lie on the tangents of the peak & valley circles, so the curve is smooth at every anchor.
struct WaveRing {
  // Radius of the valleys relative to the radius of the peaks. Clamped to [0.1, 0.95].
  float amplitude_ratio;
  // Number of wave periods around the circle. Clamped to [1, 60].
  int frequency;
  // Tangent length at the peaks, relative to the arc length of one period.
  float outer_control_ratio;
  // Tangent length at the valleys, relative to the arc length of one period.
  float inner_control_ratio;

  WaveRing(float amplitude_ratio = 0.8f, int frequency = 6, float outer_control_ratio = 0.25f,
           float inner_control_ratio = 0.275f);

  SkPath PathIn(Rect rect) const;
};

// Band with a wavy edge on both sides.
struct HollowWaveRing {
  WaveRing wave;
  // Width of the band relative to the radius. Clamped to [0.01, 0.99].
  float thickness_ratio;

  HollowWaveRing(float amplitude_ratio = 0.8f, int frequency = 6, float outer_control_ratio = 0.25f,
                 float inner_control_ratio = 0.275f, float thickness_ratio = 0.2f);

  // Rectangle that the inner (cut-out) wave is drawn in.
  Rect InnerRect(Rect rect) const;

  SkPath PathIn(Rect rect) const;
};

// Two points at `distance` from the point at `angle` on the given circle, along its tangent.
//
// The first point lies in the direction of increasing angle, the second one in the opposite
// direction.
std::pair<Vec2, Vec2> TangentPoints(Vec2 center, float radius, float angle, float distance);

}  // namespace ringkit
