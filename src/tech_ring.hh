// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <vector>

#include "angle_span.hh"
#include "math.hh"
#include "random.hh"

namespace ringkit {

// Closed ring outline with notches pressed into its edge.
//
// Notches are given as a flat list of angles (radians) - alternating notch start & end. Walls of the
// notches are chamfered so that they look like straight bevels between the outer radius and the
// inset radius.
//
// A list with an odd number of angles, or with fewer than two, produces an empty path.
constexpr int kMaxNotchCount = 360;

struct TechRing {
  // Depth of the notches relative to the radius. Clamped to [0, 1].
  float inset_ratio;
  std::vector<float> spans;

  TechRing(float inset_ratio, std::vector<float> raw_spans);
  TechRing(float inset_ratio, const std::vector<Span>& spans);

  // Random notch count from `span_count_range`, evenly distributed around the ring with a random
  // rotation. Each notch covers 25%..75% of its slot.
  static TechRing Random(XorShift32& rng, float inset_ratio = 0.1f,
                         IntRange span_count_range = {2, 5});

  SkPath PathIn(Rect rect) const;
};

// Ring band with independent notch patterns on its outer & inner edge.
struct HollowTechRing {
  float inset_ratio;
  // Width of the band relative to the radius. Clamped to [0, 1].
  float thickness_ratio;
  std::vector<float> outer_spans;
  std::vector<float> inner_spans;

  HollowTechRing(float inset_ratio, float thickness_ratio, std::vector<float> raw_outer_spans,
                 std::vector<float> raw_inner_spans);
  HollowTechRing(float inset_ratio, float thickness_ratio, const std::vector<Span>& outer_spans,
                 const std::vector<Span>& inner_spans);

  // Like `TechRing::Random` but notches cover 20%..80% of their slot.
  static HollowTechRing Random(XorShift32& rng, float inset_ratio = 0.1f,
                               float thickness_ratio = 0.25f,
                               IntRange outer_span_count_range = {2, 5},
                               IntRange inner_span_count_range = {1, 4});

  // Square that the inner notched ring is drawn in.
  Rect InnerRect(Rect rect) const;

  SkPath PathIn(Rect rect) const;
};

// Flattens `spans` into alternating start & end angles.
std::vector<float> FlattenSpans(const std::vector<Span>& spans);

// Evenly distributes a random number of notches around the circle.
//
// Each of the `count_range` slots gets one notch covering `width_ratio_range` of the slot. The
// notch starts 20%..80% into the leftover space of its slot.
// Notch count is rolled from `count_range`, clamped to [1, kMaxNotchCount].
std::vector<float> RandomNotches(XorShift32& rng, IntRange count_range, Range width_ratio_range);

// Angle that a straight wall needs to go from `outer_radius` to `outer_radius - inset` while
// keeping its length equal to `inset`. Derived from the law of cosines.
float TransitionAngle(float outer_radius, float inset);

}  // namespace ringkit
