// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include "math.hh"

namespace ringkit {

// Gear silhouette with optional spoke cut-outs and a center hole.
struct GearRing {
  // Clamped to [2, 64].
  int tooth_count;
  // Radius at the bottom of the teeth relative to the outer radius. Clamped to [0.65, 1].
  float tooth_depth_ratio;
  // Clamped to [0, 12]. Fewer than 2 spokes leaves the gear body solid.
  int spoke_count;
  // Fraction of each spoke slot that is cut out. Clamped to [0.2, 0.9].
  float spoke_width_ratio;
  bool include_center_hole;

  GearRing(int tooth_count = 24, float tooth_depth_ratio = 0.8f, int spoke_count = 6,
           float spoke_width_ratio = 0.7f, bool include_center_hole = true);

  // Single closed contour with 4 vertices per tooth. Teeth are trapezoids that alternate between the
  // inner & outer radius every quarter of the tooth angle.
  SkPath Outline(Rect rect) const;

  SkPath PathIn(Rect rect) const;
};

}  // namespace ringkit
