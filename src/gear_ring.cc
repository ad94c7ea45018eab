// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "gear_ring.hh"

#include <algorithm>

#include "angle_span.hh"
#include "even_odd.hh"

namespace ringkit {

GearRing::GearRing(int tooth_count, float tooth_depth_ratio, int spoke_count,
                   float spoke_width_ratio, bool include_center_hole)
    : tooth_count(std::clamp(tooth_count, 2, 64)),
      tooth_depth_ratio(std::clamp(tooth_depth_ratio, 0.65f, 1.f)),
      spoke_count(std::clamp(spoke_count, 0, 12)),
      spoke_width_ratio(std::clamp(spoke_width_ratio, 0.2f, 0.9f)),
      include_center_hole(include_center_hole) {}

SkPath GearRing::Outline(Rect rect) const {
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  float r_outer = square.Width() / 2;
  float r_inner = r_outer * tooth_depth_ratio;
  float tooth_angle = kTau / tooth_count;
  float segment_angle = tooth_angle / 4;
  SkPath path;
  path.moveTo(PointOnCircle(center, r_inner, 0));
  for (int i = 0; i < tooth_count; ++i) {
    float a = tooth_angle * i;
    // The last vertex of the last tooth is the starting point. `close` takes care of it.
    int last_j = i == tooth_count - 1 ? 3 : 4;
    for (int j = 1; j <= last_j; ++j) {
      float a0 = a + segment_angle * j;
      float r = (j / 2) % 2 == 0 ? r_inner : r_outer;
      path.lineTo(PointOnCircle(center, r, a0));
    }
  }
  path.close();
  return path;
}

SkPath GearRing::PathIn(Rect rect) const {
  SkPath path = Outline(rect);
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  float r_outer = square.Width() / 2;
  if (spoke_count >= 2) {
    float slot_angle = kTau / spoke_count;
    float hole_width = slot_angle * spoke_width_ratio;
    float bevel = hole_width * 0.25f * spoke_width_ratio;
    float s_outer = r_outer * (tooth_depth_ratio - 0.1f);
    float s_inner = s_outer * 0.35f;
    for (int i = 0; i < spoke_count; ++i) {
      float a0 = slot_angle * i;
      float a1 = a0 + hole_width;
      float a2 = a1 - bevel;
      float a3 = a0 + bevel;
      path.moveTo(PointOnCircle(center, s_outer, a0));
      AddArc(path, center, s_outer, a0, a1);
      path.lineTo(PointOnCircle(center, s_inner, a2));
      AddArc(path, center, s_inner, a2, a3, true);
      path.close();
    }
    if (include_center_hole) {
      path.addCircle(center.x, center.y, s_inner * 0.4f);
    }
  } else if (include_center_hole) {
    path.addCircle(center.x, center.y, r_outer * 0.1f);
  } else {
    path.setFillType(SkPathFillType::kEvenOdd);
    return path;
  }
  return NormalizeEvenOdd(std::move(path));
}

}  // namespace ringkit
