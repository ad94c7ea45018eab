// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "angle_span.hh"

#include "format.hh"

namespace ringkit {

std::string Span::ToStr() const { return f("Span({}, {})", start, end); }

float Arc::Sweep() const { return ArcSweep(start, end, clockwise); }

std::string Arc::ToStr() const {
  return f("Arc({}, {}, {})", start, end, clockwise ? "cw" : "ccw");
}

float ArcSweep(float start, float end, bool clockwise) {
  float sweep = end - start;
  if (!clockwise) {
    if (sweep >= kTau) {
      return kTau;
    }
    if (sweep < 0) {
      sweep = fmodf(sweep, kTau);
      if (sweep < 0) {
        sweep += kTau;
      }
    }
  } else {
    if (sweep <= -kTau) {
      return -kTau;
    }
    if (sweep > 0) {
      sweep = fmodf(sweep, kTau);
      if (sweep > 0) {
        sweep -= kTau;
      }
    }
  }
  return sweep;
}

void AddArc(SkPath& path, Vec2 center, float radius, float start, float end, bool clockwise) {
  constexpr float kDegPerRad = 180 / kPi;
  SkRect oval = SkRect::MakeLTRB(center.x - radius, center.y - radius, center.x + radius,
                                 center.y + radius);
  float start_deg = start * kDegPerRad;
  float sweep_deg = ArcSweep(start, end, clockwise) * kDegPerRad;
  if (fabsf(sweep_deg) >= 359.999f) {
    // arcTo can't tell a full turn from an empty one - split it in halves.
    path.arcTo(oval, start_deg, sweep_deg / 2, false);
    path.arcTo(oval, start_deg + sweep_deg / 2, sweep_deg / 2, false);
  } else {
    path.arcTo(oval, start_deg, sweep_deg, false);
  }
}

}  // namespace ringkit
