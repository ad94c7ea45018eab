// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <string>

#include "math.hh"

namespace ringkit {

// Angular interval [start, end) in radians.
//
// `end` may be smaller than `start`. Arc emission then wraps past 2π instead of sweeping backwards.
struct Span {
  float start = 0;
  float end = 0;

  constexpr float Width() const { return end - start; }
  std::string ToStr() const;
};

// Angular interval with a winding direction.
struct Arc {
  float start = 0;
  float end = 0;
  bool clockwise = false;

  constexpr Arc OffsetBy(float angle) const { return {start + angle, end + angle, clockwise}; }

  // Signed sweep in radians, normalized the way `AddArc` draws it.
  float Sweep() const;

  std::string ToStr() const;
};

constexpr Arc kEmptyArc = {0, 0};
constexpr Arc kFullCircleArc = {0, kTau};

// Sweep of an arc that goes from `start` to `end`.
//
// Counter-clockwise (increasing angle) sweeps are in [0, 2π], clockwise sweeps in [-2π, 0]. A
// difference of a full turn or more in the drawing direction is clamped to a full turn. A
// difference in the opposite direction wraps around.
float ArcSweep(float start, float end, bool clockwise);

// Append a circular arc to `path`.
//
// When `path` already has a current point, a line connects it with the arc's first point (like
// `SkPath::arcTo` with `forceMoveTo = false`). Otherwise the arc starts a new contour.
void AddArc(SkPath& path, Vec2 center, float radius, float start, float end,
            bool clockwise = false);

inline void AddArc(SkPath& path, Vec2 center, float radius, const Arc& arc) {
  AddArc(path, center, radius, arc.start, arc.end, arc.clockwise);
}

inline void AddArc(SkPath& path, Vec2 center, float radius, const Span& span) {
  AddArc(path, center, radius, span.start, span.end, false);
}

}  // namespace ringkit
