// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include "math.hh"

namespace ringkit {

// Evenly spaced radial ticks, resembling a gauge or a clock face.
//
// The path consists of open segments, so it should be stroked rather than filled.
constexpr int kMaxTickCount = 3600;

struct GaugeRing {
  int tick_count;
  // Length of each tick, relative to the radius.
  float thickness_ratio;

  // `tick_count` is clamped to [1, kMaxTickCount].
  GaugeRing(int tick_count = 60, float thickness_ratio = 0.1f);

  SkPath PathIn(Rect rect) const;
};

}  // namespace ringkit
