// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <variant>

#include "broadcast_ring.hh"
#include "format.hh"
#include "gauge_ring.hh"
#include "gear_ring.hh"
#include "math.hh"
#include "streak_ring.hh"
#include "tech_ring.hh"
#include "wave_ring.hh"

namespace ringkit {

// Any of the single-color ring generators.
//
// `BurstRing` is not part of it because it paints with two colors through its own `Draw`.
using Ring = std::variant<GaugeRing, OffsetStreakRing, SparseStreakRing, BroadcastRing, TechRing,
                          HollowTechRing, WaveRing, HollowWaveRing, GearRing>;

SkPath PathFor(const Ring& ring, Rect rect);

// Lower-case kind of the ring ("gauge", "hollow_wave", ...). Matches the `kind` field of the
// gallery config.
StrView RingName(const Ring& ring);

}  // namespace ringkit
