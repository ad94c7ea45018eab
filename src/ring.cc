// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "ring.hh"

namespace ringkit {

SkPath PathFor(const Ring& ring, Rect rect) {
  return std::visit([rect](const auto& r) { return r.PathIn(rect); }, ring);
}

namespace {

struct NameVisitor {
  StrView operator()(const GaugeRing&) const { return "gauge"; }
  StrView operator()(const OffsetStreakRing&) const { return "offset_streak"; }
  StrView operator()(const SparseStreakRing&) const { return "sparse_streak"; }
  StrView operator()(const BroadcastRing&) const { return "broadcast"; }
  StrView operator()(const TechRing&) const { return "tech"; }
  StrView operator()(const HollowTechRing&) const { return "hollow_tech"; }
  StrView operator()(const WaveRing&) const { return "wave"; }
  StrView operator()(const HollowWaveRing&) const { return "hollow_wave"; }
  StrView operator()(const GearRing&) const { return "gear"; }
};

}  // namespace

StrView RingName(const Ring& ring) { return std::visit(NameVisitor{}, ring); }

}  // namespace ringkit
