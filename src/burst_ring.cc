// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "burst_ring.hh"

#include <include/core/SkPaint.h>

#include <algorithm>

#include "format.hh"

namespace ringkit {

// Every step must make progress, otherwise the walk around the circle never ends.
constexpr float kMinSpokeWidth = 0.01f;

std::string BurstRing::Spoke::ToStr() const { return f("Spoke({}°, {}°)", angle, width); }

std::vector<BurstRing::Spoke> RandomSpokes(XorShift32& rng, Range width_range,
                                           Range spacing_range) {
  width_range = width_range.Sorted();
  width_range.min = std::max(width_range.min, kMinSpokeWidth);
  width_range.max = std::max(width_range.max, kMinSpokeWidth);
  spacing_range = spacing_range.Sorted();
  spacing_range.min = std::max(spacing_range.min, 0.f);
  spacing_range.max = std::max(spacing_range.max, 0.f);

  std::vector<BurstRing::Spoke> spokes;
  float a_offset = rng.RollFloat(0, 360);
  float a = 0;
  while (a < 360) {
    float w = width_range.Roll(rng);
    float s = spacing_range.Roll(rng);
    spokes.push_back({.angle = a + a_offset, .width = w});
    a += s + w;
  }
  return spokes;
}

BurstRing::BurstRing(float thickness, std::vector<Spoke> spokes)
    : thickness(std::max(0.f, thickness)), spokes(std::move(spokes)) {}

BurstRing BurstRing::Random(XorShift32& rng, float thickness, Range width_range,
                            Range spacing_range) {
  return BurstRing(thickness, RandomSpokes(rng, width_range, spacing_range));
}

SkPath BurstRing::RaysPath(Rect rect) const {
  Rect square = rect.CenteredSquare();
  Vec2 center = square.Center();
  SkPath path;
  for (const Spoke& spoke : spokes) {
    path.moveTo(center);
    path.arcTo(square.sk, spoke.angle - spoke.width / 2, spoke.width, false);
    path.close();
  }
  return path;
}

SkPath BurstRing::ClipPath(Rect rect) const {
  Rect square = rect.CenteredSquare();
  SkPath path;
  path.addOval(square.sk);
  Rect inner = square.Inset(thickness);
  if (inner.Width() > 0) {
    path.addOval(inner.sk);
  }
  path.setFillType(SkPathFillType::kEvenOdd);
  return path;
}

void BurstRing::Draw(SkCanvas& canvas, Rect rect, SkColor background, SkColor foreground) const {
  Rect square = rect.CenteredSquare();
  SkPaint background_paint;
  background_paint.setAntiAlias(true);
  background_paint.setColor(background);
  SkPaint foreground_paint;
  foreground_paint.setAntiAlias(true);
  foreground_paint.setColor(foreground);

  canvas.save();
  canvas.clipPath(ClipPath(rect), true);
  canvas.drawOval(square.sk, background_paint);
  canvas.drawPath(RaysPath(rect), foreground_paint);
  canvas.restore();
}

}  // namespace ringkit
